/* userproc -- A framework to experiment with process management
 *
 *    translation.cc - Page table format understood by the MMU
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "translation.h"

#include <stdexcept>


PageTable::PageTable(const size_t nEntries)
  : entries(nEntries)
{
  for (size_t i = 0; i < nEntries; ++i)
    entries[i].vpn = i;
}

TranslationEntry *
PageTable::lookup(const uint64_t vPage)
{
  if (vPage >= entries.size() || !entries[vPage].valid)
    return nullptr;

  return &entries[vPage];
}

const TranslationEntry *
PageTable::lookup(const uint64_t vPage) const
{
  if (vPage >= entries.size() || !entries[vPage].valid)
    return nullptr;

  return &entries[vPage];
}

TranslationEntry &
PageTable::slot(const uint64_t vPage)
{
  if (vPage >= entries.size())
    throw std::out_of_range("virtual page number beyond end of page table");

  return entries[vPage];
}

void
PageTable::clear(void)
{
  for (size_t i = 0; i < entries.size(); ++i)
    {
      entries[i] = TranslationEntry();
      entries[i].vpn = i;
    }
}
