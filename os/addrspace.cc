/* userproc -- A framework to experiment with process management
 *
 *    addrspace.cc - Per-process virtual address space
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "addrspace.h"

#include <stdexcept>


AddressSpace::AddressSpace(PhysMemManager &physMemManager,
                           const size_t nEntries)
  : physMemManager(physMemManager), pageTable(nEntries), usedPages()
{
}

AddressSpace::~AddressSpace()
{
  releaseAll();
}

bool
AddressSpace::mapPage(const uint64_t vPage, bool readOnly)
{
  if (vPage >= pageTable.size())
    throw std::logic_error("AddressSpace: virtual page beyond end of page table");

  TranslationEntry &entry = pageTable.slot(vPage);
  if (entry.valid)
    throw std::logic_error("AddressSpace: virtual page is already mapped");

  uint64_t pPage = 0;
  if (!physMemManager.allocatePage(pPage))
    return false;

  usedPages.push_back(pPage);

  entry.vpn = vPage;
  entry.ppn = pPage;
  entry.valid = true;
  entry.readOnly = readOnly;
  entry.used = false;
  entry.dirty = false;

  return true;
}

TranslationEntry *
AddressSpace::lookup(const uint64_t vPage)
{
  return pageTable.lookup(vPage);
}

TranslationEntry &
AddressSpace::getEntry(const uint64_t vPage)
{
  TranslationEntry *entry = pageTable.lookup(vPage);
  if (!entry)
    throw std::logic_error("AddressSpace: requested translation entry does not exist");

  return *entry;
}

void
AddressSpace::releaseAll(void)
{
  /* Invalidate first, so no entry refers to a page that is back in the
   * pool.
   */
  pageTable.clear();

  for (uint64_t pPage : usedPages)
    physMemManager.releasePage(pPage);
  usedPages.clear();
}
