/* userproc -- A framework to experiment with process management
 *
 *    translation.h - Page table format understood by the MMU
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __TRANSLATION_H__
#define __TRANSLATION_H__

#include <cstdint>
#include <cstddef>
#include <vector>

/* One virtual-to-physical page mapping plus its access bits. */
struct TranslationEntry
{
  uint64_t vpn;
  uint64_t ppn;
  bool valid;
  bool readOnly;
  bool used;       /* referenced bit, set by the MMU on every access */
  bool dirty;      /* set by the MMU on a write access */

  TranslationEntry()
    : vpn(0), ppn(0), valid(false), readOnly(false), used(false), dirty(false)
  {}
};

/* Linear page table, indexed directly by virtual page number. The table
 * has a fixed number of entries; numbers beyond the end are simply
 * unmapped.
 */
class PageTable
{
  protected:
    std::vector<TranslationEntry> entries;

  public:
    explicit PageTable(const size_t nEntries);

    size_t  size(void) const
    {
      return entries.size();
    }

    /* Returns the entry for vPage when it holds a valid mapping, nullptr
     * otherwise.
     */
    TranslationEntry       *lookup(const uint64_t vPage);
    const TranslationEntry *lookup(const uint64_t vPage) const;

    /* Raw access to a slot, valid or not. Throws std::out_of_range when
     * vPage lies beyond the table.
     */
    TranslationEntry       &slot(const uint64_t vPage);

    void    clear(void);
};

#endif /* __TRANSLATION_H__ */
