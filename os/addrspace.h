/* userproc -- A framework to experiment with process management
 *
 *    addrspace.h - Per-process virtual address space
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __ADDRSPACE_H__
#define __ADDRSPACE_H__

#include "translation.h"
#include "physmemmanager.h"

#include <cstdint>
#include <vector>

/* The page table of one process together with the physical pages it
 * leases from the PhysMemManager. Only the owning process modifies its
 * address space, so no locking is done here.
 */
class AddressSpace
{
  protected:
    PhysMemManager &physMemManager;  /* no ownership */
    PageTable pageTable;

    /* Physical pages currently leased to this address space */
    std::vector<uint64_t> usedPages;

  public:
    AddressSpace(PhysMemManager &physMemManager, const size_t nEntries);
    ~AddressSpace();

    /* Back virtual page vPage by a fresh physical page. Returns false if
     * the physical memory pool is exhausted.
     */
    bool              mapPage(const uint64_t vPage, bool readOnly = false);

    /* nullptr when vPage has no valid mapping. */
    TranslationEntry *lookup(const uint64_t vPage);

    /* For pages that must be mapped; throws std::logic_error otherwise. */
    TranslationEntry &getEntry(const uint64_t vPage);

    /* Return every leased page to the pool and invalidate all entries. */
    void              releaseAll(void);

    PageTable        &getPageTable(void)
    {
      return pageTable;
    }

    const std::vector<uint64_t> &getUsedPages(void) const
    {
      return usedPages;
    }

    size_t            getNumUsedPages(void) const
    {
      return usedPages.size();
    }

    AddressSpace(const AddressSpace &) = delete;
    AddressSpace &operator=(const AddressSpace &) = delete;
};

#endif /* __ADDRSPACE_H__ */
