/* userproc -- A framework to experiment with process management
 *
 *    physmemmanager.h - Physical Memory Manager
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __PHYSMEMMANAGER_H__
#define __PHYSMEMMANAGER_H__

#include <cstdint>
#include <list>
#include <mutex>


struct Hole
{
  uint64_t startPage;
  uint64_t count;

  Hole(uint64_t start, uint64_t cnt) : startPage(start), count(cnt) {}
};

/* Keeps track of which physical pages are free. Shared by every process
 * in the system, all methods may be called concurrently.
 */
class PhysMemManager
{
  protected:
    const uint64_t nPages;

    uint64_t nAllocatedPages;
    uint64_t maxAllocatedPages;

    /* Hole list: maintains free page ranges */
    std::list<Hole> holes;

    mutable std::mutex lock;

    /* Helper methods for hole management, to be called with lock held */
    void mergeHoles();
    std::list<Hole>::iterator findFit(size_t count);
    std::list<Hole>::const_iterator findHole(uint64_t page) const;

  public:
    explicit PhysMemManager(const uint64_t nPages);
    ~PhysMemManager();

    /* Take one page from the free pool. Returns false if none is left. */
    bool      allocatePage(uint64_t &pPage);

    /* Return a page to the free pool. The page must not be referenced by
     * any page table anymore.
     */
    void      releasePage(const uint64_t pPage);

    uint64_t  getNumPages(void) const;
    uint64_t  getFreePageCount(void) const;
    bool      isFree(const uint64_t pPage) const;

    bool      allReleased(void) const;
    uint64_t  getMaxAllocatedPages(void) const;

    PhysMemManager(const PhysMemManager &) = delete;
    PhysMemManager &operator=(const PhysMemManager &) = delete;
};

#endif /* __PHYSMEMMANAGER_H__ */
