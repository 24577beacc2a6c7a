/* userproc -- A framework to experiment with process management
 *
 *    physmemmanager.cc - Physical Memory Manager
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "physmemmanager.h"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>


PhysMemManager::PhysMemManager(const uint64_t nPages)
  : nPages(nPages), nAllocatedPages(0), maxAllocatedPages(0),
    holes(), lock()
{
  /* Initialize hole list with one large hole covering all memory */
  if (nPages > 0)
    holes.emplace_back(0, nPages);
}

PhysMemManager::~PhysMemManager()
{
  if (nAllocatedPages != 0)
    std::cerr << "PhysMemManager: error: " << nAllocatedPages
              << " pages were not released." << std::endl;
}

std::list<Hole>::iterator
PhysMemManager::findFit(size_t count)
{
  /* First-fit algorithm: find the first hole that can accommodate 'count' pages */
  for (auto it = holes.begin(); it != holes.end(); ++it) {
    if (it->count >= count) {
      return it;
    }
  }
  return holes.end();
}

std::list<Hole>::const_iterator
PhysMemManager::findHole(uint64_t page) const
{
  for (auto it = holes.begin(); it != holes.end(); ++it) {
    if (page >= it->startPage && page < it->startPage + it->count) {
      return it;
    }
  }
  return holes.end();
}

void
PhysMemManager::mergeHoles()
{
  /* Sort holes by start page for efficient merging */
  holes.sort([](const Hole &a, const Hole &b) {
    return a.startPage < b.startPage;
  });

  /* Merge adjacent holes */
  auto it = holes.begin();
  while (it != holes.end()) {
    auto next = std::next(it);
    if (next != holes.end() && it->startPage + it->count == next->startPage) {
      it->count += next->count;
      holes.erase(next);
    } else {
      ++it;
    }
  }
}

bool
PhysMemManager::allocatePage(uint64_t &pPage)
{
  std::lock_guard<std::mutex> guard(lock);

  auto it = findFit(1);
  if (it == holes.end())
    return false;

  /* Allocate from the beginning of the found hole */
  pPage = it->startPage;
  it->startPage++;
  it->count--;
  if (it->count == 0)
    holes.erase(it);

  /* Update statistics */
  nAllocatedPages++;
  maxAllocatedPages = std::max(maxAllocatedPages, nAllocatedPages);

  return true;
}

void
PhysMemManager::releasePage(const uint64_t pPage)
{
  std::lock_guard<std::mutex> guard(lock);

  if (pPage >= nPages)
    throw std::logic_error("PhysMemManager: release of non-existing page");
  if (findHole(pPage) != holes.end())
    throw std::logic_error("PhysMemManager: release of page that is already free");

  /* Add the released page as a new hole */
  holes.emplace_back(pPage, 1);

  /* Merge adjacent holes to minimize fragmentation */
  mergeHoles();

  nAllocatedPages--;
}

uint64_t
PhysMemManager::getNumPages(void) const
{
  return nPages;
}

uint64_t
PhysMemManager::getFreePageCount(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return nPages - nAllocatedPages;
}

bool
PhysMemManager::isFree(const uint64_t pPage) const
{
  std::lock_guard<std::mutex> guard(lock);
  return findHole(pPage) != holes.end();
}

bool
PhysMemManager::allReleased(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return nAllocatedPages == 0;
}

uint64_t
PhysMemManager::getMaxAllocatedPages(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return maxAllocatedPages;
}
