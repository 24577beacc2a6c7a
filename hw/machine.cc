/* userproc -- A framework to experiment with process management
 *
 *    machine.cc - Simulated machine: physical memory and power switch
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "machine.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include <errno.h>
#include <string.h>
#include <sys/mman.h>  /* mmap() */


Machine::Machine(const uint64_t pageSize, const uint64_t nPhysPages)
  : baseAddress(nullptr), pageSize(pageSize), nPhysPages(nPhysPages),
    memorySize(pageSize * nPhysPages), haltLock(), haltHandler(),
    halted(false)
{
  if (pageSize == 0 || nPhysPages == 0)
    throw std::runtime_error("machine needs a non-zero page size and page count.");

  /* Circuit breaker: avoid too large memory allocations to avoid the user
   * of this program getting into trouble. We limit at 2 GiB.
   */
  if (memorySize > 2ULL * 1024 * 1024 * 1024)
    throw std::runtime_error("automatic protection: attempted to allocate more than 2 GiB of memory.");

  /* Try to allocate "physical" memory. Anonymous mappings are zero-filled. */
  baseAddress = mmap(nullptr, memorySize,
                     PROT_READ | PROT_WRITE,
                     MAP_ANONYMOUS | MAP_PRIVATE, -1, 0);
  if (baseAddress == MAP_FAILED)
    throw std::runtime_error("mmap for physical memory failed: "
                             + std::string(strerror(errno)));

  std::cerr << "BOOT: system memory @ "
            << std::hex << std::showbase << baseAddress
            << std::dec
            << " page size of " << pageSize << " bytes, "
            << nPhysPages << " pages available." << std::endl;
}

Machine::~Machine()
{
  munmap(baseAddress, memorySize);
}

uint8_t *
Machine::getMemory(void)
{
  return static_cast<uint8_t *>(baseAddress);
}

uint8_t *
Machine::getPageAddress(const uint64_t pPage)
{
  if (pPage >= nPhysPages)
    throw std::out_of_range("physical page number beyond end of memory");

  return getMemory() + pPage * pageSize;
}

void
Machine::setHaltHandler(HaltFunction handler)
{
  std::lock_guard<std::mutex> guard(haltLock);
  haltHandler = handler;
}

void
Machine::halt(void)
{
  HaltFunction handler;
  {
    std::lock_guard<std::mutex> guard(haltLock);
    if (halted.exchange(true))
      return;
    handler = haltHandler;
  }

  std::cerr << "MACHINE: halting." << std::endl;
  if (handler)
    handler();
}

bool
Machine::isHalted(void) const
{
  return halted;
}
