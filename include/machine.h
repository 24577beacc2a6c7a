/* userproc -- A framework to experiment with process management
 *
 *    machine.h - Simulated machine: physical memory and power switch
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __MACHINE_H__
#define __MACHINE_H__

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

using HaltFunction = std::function<void(void)>;

class Machine
{
  protected:
    void *baseAddress;
    const uint64_t pageSize;
    const uint64_t nPhysPages;
    const uint64_t memorySize;

    std::mutex haltLock;
    HaltFunction haltHandler;
    std::atomic<bool> halted;

  public:
    Machine(const uint64_t pageSize, const uint64_t nPhysPages);
    ~Machine();

    uint8_t  *getMemory(void);
    uint8_t  *getPageAddress(const uint64_t pPage);

    uint64_t  getPageSize(void) const
    {
      return pageSize;
    }

    uint64_t  getNumPhysPages(void) const
    {
      return nPhysPages;
    }

    uint64_t  getMemorySize(void) const
    {
      return memorySize;
    }

    void      setHaltHandler(HaltFunction handler);
    void      halt(void);
    bool      isHalted(void) const;

    Machine(const Machine &) = delete;
    Machine &operator=(const Machine &) = delete;
};

#endif /* __MACHINE_H__ */
