/* userproc -- A framework to experiment with process management
 *
 *    mmu.h - Memory Management Unit component
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __MMU_H__
#define __MMU_H__

#include "machine.h"
#include "translation.h"

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <vector>


enum class MemAccessType
{
  Load,
  Store
};

/* Describes one transfer between a kernel buffer and user memory. */
struct MemAccess
{
  MemAccessType type;
  uint64_t addr;
  uint64_t size;
};

std::ostream &operator<<(std::ostream &os, const MemAccess &access);

/* Raised when a store targets a page mapped read-only. The kernel never
 * hands out such addresses for writing, so reaching this is a defect in
 * the caller rather than a user error.
 */
class ProtectionFault : public std::runtime_error
{
  protected:
    uint64_t vAddr;

  public:
    explicit ProtectionFault(const uint64_t vAddr);

    uint64_t getAddress(void) const
    {
      return vAddr;
    }
};

class MMU
{
  protected:
    Machine &machine;

    size_t    transfer(PageTable &pageTable, const MemAccess &access,
                       uint8_t *buffer);

  public:
    explicit MMU(Machine &machine);
    ~MMU();

    uint64_t  getPageSize(void) const;

    /* Translate a single virtual address. Returns false when the page
     * holding vAddr is not mapped. Sets the referenced bit, and the dirty
     * bit if isWrite is set.
     */
    bool      getTranslation(PageTable &pageTable, const uint64_t vAddr,
                             bool isWrite, uint64_t &pAddr);

    /* Copy length bytes starting at virtual address vAddr into data,
     * beginning at data[offset]. Stops at the first unmapped page and
     * returns the number of bytes actually transferred.
     */
    size_t    readVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                                std::vector<uint8_t> &data,
                                const size_t offset, const size_t length);
    size_t    readVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                                std::vector<uint8_t> &data);

    /* Counterpart of readVirtualMemory. Throws ProtectionFault when a
     * read-only page is reached; bytes stored before that point remain.
     */
    size_t    writeVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                                 const std::vector<uint8_t> &data,
                                 const size_t offset, const size_t length);
    size_t    writeVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                                 const std::vector<uint8_t> &data);

    MMU(const MMU &) = delete;
    MMU &operator=(const MMU &) = delete;
};


#endif /* __MMU_H__ */
