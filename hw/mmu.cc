/* userproc -- A framework to experiment with process management
 *
 *    mmu.cc - Memory Management Unit component
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "mmu.h"
#include "settings.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>


std::ostream &
operator<<(std::ostream &os, const MemAccess &access)
{
  os << (access.type == MemAccessType::Load ? "load " : "store ")
     << std::hex << std::showbase << access.addr
     << std::dec << " (" << access.size << " bytes)";
  return os;
}

static std::string
faultMessage(const uint64_t vAddr)
{
  std::ostringstream ss;
  ss << "MMU: write to read-only page at virtual address "
     << std::hex << std::showbase << vAddr;
  return ss.str();
}

ProtectionFault::ProtectionFault(const uint64_t vAddr)
  : std::runtime_error(faultMessage(vAddr)), vAddr(vAddr)
{
}

MMU::MMU(Machine &machine)
  : machine(machine)
{
}

MMU::~MMU()
{
}

uint64_t
MMU::getPageSize(void) const
{
  return machine.getPageSize();
}

bool
MMU::getTranslation(PageTable &pageTable, const uint64_t vAddr,
                    bool isWrite, uint64_t &pAddr)
{
  const uint64_t pageSize = machine.getPageSize();
  const uint64_t vPage = vAddr / pageSize;

  TranslationEntry *entry = pageTable.lookup(vPage);
  if (!entry)
    return false;

  if (isWrite && entry->readOnly)
    throw ProtectionFault(vAddr);

  if (entry->ppn >= machine.getNumPhysPages())
    throw std::logic_error("MMU: page table entry refers to non-existing physical page");

  entry->used = true;
  if (isWrite)
    entry->dirty = true;

  pAddr = entry->ppn * pageSize + (vAddr % pageSize);
  return true;
}

/* Moves bytes one page at a time. Every page is translated before any
 * byte of it is touched, so the returned count always equals the number
 * of bytes that reached their destination.
 */
size_t
MMU::transfer(PageTable &pageTable, const MemAccess &access, uint8_t *buffer)
{
  const uint64_t pageSize = machine.getPageSize();
  const bool isWrite = access.type == MemAccessType::Store;
  uint8_t *memory = machine.getMemory();

  if (LogMemoryAccesses)
    std::cerr << "MMU: memory access: " << access << std::endl;

  size_t transferred = 0;
  while (transferred < access.size)
    {
      const uint64_t vAddr = access.addr + transferred;
      if (vAddr < access.addr)
        break; /* wrapped around the address space */

      uint64_t pAddr = 0;
      if (!getTranslation(pageTable, vAddr, isWrite, pAddr))
        break;

      const size_t amount = std::min<uint64_t>(access.size - transferred,
                                               pageSize - (vAddr % pageSize));
      if (isWrite)
        std::memcpy(memory + pAddr, buffer + transferred, amount);
      else
        std::memcpy(buffer + transferred, memory + pAddr, amount);

      transferred += amount;
    }

  if (LogMemoryAccesses && transferred != access.size)
    std::cerr << "MMU: short transfer, " << transferred << " of "
              << access.size << " bytes" << std::endl;

  return transferred;
}

static void
checkBounds(const size_t bufferSize, const size_t offset, const size_t length)
{
  if (offset > bufferSize || length > bufferSize - offset)
    throw std::out_of_range("MMU: transfer exceeds bounds of kernel buffer");
}

size_t
MMU::readVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                       std::vector<uint8_t> &data,
                       const size_t offset, const size_t length)
{
  checkBounds(data.size(), offset, length);
  if (length == 0)
    return 0;

  MemAccess access{ MemAccessType::Load, vAddr, length };
  return transfer(pageTable, access, data.data() + offset);
}

size_t
MMU::readVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                       std::vector<uint8_t> &data)
{
  return readVirtualMemory(pageTable, vAddr, data, 0, data.size());
}

size_t
MMU::writeVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                        const std::vector<uint8_t> &data,
                        const size_t offset, const size_t length)
{
  checkBounds(data.size(), offset, length);
  if (length == 0)
    return 0;

  MemAccess access{ MemAccessType::Store, vAddr, length };
  /* transfer() only reads from the buffer on a store. */
  return transfer(pageTable, access,
                  const_cast<uint8_t *>(data.data()) + offset);
}

size_t
MMU::writeVirtualMemory(PageTable &pageTable, const uint64_t vAddr,
                        const std::vector<uint8_t> &data)
{
  return writeVirtualMemory(pageTable, vAddr, data, 0, data.size());
}
