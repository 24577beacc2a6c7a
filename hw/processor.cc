/* userproc -- A framework to experiment with process management
 *
 *    processor.cc - User-mode register file of the simulated CPU
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "processor.h"

#include <stdexcept>

const char *exceptionNames[numExceptionTypes] =
{
  "syscall", "page fault", "TLB miss", "read-only",
  "bus error", "address error", "overflow", "illegal instruction"
};

Processor::Processor()
  : registers()
{
  clearRegisters();
}

int32_t
Processor::readRegister(const int reg) const
{
  if (reg < 0 || reg >= numUserRegisters)
    throw std::out_of_range("register number out of range");

  return registers[reg];
}

void
Processor::writeRegister(const int reg, const int32_t value)
{
  if (reg < 0 || reg >= numUserRegisters)
    throw std::out_of_range("register number out of range");

  registers[reg] = value;
}

void
Processor::advancePC(void)
{
  registers[regPC] = registers[regNextPC];
  registers[regNextPC] += 4;
}

void
Processor::clearRegisters(void)
{
  registers.fill(0);
  registers[regNextPC] = 4;
}
