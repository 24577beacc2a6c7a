/* userproc -- A framework to experiment with process management
 *
 *    processor.h - User-mode register file of the simulated CPU
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __PROCESSOR_H__
#define __PROCESSOR_H__

#include <array>
#include <cstdint>

/* MIPS register numbering, as used by the syscall calling convention:
 * syscall number in V0, arguments in A0..A3, result back in V0.
 */
const static int regV0 = 2;
const static int regV1 = 3;
const static int regA0 = 4;
const static int regA1 = 5;
const static int regA2 = 6;
const static int regA3 = 7;
const static int regSP = 29;
const static int regRA = 31;
const static int regHi = 32;
const static int regLo = 33;
const static int regPC = 34;
const static int regNextPC = 35;
const static int numUserRegisters = 40;

/* Exception causes raised by the CPU. */
enum ExceptionCause
{
  exceptionSyscall = 0,
  exceptionPageFault,
  exceptionTLBMiss,
  exceptionReadOnly,
  exceptionBusError,
  exceptionAddressError,
  exceptionOverflow,
  exceptionIllegalInstruction,
  numExceptionTypes
};

extern const char *exceptionNames[numExceptionTypes];

/* Every user thread runs on its own Processor instance; the register
 * file therefore needs no locking.
 */
class Processor
{
  protected:
    std::array<int32_t, numUserRegisters> registers;

  public:
    Processor();

    int32_t readRegister(const int reg) const;
    void    writeRegister(const int reg, const int32_t value);

    /* Move PC past the instruction that trapped. */
    void    advancePC(void);

    void    clearRegisters(void);
};

#endif /* __PROCESSOR_H__ */
