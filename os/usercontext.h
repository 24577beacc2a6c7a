/* userproc -- A framework to experiment with process management
 *
 *    usercontext.h - What a running program sees of the machine
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __USERCONTEXT_H__
#define __USERCONTEXT_H__

#include "processor.h"

#include <cstdint>
#include <string>
#include <vector>

class UserProcess;

/* Programs execute "in user mode": they only touch their own virtual
 * memory and enter the kernel by trapping with a syscall number in V0.
 * The wrappers below play the role of the C library syscall stubs.
 */
class UserContext
{
  protected:
    UserProcess &process;
    Processor &cpu;

  public:
    UserContext(UserProcess &process, Processor &cpu);

    int       getPid(void) const;
    int       getArgc(void) const;
    uint32_t  getArgv(void) const;
    uint32_t  getStackPointer(void) const;

    Processor &getProcessor(void)
    {
      return cpu;
    }

    /* Decode argv from the argument page. */
    std::vector<std::string> getArguments(void);

    /* Raw trap: V0 = number, A0..A3 = arguments, result from V0. */
    int       syscall(const int number, const int a0 = 0, const int a1 = 0,
                      const int a2 = 0, const int a3 = 0);

    /* Raise a CPU exception other than a syscall; the kernel terminates
     * the process.
     */
    [[noreturn]] void raiseException(const int cause);

    /* Loads and stores in the program's own address space. Both return
     * the number of bytes transferred.
     */
    size_t    load(const uint32_t vAddr, std::vector<uint8_t> &data);
    size_t    store(const uint32_t vAddr, const std::vector<uint8_t> &data);

    /* Reserve room on the stack and copy data there. Returns the address
     * of the copy.
     */
    uint32_t  push(const std::vector<uint8_t> &data);
    uint32_t  pushString(const std::string &str);
    uint32_t  pushAddresses(const std::vector<uint32_t> &addrs);

    int       exec(const std::string &name,
                   const std::vector<std::string> &args);
    int       join(const int pid, int32_t &status);
    [[noreturn]] void exit(const int status);
    [[noreturn]] void halt(void);
};

#endif /* __USERCONTEXT_H__ */
