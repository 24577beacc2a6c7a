/* userproc -- A framework to experiment with process management
 *
 *    usercontext.cc - What a running program sees of the machine
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "usercontext.h"
#include "userprocess.h"
#include "settings.h"

#include <cstring>
#include <stdexcept>


UserContext::UserContext(UserProcess &process, Processor &cpu)
  : process(process), cpu(cpu)
{
}

int
UserContext::getPid(void) const
{
  return process.getPid();
}

int
UserContext::getArgc(void) const
{
  return cpu.readRegister(regA0);
}

uint32_t
UserContext::getArgv(void) const
{
  return cpu.readRegister(regA1);
}

uint32_t
UserContext::getStackPointer(void) const
{
  return cpu.readRegister(regSP);
}

std::vector<std::string>
UserContext::getArguments(void)
{
  const int argc = getArgc();
  std::vector<std::string> args;

  std::vector<uint8_t> table(static_cast<size_t>(argc) * 4);
  if (load(getArgv(), table) != table.size())
    throw std::runtime_error("argument vector not readable");

  for (int i = 0; i < argc; ++i)
    {
      uint32_t addr;
      std::memcpy(&addr, table.data() + i * 4, sizeof(addr));

      std::string arg;
      if (!process.readVirtualMemoryString(addr, MaxArgLength, arg))
        throw std::runtime_error("argument string not readable");
      args.push_back(arg);
    }

  return args;
}

int
UserContext::syscall(const int number, const int a0, const int a1,
                     const int a2, const int a3)
{
  cpu.writeRegister(regV0, number);
  cpu.writeRegister(regA0, a0);
  cpu.writeRegister(regA1, a1);
  cpu.writeRegister(regA2, a2);
  cpu.writeRegister(regA3, a3);

  process.handleException(cpu, exceptionSyscall);

  return cpu.readRegister(regV0);
}

void
UserContext::raiseException(const int cause)
{
  process.handleException(cpu, cause);
  throw std::logic_error("process survived a fatal exception");
}

size_t
UserContext::load(const uint32_t vAddr, std::vector<uint8_t> &data)
{
  return process.readVirtualMemory(vAddr, data);
}

size_t
UserContext::store(const uint32_t vAddr, const std::vector<uint8_t> &data)
{
  return process.writeVirtualMemory(vAddr, data);
}

uint32_t
UserContext::push(const std::vector<uint8_t> &data)
{
  /* keep the stack pointer word aligned */
  const uint32_t size = (data.size() + 3) & ~3u;
  const uint32_t sp = getStackPointer() - size;

  if (store(sp, data) != data.size())
    throw std::runtime_error("stack overflow");

  cpu.writeRegister(regSP, sp);
  return sp;
}

uint32_t
UserContext::pushString(const std::string &str)
{
  std::vector<uint8_t> bytes(str.begin(), str.end());
  bytes.push_back(0);
  return push(bytes);
}

uint32_t
UserContext::pushAddresses(const std::vector<uint32_t> &addrs)
{
  std::vector<uint8_t> bytes(addrs.size() * sizeof(uint32_t));
  if (!addrs.empty())
    std::memcpy(bytes.data(), addrs.data(), bytes.size());
  return push(bytes);
}

int
UserContext::exec(const std::string &name, const std::vector<std::string> &args)
{
  const int32_t savedSP = cpu.readRegister(regSP);

  const uint32_t nameAddr = pushString(name);
  std::vector<uint32_t> argvAddrs;
  for (const std::string &arg : args)
    argvAddrs.push_back(pushString(arg));
  const uint32_t argvAddr = pushAddresses(argvAddrs);

  const int result = syscall(syscallExec, nameAddr, args.size(), argvAddr);

  cpu.writeRegister(regSP, savedSP);
  return result;
}

int
UserContext::join(const int pid, int32_t &status)
{
  const int32_t savedSP = cpu.readRegister(regSP);

  const uint32_t statusAddr = push(std::vector<uint8_t>(sizeof(status), 0));
  const int result = syscall(syscallJoin, pid, statusAddr);

  std::vector<uint8_t> bytes(sizeof(status));
  if (load(statusAddr, bytes) == bytes.size())
    std::memcpy(&status, bytes.data(), sizeof(status));

  cpu.writeRegister(regSP, savedSP);
  return result;
}

void
UserContext::exit(const int status)
{
  syscall(syscallExit, status);
  throw std::logic_error("exit() returned");
}

void
UserContext::halt(void)
{
  syscall(syscallHalt);
  throw std::logic_error("halt() returned");
}
