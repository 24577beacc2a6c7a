/* userproc -- A framework to experiment with process management
 *
 *    userprocess.cc - User process: address space, loader and the
 *                     process lifecycle syscalls
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "userprocess.h"
#include "usercontext.h"
#include "oskernel.h"
#include "uthread.h"
#include "settings.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>


static bool
hasExecutableSuffix(const std::string &name)
{
  const size_t suffixLength = std::strlen(ExecutableSuffix);

  return name.size() > suffixLength &&
      name.compare(name.size() - suffixLength, suffixLength,
                   ExecutableSuffix) == 0;
}

UserProcess::UserProcess(OSKernel &kernel, const int pid)
  : kernel(kernel), pid(pid),
    addrSpace(kernel.getPhysMemManager(), kernel.getMachine().getNumPhysPages()),
    fileTable(kernel.createFileTable()), executable(), thread(),
    numPages(0), initialPC(0), initialSP(0), argc(0), argv(0),
    stateLock(), status(ProcessStatus::Ready), exitStatus(0)
{
}

UserProcess::~UserProcess()
{
}

void
UserProcess::logEvent(const std::string &message) const
{
  if (LogProcessEvents)
    std::cerr << "PROC " << pid << ": " << message << std::endl;
}

ProcessStatus
UserProcess::getStatus(void) const
{
  std::lock_guard<std::mutex> guard(stateLock);
  return status;
}

int
UserProcess::getExitStatus(void) const
{
  std::lock_guard<std::mutex> guard(stateLock);
  return exitStatus;
}

void
UserProcess::setExited(const int status)
{
  std::lock_guard<std::mutex> guard(stateLock);
  this->status = ProcessStatus::Exited;
  exitStatus = status;
}

std::shared_ptr<UThread>
UserProcess::getThread(void) const
{
  std::lock_guard<std::mutex> guard(stateLock);
  return thread;
}

/*
 * Loading
 */

bool
UserProcess::execute(const std::string &name,
                     const std::vector<std::string> &args)
{
  if (!load(name, args))
    {
      addrSpace.releaseAll();
      return false;
    }

  /* The thread keeps this process alive until it has finished, even when
   * the process table lets go of it earlier.
   */
  auto self = shared_from_this();

  {
    std::lock_guard<std::mutex> guard(stateLock);
    status = ProcessStatus::Running;
  }

  auto newThread = kernel.startThread(name, [self]() { self->run(); });
  if (!newThread)
    {
      logEvent("\tsystem is shutting down");
      {
        std::lock_guard<std::mutex> guard(stateLock);
        status = ProcessStatus::Ready;
      }
      addrSpace.releaseAll();
      return false;
    }

  std::lock_guard<std::mutex> guard(stateLock);
  thread = newThread;
  return true;
}

bool
UserProcess::load(const std::string &name,
                  const std::vector<std::string> &args)
{
  logEvent("load(\"" + name + "\")");

  executable = kernel.getLoader().open(name);
  if (!executable || !executable->program)
    {
      logEvent("\topen failed");
      return false;
    }

  const uint64_t pageSize = kernel.getMachine().getPageSize();

  /* make sure the sections are contiguous and start at page 0 */
  numPages = 0;
  for (const Section &section : executable->sections)
    {
      if (section.firstVPN != numPages)
        {
          logEvent("\tfragmented executable");
          return false;
        }
      if (section.contents.size() > section.numPages * pageSize)
        {
          logEvent("\tsection " + section.name + " larger than its pages");
          return false;
        }
      numPages += section.numPages;
    }

  /* make sure the argv array will fit in one page; 4 bytes for the argv[]
   * pointer, then the string plus one for the null byte
   */
  uint64_t argsSize = 0;
  for (const std::string &arg : args)
    argsSize += 4 + arg.size() + 1;

  if (argsSize > pageSize)
    {
      logEvent("\targuments too long");
      return false;
    }

  /* program counter initially points at the program entry point */
  initialPC = executable->entryPoint;

  /* next comes the stack; stack pointer initially points to top of it */
  numPages += StackPages;
  initialSP = numPages * pageSize;

  /* and finally reserve 1 page for arguments */
  numPages++;

  if (!loadSections())
    return false;

  /* store arguments in last page */
  uint64_t entryOffset = (numPages - 1) * pageSize;
  uint64_t stringOffset = entryOffset + args.size() * 4;

  argc = args.size();
  argv = entryOffset;

  for (const std::string &arg : args)
    {
      const uint32_t stringAddr = stringOffset;
      std::vector<uint8_t> pointer(sizeof(stringAddr));
      std::memcpy(pointer.data(), &stringAddr, sizeof(stringAddr));

      std::vector<uint8_t> bytes(arg.begin(), arg.end());
      bytes.push_back(0);

      if (writeVirtualMemory(entryOffset, pointer) != pointer.size() ||
          writeVirtualMemory(stringOffset, bytes) != bytes.size())
        {
          logEvent("\tcould not store arguments");
          return false;
        }

      entryOffset += pointer.size();
      stringOffset += bytes.size();
    }

  return true;
}

/* Allocates memory for this process and copies the sections into it. If
 * this returns successfully, the process will definitely be run.
 */
bool
UserProcess::loadSections(void)
{
  Machine &machine = kernel.getMachine();
  const uint64_t pageSize = machine.getPageSize();

  if (numPages > machine.getNumPhysPages())
    {
      logEvent("\tinsufficient physical memory");
      return false;
    }

  for (const Section &section : executable->sections)
    {
      std::ostringstream msg;
      msg << "\tinitializing " << section.name << " section ("
          << section.numPages << " pages)";
      logEvent(msg.str());

      for (uint64_t i = 0; i < section.numPages; ++i)
        {
          const uint64_t vpn = section.firstVPN + i;
          if (!addrSpace.mapPage(vpn, section.readOnly))
            {
              logEvent("\tout of physical pages");
              return false;
            }

          uint8_t *page = machine.getPageAddress(addrSpace.getEntry(vpn).ppn);
          std::memset(page, 0, pageSize);

          const uint64_t start = i * pageSize;
          if (start < section.contents.size())
            std::memcpy(page, section.contents.data() + start,
                        std::min<uint64_t>(pageSize,
                                           section.contents.size() - start));
        }
    }

  /* stack pages and the argument page */
  for (uint64_t vpn = numPages - StackPages - 1; vpn < numPages; ++vpn)
    {
      if (!addrSpace.mapPage(vpn))
        {
          logEvent("\tout of physical pages");
          return false;
        }
      std::memset(machine.getPageAddress(addrSpace.getEntry(vpn).ppn),
                  0, pageSize);
    }

  return true;
}

void
UserProcess::initRegisters(Processor &cpu) const
{
  /* by default, everything's 0 */
  cpu.clearRegisters();

  cpu.writeRegister(regPC, initialPC);
  cpu.writeRegister(regNextPC, initialPC + 4);
  cpu.writeRegister(regSP, initialSP);

  cpu.writeRegister(regA0, argc);
  cpu.writeRegister(regA1, argv);
}

void
UserProcess::run(void)
{
  Processor cpu;
  initRegisters(cpu);

  UserContext context(*this, cpu);
  int result = AbnormalExitStatus;

  try
    {
      result = executable->program(context);
    }
  catch (const std::exception &e)
    {
      std::cerr << "PROC " << pid << ": error: program raised: "
                << e.what() << std::endl;
      result = AbnormalExitStatus;
    }

  /* Returning from the program is an implicit exit. */
  handleExit(result);
}

/*
 * Virtual memory
 */

size_t
UserProcess::readVirtualMemory(const uint64_t vAddr, std::vector<uint8_t> &data,
                               const size_t offset, const size_t length)
{
  return kernel.getMMU().readVirtualMemory(addrSpace.getPageTable(), vAddr,
                                           data, offset, length);
}

size_t
UserProcess::readVirtualMemory(const uint64_t vAddr, std::vector<uint8_t> &data)
{
  return readVirtualMemory(vAddr, data, 0, data.size());
}

size_t
UserProcess::writeVirtualMemory(const uint64_t vAddr,
                                const std::vector<uint8_t> &data,
                                const size_t offset, const size_t length)
{
  return kernel.getMMU().writeVirtualMemory(addrSpace.getPageTable(), vAddr,
                                            data, offset, length);
}

size_t
UserProcess::writeVirtualMemory(const uint64_t vAddr,
                                const std::vector<uint8_t> &data)
{
  return writeVirtualMemory(vAddr, data, 0, data.size());
}

bool
UserProcess::readVirtualMemoryString(const uint64_t vAddr,
                                     const size_t maxLength,
                                     std::string &str)
{
  std::vector<uint8_t> bytes(maxLength + 1);

  const size_t bytesRead = readVirtualMemory(vAddr, bytes);

  for (size_t length = 0; length < bytesRead; ++length)
    {
      if (bytes[length] == 0)
        {
          str.assign(bytes.begin(), bytes.begin() + length);
          return true;
        }
    }

  return false;
}

/*
 * Syscalls
 */

void
UserProcess::handleException(Processor &cpu, const int cause)
{
  /* Once the machine has halted nothing gets serviced any more. */
  if (kernel.isTerminated())
    handleShutdown();

  if (cause == exceptionSyscall)
    {
      const int result = handleSyscall(cpu.readRegister(regV0),
                                       cpu.readRegister(regA0),
                                       cpu.readRegister(regA1),
                                       cpu.readRegister(regA2),
                                       cpu.readRegister(regA3));
      /* The machine may have halted while the call blocked. */
      if (kernel.isTerminated())
        handleShutdown();

      cpu.writeRegister(regV0, result);
      cpu.advancePC();
      return;
    }

  std::cerr << "PROC " << pid << ": error: unexpected exception: "
            << (cause >= 0 && cause < numExceptionTypes ?
                exceptionNames[cause] : "unknown")
            << std::endl;
  handleExit(AbnormalExitStatus);
}

int
UserProcess::handleSyscall(const int syscall, const int a0, const int a1,
                           const int a2, const int a3)
{
  switch (syscall)
    {
      case syscallHalt:
        handleHalt();

      case syscallExit:
        handleExit(a0);

      case syscallExec:
        {
          /* a1 pointers of 4 bytes each cannot exceed a page, as the
           * arguments have to fit in one.
           */
          const uint64_t pageSize = kernel.getMachine().getPageSize();
          if (a1 < 0 || static_cast<uint64_t>(a1) * 4 > pageSize)
            return ExecErrorCode;

          std::vector<uint8_t> table(static_cast<size_t>(a1) * 4);
          if (readVirtualMemory(static_cast<uint32_t>(a2), table) != table.size())
            return ExecErrorCode;

          std::vector<uint32_t> argvAddrs(a1);
          if (!table.empty())
            std::memcpy(argvAddrs.data(), table.data(), table.size());

          return handleExec(static_cast<uint32_t>(a0), a1, argvAddrs);
        }

      case syscallJoin:
        return handleJoin(a0, static_cast<uint32_t>(a1));

      case syscallCreate:
      case syscallOpen:
      case syscallRead:
      case syscallWrite:
      case syscallClose:
      case syscallUnlink:
        return fileTable->handleSyscall(syscall, a0, a1, a2, a3);

      default:
        std::cerr << "PROC " << pid << ": error: unknown syscall "
                  << syscall << std::endl;
        return UnknownSyscallCode;
    }
}

void
UserProcess::handleHalt(void)
{
  if (pid != RootProcessID)
    {
      std::cerr << "PROC " << pid << ": error: halt() is reserved for the "
                << "root process, terminating caller." << std::endl;
      handleExit(AbnormalExitStatus);
    }

  logEvent("halt()");
  kernel.terminate();

  handleShutdown();
}

void
UserProcess::handleExit(const int status)
{
  logEvent("exit(" + std::to_string(status) + ")");
  ProcessTable &processTable = kernel.getProcessTable();

  fileTable->closeAll();

  std::vector<int> orphans = processTable.orphanChildren(pid);
  if (!orphans.empty())
    logEvent("\torphaned " + std::to_string(orphans.size()) + " children");

  addrSpace.releaseAll();

  processTable.markExited(pid, status);

  /* The root process going away takes the system down with it. */
  if (pid == RootProcessID)
    kernel.terminate();

  UThread::finish();
}

void
UserProcess::handleShutdown(void)
{
  logEvent("machine halted, stopping");
  handleExit(AbnormalExitStatus);
}

int
UserProcess::handleExec(const uint32_t nameAddr, const int argc,
                        const std::vector<uint32_t> &argvAddrs)
{
  std::string name;
  if (!readVirtualMemoryString(nameAddr, MaxArgLength, name))
    {
      logEvent("exec: unreadable file name");
      return ExecErrorCode;
    }

  if (!hasExecutableSuffix(name))
    {
      logEvent("exec(\"" + name + "\"): not an executable");
      return ExecErrorCode;
    }

  if (argc < 0 || static_cast<size_t>(argc) != argvAddrs.size())
    {
      logEvent("exec(\"" + name + "\"): argument count mismatch");
      return ExecErrorCode;
    }

  std::vector<std::string> args(argc);
  for (int i = 0; i < argc; ++i)
    {
      if (!readVirtualMemoryString(argvAddrs[i], MaxArgLength, args[i]))
        {
          logEvent("exec(\"" + name + "\"): unreadable argument");
          return ExecErrorCode;
        }
    }

  if (kernel.isTerminated())
    {
      logEvent("exec(\"" + name + "\"): machine halted");
      return ExecErrorCode;
    }

  ProcessTable &processTable = kernel.getProcessTable();
  auto child = std::make_shared<UserProcess>(kernel, processTable.allocatePid());
  const int childPid = child->getPid();

  processTable.registerChild(pid, child);

  if (!child->execute(name, args))
    {
      logEvent("exec(\"" + name + "\"): load failed");
      processTable.unregisterChild(pid, childPid);
      return ExecErrorCode;
    }

  logEvent("exec(\"" + name + "\") = " + std::to_string(childPid));
  return childPid;
}

int
UserProcess::handleJoin(const int childPid, const uint32_t statusAddr)
{
  ProcessTable &processTable = kernel.getProcessTable();

  auto child = processTable.lookupChild(pid, childPid);
  if (!child)
    return NoSuchChildCode;

  logEvent("join(" + std::to_string(childPid) + ")");

  /* Returns immediately if the child is done, otherwise waits. */
  auto childThread = child->getThread();
  if (!childThread)
    throw std::logic_error("UserProcess: child process has no thread");
  childThread->join();

  const int32_t childExitStatus = child->getExitStatus();

  /* From here on the child cannot be joined again, whatever happens to
   * the status write.
   */
  processTable.unregisterChild(pid, childPid);

  std::vector<uint8_t> bytes(sizeof(childExitStatus));
  std::memcpy(bytes.data(), &childExitStatus, sizeof(childExitStatus));

  try
    {
      if (writeVirtualMemory(statusAddr, bytes) != bytes.size())
        return JoinErrorCode;
    }
  catch (const ProtectionFault &e)
    {
      std::cerr << "PROC " << pid << ": error: join: " << e.what() << std::endl;
      return JoinErrorCode;
    }

  return JoinSuccessCode;
}
