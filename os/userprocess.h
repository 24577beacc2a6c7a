/* userproc -- A framework to experiment with process management
 *
 *    userprocess.h - User process: address space, loader and the
 *                    process lifecycle syscalls
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __USERPROCESS_H__
#define __USERPROCESS_H__

#include "addrspace.h"
#include "executable.h"
#include "filetable.h"
#include "processor.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class OSKernel;
class UThread;

enum class ProcessStatus
{
  Ready,
  Running,
  Exited
};

/* Syscall numbers */
const static int syscallHalt = 0;
const static int syscallExit = 1;
const static int syscallExec = 2;
const static int syscallJoin = 3;
const static int syscallCreate = 4;
const static int syscallOpen = 5;
const static int syscallRead = 6;
const static int syscallWrite = 7;
const static int syscallClose = 8;
const static int syscallUnlink = 9;

/* Syscall return codes */
const static int ExecErrorCode = -1;
const static int JoinSuccessCode = 1;
const static int JoinErrorCode = 0;
const static int NoSuchChildCode = -1;
const static int UnknownSyscallCode = -1;

/* Exit status of a process that was terminated by the kernel. */
const static int AbnormalExitStatus = -1;

class UserProcess : public std::enable_shared_from_this<UserProcess>
{
  protected:
    OSKernel &kernel;  /* no ownership */
    const int pid;

    AddressSpace addrSpace;
    std::unique_ptr<FileTable> fileTable;
    std::shared_ptr<const Executable> executable;
    std::shared_ptr<UThread> thread;

    /* Layout established by load() */
    uint64_t numPages;
    uint32_t initialPC;
    uint32_t initialSP;
    int argc;
    uint32_t argv;

    mutable std::mutex stateLock;
    ProcessStatus status;
    int exitStatus;

    bool      load(const std::string &name,
                   const std::vector<std::string> &args);
    bool      loadSections(void);

    /* Body of the process's thread */
    void      run(void);

    void      logEvent(const std::string &message) const;

  public:
    UserProcess(OSKernel &kernel, const int pid);
    ~UserProcess();

    int            getPid(void) const
    {
      return pid;
    }

    ProcessStatus  getStatus(void) const;
    int            getExitStatus(void) const;
    void           setExited(const int status);

    AddressSpace  &getAddressSpace(void)
    {
      return addrSpace;
    }

    std::shared_ptr<UThread> getThread(void) const;

    /* Load the named executable and start a thread running it. Returns
     * false, with every page released again, if loading failed.
     */
    bool      execute(const std::string &name,
                      const std::vector<std::string> &args);

    /* Set PC, SP and the argc/argv argument registers. */
    void      initRegisters(Processor &cpu) const;

    size_t    readVirtualMemory(const uint64_t vAddr, std::vector<uint8_t> &data,
                                const size_t offset, const size_t length);
    size_t    readVirtualMemory(const uint64_t vAddr, std::vector<uint8_t> &data);
    size_t    writeVirtualMemory(const uint64_t vAddr,
                                 const std::vector<uint8_t> &data,
                                 const size_t offset, const size_t length);
    size_t    writeVirtualMemory(const uint64_t vAddr,
                                 const std::vector<uint8_t> &data);

    /* Read a null-terminated string of at most maxLength characters.
     * Returns false if no terminator was found in the readable range.
     */
    bool      readVirtualMemoryString(const uint64_t vAddr,
                                      const size_t maxLength,
                                      std::string &str);

    /* Trap entry: decode the registers of cpu and dispatch. */
    void      handleException(Processor &cpu, const int cause);
    int       handleSyscall(const int syscall, const int a0, const int a1,
                            const int a2, const int a3);

    [[noreturn]] void handleHalt(void);
    [[noreturn]] void handleExit(const int status);
    /* End the caller after the machine halted. */
    [[noreturn]] void handleShutdown(void);
    int       handleExec(const uint32_t nameAddr, const int argc,
                         const std::vector<uint32_t> &argvAddrs);
    int       handleJoin(const int childPid, const uint32_t statusAddr);

    UserProcess(const UserProcess &) = delete;
    UserProcess &operator=(const UserProcess &) = delete;
};

#endif /* __USERPROCESS_H__ */
