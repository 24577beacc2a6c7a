/* userproc -- A framework to experiment with process management
 *
 *    oskernel.h - The kernel: owns the shared resources all processes use
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __OSKERNEL_H__
#define __OSKERNEL_H__

#include "machine.h"
#include "mmu.h"
#include "physmemmanager.h"
#include "processtable.h"
#include "executable.h"
#include "filetable.h"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class UThread;

class OSKernel
{
  protected:
    Machine &machine;          /* no ownership */
    ExecutableLoader &loader;  /* no ownership */
    FileTableFactory fileTableFactory;

    PhysMemManager physMemManager;
    MMU mmu;

    /* Every thread ever started, reaped on destruction. Once shuttingDown
     * is set no new threads are started.
     */
    std::mutex threadsLock;
    std::vector<std::shared_ptr<UThread>> threads;
    bool shuttingDown;

    /* Declared after physMemManager: processes return their pages to it
     * when the table drops them.
     */
    ProcessTable processTable;

    mutable std::mutex terminateLock;
    std::condition_variable terminateCond;
    bool terminated;

    void      reapThreads(void);

  public:
    OSKernel(Machine &machine, ExecutableLoader &loader,
             FileTableFactory fileTableFactory = nullptr);
    ~OSKernel();

    /* Start the root process. Returns its PID, or ExecErrorCode if the
     * executable could not be loaded.
     */
    int       run(const std::string &name,
                  const std::vector<std::string> &args);

    /* Block until the root process exited or the machine was halted. */
    void      waitForTermination(void);
    void      terminate(void);
    bool      isTerminated(void) const;

    /* Fork a new thread running body. Returns nullptr once the kernel
     * has terminated or is being destroyed.
     */
    std::shared_ptr<UThread>   startThread(const std::string &name,
                                           std::function<void(void)> body);
    std::unique_ptr<FileTable> createFileTable(void);

    Machine          &getMachine(void)
    {
      return machine;
    }

    ExecutableLoader &getLoader(void)
    {
      return loader;
    }

    PhysMemManager   &getPhysMemManager(void)
    {
      return physMemManager;
    }

    MMU              &getMMU(void)
    {
      return mmu;
    }

    ProcessTable     &getProcessTable(void)
    {
      return processTable;
    }

    OSKernel(const OSKernel &) = delete;
    OSKernel &operator=(const OSKernel &) = delete;
};

#endif /* __OSKERNEL_H__ */
