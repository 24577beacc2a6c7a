/* userproc -- A framework to experiment with process management
 *
 *    oskernel.cc - The kernel: owns the shared resources all processes use
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "oskernel.h"
#include "userprocess.h"
#include "uthread.h"
#include "settings.h"

#include <iostream>
#include <system_error>
#include <utility>


OSKernel::OSKernel(Machine &machine, ExecutableLoader &loader,
                   FileTableFactory fileTableFactory)
  : machine(machine), loader(loader),
    fileTableFactory(std::move(fileTableFactory)),
    physMemManager(machine.getNumPhysPages()), mmu(machine),
    threadsLock(), threads(), shuttingDown(false), processTable(),
    terminateLock(), terminateCond(), terminated(false)
{
  std::cerr << "KERNEL: " << physMemManager.getNumPages()
            << " physical pages for user processes." << std::endl;
}

OSKernel::~OSKernel()
{
  {
    std::lock_guard<std::mutex> guard(threadsLock);
    shuttingDown = true;
  }

  reapThreads();

  if (processTable.getNumProcesses() != 0)
    std::cerr << "KERNEL: " << processTable.getNumProcesses()
              << " processes still registered at shutdown." << std::endl;
}

void
OSKernel::reapThreads(void)
{
  /* Threads started before shuttingDown was set may still be in the
   * list after the first swap, so keep going until it stays empty.
   */
  while (true)
    {
      std::vector<std::shared_ptr<UThread>> pending;
      {
        std::lock_guard<std::mutex> guard(threadsLock);
        pending.swap(threads);
      }

      if (pending.empty())
        break;

      for (auto &thread : pending)
        thread->reap();
    }
}

int
OSKernel::run(const std::string &name, const std::vector<std::string> &args)
{
  const int pid = processTable.allocatePid();
  auto process = std::make_shared<UserProcess>(*this, pid);
  processTable.registerRoot(process);

  if (!process->execute(name, args))
    {
      std::cerr << "KERNEL: could not start root process \""
                << name << "\"." << std::endl;
      processTable.reap(pid);
      return ExecErrorCode;
    }

  return pid;
}

void
OSKernel::waitForTermination(void)
{
  std::unique_lock<std::mutex> guard(terminateLock);
  terminateCond.wait(guard, [this] { return terminated; });
}

void
OSKernel::terminate(void)
{
  {
    std::lock_guard<std::mutex> guard(terminateLock);
    if (terminated)
      return;
    terminated = true;
  }

  if (LogProcessEvents)
    std::cerr << "KERNEL: terminating." << std::endl;

  machine.halt();
  terminateCond.notify_all();
}

bool
OSKernel::isTerminated(void) const
{
  std::lock_guard<std::mutex> guard(terminateLock);
  return terminated;
}

std::shared_ptr<UThread>
OSKernel::startThread(const std::string &name, std::function<void(void)> body)
{
  /* Forking under threadsLock guarantees that reapThreads() only ever
   * sees threads that are already running.
   */
  std::lock_guard<std::mutex> guard(threadsLock);
  if (shuttingDown || isTerminated())
    return nullptr;

  auto thread = std::make_shared<UThread>(name, std::move(body));
  threads.push_back(thread);
  try
    {
      thread->fork();
    }
  catch (const std::system_error &)
    {
      threads.pop_back();
      throw;
    }
  return thread;
}

std::unique_ptr<FileTable>
OSKernel::createFileTable(void)
{
  if (fileTableFactory)
    return fileTableFactory();

  return std::make_unique<NullFileTable>();
}
