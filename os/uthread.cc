/* userproc -- A framework to experiment with process management
 *
 *    uthread.cc - Host thread executing one user process
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "uthread.h"

#include <stdexcept>
#include <utility>


UThread::UThread(const std::string &name, std::function<void(void)> body)
  : name(name), body(std::move(body)), thread(), lock(), finishedCond(),
    started(false), finished(false)
{
}

UThread::~UThread()
{
  if (!thread.joinable())
    return;

  if (thread.get_id() == std::this_thread::get_id())
    thread.detach();
  else
    thread.join();
}

void
UThread::run(void)
{
  try
    {
      body();
    }
  catch (const ThreadFinished &)
    {
    }

  /* Drop whatever the body captured before announcing completion. */
  body = nullptr;

  {
    std::lock_guard<std::mutex> guard(lock);
    finished = true;
  }
  finishedCond.notify_all();
}

void
UThread::fork(void)
{
  std::lock_guard<std::mutex> guard(lock);
  if (started)
    throw std::logic_error("UThread: thread " + name + " forked twice");

  /* run() only takes the lock once the body has returned, so the new
   * thread cannot get stuck on it while we hold it here.
   */
  thread = std::thread(&UThread::run, this);
  started = true;
}

void
UThread::join(void)
{
  std::unique_lock<std::mutex> guard(lock);
  if (!started)
    throw std::logic_error("UThread: join on thread " + name + " that was never forked");

  finishedCond.wait(guard, [this] { return finished; });
}

bool
UThread::isFinished(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return finished;
}

void
UThread::reap(void)
{
  std::thread host;
  {
    std::lock_guard<std::mutex> guard(lock);
    if (!thread.joinable())
      return;
    if (thread.get_id() == std::this_thread::get_id())
      throw std::logic_error("UThread: thread " + name + " cannot reap itself");
    host = std::move(thread);
  }

  host.join();
}

void
UThread::finish(void)
{
  throw ThreadFinished();
}
