/* userproc -- A framework to experiment with process management
 *
 *    uthread.h - Host thread executing one user process
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __UTHREAD_H__
#define __UTHREAD_H__

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/* Thrown by UThread::finish() to unwind the calling thread back into its
 * trampoline. Deliberately not derived from std::exception, so that
 * handlers for ordinary errors let it pass.
 */
struct ThreadFinished
{
};

class UThread
{
  protected:
    const std::string name;
    std::function<void(void)> body;
    std::thread thread;

    mutable std::mutex lock;
    std::condition_variable finishedCond;
    bool started;
    bool finished;

    void      run(void);

  public:
    UThread(const std::string &name, std::function<void(void)> body);
    ~UThread();

    const std::string &getName(void) const
    {
      return name;
    }

    /* Start executing the body on a new host thread. */
    void      fork(void);

    /* Block until the thread has finished. There is no timeout: joining
     * a thread that never finishes blocks forever.
     */
    void      join(void);

    bool      isFinished(void) const;

    /* Wait for the host thread itself to go away. Must not be called from
     * the thread being reaped.
     */
    void      reap(void);

    /* End the calling UThread. Must be called on a UThread. */
    [[noreturn]] static void finish(void);

    UThread(const UThread &) = delete;
    UThread &operator=(const UThread &) = delete;
};

#endif /* __UTHREAD_H__ */
