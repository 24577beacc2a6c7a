/* userproc -- A framework to experiment with process management
 *
 *    tests/lifecycle.cc - exec, exit, join and halt as seen by running
 *                         programs.
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#define BOOST_TEST_MODULE Lifecycle
#include <boost/test/unit_test.hpp>

#include "machine.h"
#include "settings.h"
#include "os/executable.h"
#include "os/filetable.h"
#include "os/oskernel.h"
#include "os/usercontext.h"
#include "os/userprocess.h"
#include "os/uthread.h"

#include <atomic>
#include <cstring>
#include <future>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


BOOST_AUTO_TEST_SUITE(lifecycle_test)

constexpr static uint64_t PageSize = 256;
constexpr static uint64_t NumPages = 64;

/* One text page, the stack and the argument page */
constexpr static uint64_t ImagePages = 1 + StackPages + 1;

class CountingFileTable : public FileTable
{
  protected:
    std::atomic<int> &closed;

  public:
    explicit CountingFileTable(std::atomic<int> &closed)
      : closed(closed)
    {
    }

    virtual int handleSyscall(int syscall, int, int, int, int) override
    {
      return 100 + syscall;
    }

    virtual void closeAll(void) override
    {
      closed++;
    }
};

struct KernelFixture
{
  Machine machine;
  ImageDirectory images;
  std::atomic<int> filesClosed;
  std::unique_ptr<OSKernel> kernel;

  KernelFixture()
    : machine(PageSize, NumPages), images(), filesClosed(0), kernel()
  {
  }

  ~KernelFixture()
  {
    kernel.reset();
  }

  /* Run name as the root process until the system terminates. */
  void boot(const std::string &name,
            const std::vector<std::string> &args = {})
  {
    kernel = std::make_unique<OSKernel>(machine, images, [this]() {
      return std::make_unique<CountingFileTable>(filesClosed);
    });

    BOOST_REQUIRE_EQUAL(kernel->run(name, args), RootProcessID);
    kernel->waitForTermination();
  }

  /* Wait for every remaining thread. */
  void shutdown()
  {
    kernel.reset();
  }

  uint64_t freePages()
  {
    return kernel->getPhysMemManager().getFreePageCount();
  }
};

BOOST_FIXTURE_TEST_CASE( exec_exit_join, KernelFixture )
{
  int childPid = 0, firstJoin = 0, secondJoin = 0;
  int32_t status = 0;
  int childArgc = 0;
  std::vector<std::string> childArgs;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    childPid = ctx.exec("b.coff", { "first", "second" });
    firstJoin = ctx.join(childPid, status);

    int32_t again = 0;
    secondJoin = ctx.join(childPid, again);
    return 0;
  }));

  images.add("b.coff", makeExecutable([&](UserContext &ctx) -> int {
    childArgc = ctx.getArgc();
    childArgs = ctx.getArguments();
    ctx.exit(42);
  }));

  boot("a.coff");
  shutdown();

  BOOST_CHECK_EQUAL(childPid, 1);
  BOOST_CHECK_EQUAL(childArgc, 2);
  BOOST_REQUIRE_EQUAL(childArgs.size(), 2);
  BOOST_CHECK_EQUAL(childArgs[0], "first");
  BOOST_CHECK_EQUAL(childArgs[1], "second");

  BOOST_CHECK_EQUAL(firstJoin, JoinSuccessCode);
  BOOST_CHECK_EQUAL(status, 42);
  BOOST_CHECK_EQUAL(secondJoin, NoSuchChildCode);

  /* Both processes closed their files on the way out */
  BOOST_CHECK_EQUAL(filesClosed.load(), 2);
}

BOOST_FIXTURE_TEST_CASE( status_lands_in_memory, KernelFixture )
{
  int result = 0;
  std::vector<uint8_t> raw(4);

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    const int pid = ctx.exec("b.coff", {});
    const uint32_t statusAddr = ctx.push(std::vector<uint8_t>(4, 0xff));

    result = ctx.syscall(syscallJoin, pid, statusAddr);
    ctx.load(statusAddr, raw);
    return 0;
  }));
  images.add("b.coff", makeExecutable([](UserContext &) { return -1234; }));

  boot("a.coff");
  shutdown();

  int32_t status;
  std::memcpy(&status, raw.data(), sizeof(status));

  BOOST_CHECK_EQUAL(result, JoinSuccessCode);
  BOOST_CHECK_EQUAL(status, -1234);
}

BOOST_FIXTURE_TEST_CASE( exec_rejects_bad_name, KernelFixture )
{
  int badSuffix = 0, missing = 0, removed = 0, goodPid = 0;
  uint64_t freeBefore = 0, freeAfter = 0;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    freeBefore = freePages();
    badSuffix = ctx.exec("b.txt", {});
    freeAfter = freePages();

    /* no ID was used up by the rejected call */
    goodPid = ctx.exec("b.coff", {});

    missing = ctx.exec("missing.coff", {});

    images.remove("b.coff");
    removed = ctx.exec("b.coff", {});
    return 0;
  }));
  images.add("b.coff", makeExecutable([](UserContext &) { return 0; }));
  images.add("b.txt", makeExecutable([](UserContext &) { return 0; }));
  BOOST_CHECK(!images.remove("c.coff"));

  boot("a.coff");
  shutdown();

  BOOST_CHECK_EQUAL(badSuffix, ExecErrorCode);
  BOOST_CHECK_EQUAL(freeBefore, freeAfter);
  BOOST_CHECK_EQUAL(goodPid, 1);
  BOOST_CHECK_EQUAL(missing, ExecErrorCode);
  BOOST_CHECK_EQUAL(removed, ExecErrorCode);
}

BOOST_FIXTURE_TEST_CASE( exec_rejects_bad_arguments, KernelFixture )
{
  int negativeArgc = 0, unmappedName = 0, unmappedArgv = 0, unmappedArg = 0;
  int tooLong = 0;
  uint64_t freeBefore = 0, freeAfter = 0;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    freeBefore = freePages();
    const uint32_t nameAddr = ctx.pushString("b.coff");
    const uint32_t unmapped = 0x40000000;

    negativeArgc = ctx.syscall(syscallExec, nameAddr, -1, 0);
    unmappedName = ctx.syscall(syscallExec, unmapped, 0, 0);
    unmappedArgv = ctx.syscall(syscallExec, nameAddr, 1, unmapped);

    const uint32_t argvAddr = ctx.pushAddresses({ unmapped });
    unmappedArg = ctx.syscall(syscallExec, nameAddr, 1, argvAddr);

    /* Two arguments that do not fit in one argument page together */
    const std::string arg(200, 'x');
    tooLong = ctx.exec("b.coff", { arg, arg });

    freeAfter = freePages();
    return 0;
  }));
  images.add("b.coff", makeExecutable([](UserContext &) { return 0; }));

  boot("a.coff");
  shutdown();

  BOOST_CHECK_EQUAL(negativeArgc, ExecErrorCode);
  BOOST_CHECK_EQUAL(unmappedName, ExecErrorCode);
  BOOST_CHECK_EQUAL(unmappedArgv, ExecErrorCode);
  BOOST_CHECK_EQUAL(unmappedArg, ExecErrorCode);
  BOOST_CHECK_EQUAL(tooLong, ExecErrorCode);
  BOOST_CHECK_EQUAL(freeBefore, freeAfter);
}

BOOST_FIXTURE_TEST_CASE( exec_out_of_memory_does_not_leak, KernelFixture )
{
  int tooBig = 0, exhausted = 0, afterwards = 0;
  uint64_t freeBefore = 0, freeAfterTooBig = 0, freeAfterExhausted = 0;
  size_t processes = 0;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    freeBefore = freePages();

    /* More pages than the machine has */
    tooBig = ctx.exec("huge.coff", {});
    freeAfterTooBig = freePages();

    /* Fits the machine, but one page more than is free */
    exhausted = ctx.exec("big.coff", {});
    freeAfterExhausted = freePages();

    processes = kernel->getProcessTable().getNumProcesses();

    int32_t status = -1;
    const int pid = ctx.exec("b.coff", {});
    afterwards = ctx.join(pid, status);
    return 0;
  }));

  const uint64_t available = NumPages - ImagePages;
  images.add("huge.coff",
             makeExecutable([](UserContext &) { return 0; }, NumPages));
  images.add("big.coff",
             makeExecutable([](UserContext &) { return 0; },
                            available + 1 - (StackPages + 1)));
  images.add("b.coff", makeExecutable([](UserContext &) { return 0; }));

  boot("a.coff");

  BOOST_CHECK_EQUAL(freePages(), NumPages);
  shutdown();

  BOOST_CHECK_EQUAL(freeBefore, available);
  BOOST_CHECK_EQUAL(tooBig, ExecErrorCode);
  BOOST_CHECK_EQUAL(freeAfterTooBig, available);
  BOOST_CHECK_EQUAL(exhausted, ExecErrorCode);
  BOOST_CHECK_EQUAL(freeAfterExhausted, available);

  /* Failed children do not stay behind in the process table */
  BOOST_CHECK_EQUAL(processes, 1);
  BOOST_CHECK_EQUAL(afterwards, JoinSuccessCode);
}

BOOST_FIXTURE_TEST_CASE( exit_orphans_children, KernelFixture )
{
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  std::vector<int> grandchildren;
  int parentPid = 0, joinParent = 0, joinGrandchild = 0;
  int32_t parentStatus = 0;
  std::vector<int> parentLinks;
  bool stillRegistered = true, disjoint = false;
  uint64_t freeWhileBlocked = 0, freeAtEnd = 0;

  images.add("root.coff", makeExecutable([&](UserContext &ctx) {
    ProcessTable &table = kernel->getProcessTable();

    parentPid = ctx.exec("parent.coff", {});
    joinParent = ctx.join(parentPid, parentStatus);

    /* Grandchildren are not ours to join */
    int32_t status = 0;
    joinGrandchild = ctx.join(grandchildren.at(0), status);

    std::set<uint64_t> pages;
    size_t total = 0;
    std::vector<std::shared_ptr<UThread>> threads;
    for (int pid : grandchildren)
      {
        parentLinks.push_back(table.getParentPid(pid));
        auto process = table.lookup(pid);
        for (uint64_t page : process->getAddressSpace().getUsedPages())
          pages.insert(page);
        total += process->getAddressSpace().getNumUsedPages();
        threads.push_back(process->getThread());
      }
    auto self = table.lookup(ctx.getPid());
    for (uint64_t page : self->getAddressSpace().getUsedPages())
      pages.insert(page);
    total += self->getAddressSpace().getNumUsedPages();
    disjoint = pages.size() == total;

    freeWhileBlocked = freePages();

    gate.set_value();
    for (auto &thread : threads)
      thread->join();

    stillRegistered = false;
    for (int pid : grandchildren)
      if (table.lookup(pid))
        stillRegistered = true;

    freeAtEnd = freePages();
    return 0;
  }));

  images.add("parent.coff", makeExecutable([&](UserContext &ctx) -> int {
    for (int i = 0; i < 3; i++)
      grandchildren.push_back(ctx.exec("child.coff", {}));
    ctx.exit(5);
  }));

  images.add("child.coff", makeExecutable([opened](UserContext &) {
    opened.wait();
    return 3;
  }));

  boot("root.coff");
  shutdown();

  BOOST_CHECK_EQUAL(parentPid, 1);
  BOOST_CHECK_EQUAL(joinParent, JoinSuccessCode);
  BOOST_CHECK_EQUAL(parentStatus, 5);
  BOOST_CHECK_EQUAL(joinGrandchild, NoSuchChildCode);

  BOOST_REQUIRE_EQUAL(parentLinks.size(), 3);
  for (int link : parentLinks)
    BOOST_CHECK_EQUAL(link, NoProcessID);

  /* root and three grandchildren hold pages, the parent gave its back */
  BOOST_CHECK(disjoint);
  BOOST_CHECK_EQUAL(freeWhileBlocked, NumPages - 4 * ImagePages);

  /* Orphans are dropped as soon as they exit */
  BOOST_CHECK(!stillRegistered);
  BOOST_CHECK_EQUAL(freeAtEnd, NumPages - ImagePages);
}

BOOST_FIXTURE_TEST_CASE( join_failures, KernelFixture )
{
  int notAChild = 0, self = 0, readOnly = 0, readOnlyAgain = 0;
  int unmapped = 0;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    notAChild = ctx.syscall(syscallJoin, 77, 0);
    self = ctx.syscall(syscallJoin, ctx.getPid(), 0);

    /* Page 0 holds read-only text */
    int pid = ctx.exec("b.coff", {});
    readOnly = ctx.syscall(syscallJoin, pid, 0);
    readOnlyAgain = ctx.syscall(syscallJoin, pid, 0);

    pid = ctx.exec("b.coff", {});
    unmapped = ctx.syscall(syscallJoin, pid, 0x40000000);
    return 0;
  }));
  images.add("b.coff", makeExecutable([](UserContext &) { return 9; }));

  boot("a.coff");
  shutdown();

  BOOST_CHECK_EQUAL(notAChild, NoSuchChildCode);
  BOOST_CHECK_EQUAL(self, NoSuchChildCode);
  BOOST_CHECK_EQUAL(readOnly, JoinErrorCode);
  BOOST_CHECK_EQUAL(readOnlyAgain, NoSuchChildCode);
  BOOST_CHECK_EQUAL(unmapped, JoinErrorCode);
}

BOOST_FIXTURE_TEST_CASE( abnormal_termination, KernelFixture )
{
  int32_t thrown = 0, trapped = 0;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    ctx.join(ctx.exec("thrower.coff", {}), thrown);
    ctx.join(ctx.exec("trapper.coff", {}), trapped);
    return 0;
  }));
  images.add("thrower.coff", makeExecutable([](UserContext &) -> int {
    throw std::runtime_error("segmentation fault");
  }));
  images.add("trapper.coff", makeExecutable([](UserContext &ctx) -> int {
    /* unknown syscalls only fail the call */
    if (ctx.syscall(-5) != UnknownSyscallCode)
      return 1;

    /* any other exception ends the process */
    ctx.raiseException(exceptionIllegalInstruction);
  }));

  boot("a.coff");
  shutdown();

  BOOST_CHECK_EQUAL(thrown, AbnormalExitStatus);
  BOOST_CHECK_EQUAL(trapped, AbnormalExitStatus);
}

BOOST_FIXTURE_TEST_CASE( file_syscalls_are_delegated, KernelFixture )
{
  std::vector<int> results;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) {
    for (int syscall = syscallCreate; syscall <= syscallUnlink; syscall++)
      results.push_back(ctx.syscall(syscall, 1, 2, 3, 4));
    results.push_back(ctx.syscall(42));
    return 0;
  }));

  boot("a.coff");
  shutdown();

  BOOST_REQUIRE_EQUAL(results.size(), 7);
  for (int i = 0; i < 6; i++)
    BOOST_CHECK_EQUAL(results[i], 100 + syscallCreate + i);
  BOOST_CHECK_EQUAL(results[6], UnknownSyscallCode);
}

BOOST_FIXTURE_TEST_CASE( halt_only_from_root, KernelFixture )
{
  std::atomic<bool> haltHandled(false);
  machine.setHaltHandler([&]() { haltHandled = true; });

  int joined = 0;
  int32_t status = 0;
  bool haltedEarly = true;

  images.add("a.coff", makeExecutable([&](UserContext &ctx) -> int {
    joined = ctx.join(ctx.exec("rogue.coff", {}), status);
    haltedEarly = machine.isHalted();
    ctx.halt();
  }));
  images.add("rogue.coff", makeExecutable([](UserContext &ctx) -> int {
    ctx.halt();
  }));

  boot("a.coff");

  BOOST_CHECK(kernel->isTerminated());
  shutdown();

  BOOST_CHECK_EQUAL(joined, JoinSuccessCode);
  BOOST_CHECK_EQUAL(status, AbnormalExitStatus);
  BOOST_CHECK(!haltedEarly);
  BOOST_CHECK(machine.isHalted());
  BOOST_CHECK(haltHandled);
}

BOOST_FIXTURE_TEST_CASE( halt_stops_running_processes, KernelFixture )
{
  std::promise<void> spinning;
  std::shared_ptr<UThread> busyThread;
  bool continuedAfterHalt = false;
  std::atomic<bool> lateRan(false);

  images.add("a.coff", makeExecutable([&](UserContext &ctx) -> int {
    const int pid = ctx.exec("busy.coff", {});
    busyThread = kernel->getProcessTable().lookup(pid)->getThread();
    spinning.get_future().wait();
    ctx.halt();
  }));
  images.add("busy.coff", makeExecutable([&](UserContext &ctx) {
    spinning.set_value();
    while (!machine.isHalted())
      std::this_thread::yield();

    /* Trapping into a halted kernel ends the process */
    ctx.exec("late.coff", {});
    continuedAfterHalt = true;
    return 0;
  }));
  images.add("late.coff", makeExecutable([&](UserContext &) {
    lateRan = true;
    return 0;
  }));

  boot("a.coff");

  auto root = kernel->getProcessTable().lookup(RootProcessID);
  if (root)
    root->getThread()->join();
  BOOST_REQUIRE(busyThread);
  busyThread->join();

  BOOST_CHECK(!continuedAfterHalt);
  BOOST_CHECK_EQUAL(kernel->getProcessTable().getNumProcesses(), 0);
  BOOST_CHECK_EQUAL(freePages(), NumPages);
  BOOST_CHECK_EQUAL(filesClosed.load(), 2);
  shutdown();

  BOOST_CHECK(!lateRan);
}

BOOST_FIXTURE_TEST_CASE( no_threads_after_termination, KernelFixture )
{
  std::atomic<bool> ran(false);
  images.add("a.coff", makeExecutable([&](UserContext &) {
    ran = true;
    return 0;
  }));

  kernel = std::make_unique<OSKernel>(machine, images);
  kernel->terminate();

  BOOST_CHECK(!kernel->startThread("late", [&]() { ran = true; }));
  BOOST_CHECK_EQUAL(kernel->run("a.coff", {}), ExecErrorCode);
  BOOST_CHECK_EQUAL(kernel->getProcessTable().getNumProcesses(), 0);
  BOOST_CHECK(kernel->getPhysMemManager().allReleased());
  shutdown();

  BOOST_CHECK(!ran);
  BOOST_CHECK(machine.isHalted());
}

BOOST_FIXTURE_TEST_CASE( root_exit_terminates_system, KernelFixture )
{
  images.add("a.coff", makeExecutable([](UserContext &ctx) -> int {
    ctx.exit(0);
  }));

  boot("a.coff");

  BOOST_CHECK(kernel->isTerminated());
  BOOST_CHECK(machine.isHalted());
  BOOST_CHECK_EQUAL(freePages(), NumPages);
  BOOST_CHECK_EQUAL(kernel->getProcessTable().getNumProcesses(), 0);
  shutdown();
}

BOOST_FIXTURE_TEST_CASE( root_must_load, KernelFixture )
{
  kernel = std::make_unique<OSKernel>(machine, images);

  BOOST_CHECK_EQUAL(kernel->run("nothing.coff", {}), ExecErrorCode);
  BOOST_CHECK_EQUAL(kernel->getProcessTable().getNumProcesses(), 0);
  BOOST_CHECK(kernel->getPhysMemManager().allReleased());
}

BOOST_AUTO_TEST_SUITE_END()
