/* userproc -- A framework to experiment with process management
 *
 *    main.cc - Boots the machine and runs a root process
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "machine.h"
#include "settings.h"
#include "os/oskernel.h"
#include "os/usercontext.h"
#include "os/userprocess.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <getopt.h>


/*
 * Built-in programs
 */

/* Runs every argument as a program without arguments, joining each of
 * them in turn. The exit status is the number of failed children.
 */
static int
initProgram(UserContext &ctx)
{
  std::vector<std::string> args = ctx.getArguments();
  if (args.empty())
    args = { "echo.coff" };

  int failures = 0;
  for (const std::string &name : args)
    {
      const int pid = ctx.exec(name, { name, "hello", "world" });
      if (pid < 0)
        {
          std::cout << "init: exec(\"" << name << "\") failed" << std::endl;
          ++failures;
          continue;
        }

      int32_t status = 0;
      const int result = ctx.join(pid, status);
      std::cout << "init: " << name << " (pid " << pid << ") joined with "
                << result << ", exit status " << status << std::endl;
      if (result != JoinSuccessCode || status != 0)
        ++failures;
    }

  return failures;
}

static int
echoProgram(UserContext &ctx)
{
  std::vector<std::string> args = ctx.getArguments();

  std::cout << "echo (pid " << ctx.getPid() << "):";
  for (size_t i = 1; i < args.size(); ++i)
    std::cout << " " << args[i];
  std::cout << std::endl;

  return 0;
}

/* Spawns a child without waiting for it, then exits; the child ends up
 * orphaned.
 */
static int
orphanProgram(UserContext &ctx)
{
  const int pid = ctx.exec("echo.coff", { "echo.coff", "orphaned" });
  return pid < 0 ? 1 : 0;
}

static int
haltProgram(UserContext &ctx)
{
  ctx.halt();
}

static void
installImages(ImageDirectory &images)
{
  images.add("init.coff", makeExecutable(initProgram));
  images.add("echo.coff", makeExecutable(echoProgram, 1, 1));
  images.add("orphan.coff", makeExecutable(orphanProgram));
  images.add("halt.coff", makeExecutable(haltProgram));
}

static void
showHelp(const char *progName)
{
  std::cerr << "usage: " << progName
            << " [-p pages] [-s pagesize] [-m] [-v] [image [args...]]"
            << std::endl
            << "  -p pages     number of physical pages (default "
            << DefaultNumPhysPages << ")" << std::endl
            << "  -s pagesize  page size in bytes (default "
            << DefaultPageSize << ")" << std::endl
            << "  -m           log memory accesses" << std::endl
            << "  -v           log process events" << std::endl
            << "built-in images: init.coff echo.coff orphan.coff halt.coff"
            << std::endl;
}

int
main(int argc, char **argv)
{
  const char *progName = argv[0];
  uint64_t nPages = DefaultNumPhysPages;
  uint64_t pageSize = DefaultPageSize;

  int c;
  while ((c = getopt(argc, argv, "p:s:mvh")) != -1)
    {
      switch (c)
        {
          case 'p':
            nPages = std::strtoull(optarg, nullptr, 10);
            break;
          case 's':
            pageSize = std::strtoull(optarg, nullptr, 10);
            break;
          case 'm':
            LogMemoryAccesses = true;
            break;
          case 'v':
            LogProcessEvents = true;
            break;
          case 'h':
          default:
            showHelp(progName);
            return c == 'h' ? 0 : 1;
        }
    }

  std::string image = "init.coff";
  std::vector<std::string> args;
  if (optind < argc)
    image = argv[optind];
  for (int i = optind + 1; i < argc; ++i)
    args.push_back(argv[i]);

  try
    {
      Machine machine(pageSize, nPages);
      ImageDirectory images;
      installImages(images);

      OSKernel kernel(machine, images);
      if (kernel.run(image, args) < 0)
        return 1;

      kernel.waitForTermination();
    }
  catch (const std::exception &e)
    {
      std::cerr << "error: " << e.what() << std::endl;
      return 1;
    }

  return 0;
}
