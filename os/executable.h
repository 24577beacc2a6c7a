/* userproc -- A framework to experiment with process management
 *
 *    executable.h - Executable images and the loader interface
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __EXECUTABLE_H__
#define __EXECUTABLE_H__

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class UserContext;

/* The code of a simulated program. It runs on the process's own thread
 * and its return value becomes the exit status.
 */
using ProgramFunction = std::function<int(UserContext &)>;

struct Section
{
  std::string name;
  uint64_t firstVPN;
  uint64_t numPages;
  bool readOnly;
  std::vector<uint8_t> contents;  /* at most numPages pages, rest is zero */
};

struct Executable
{
  std::vector<Section> sections;
  uint64_t entryPoint;
  ProgramFunction program;

  Executable() : sections(), entryPoint(0), program() {}
};

/* Build an image consisting of a read-only text section followed by an
 * optional writable data section, both starting at page 0.
 */
Executable makeExecutable(ProgramFunction program,
                          const uint64_t textPages = 1,
                          const uint64_t dataPages = 0);

class ExecutableLoader
{
  public:
    virtual ~ExecutableLoader();

    /* Returns nullptr when no image with the given name exists. */
    virtual std::shared_ptr<const Executable> open(const std::string &name) = 0;
};

/* Keeps images in memory, keyed by file name. */
class ImageDirectory : public ExecutableLoader
{
  protected:
    std::mutex lock;
    std::map<std::string, std::shared_ptr<const Executable>> images;

  public:
    ImageDirectory();
    virtual ~ImageDirectory() override;

    void      add(const std::string &name, Executable executable);
    bool      remove(const std::string &name);

    virtual std::shared_ptr<const Executable> open(const std::string &name) override;
};

#endif /* __EXECUTABLE_H__ */
