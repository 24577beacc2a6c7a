/* userproc -- A framework to experiment with process management
 *
 *    executable.cc - Executable images and the loader interface
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "executable.h"

#include <utility>


Executable
makeExecutable(ProgramFunction program, const uint64_t textPages,
               const uint64_t dataPages)
{
  Executable executable;

  executable.sections.push_back(Section{ ".text", 0, textPages, true, {} });
  if (dataPages > 0)
    executable.sections.push_back(Section{ ".data", textPages, dataPages,
                                           false, {} });

  executable.entryPoint = 0;
  executable.program = std::move(program);
  return executable;
}

ExecutableLoader::~ExecutableLoader()
{
}

ImageDirectory::ImageDirectory()
  : lock(), images()
{
}

ImageDirectory::~ImageDirectory()
{
}

void
ImageDirectory::add(const std::string &name, Executable executable)
{
  std::lock_guard<std::mutex> guard(lock);
  images[name] = std::make_shared<const Executable>(std::move(executable));
}

bool
ImageDirectory::remove(const std::string &name)
{
  std::lock_guard<std::mutex> guard(lock);
  return images.erase(name) > 0;
}

std::shared_ptr<const Executable>
ImageDirectory::open(const std::string &name)
{
  std::lock_guard<std::mutex> guard(lock);

  auto it = images.find(name);
  if (it == images.end())
    return nullptr;

  return it->second;
}
