/* userproc -- A framework to experiment with process management
 *
 *    processtable.cc - Process identities and the parent/child forest
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "processtable.h"
#include "userprocess.h"

#include <stdexcept>
#include <utility>


ProcessTable::ProcessTable()
  : lock(), nextPid(RootProcessID), nodes()
{
}

ProcessTable::~ProcessTable()
{
}

int
ProcessTable::allocatePid(void)
{
  std::lock_guard<std::mutex> guard(lock);
  return nextPid++;
}

void
ProcessTable::registerRoot(std::shared_ptr<UserProcess> process)
{
  std::lock_guard<std::mutex> guard(lock);

  const int pid = process->getPid();
  if (nodes.count(pid))
    throw std::logic_error("ProcessTable: PID registered twice");

  nodes[pid] = Node{ std::move(process), NoProcessID, {} };
}

void
ProcessTable::registerChild(const int parentPid,
                            std::shared_ptr<UserProcess> child)
{
  std::lock_guard<std::mutex> guard(lock);

  auto parent = nodes.find(parentPid);
  if (parent == nodes.end())
    throw std::logic_error("ProcessTable: parent of new process is not registered");

  const int childPid = child->getPid();
  if (nodes.count(childPid))
    throw std::logic_error("ProcessTable: PID registered twice");

  parent->second.children.insert(childPid);
  nodes[childPid] = Node{ std::move(child), parentPid, {} };
}

bool
ProcessTable::unregisterChild(const int parentPid, const int childPid)
{
  std::lock_guard<std::mutex> guard(lock);

  auto parent = nodes.find(parentPid);
  if (parent == nodes.end() || !parent->second.children.erase(childPid))
    return false;

  nodes.erase(childPid);
  return true;
}

void
ProcessTable::orphan(const int childPid)
{
  std::lock_guard<std::mutex> guard(lock);

  auto child = nodes.find(childPid);
  if (child != nodes.end())
    child->second.parentPid = NoProcessID;
}

std::vector<int>
ProcessTable::orphanChildren(const int parentPid)
{
  std::lock_guard<std::mutex> guard(lock);
  std::vector<int> orphaned;

  auto parent = nodes.find(parentPid);
  if (parent == nodes.end())
    return orphaned;

  std::set<int> children;
  children.swap(parent->second.children);

  for (int childPid : children)
    {
      auto child = nodes.find(childPid);
      if (child == nodes.end())
        continue;

      child->second.parentPid = NoProcessID;
      orphaned.push_back(childPid);

      if (child->second.process->getStatus() == ProcessStatus::Exited)
        nodes.erase(child);
    }

  return orphaned;
}

void
ProcessTable::markExited(const int pid, const int status)
{
  std::lock_guard<std::mutex> guard(lock);

  auto node = nodes.find(pid);
  if (node == nodes.end())
    throw std::logic_error("ProcessTable: exiting process is not registered");

  node->second.process->setExited(status);

  if (node->second.parentPid == NoProcessID)
    nodes.erase(node);
}

bool
ProcessTable::reap(const int pid)
{
  std::lock_guard<std::mutex> guard(lock);
  return nodes.erase(pid) > 0;
}

std::shared_ptr<UserProcess>
ProcessTable::lookup(const int pid) const
{
  std::lock_guard<std::mutex> guard(lock);

  auto node = nodes.find(pid);
  if (node == nodes.end())
    return nullptr;

  return node->second.process;
}

std::shared_ptr<UserProcess>
ProcessTable::lookupChild(const int parentPid, const int childPid) const
{
  std::lock_guard<std::mutex> guard(lock);

  auto parent = nodes.find(parentPid);
  if (parent == nodes.end() || !parent->second.children.count(childPid))
    return nullptr;

  auto child = nodes.find(childPid);
  if (child == nodes.end())
    throw std::logic_error("ProcessTable: child link refers to unknown process");

  return child->second.process;
}

int
ProcessTable::getParentPid(const int pid) const
{
  std::lock_guard<std::mutex> guard(lock);

  auto node = nodes.find(pid);
  if (node == nodes.end())
    return NoProcessID;

  return node->second.parentPid;
}

std::vector<int>
ProcessTable::getChildren(const int pid) const
{
  std::lock_guard<std::mutex> guard(lock);

  auto node = nodes.find(pid);
  if (node == nodes.end())
    return std::vector<int>();

  return std::vector<int>(node->second.children.begin(),
                          node->second.children.end());
}

size_t
ProcessTable::getNumProcesses(void) const
{
  std::lock_guard<std::mutex> guard(lock);
  return nodes.size();
}
