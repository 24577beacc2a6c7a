/* userproc -- A framework to experiment with process management
 *
 *    processtable.h - Process identities and the parent/child forest
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __PROCESSTABLE_H__
#define __PROCESSTABLE_H__

#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

class UserProcess;

const static int NoProcessID = -1;
const static int RootProcessID = 0;

/* All live processes, keyed by PID. Parent and child links are stored as
 * PIDs and resolved through the table, so clearing a link never leaves a
 * dangling reference behind. One lock protects the PID counter, the
 * table and every link.
 */
class ProcessTable
{
  protected:
    struct Node
    {
      std::shared_ptr<UserProcess> process;
      int parentPid;
      std::set<int> children;
    };

    mutable std::mutex lock;
    int nextPid;
    std::unordered_map<int, Node> nodes;

  public:
    ProcessTable();
    ~ProcessTable();

    /* Hand out the next process ID. IDs are never reused. */
    int       allocatePid(void);

    void      registerRoot(std::shared_ptr<UserProcess> process);

    /* Link child to its parent and enter it into the table, as one step. */
    void      registerChild(const int parentPid,
                            std::shared_ptr<UserProcess> child);

    /* Remove child from its parent and from the table. Returns false if
     * childPid is not a child of parentPid.
     */
    bool      unregisterChild(const int parentPid, const int childPid);

    /* Clear the parent link of a single process. */
    void      orphan(const int childPid);

    /* Orphan all children of parentPid. Children that have already
     * exited are dropped from the table, nobody can join them anymore.
     */
    std::vector<int> orphanChildren(const int parentPid);

    /* Record the exit status of pid. Drops the process from the table
     * when it has no parent left to join it.
     */
    void      markExited(const int pid, const int status);

    /* Drop pid from the table without further bookkeeping. */
    bool      reap(const int pid);

    std::shared_ptr<UserProcess> lookup(const int pid) const;
    std::shared_ptr<UserProcess> lookupChild(const int parentPid,
                                             const int childPid) const;

    int              getParentPid(const int pid) const;
    std::vector<int> getChildren(const int pid) const;
    size_t           getNumProcesses(void) const;

    ProcessTable(const ProcessTable &) = delete;
    ProcessTable &operator=(const ProcessTable &) = delete;
};

#endif /* __PROCESSTABLE_H__ */
