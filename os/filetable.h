/* userproc -- A framework to experiment with process management
 *
 *    filetable.h - Interface to the per-process file descriptor table
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __FILETABLE_H__
#define __FILETABLE_H__

#include <functional>
#include <memory>

/* Handles syscalls 4 through 9 (create, open, read, write, close,
 * unlink) on behalf of one process.
 */
class FileTable
{
  public:
    virtual ~FileTable();

    virtual int   handleSyscall(int syscall, int a0, int a1, int a2, int a3) = 0;

    /* Close every descriptor the process still holds. */
    virtual void  closeAll(void) = 0;
};

using FileTableFactory = std::function<std::unique_ptr<FileTable>(void)>;

/* A file table without a file system behind it: every call fails. */
class NullFileTable : public FileTable
{
  public:
    virtual ~NullFileTable() override;

    virtual int   handleSyscall(int syscall, int a0, int a1, int a2, int a3) override;
    virtual void  closeAll(void) override;
};

#endif /* __FILETABLE_H__ */
