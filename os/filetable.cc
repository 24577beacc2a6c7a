/* userproc -- A framework to experiment with process management
 *
 *    filetable.cc - Interface to the per-process file descriptor table
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "filetable.h"

FileTable::~FileTable()
{
}

NullFileTable::~NullFileTable()
{
}

int
NullFileTable::handleSyscall(int, int, int, int, int)
{
  return -1;
}

void
NullFileTable::closeAll(void)
{
}
