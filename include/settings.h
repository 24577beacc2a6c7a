/* userproc -- A framework to experiment with process management
 *
 *    settings.h - Global settings and tunables
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __SETTINGS_H__
#define __SETTINGS_H__

#include <cstdint>
#include <cstddef>

/* Log every virtual memory transfer performed by the MMU. */
extern bool LogMemoryAccesses;

/* Log process lifecycle events: load, exec, exit and join. */
extern bool LogProcessEvents;

/* Defaults for the simulated machine, can be overridden on the
 * command line of the driver program.
 */
const static uint64_t DefaultPageSize = 1024;
const static uint64_t DefaultNumPhysPages = 64;

/* Number of pages reserved for the user stack of every process. */
const static uint64_t StackPages = 8;

/* Maximum length of a string argument read from user memory, not
 * including the null terminator.
 */
const static size_t MaxArgLength = 256;

/* File name suffix every executable image must carry. */
const static char ExecutableSuffix[] = ".coff";

#endif /* __SETTINGS_H__ */
