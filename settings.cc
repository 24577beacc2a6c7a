/* userproc -- A framework to experiment with process management
 *
 *    settings.cc - Global settings and tunables
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "settings.h"

bool LogMemoryAccesses = false;
bool LogProcessEvents = false;
