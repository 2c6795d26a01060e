/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
// stdafx.h : include file for standard system include files,
//  or project specific include files that are used frequently, but
//      are changed infrequently
//

#include <stdint.h>
#include <stdlib.h>
#include <stdio.h>
#include <time.h>

/* UNIX includes */
#include <stdarg.h>
#include <unistd.h>
#include <string.h>
#include <strings.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <fcntl.h>
#include <ctype.h>

#include <string>
#include <vector>
#include <map>
#include <set>

#define HAVE_VSNPRINTF
#define HAVE_FSEEKO
#define HAVE_FTRUNCATE
