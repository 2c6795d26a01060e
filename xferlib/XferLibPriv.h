/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Declarations common within but private to the Xfer library.
 *
 * External code should not include this.
 */
#ifndef XFERLIB_XFERLIBPRIV_H
#define XFERLIB_XFERLIBPRIV_H

#include "XferLib.h"
#include <errno.h>
#include <assert.h>
// "GenericFD.h" included at end

using namespace XferLib;        // make life easy for all internal code

namespace XferLib {

/*
 * Debug logging macros.
 *
 * The macro choice implies a severity level, but we don't currently
 * support that in the callback interface, so it's not used.
 */
#define DLOG_BASE(file, line, format, ...) \
        Global::PrintDebugMsg((file), (line), (format), ##__VA_ARGS__)

#define LOGV(format, ...) DLOG_BASE(__FILE__, __LINE__, (format), ##__VA_ARGS__)
#define LOGD(format, ...) DLOG_BASE(__FILE__, __LINE__, (format), ##__VA_ARGS__)
#define LOGI(format, ...) DLOG_BASE(__FILE__, __LINE__, (format), ##__VA_ARGS__)
#define LOGW(format, ...) DLOG_BASE(__FILE__, __LINE__, (format), ##__VA_ARGS__)
#define LOGE(format, ...) DLOG_BASE(__FILE__, __LINE__, (format), ##__VA_ARGS__)

/* put this in to break on interesting events when built debug */
#if defined(_DEBUG)
# define DebugBreak() { assert(false); }
#else
# define DebugBreak() ((void) 0)
#endif

/*
 * Standard goodies.
 */
#define NELEM(x) (sizeof(x) / sizeof(x[0]))

#define ErrnoOrGeneric() (errno != 0 ? (XferError) errno : kXferErrGeneric)

/* filename manipulation functions */
const char* FilenameOnly(const char* pathname, char fssep);

/* get/set integer values out of a memory buffer */
uint16_t GetShortLE(const uint8_t* buf);
uint32_t GetLongLE(const uint8_t* buf);
uint16_t GetShortBE(const uint8_t* buf);
uint32_t GetLongBE(const uint8_t* buf);
void PutShortBE(uint8_t* ptr, uint16_t val);
void PutLongBE(uint8_t* ptr, uint32_t val);

/* date conversions */
time_t ConvertProDOSDateTime(uint16_t prodosDate, uint16_t prodosTime);

}   // namespace XferLib

#include "GenericFD.h"

#endif /*XFERLIB_XFERLIBPRIV_H*/
