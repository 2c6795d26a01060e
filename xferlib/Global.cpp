/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Implementation of XferLib globals.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"

/*static*/ bool Global::fAppInitCalled = false;


/*
 * Perform one-time library initialization.
 */
/*static*/ XferError Global::AppInit(void)
{
    if (fAppInitCalled) {
        LOGW("XferLib AppInit already called");
        return kXferErrNone;
    }

    LOGI("Initializing Xfer library v%d.%d.%d",
        kXferLibVersionMajor, kXferLibVersionMinor, kXferLibVersionBug);

    fAppInitCalled = true;

    return kXferErrNone;
}

/*
 * Perform cleanup at application shutdown time.
 */
/*static*/ XferError Global::AppCleanup(void)
{
    LOGI("XferLib cleanup");
    fAppInitCalled = false;
    return kXferErrNone;
}


/*
 * Return current library versions.
 */
/*static*/ void Global::GetVersion(int32_t* pMajor, int32_t* pMinor,
    int32_t* pBug)
{
    if (pMajor != NULL)
        *pMajor = kXferLibVersionMajor;
    if (pMinor != NULL)
        *pMinor = kXferLibVersionMinor;
    if (pBug != NULL)
        *pBug = kXferLibVersionBug;
}


/*
 * Pointer to debug message handler function.
 */
/*static*/ Global::DebugMsgHandler Global::gDebugMsgHandler = NULL;

/*
 * Change the debug message handler.  The previous handler is returned.
 */
Global::DebugMsgHandler Global::SetDebugMsgHandler(DebugMsgHandler handler)
{
    DebugMsgHandler oldHandler;

    oldHandler = gDebugMsgHandler;
    gDebugMsgHandler = handler;
    return oldHandler;
}

/*
 * Send a debug message to the debug message handler.
 *
 * If the application hasn't installed a handler, the message is dropped.
 */
/*static*/ void Global::PrintDebugMsg(const char* file, int line, const char* fmt, ...)
{
    if (gDebugMsgHandler == NULL)
        return;

    char buf[512];
    va_list args;

    va_start(args, fmt);
    (void) vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    buf[sizeof(buf)-1] = '\0';

    (*gDebugMsgHandler)(file, line, buf);
}
