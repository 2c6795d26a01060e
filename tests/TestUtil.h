/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Helpers shared by the XferLib tests.
 */
#ifndef XFERLIB_TESTS_TESTUTIL_H
#define XFERLIB_TESTS_TESTUTIL_H

#include "XferLib.h"
#include "CallbackFacts.h"
#include "PartSource.h"
#include <map>
#include <string>
#include <vector>

namespace XferTest {

using namespace XferLib;

/*
 * Callback that records everything it's told, and answers each reason
 * with a configurable result.  By default existing files are skipped,
 * failures cancel, and everything else continues.
 */
class RecordingCallback {
public:
    RecordingCallback(void) : fCancelAtQuery(-1), fQueryCount(0) {}

    // Pass this as the XferCallback, with the object as the state.
    static CallbackFacts::Result Callback(const CallbackFacts* pFacts,
        void* vState);

    void SetAnswer(CallbackFacts::Reason reason, CallbackFacts::Result result) {
        fAnswers[reason] = result;
    }
    // Answer Cancel to the Nth cancellation query (1-based).
    void CancelAtQuery(int queryNum) { fCancelAtQuery = queryNum; }

    int Count(CallbackFacts::Reason reason) const;
    const CallbackFacts* FindFirst(CallbackFacts::Reason reason) const;
    const std::vector<CallbackFacts>& GetFacts(void) const { return fFacts; }

private:
    CallbackFacts::Result Handle(const CallbackFacts* pFacts);

    std::map<int, CallbackFacts::Result> fAnswers;
    std::vector<CallbackFacts> fFacts;
    int     fCancelAtQuery;
    int     fQueryCount;
};

/*
 * Scratch directory under /tmp, removed along with its contents when the
 * object goes away.
 */
class TempDir {
public:
    TempDir(void);
    ~TempDir(void);

    const std::string& GetPath(void) const { return fPath; }
    std::string Path(const std::string& relPath) const {
        return fPath + kHostDirSep + relPath;
    }

private:
    TempDir& operator=(const TempDir&);
    TempDir(const TempDir&);

    std::string fPath;
};

bool WriteHostFile(const std::string& pathName, const std::string& contents);
bool ReadHostFile(const std::string& pathName, std::string* pContents);
bool HostFileExists(const std::string& pathName);
bool MakeHostDir(const std::string& pathName);

// Open the source, read everything, and close it.
XferError ReadAll(PartSource* pSource, std::string* pContents);

// Read-only memory descriptor holding a copy of "contents".  Caller owns it.
GenericFD* NewStringFD(const std::string& contents);

/*
 * Generate an AppleSingle or AppleDouble file into a string.  Either fork
 * pointer may be NULL.
 */
XferError GenerateAppleSingle(const FileAttribs& attrs,
    const std::string& fileName, const std::string* pData,
    const std::string* pRsrc, bool asDouble, std::string* pOut);

}   // namespace XferTest

#endif /*XFERLIB_TESTS_TESTUTIL_H*/
