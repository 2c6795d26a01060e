/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Test helpers, and the global setup for the test program.
 */
#include "TestUtil.h"
#include "AppleSingle.h"
#include <gtest/gtest.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <ftw.h>
#include <sys/stat.h>

using namespace XferTest;

/*
 * Library debug messages go to stderr when XFERLIB_TEST_LOG is set.
 */
static void TestMsgHandler(const char* file, int line, const char* msg)
{
    const char* cp = strrchr(file, '/');
    fprintf(stderr, "  [%s:%d] %s\n", cp != NULL ? cp + 1 : file, line, msg);
}

class XferLibEnvironment : public ::testing::Environment {
public:
    virtual void SetUp(void) override {
        if (getenv("XFERLIB_TEST_LOG") != NULL)
            Global::SetDebugMsgHandler(TestMsgHandler);
        ASSERT_EQ(kXferErrNone, Global::AppInit());
    }
    virtual void TearDown(void) override {
        Global::AppCleanup();
    }
};

static ::testing::Environment* const gXferEnv =
    ::testing::AddGlobalTestEnvironment(new XferLibEnvironment);


/*
 * ===========================================================================
 *      RecordingCallback
 * ===========================================================================
 */

/*static*/ CallbackFacts::Result RecordingCallback::Callback(
    const CallbackFacts* pFacts, void* vState)
{
    return ((RecordingCallback*) vState)->Handle(pFacts);
}

CallbackFacts::Result RecordingCallback::Handle(const CallbackFacts* pFacts)
{
    fFacts.push_back(*pFacts);

    if (pFacts->reason == CallbackFacts::kReasonQueryCancel) {
        fQueryCount++;
        if (fQueryCount == fCancelAtQuery)
            return CallbackFacts::kResultCancel;
    }

    std::map<int, CallbackFacts::Result>::const_iterator it =
        fAnswers.find(pFacts->reason);
    if (it != fAnswers.end())
        return it->second;

    switch (pFacts->reason) {
    case CallbackFacts::kReasonFileNameExists:
    case CallbackFacts::kReasonPathTooLong:
        return CallbackFacts::kResultSkip;
    case CallbackFacts::kReasonFailure:
        return CallbackFacts::kResultCancel;
    default:
        return CallbackFacts::kResultContinue;
    }
}

int RecordingCallback::Count(CallbackFacts::Reason reason) const
{
    int count = 0;
    for (size_t i = 0; i < fFacts.size(); i++) {
        if (fFacts[i].reason == reason)
            count++;
    }
    return count;
}

const CallbackFacts* RecordingCallback::FindFirst(
    CallbackFacts::Reason reason) const
{
    for (size_t i = 0; i < fFacts.size(); i++) {
        if (fFacts[i].reason == reason)
            return &fFacts[i];
    }
    return NULL;
}


/*
 * ===========================================================================
 *      Host file helpers
 * ===========================================================================
 */

TempDir::TempDir(void)
{
    char templ[] = "/tmp/xfertest.XXXXXX";
    if (mkdtemp(templ) != NULL)
        fPath = templ;
    else
        ADD_FAILURE() << "mkdtemp failed: " << strerror(errno);
}

static int RemoveOne(const char* fpath, const struct stat* sb, int typeflag,
    struct FTW* ftwbuf)
{
    (void) sb; (void) typeflag; (void) ftwbuf;
    if (remove(fpath) != 0)
        fprintf(stderr, "Unable to remove '%s': %s\n", fpath, strerror(errno));
    return 0;
}

TempDir::~TempDir(void)
{
    if (!fPath.empty())
        (void) nftw(fPath.c_str(), RemoveOne, 16, FTW_DEPTH | FTW_PHYS);
}

bool XferTest::WriteHostFile(const std::string& pathName,
    const std::string& contents)
{
    FILE* fp = fopen(pathName.c_str(), "wb");
    if (fp == NULL)
        return false;
    bool result = fwrite(contents.data(), 1, contents.length(), fp) ==
        contents.length();
    if (fclose(fp) != 0)
        result = false;
    return result;
}

bool XferTest::ReadHostFile(const std::string& pathName, std::string* pContents)
{
    FILE* fp = fopen(pathName.c_str(), "rb");
    if (fp == NULL)
        return false;

    char buf[4096];
    size_t actual;
    pContents->clear();
    while ((actual = fread(buf, 1, sizeof(buf), fp)) > 0)
        pContents->append(buf, actual);
    bool result = ferror(fp) == 0;
    fclose(fp);
    return result;
}

bool XferTest::HostFileExists(const std::string& pathName)
{
    struct stat sb;
    return lstat(pathName.c_str(), &sb) == 0;
}

bool XferTest::MakeHostDir(const std::string& pathName)
{
    return mkdir(pathName.c_str(), 0755) == 0;
}

XferError XferTest::ReadAll(PartSource* pSource, std::string* pContents)
{
    char buf[1024];
    XferError xerr;

    ScopedPartSource guard(pSource);
    pContents->clear();
    xerr = pSource->Open();
    while (xerr == kXferErrNone) {
        size_t actual;
        xerr = pSource->Read(buf, sizeof(buf), &actual);
        if (xerr != kXferErrNone || actual == 0)
            break;
        pContents->append(buf, actual);
    }
    return xerr;
}

GenericFD* XferTest::NewStringFD(const std::string& contents)
{
    GFDBuffer* pGFD = new GFDBuffer;
    XferError xerr;

    if (contents.empty()) {
        xerr = pGFD->Open(NULL, 0, true, false, true);
    } else {
        uint8_t* buf = new uint8_t[contents.length()];
        memcpy(buf, contents.data(), contents.length());
        xerr = pGFD->Open(buf, contents.length(), true, false, true);
        if (xerr != kXferErrNone)
            delete[] buf;
    }
    EXPECT_EQ(kXferErrNone, xerr);
    return pGFD;
}

XferError XferTest::GenerateAppleSingle(const FileAttribs& attrs,
    const std::string& fileName, const std::string* pData,
    const std::string* pRsrc, bool asDouble, std::string* pOut)
{
    StreamPartSource* pDataSrc = NULL;
    StreamPartSource* pRsrcSrc = NULL;
    GFDBuffer outBuf;
    XferError xerr;

    if (pData != NULL)
        pDataSrc = new StreamPartSource(NewStringFD(*pData), false);
    if (pRsrc != NULL)
        pRsrcSrc = new StreamPartSource(NewStringFD(*pRsrc), false);

    xerr = outBuf.OpenExpandable();
    if (xerr == kXferErrNone) {
        xerr = AppleSingle::Generate(attrs, fileName, pDataSrc, pRsrcSrc,
            asDouble, &outBuf);
    }
    if (xerr == kXferErrNone) {
        pOut->assign((const char*) outBuf.GetBuffer(),
            (size_t) outBuf.GetBufferLength());
    }

    delete pDataSrc;
    delete pRsrcSrc;
    return xerr;
}
