/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Tests for the file descriptor classes.
 */
#include "TestUtil.h"
#include "GenericFD.h"
#include <gtest/gtest.h>
#include <memory>

using namespace XferTest;

namespace {

std::string BufferContents(const GFDBuffer& gfd)
{
    if (gfd.GetBuffer() == NULL)
        return "";
    return std::string((const char*) gfd.GetBuffer(),
        (size_t) gfd.GetBufferLength());
}

TEST(GenericFDTest, BufferGrowsAndTruncates)
{
    GFDBuffer gfd;
    xf_off_t length;

    ASSERT_EQ(kXferErrNone, gfd.OpenExpandable());
    ASSERT_EQ(kXferErrNone, gfd.Write("hello, world", 12));
    ASSERT_EQ(kXferErrNone, gfd.GetLength(&length));
    EXPECT_EQ(12, length);
    EXPECT_EQ(12, gfd.Tell());

    ASSERT_EQ(kXferErrNone, gfd.Seek(5, kSeekSet));
    ASSERT_EQ(kXferErrNone, gfd.Truncate());
    EXPECT_EQ("hello", BufferContents(gfd));

    char buf[8];
    ASSERT_EQ(kXferErrNone, gfd.Rewind());
    ASSERT_EQ(kXferErrNone, gfd.Read(buf, 5));
    EXPECT_EQ("hello", std::string(buf, 5));
    EXPECT_EQ(kXferErrEOF, gfd.Read(buf, 1));
}

TEST(GenericFDTest, ReadOnlyBuffer)
{
    std::unique_ptr<GenericFD> pGFD(NewStringFD("abc"));
    EXPECT_TRUE(pGFD->GetReadOnly());
    EXPECT_NE(kXferErrNone, pGFD->Write("x", 1));
}

TEST(GenericFDTest, SliceStaysInBounds)
{
    std::unique_ptr<GenericFD> pParent(NewStringFD("0123456789"));
    GFDSlice slice;
    char buf[16];
    size_t actual;

    ASSERT_EQ(kXferErrNone, slice.Open(pParent.get(), 2, 5));
    ASSERT_EQ(kXferErrNone, slice.Read(buf, sizeof(buf), &actual));
    EXPECT_EQ("23456", std::string(buf, actual));
    EXPECT_EQ(kXferErrEOF, slice.Read(buf, 1, &actual));

    ASSERT_EQ(kXferErrNone, slice.Seek(-2, kSeekEnd));
    ASSERT_EQ(kXferErrNone, slice.Read(buf, 2));
    EXPECT_EQ("56", std::string(buf, 2));

    EXPECT_EQ(kXferErrInvalidArg, slice.Seek(6, kSeekSet));
    EXPECT_EQ(kXferErrAccessDenied, slice.Write("x", 1));

    // the parent is still usable after the slice goes away
    ASSERT_EQ(kXferErrNone, slice.Close());
    ASSERT_EQ(kXferErrNone, pParent->Rewind());
    ASSERT_EQ(kXferErrNone, pParent->Read(buf, 1));
    EXPECT_EQ('0', buf[0]);
}

TEST(GenericFDTest, TempFile)
{
    GFDFile gfd;
    char buf[8];
    size_t actual;

    ASSERT_EQ(kXferErrNone, gfd.OpenTemp());
    ASSERT_EQ(kXferErrNone, gfd.Write("abcdef", 6));
    ASSERT_EQ(kXferErrNone, gfd.Rewind());
    ASSERT_EQ(kXferErrNone, gfd.Read(buf, sizeof(buf), &actual));
    EXPECT_EQ("abcdef", std::string(buf, actual));
    EXPECT_EQ(kXferErrNone, gfd.Close());
}

TEST(GenericFDTest, HostFile)
{
    TempDir tmp;
    GFDFile gfd;
    char buf[4];

    EXPECT_EQ(kXferErrFileNotFound,
        gfd.Open(tmp.Path("missing").c_str(), true));

    ASSERT_EQ(kXferErrNone, gfd.Create(tmp.Path("out").c_str()));
    ASSERT_EQ(kXferErrNone, gfd.Write("data", 4));
    ASSERT_EQ(kXferErrNone, gfd.Close());

    ASSERT_EQ(kXferErrNone, gfd.Open(tmp.Path("out").c_str(), true));
    ASSERT_EQ(kXferErrNone, gfd.Read(buf, 4));
    EXPECT_EQ("data", std::string(buf, 4));
    EXPECT_EQ(tmp.Path("out"), gfd.GetPathName());
}

}   // namespace
