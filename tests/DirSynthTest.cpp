/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Tests for directory synthesis.
 */
#include "TestUtil.h"
#include "MemFileSystem.h"
#include "DirSynth.h"
#include <gtest/gtest.h>

using namespace XferTest;

namespace {

TEST(DirSynthTest, StringAncestorsEmittedOnce)
{
    DirSynth synth;
    std::vector<std::string> dirs;

    synth.AddAncestors("a/b/c", '/', &dirs);
    ASSERT_EQ(2u, dirs.size());
    EXPECT_EQ("a", dirs[0]);
    EXPECT_EQ("a/b", dirs[1]);

    dirs.clear();
    synth.AddAncestors("a/b/d", '/', &dirs);
    EXPECT_TRUE(dirs.empty());

    synth.AddAncestors("a/x/y", '/', &dirs);
    ASSERT_EQ(1u, dirs.size());
    EXPECT_EQ("a/x", dirs[0]);
}

TEST(DirSynthTest, NoSeparatorMeansNoDirectories)
{
    DirSynth synth;
    std::vector<std::string> dirs;

    synth.AddAncestors("a/b/c", '\0', &dirs);
    synth.AddAncestors("plain", '/', &dirs);
    EXPECT_TRUE(dirs.empty());
}

TEST(DirSynthTest, SkipsEmptyComponents)
{
    DirSynth synth;
    std::vector<std::string> dirs;

    synth.AddAncestors(":a::b", ':', &dirs);
    ASSERT_EQ(1u, dirs.size());
    EXPECT_EQ(":a", dirs[0]);
}

TEST(DirSynthTest, MarkSeenIsCaseSensitive)
{
    DirSynth synth;

    EXPECT_TRUE(synth.MarkSeen("foo"));
    EXPECT_FALSE(synth.MarkSeen("foo"));
    EXPECT_TRUE(synth.MarkSeen("FOO"));
    EXPECT_TRUE(synth.IsSeen("FOO"));

    synth.Reset();
    EXPECT_FALSE(synth.IsSeen("foo"));
}

class DirSynthFSTest : public ::testing::Test {
protected:
    DirSynthFSTest(void) : fFS(MemFileSystem::ProDOSLike()) {
        fpDirA = fFS.AddTestDir(fFS.GetVolDir(), "A");
        fpDirB = fFS.AddTestDir(fpDirA, "B");
        fpFileC = fFS.AddTestFile(fpDirB, "C", "data");
        fpFileD = fFS.AddTestFile(fpDirA, "D", "more");
    }

    MemFileSystem   fFS;
    MemFSEntry*     fpDirA;
    MemFSEntry*     fpDirB;
    MemFSEntry*     fpFileC;
    MemFSEntry*     fpFileD;
};

TEST_F(DirSynthFSTest, EntryAncestorsFromVolume)
{
    DirSynth synth;
    std::vector<FileEntry*> dirs;

    synth.AddAncestors(fpFileC, NULL, ':', &dirs);
    ASSERT_EQ(2u, dirs.size());
    EXPECT_EQ(fpDirA, dirs[0]);
    EXPECT_EQ(fpDirB, dirs[1]);

    dirs.clear();
    synth.AddAncestors(fpFileD, NULL, ':', &dirs);
    EXPECT_TRUE(dirs.empty());
}

TEST_F(DirSynthFSTest, EntryAncestorsStopAtBoundary)
{
    DirSynth synth;
    std::vector<FileEntry*> dirs;

    synth.AddAncestors(fpFileC, fpDirA, ':', &dirs);
    ASSERT_EQ(1u, dirs.size());
    EXPECT_EQ(fpDirB, dirs[0]);
    EXPECT_TRUE(synth.IsSeen("B"));
}

TEST_F(DirSynthFSTest, RelativePath)
{
    EXPECT_EQ("A:B:C", DirSynth::GetRelativePath(fpFileC, NULL, ':'));
    EXPECT_EQ("B:C", DirSynth::GetRelativePath(fpFileC, fpDirA, ':'));
    EXPECT_EQ("A/B/C", DirSynth::GetRelativePath(fpFileC, NULL, '/'));
    EXPECT_EQ("", DirSynth::GetRelativePath(fFS.GetVolDir(), NULL, ':'));

    // not under the boundary, so the path comes from the volume dir
    EXPECT_EQ("A:D", DirSynth::GetRelativePath(fpFileD, fpDirB, ':'));
}

}   // namespace
