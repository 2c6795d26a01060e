/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Tests for AppleSingle / AppleDouble generation and parsing.
 */
#include "TestUtil.h"
#include "AppleSingle.h"
#include <gtest/gtest.h>
#include <memory>

using namespace XferTest;

namespace {

/*
 * Assembles an AppleSingle file by hand, so we can produce things our
 * generator never would (little-endian, damaged, version 1).
 */
class ASBuilder {
public:
    ASBuilder(uint32_t magic, uint32_t version, bool bigEndian)
        : fMagic(magic), fVersion(version), fBigEndian(bigEndian)
        {}

    void AddEntry(uint32_t id, const std::string& contents) {
        Entry entry;
        entry.id = id;
        entry.contents = contents;
        entry.lengthAdjust = 0;
        fEntries.push_back(entry);
    }
    // Claim more bytes than the entry actually has.
    void OverstateLast(uint32_t extra) {
        fEntries.back().lengthAdjust = extra;
    }

    std::string Build(void) const {
        std::string out;
        Put32(&out, fMagic);
        Put32(&out, fVersion);
        out.append(16, '\0');
        Put16(&out, (uint16_t) fEntries.size());

        uint32_t offset = (uint32_t) (26 + fEntries.size() * 12);
        for (size_t i = 0; i < fEntries.size(); i++) {
            Put32(&out, fEntries[i].id);
            Put32(&out, offset);
            Put32(&out, (uint32_t) fEntries[i].contents.length() +
                fEntries[i].lengthAdjust);
            offset += (uint32_t) fEntries[i].contents.length();
        }
        for (size_t i = 0; i < fEntries.size(); i++)
            out += fEntries[i].contents;
        return out;
    }

    // Big-endian helper for building entry contents.
    static std::string BE32(uint32_t val) {
        std::string out;
        out += (char) (val >> 24);
        out += (char) (val >> 16);
        out += (char) (val >> 8);
        out += (char) val;
        return out;
    }

private:
    struct Entry {
        uint32_t    id;
        std::string contents;
        uint32_t    lengthAdjust;
    };

    void Put16(std::string* pOut, uint16_t val) const {
        if (fBigEndian) {
            *pOut += (char) (val >> 8);
            *pOut += (char) val;
        } else {
            *pOut += (char) val;
            *pOut += (char) (val >> 8);
        }
    }
    void Put32(std::string* pOut, uint32_t val) const {
        if (fBigEndian) {
            *pOut += BE32(val);
        } else {
            for (int i = 0; i < 4; i++)
                *pOut += (char) (val >> (i * 8));
        }
    }

    uint32_t    fMagic;
    uint32_t    fVersion;
    bool        fBigEndian;
    std::vector<Entry> fEntries;
};

enum {
    kIdDataFork = 1, kIdResourceFork = 2, kIdRealName = 3,
    kIdFinderInfo = 9, kIdProDOSFileInfo = 11
};

XferError ParseString(const std::string& contents, bool isDouble,
    AppleSingle* pAS)
{
    std::unique_ptr<GenericFD> pGFD(NewStringFD(contents));
    return pAS->Parse(pGFD.get(), isDouble);
}

std::string ReadFork(const std::string& contents, const AppleSingle& as,
    FilePart part)
{
    xf_off_t offset, length;
    if (!as.GetForkExtent(part, &offset, &length))
        return "<none>";
    return contents.substr((size_t) offset, (size_t) length);
}

FileAttribs MakeAttribs(void)
{
    FileAttribs attrs;
    attrs.fileType = 0xc1;
    attrs.auxType = 0x2000;
    attrs.access = kFileAccessLocked;
    attrs.createWhen = 1000000000;
    attrs.modWhen = 1100000000;
    return attrs;
}

TEST(AppleSingleTest, GenerateAndParseBothForks)
{
    std::string data("data fork bytes");
    std::string rsrc("RSRC");
    std::string contents;
    AppleSingle as;

    ASSERT_EQ(kXferErrNone, GenerateAppleSingle(MakeAttribs(), "PICTURE",
        &data, &rsrc, false, &contents));
    ASSERT_EQ(kXferErrNone, ParseString(contents, false, &as));

    EXPECT_FALSE(as.IsDouble());
    EXPECT_TRUE(as.IsBigEndian());
    EXPECT_EQ(AppleSingle::kVersion2, as.GetVersion());
    EXPECT_TRUE(as.HasFileName());
    EXPECT_EQ("PICTURE", as.GetFileName());
    EXPECT_TRUE(as.HasProDOSInfo());
    EXPECT_FALSE(as.HasFinderInfo());
    EXPECT_EQ(0xc1u, as.GetFileType());
    EXPECT_EQ(0x2000u, as.GetAuxType());
    EXPECT_EQ(kFileAccessLocked, as.GetAccess());
    EXPECT_EQ((time_t) 1000000000, as.GetCreateWhen());
    EXPECT_EQ((time_t) 1100000000, as.GetModWhen());

    EXPECT_EQ(data, ReadFork(contents, as, kPartDataFork));
    EXPECT_EQ(rsrc, ReadFork(contents, as, kPartRsrcFork));
}

TEST(AppleSingleTest, DoubleOmitsDataFork)
{
    std::string data("ignored");
    std::string rsrc("resource");
    std::string contents;
    AppleSingle as;

    ASSERT_EQ(kXferErrNone, GenerateAppleSingle(MakeAttribs(), "",
        &data, &rsrc, true, &contents));
    EXPECT_TRUE(AppleSingle::TestMagic(
        std::unique_ptr<GenericFD>(NewStringFD(contents)).get(), true));

    ASSERT_EQ(kXferErrNone, ParseString(contents, true, &as));
    EXPECT_TRUE(as.IsDouble());
    EXPECT_FALSE(as.HasFileName());
    EXPECT_FALSE(as.HasDataFork());
    EXPECT_EQ(rsrc, ReadFork(contents, as, kPartRsrcFork));

    // an AppleDouble file isn't AppleSingle
    AppleSingle as2;
    EXPECT_EQ(kXferErrUnrecognizedFileFmt, ParseString(contents, false, &as2));
}

TEST(AppleSingleTest, UnknownDatesAndNoTypes)
{
    FileAttribs attrs;
    std::string data("x");
    std::string contents;
    AppleSingle as;

    attrs.access = 0;
    ASSERT_EQ(kXferErrNone, GenerateAppleSingle(attrs, "X", &data, NULL,
        false, &contents));
    ASSERT_EQ(kXferErrNone, ParseString(contents, false, &as));
    EXPECT_FALSE(as.HasProDOSInfo());
    EXPECT_FALSE(as.HasFinderInfo());
    EXPECT_FALSE(as.HasRsrcFork());
    EXPECT_EQ(kDateNone, as.GetCreateWhen());
    EXPECT_EQ(kDateNone, as.GetModWhen());
}

TEST(AppleSingleTest, FinderInfoOnly)
{
    FileAttribs attrs;
    std::string data("text");
    std::string contents;
    AppleSingle as;

    attrs.access = 0;
    attrs.hfsFileType = 0x54455854;     // 'TEXT'
    attrs.hfsCreator = 0x74747874;      // 'ttxt'
    ASSERT_EQ(kXferErrNone, GenerateAppleSingle(attrs, "note", &data, NULL,
        false, &contents));
    ASSERT_EQ(kXferErrNone, ParseString(contents, false, &as));
    EXPECT_TRUE(as.HasFinderInfo());
    EXPECT_FALSE(as.HasProDOSInfo());
    EXPECT_EQ(0x54455854u, as.GetHFSFileType());
    EXPECT_EQ(0x74747874u, as.GetHFSCreator());
    EXPECT_EQ(0u, as.GetFileType());
}

TEST(AppleSingleTest, PdosFinderInfoBecomesProDOSTypes)
{
    ASBuilder builder(AppleSingle::kASMagic, AppleSingle::kVersion2, true);
    std::string finder = ASBuilder::BE32(0x70062000) +      // 'p' $06 $2000
        ASBuilder::BE32(kPdosCreator);
    finder.append(24, '\0');
    builder.AddEntry(kIdFinderInfo, finder);
    builder.AddEntry(kIdDataFork, "abc");

    std::string contents = builder.Build();
    AppleSingle as;
    ASSERT_EQ(kXferErrNone, ParseString(contents, false, &as));
    EXPECT_EQ(0x06u, as.GetFileType());
    EXPECT_EQ(0x2000u, as.GetAuxType());
    EXPECT_EQ("abc", ReadFork(contents, as, kPartDataFork));
}

TEST(AppleSingleTest, LittleEndianSingle)
{
    ASBuilder builder(AppleSingle::kASMagic, AppleSingle::kVersion2, false);
    builder.AddEntry(kIdRealName, "little");
    builder.AddEntry(kIdDataFork, "payload");

    std::string contents = builder.Build();
    AppleSingle as;
    EXPECT_TRUE(AppleSingle::TestMagic(
        std::unique_ptr<GenericFD>(NewStringFD(contents)).get(), false));
    ASSERT_EQ(kXferErrNone, ParseString(contents, false, &as));
    EXPECT_FALSE(as.IsBigEndian());
    EXPECT_EQ("little", as.GetFileName());
    EXPECT_EQ("payload", ReadFork(contents, as, kPartDataFork));
}

TEST(AppleSingleTest, LittleEndianDoubleRejected)
{
    ASBuilder builder(AppleSingle::kADFMagic, AppleSingle::kVersion2, false);
    builder.AddEntry(kIdResourceFork, "r");

    AppleSingle as;
    EXPECT_EQ(kXferErrUnrecognizedFileFmt,
        ParseString(builder.Build(), true, &as));
}

TEST(AppleSingleTest, VersionOneProDOSInfo)
{
    ASBuilder builder(AppleSingle::kASMagic, AppleSingle::kVersion1, true);
    std::string info;
    info += '\0'; info += (char) 0xc3;              // access
    info += '\0'; info += (char) 0x04;              // file type
    info += ASBuilder::BE32(0x1234);                // aux type
    builder.AddEntry(kIdProDOSFileInfo, info);
    builder.AddEntry(kIdDataFork, "");

    AppleSingle as;
    ASSERT_EQ(kXferErrNone, ParseString(builder.Build(), false, &as));
    EXPECT_EQ(AppleSingle::kVersion1, as.GetVersion());
    EXPECT_EQ(0x04u, as.GetFileType());
    EXPECT_EQ(0x1234u, as.GetAuxType());
    EXPECT_EQ(0xc3u, as.GetAccess());
    EXPECT_TRUE(as.HasDataFork());
    EXPECT_EQ(0, as.GetDataLength());
}

TEST(AppleSingleTest, Unrecognized)
{
    AppleSingle as;
    EXPECT_EQ(kXferErrUnrecognizedFileFmt, ParseString("short", false, &as));
    EXPECT_EQ(kXferErrUnrecognizedFileFmt,
        ParseString(std::string(64, 'x'), false, &as));

    ASBuilder badVersion(AppleSingle::kASMagic, 0x00030000, true);
    EXPECT_EQ(kXferErrUnrecognizedFileFmt,
        ParseString(badVersion.Build(), false, &as));

    EXPECT_FALSE(AppleSingle::TestMagic(
        std::unique_ptr<GenericFD>(NewStringFD("ab")).get(), false));
}

TEST(AppleSingleTest, EntryPastEndIsBad)
{
    ASBuilder builder(AppleSingle::kASMagic, AppleSingle::kVersion2, true);
    builder.AddEntry(kIdDataFork, "abc");
    builder.OverstateLast(10);

    AppleSingle as;
    EXPECT_EQ(kXferErrBadFileFormat, ParseString(builder.Build(), false, &as));
}

TEST(AppleSingleTest, TruncatedTOCIsBad)
{
    ASBuilder builder(AppleSingle::kASMagic, AppleSingle::kVersion2, true);
    builder.AddEntry(kIdDataFork, "abc");
    builder.AddEntry(kIdResourceFork, "def");

    std::string contents = builder.Build();
    contents.resize(26 + 12);       // header plus one TOC entry

    AppleSingle as;
    EXPECT_EQ(kXferErrBadFileFormat, ParseString(contents, false, &as));
}

TEST(AppleSingleTest, DuplicateForksAreBad)
{
    ASBuilder dupData(AppleSingle::kASMagic, AppleSingle::kVersion2, true);
    dupData.AddEntry(kIdDataFork, "one");
    dupData.AddEntry(kIdDataFork, "two");

    AppleSingle as;
    EXPECT_EQ(kXferErrBadFileFormat, ParseString(dupData.Build(), false, &as));

    ASBuilder dupRsrc(AppleSingle::kADFMagic, AppleSingle::kVersion2, true);
    dupRsrc.AddEntry(kIdResourceFork, "one");
    dupRsrc.AddEntry(kIdResourceFork, "two");
    EXPECT_EQ(kXferErrBadFileFormat, ParseString(dupRsrc.Build(), true, &as));

    // AppleDouble ignores data forks, so two of them are fine
    ASBuilder dupIgnored(AppleSingle::kADFMagic, AppleSingle::kVersion2, true);
    dupIgnored.AddEntry(kIdDataFork, "one");
    dupIgnored.AddEntry(kIdDataFork, "two");
    EXPECT_EQ(kXferErrNone, ParseString(dupIgnored.Build(), true, &as));
    EXPECT_FALSE(as.HasDataFork());
}

}   // namespace
