/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * File name conversion and the naming conventions used to preserve file
 * types on host filesystems.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "PathName.h"

#define kPreserveIndic  '#'     /* use # rather than $ for hex indication */
#define kFilenameExtDelim '.'   /* separates extension from filename */

/*static*/ const char* PathName::kMirandaFileName = "A";
/*static*/ const char* PathName::kASExtension = ".as";
/*static*/ const char* PathName::kADFPrefix = "._";
/*static*/ const char* PathName::kMacZipDir = "__MACOSX";
/*static*/ const char* PathName::kRsrcForkSuffix = "/..namedfork/rsrc";

static const char kHexDigits[] = "0123456789abcdef";

/*
 * Return the value of a hex digit, or -1 if it isn't one.
 */
static int HexValue(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

/*
 * Characters that can't appear in a file name on a UNIX filesystem.
 */
/*static*/ bool PathName::IsInvalidHostChar(unsigned char ch)
{
    return ch == '\0' || ch == kHostDirSep;
}

/*static*/ std::string PathName::AdjustFileName(const std::string& fileName,
    char replChar)
{
    if (fileName.empty())
        return kMirandaFileName;

    std::string result(fileName);
    for (size_t i = 0; i < result.length(); i++) {
        if (IsInvalidHostChar(result[i]))
            result[i] = replChar;
    }
    return result;
}

/*static*/ std::string PathName::EscapeFileName(const std::string& fileName)
{
    if (fileName.empty())
        return kMirandaFileName;

    std::string result;
    result.reserve(fileName.length() + 8);
    for (size_t i = 0; i < fileName.length(); i++) {
        unsigned char ch = fileName[i];
        if (ch == kEscapeChar) {
            /* change '%' to "%%" */
            result += kEscapeChar;
            result += kEscapeChar;
        } else if (IsInvalidHostChar(ch) || ch < 0x20 || ch == 0x7f) {
            /* change invalid char to "%2f" */
            result += kEscapeChar;
            result += kHexDigits[ch >> 4];
            result += kHexDigits[ch & 0x0f];
        } else {
            result += (char) ch;
        }
    }
    return result;
}

/*static*/ std::string PathName::UnescapeFileName(const std::string& fileName,
    char dirSep)
{
    std::string result;
    size_t len = fileName.length();

    result.reserve(len);
    for (size_t i = 0; i < len; i++) {
        char ch = fileName[i];
        if (ch != kEscapeChar) {
            result += ch;
            continue;
        }

        if (i + 1 < len && fileName[i+1] == kEscapeChar) {
            result += kEscapeChar;
            i++;
        } else if (i + 2 < len && HexValue(fileName[i+1]) >= 0 &&
            HexValue(fileName[i+2]) >= 0)
        {
            char newCh = (char) (HexValue(fileName[i+1]) << 4 |
                HexValue(fileName[i+2]));
            if (newCh == '\0') {
                /* drop it */
            } else if (newCh == dirSep) {
                result += kEscapeChar;
            } else {
                result += newCh;
            }
            i += 2;
        } else {
            /* not a valid escape; keep it */
            result += ch;
        }
    }
    return result;
}

/*static*/ std::string PathName::PrintifyControlChars(const std::string& str)
{
    std::string result;
    result.reserve(str.length());
    for (size_t i = 0; i < str.length(); i++) {
        unsigned char ch = str[i];
        if (ch < 0x20) {
            /* U+2400 + ch */
            result += (char) 0xe2;
            result += (char) 0x90;
            result += (char) (0x80 + ch);
        } else if (ch == 0x7f) {
            /* U+2421 */
            result += (char) 0xe2;
            result += (char) 0x90;
            result += (char) 0xa1;
        } else {
            result += (char) ch;
        }
    }
    return result;
}

/*
 * Split "pathName" on "dirSep", run each piece through the adjuster, and
 * glue it back together with the host separator.  Empty components are
 * dropped.
 */
static std::string ConvertPath(const std::string& pathName, char dirSep,
    char replChar, bool escapeLast)
{
    std::vector<std::string> parts;

    if (dirSep == PathName::kNoDirSep) {
        parts.push_back(pathName);
    } else {
        size_t start = 0;
        while (true) {
            size_t end = pathName.find(dirSep, start);
            std::string part = pathName.substr(start,
                end == std::string::npos ? std::string::npos : end - start);
            if (!part.empty())
                parts.push_back(part);
            if (end == std::string::npos)
                break;
            start = end + 1;
        }
        if (parts.empty())
            parts.push_back(std::string());
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i != 0)
            result += kHostDirSep;
        if (escapeLast && i == parts.size() - 1)
            result += PathName::EscapeFileName(parts[i]);
        else
            result += PathName::AdjustFileName(parts[i], replChar);
    }
    return result;
}

/*static*/ std::string PathName::AdjustPathName(const std::string& pathName,
    char dirSep, char replChar)
{
    return ConvertPath(pathName, dirSep, replChar, false);
}

/*static*/ std::string PathName::AdjustEscapePathName(const std::string& pathName,
    char dirSep, char replChar)
{
    return ConvertPath(pathName, dirSep, replChar, true);
}

/*static*/ std::string PathName::GetFileName(const std::string& pathName,
    char dirSep)
{
    if (dirSep == kNoDirSep)
        return pathName;
    size_t posn = pathName.rfind(dirSep);
    if (posn == std::string::npos)
        return pathName;
    return pathName.substr(posn + 1);
}

/*static*/ std::string PathName::GetDirectoryName(const std::string& pathName,
    char dirSep)
{
    if (dirSep == kNoDirSep)
        return std::string();
    size_t posn = pathName.rfind(dirSep);
    if (posn == std::string::npos)
        return std::string();
    return pathName.substr(0, posn);
}

/*static*/ std::string PathName::Combine(const std::string& dirName,
    const std::string& fileName, char dirSep)
{
    if (dirName.empty())
        return fileName;
    if (fileName.empty())
        return dirName;
    if (dirName[dirName.length() - 1] == dirSep)
        return dirName + fileName;
    return dirName + dirSep + fileName;
}

/*static*/ bool PathName::EndsWithNoCase(const std::string& str,
    const char* suffix)
{
    size_t suffixLen = strlen(suffix);
    if (str.length() < suffixLen)
        return false;
    return strcasecmp(str.c_str() + str.length() - suffixLen, suffix) == 0;
}

/*static*/ std::string PathName::GenerateMacZipName(const std::string& fullName,
    char dirSep)
{
    if (fullName.empty() ||
        (dirSep != kNoDirSep && fullName[fullName.length() - 1] == dirSep))
    {
        return std::string();
    }

    std::string dirName = GetDirectoryName(fullName, dirSep);
    std::string fileName = GetFileName(fullName, dirSep);
    std::string result(kMacZipDir);
    result += dirSep;
    if (!dirName.empty()) {
        result += dirName;
        result += dirSep;
    }
    result += kADFPrefix;
    result += fileName;
    return result;
}

/*static*/ bool PathName::IsMacZipHeader(const std::string& fullName,
    char dirSep)
{
    std::string prefix(kMacZipDir);
    prefix += dirSep;
    if (fullName.compare(0, prefix.length(), prefix) != 0)
        return false;
    std::string fileName = GetFileName(fullName, dirSep);
    return fileName.compare(0, strlen(kADFPrefix), kADFPrefix) == 0;
}

/*static*/ std::string PathName::GenerateNAPSTag(uint32_t fileType,
    uint32_t auxType, uint32_t hfsFileType, uint32_t hfsCreator)
{
    char buf[20];

    if (fileType == 0 && auxType == 0 &&
        (hfsFileType != 0 || hfsCreator != 0))
    {
        snprintf(buf, sizeof(buf), "%c%08x%08x", kPreserveIndic,
            hfsFileType, hfsCreator);
    } else {
        snprintf(buf, sizeof(buf), "%c%02x%04x", kPreserveIndic,
            fileType & 0xff, auxType & 0xffff);
    }
    return buf;
}

/*
 * See if there's a NAPS tag with "numDigits" hex digits at "hashPosn".
 * After the digits we allow an optional part char, then either the end
 * of the string or a '.' that starts a host extension.
 */
/*static*/ bool PathName::MatchNAPSAt(const std::string& fileName,
    size_t hashPosn, int numDigits, char* pPartChar)
{
    size_t len = fileName.length();
    size_t posn = hashPosn + 1;

    if (hashPosn == 0)
        return false;       // need at least one char of name
    if (posn + numDigits > len)
        return false;
    for (int i = 0; i < numDigits; i++) {
        if (HexValue(fileName[posn + i]) < 0)
            return false;
    }
    posn += numDigits;

    char partChar = '\0';
    if (posn < len) {
        char ch = (char) tolower((unsigned char) fileName[posn]);
        if (ch == 'd' || ch == 'r' || ch == 'i') {
            partChar = ch;
            posn++;
        }
    }
    if (posn < len && fileName[posn] != kFilenameExtDelim)
        return false;

    *pPartChar = partChar;
    return true;
}

/*static*/ bool PathName::ParseNAPS(const std::string& fileName,
    std::string* pStorageName, uint32_t* pFileType, uint32_t* pAuxType,
    bool* pIsHFS, char* pPartChar)
{
    static const int kDigitCounts[] = { 6, 16 };

    /*
     * The six-digit form wins if both could match.  Within a form, use the
     * last '#' that yields a match, so "foo#bar#0612ab" is named "foo#bar".
     */
    for (size_t form = 0; form < NELEM(kDigitCounts); form++) {
        int numDigits = kDigitCounts[form];
        size_t hashPosn = fileName.rfind(kPreserveIndic);
        while (hashPosn != std::string::npos) {
            char partChar;
            if (MatchNAPSAt(fileName, hashPosn, numDigits, &partChar)) {
                std::string digits = fileName.substr(hashPosn + 1, numDigits);
                int half = numDigits == 6 ? 2 : 8;
                *pFileType = (uint32_t) strtoul(digits.substr(0, half).c_str(),
                    NULL, 16);
                *pAuxType = (uint32_t) strtoul(digits.substr(half).c_str(),
                    NULL, 16);
                *pIsHFS = (numDigits == 16);
                *pPartChar = partChar;
                *pStorageName = fileName.substr(0, hashPosn);
                return true;
            }
            if (hashPosn == 0)
                break;
            hashPosn = fileName.rfind(kPreserveIndic, hashPosn - 1);
        }
    }
    return false;
}
