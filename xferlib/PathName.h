/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Filename manipulations.  Converts between Apple II / Mac file names and
 * host file names, and handles the NAPS and MacZip naming conventions.
 */
#ifndef XFERLIB_PATHNAME_H
#define XFERLIB_PATHNAME_H

#include "XferLib.h"
#include <string>

namespace XferLib {

/*
 * This class is just a namespace clumper.  Do not instantiate.
 *
 * All of the path-building functions produce host paths, separated with
 * kHostDirSep.
 */
class XFERLIB_API PathName {
public:
    static const char kDefaultReplChar = '_';
    static const char kEscapeChar = '%';        // "%2f" for NAPS names
    static const char kNoDirSep = '\0';
    static const char* kMirandaFileName;        // used when name is empty

    static const char* kASExtension;            // ".as"
    static const char* kADFPrefix;              // "._"
    static const char* kMacZipDir;              // "__MACOSX"
    static const char* kRsrcForkSuffix;         // "/..namedfork/rsrc"

    /*
     * Replace characters that can't appear in a host file name with
     * "replChar".  An empty name becomes kMirandaFileName.
     */
    static std::string AdjustFileName(const std::string& fileName,
        char replChar = kDefaultReplChar);

    /*
     * Escape characters that can't appear in a host file name, as well as
     * control characters and DEL, as "%xx".  '%' becomes "%%".
     */
    static std::string EscapeFileName(const std::string& fileName);

    /*
     * Undo EscapeFileName.  "%%" becomes '%', "%xx" becomes the byte with
     * that value, and "%00" is dropped.  If the unescaped character would be
     * "dirSep", we output '%' instead, so that the result can't be split.
     * Anything that doesn't look like a valid escape is left alone.
     */
    static std::string UnescapeFileName(const std::string& fileName,
        char dirSep);

    /*
     * Replace control characters with printable glyphs (the Unicode
     * "control pictures" block, UTF-8 encoded).
     */
    static std::string PrintifyControlChars(const std::string& str);

    /*
     * Convert a path from a foreign container to a host path.  Each
     * component is passed through AdjustFileName.  AdjustEscapePathName
     * escapes the filename component instead, and only adjusts the
     * directory names.
     */
    static std::string AdjustPathName(const std::string& pathName,
        char dirSep, char replChar = kDefaultReplChar);
    static std::string AdjustEscapePathName(const std::string& pathName,
        char dirSep, char replChar = kDefaultReplChar);

    // Split a path.  The directory name doesn't include the trailing sep.
    static std::string GetFileName(const std::string& pathName, char dirSep);
    static std::string GetDirectoryName(const std::string& pathName,
        char dirSep);
    // Join two pieces with "dirSep", omitting it if either is empty.
    static std::string Combine(const std::string& dirName,
        const std::string& fileName, char dirSep);

    /*
     * Returns true if "str" ends with "suffix", ignoring case.
     */
    static bool EndsWithNoCase(const std::string& str, const char* suffix);

    /*
     * MacZip naming.  "dir/foo" pairs with "__MACOSX/dir/._foo".  Returns
     * an empty string for a directory name (path ends with the separator).
     */
    static std::string GenerateMacZipName(const std::string& fullName,
        char dirSep);
    static bool IsMacZipHeader(const std::string& fullName, char dirSep);

    /*
     * NAPS ("NuLib2 Attribute Preservation String") tags.  ProDOS types
     * look like "#0612ab", HFS types like "#5445585474747874" (when the
     * ProDOS types are zero).  A resource fork adds an 'r'.
     */
    static std::string GenerateNAPSTag(uint32_t fileType, uint32_t auxType,
        uint32_t hfsFileType, uint32_t hfsCreator);

    /*
     * Parse a NAPS-tagged file name.  The tag may be followed by a part
     * character ('d', 'r', or 'i', either case) and a host extension that
     * we throw away.  On success, returns true and fills in the pieces;
     * "*pPartChar" is lower case, or '\0' if there wasn't one.  If the
     * tag had 16 digits, the values go into the HFS fields and "*pIsHFS"
     * is set.
     */
    static bool ParseNAPS(const std::string& fileName, std::string* pStorageName,
        uint32_t* pFileType, uint32_t* pAuxType, bool* pIsHFS, char* pPartChar);

private:
    // no instantiation allowed
    PathName(void) {}
    ~PathName(void) {}

    static bool IsInvalidHostChar(unsigned char ch);
    static bool MatchNAPSAt(const std::string& fileName, size_t hashPosn,
        int numDigits, char* pPartChar);
};

}   // namespace XferLib

#endif /*XFERLIB_PATHNAME_H*/
