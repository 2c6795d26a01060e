/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Import converters turn a host file into an Apple II file, e.g. host text
 * into carriage-return-terminated text with the TXT file type.
 */
#ifndef XFERLIB_IMPORTCONVERTER_H
#define XFERLIB_IMPORTCONVERTER_H

#include "XferLib.h"

namespace XferLib {

/*
 * Abstract base class for import converters.
 */
class XFERLIB_API ImportConverter {
public:
    ImportConverter(void) {}
    virtual ~ImportConverter(void) {}

    // Short name, for log messages.
    virtual const char* GetTag(void) const = 0;

    // Does the conversion produce a resource fork?
    virtual bool HasRsrcFork(void) const { return false; }

    /*
     * Remove the host extension that marks the file as convertible, if
     * present.  e.g. "FOO.TXT" becomes "FOO".
     */
    virtual std::string StripExtension(const std::string& fileName) const = 0;

    // File types to assign to the converted file.
    virtual void GetFileTypes(uint32_t* pFileType, uint32_t* pAuxType) const = 0;

    /*
     * Convert everything from the current position of "pIn" to end of file,
     * writing the requested part to "pOut".
     */
    virtual XferError Convert(GenericFD* pIn, FilePart part,
        GenericFD* pOut) const = 0;

private:
    ImportConverter& operator=(const ImportConverter&);
    ImportConverter(const ImportConverter&);
};

/*
 * Host text to Apple II text.  LF and CRLF line endings become CR.  If
 * "highASCII" is set, the high bit is set on every byte.
 */
class XFERLIB_API TextImportConverter : public ImportConverter {
public:
    explicit TextImportConverter(bool highASCII = false)
        : fHighASCII(highASCII)
        {}
    virtual ~TextImportConverter(void) {}

    virtual const char* GetTag(void) const override { return "text"; }
    virtual std::string StripExtension(const std::string& fileName) const override;
    virtual void GetFileTypes(uint32_t* pFileType,
        uint32_t* pAuxType) const override;
    virtual XferError Convert(GenericFD* pIn, FilePart part,
        GenericFD* pOut) const override;

private:
    bool        fHighASCII;
};

}   // namespace XferLib

#endif /*XFERLIB_IMPORTCONVERTER_H*/
