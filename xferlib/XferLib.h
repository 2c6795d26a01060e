/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Public declarations for the Xfer library.
 *
 * Everything is wrapped in the "XferLib" namespace.  Either prefix
 * all references with "XferLib::", or add "using namespace XferLib"
 * to all C++ source files that make use of it.
 *
 * The library moves files between host directories, file archives, and
 * filesystems on disk images.  It doesn't know how to read or write any
 * particular archive or filesystem format; those are handed to it through
 * the Archive and FileSystem interfaces declared here.
 *
 * Under Linux, this should be compiled with -D_FILE_OFFSET_BITS=64.
 *
 * None of this is thread-safe.  A transfer runs to completion on the
 * caller's thread, calling back into the application for progress updates
 * and decisions.
 */
#ifndef XFERLIB_XFERLIB_H
#define XFERLIB_XFERLIB_H

#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>
#include <time.h>
#include <sys/types.h>
#include <string>

#define XFERLIB_API

namespace XferLib {

/* compiled-against versions; call Global::GetVersion for linked-against */
#define kXferLibVersionMajor    1
#define kXferLibVersionMinor    0
#define kXferLibVersionBug      2


/*
 * Errors from the various Xfer classes.
 */
typedef enum XferError {
    kXferErrNone                = 0,

    /* I/O request errors */
    kXferErrAccessDenied        = -10,
    kXferErrWriteProtected      = -14,  // destination is read-only

    kXferErrFileNotFound        = -20,
    kXferErrForkNotFound        = -21,  // requested fork does not exist
    kXferErrAlreadyOpen         = -22,  // already open, can't open a 2nd time
    kXferErrFileOpen            = -23,  // file is open, can't delete it
    kXferErrNotReady            = -24,
    kXferErrFileExists          = -25,  // file already exists
    kXferErrDirectoryExists     = -26,  // directory already exists

    kXferErrEOF                 = -30,  // end-of-file reached
    kXferErrReadFailed          = -31,
    kXferErrWriteFailed         = -32,
    kXferErrGenericIO           = -35,  // generic I/O error

    kXferErrUnrecognizedFileFmt = -41,  // file format just not recognized
    kXferErrBadFileFormat       = -42,  // contents don't match the format

    kXferErrBadFile             = -63,  // damaged file in archive or image
    kXferErrBadDirectory        = -64,  // damaged directory
    kXferErrBadArchiveStruct    = -74,  // bad archive structure

    kXferErrInvalidFileName     = -90,  // tried to create file with bad name
    kXferErrDiskFull            = -91,  // no space left on disk
    kXferErrNameTooLong         = -95,  // name can't be stored in target
    kXferErrTypeMismatch        = -96,  // file where dir expected, or v.v.
    kXferErrSelfOverwrite       = -97,  // tried to replace a file with itself

    /* higher-level errors */
    kXferErrGeneric             = -101,
    kXferErrInternal            = -102,
    kXferErrMalloc              = -103,
    kXferErrInvalidArg          = -104,
    kXferErrNotSupported        = -105, // feature not currently supported
    kXferErrCancelled           = -106, // an operation was cancelled by user

    kXferErrNufxLibInitFailed   = -110,
} XferError;

/* return a string describing the error */
XFERLIB_API const char* XferStrError(XferError xerr);

/*
 * Overall result of a multi-file operation.  "Cancelled" is not a failure;
 * files that were completely written before the cancel remain.
 */
typedef enum XferStatus {
    kXferOK = 0,
    kXferFailed,
    kXferCancelled
} XferStatus;


/* exact definition of off_t varies, so just define our own */
typedef off_t xf_off_t;

/* common definition of "whence" for seeks */
enum XferWhence {
    kSeekSet = SEEK_SET,
    kSeekCur = SEEK_CUR,
    kSeekEnd = SEEK_END
};

/* time_t values for bad dates */
#define kDateNone       ((time_t) -2)
#define kDateInvalid    ((time_t) -1)       // should match return from mktime()

inline bool IsValidDate(time_t when) {
    return when != kDateNone && when != kDateInvalid;
}

/* ProDOS-style access flags */
const uint32_t kFileAccessDestroy   = 0x80;
const uint32_t kFileAccessRename    = 0x40;
const uint32_t kFileAccessInvisible = 0x04;
const uint32_t kFileAccessWrite     = 0x02;
const uint32_t kFileAccessRead      = 0x01;
const uint32_t kFileAccessUnlocked  = 0xc3;
const uint32_t kFileAccessLocked    = 0x01;

/* a few ProDOS file types we care about */
const uint32_t kFileTypeNON = 0x00;
const uint32_t kFileTypeTXT = 0x04;
const uint32_t kFileTypeBIN = 0x06;
const uint32_t kFileTypeDIR = 0x0f;

/* host directory separator */
const char kHostDirSep = '/';

/*
 * Which part of a file we're talking about.
 */
typedef enum FilePart {
    kPartUnknown = 0,
    kPartDataFork,
    kPartRsrcFork,
    kPartRawData,           // DOS 3.x file without the header/length clip
    kPartDiskImage,
} FilePart;

/*
 * How to represent file types and resource forks on a host filesystem
 * that can't hold them.
 */
typedef enum PreserveMode {
    kPreserveUnknown = 0,
    kPreserveNone,          // discard types and resource fork
    kPreserveADF,           // AppleDouble "._" header file
    kPreserveAS,            // AppleSingle ".as" file
    kPreserveHost,          // host's own named fork and xattrs
    kPreserveNAPS,          // NuLib2 attribute preservation strings
} PreserveMode;

/*
 * Filesystem formats the engine needs to tell apart.  Only DOS-ness
 * actually changes behavior.
 */
typedef enum FileSystemType {
    kFSUnknown = 0,
    kFSDOS32,
    kFSDOS33,
    kFSProDOS,
    kFSHFS,
    kFSPascal,
    kFSCPM,
    kFSRDOS,
    kFSGutenberg,
    kFSMFS,
} FileSystemType;

inline bool IsDOSFlavored(FileSystemType fsType) {
    return fsType == kFSDOS32 || fsType == kFSDOS33;
}

typedef enum CompressionFormat {
    kCompressDefault = 0,   // whatever the archive likes best
    kCompressUncompressed,
} CompressionFormat;


/* forward and external class definitions */
class GenericFD;
class FileEntry;
class Archive;
class FileSystem;
class PartSource;
class CallbackFacts;


/*
 * Library-global data functions.
 *
 * This class is just a namespace clumper.  Do not instantiate.
 */
class XFERLIB_API Global {
public:
    // one-time library initialization; use SetDebugMsgHandler first
    static XferError AppInit(void);
    // one-time library cleanup
    static XferError AppCleanup(void);

    // return the Xfer library version number
    static void GetVersion(int32_t* pMajor, int32_t* pMinor, int32_t* pBug);

    static bool GetAppInitCalled(void) { return fAppInitCalled; }

    // pointer to the debug message handler
    typedef void (*DebugMsgHandler)(const char* file, int line, const char* msg);
    static DebugMsgHandler gDebugMsgHandler;

    static DebugMsgHandler SetDebugMsgHandler(DebugMsgHandler handler);
    static void PrintDebugMsg(const char* file, int line, const char* fmt, ...)
        #if defined(__GNUC__)
            __attribute__ ((format(printf, 3, 4)))
        #endif
        ;

private:
    // no instantiation allowed
    Global(void) {}
    ~Global(void) {}

    // make sure app calls AppInit
    static bool fAppInitCalled;
};


/*
 * Abstract representation of a file in an archive or on a filesystem.
 *
 * All Apple II files have certain characteristics, of which ProDOS is
 * roughly a superset.  Files from HFS volumes and MacZip archives also
 * have four-byte file types and creators, so we carry both sets.  Most
 * containers can only store one kind or the other; HasProDOSTypes and
 * HasHFSTypes report which.
 *
 * The path name uses the container's directory separator, returned by
 * GetFssep ('\0' if the container doesn't have one).  On a filesystem,
 * the volume directory's name is not part of the path.
 *
 * Entries are owned by their container.  Don't delete them.
 */
class XFERLIB_API FileEntry {
public:
    FileEntry(void) {}
    virtual ~FileEntry(void) {}

    virtual const char* GetFileName(void) const = 0;    // name of this file
    virtual const char* GetPathName(void) const = 0;    // full path
    virtual char GetFssep(void) const = 0;              // '\0' if none
    virtual uint32_t GetFileType(void) const = 0;
    virtual uint32_t GetAuxType(void) const = 0;
    virtual uint32_t GetHFSFileType(void) const { return 0; }
    virtual uint32_t GetHFSCreator(void) const { return 0; }
    virtual uint32_t GetAccess(void) const = 0;         // ProDOS-style perms
    virtual time_t GetCreateWhen(void) const = 0;
    virtual time_t GetModWhen(void) const = 0;
    virtual xf_off_t GetDataLength(void) const = 0;     // len of data fork
    virtual xf_off_t GetRsrcLength(void) const = 0;     // len or -1 if no rsrc
    virtual bool HasDataFork(void) const = 0;
    virtual bool HasRsrcFork(void) const = 0;
    virtual bool IsDirectory(void) const { return false; }
    virtual bool IsDamaged(void) const { return false; }

    // Parent directory, or NULL for the volume dir and for archive entries.
    virtual FileEntry* GetParent(void) const { return NULL; }

    // Which typing schemes the container can store for this entry.
    virtual bool HasProDOSTypes(void) const { return true; }
    virtual bool HasHFSTypes(void) const { return false; }

    /*
     * Attribute setters.  Filesystems apply these when SaveChanges is
     * called; archives apply them when the transaction is committed.
     */
    virtual void SetFileType(uint32_t fileType) = 0;
    virtual void SetAuxType(uint32_t auxType) = 0;
    virtual void SetHFSFileType(uint32_t fileType) { (void) fileType; }
    virtual void SetHFSCreator(uint32_t creator) { (void) creator; }
    virtual void SetAccess(uint32_t access) = 0;
    virtual void SetCreateWhen(time_t when) = 0;
    virtual void SetModWhen(time_t when) = 0;
    virtual XferError SaveChanges(void) { return kXferErrNone; }

private:
    FileEntry& operator=(const FileEntry&);
    FileEntry(const FileEntry&);
};


/*
 * A file archive: ShrinkIt, ZIP, AppleSingle, and so on.
 *
 * Modifications happen inside a transaction.  Records and parts added
 * during the transaction don't show up in the entry list until the
 * transaction is committed.  Part sources handed to AddPart become the
 * property of the archive, which reads them during the commit and
 * deletes them when the transaction ends either way.
 *
 * The application starts and commits the transaction; the workers just
 * add and delete things.
 */
class XFERLIB_API Archive {
public:
    Archive(void) {}
    virtual ~Archive(void) {}

    typedef struct Characteristics {
        const char* name;           // e.g. "NuFX (ShrinkIt)"
        bool    canWrite;
        bool    hasResourceForks;
        bool    keepsEmptyRsrc;     // zero-length rsrc fork still counts (NuFX)
        bool    hasSingleEntry;     // AppleSingle, gzip
        bool    isMacZipCapable;    // can hold "__MACOSX" AppleDouble pairs
        char    defaultDirSep;      // '\0' if archive doesn't do paths
    } Characteristics;

    virtual const Characteristics& GetCharacteristics(void) const = 0;
    virtual bool IsDubious(void) const { return false; }

    virtual long GetEntryCount(void) const = 0;
    virtual FileEntry* GetEntry(long idx) const = 0;

    /*
     * Find an entry by exact path name.  Returns NULL if not found.  The
     * default implementation does a linear scan.
     */
    virtual FileEntry* FindEntry(const char* pathName) const;

    /*
     * Open one part of an entry for reading.  The caller must delete the
     * descriptor when done.  Archive streams may not be seekable.
     */
    virtual XferError OpenPart(FileEntry* pEntry, FilePart part,
        GenericFD** ppGFD) = 0;

    virtual XferError StartTransaction(void) = 0;
    virtual XferError CreateRecord(const char* pathName, char fssep,
        FileEntry** ppEntry) = 0;
    virtual XferError DeleteRecord(FileEntry* pEntry) = 0;
    virtual XferError AddPart(FileEntry* pEntry, FilePart part,
        PartSource* pSource, CompressionFormat format) = 0;
    virtual XferError CommitTransaction(void) = 0;
    virtual void CancelTransaction(void) = 0;

    // Replace characters the archive can't store.
    virtual std::string AdjustFileName(const std::string& fileName) const {
        return fileName;
    }
    // Returns false if the full storage name is unacceptable (too long).
    virtual bool CheckStorageName(const std::string& pathName) const {
        (void) pathName;
        return true;
    }

private:
    Archive& operator=(const Archive&);
    Archive(const Archive&);
};


/*
 * A filesystem on a disk image: DOS 3.3, ProDOS, HFS, and so on.
 *
 * Changes are written as they are made.
 */
class XFERLIB_API FileSystem {
public:
    FileSystem(void) {}
    virtual ~FileSystem(void) {}

    typedef struct Characteristics {
        const char* name;           // e.g. "ProDOS"
        FileSystemType fsType;
        bool    isHierarchical;
        bool    hasResourceForks;
        bool    isCaseSensitive;
        char    dirSep;             // '\0' if not hierarchical
    } Characteristics;

    typedef enum CreateMode {
        kCreateUnknown = 0,
        kCreateFile,
        kCreateExtended,            // file with a resource fork
        kCreateDirectory,
    } CreateMode;

    /*
     * Details for a new file.  The types are ProDOS values, and are known
     * before any data is written; DOS 3.3 needs them to decide how the
     * file is laid out.  Filesystems without ProDOS types convert them.
     */
    typedef struct CreateParms {
        CreateMode  mode;
        uint32_t    fileType;
        uint32_t    auxType;
    } CreateParms;

    virtual const Characteristics& GetCharacteristics(void) const = 0;
    virtual bool IsReadOnly(void) const = 0;
    virtual bool IsDubious(void) const { return false; }

    virtual FileEntry* GetVolDirEntry(void) const = 0;
    virtual long GetChildCount(const FileEntry* pDir) const = 0;
    virtual FileEntry* GetChild(const FileEntry* pDir, long idx) const = 0;

    /*
     * Find a file in a directory.  Name comparison follows the filesystem's
     * case-sensitivity.  Returns NULL if not found.
     */
    virtual FileEntry* FindFileEntry(const FileEntry* pDir,
        const char* fileName) const;

    virtual XferError CreateFile(FileEntry* pDir, const char* fileName,
        const CreateParms* pParms, FileEntry** ppEntry) = 0;
    virtual XferError DeleteFile(FileEntry* pEntry) = 0;

    /*
     * Open one fork of a file.  The caller must delete the descriptor when
     * done.  Descriptors opened for writing flush on delete.
     */
    virtual XferError OpenFile(FileEntry* pEntry, bool readOnly,
        FilePart part, GenericFD** ppGFD) = 0;

    // Replace characters the filesystem can't store, and clamp the length.
    virtual std::string AdjustFileName(const std::string& fileName) const {
        return fileName;
    }

    /*
     * Find or create each directory named in "dirPath" (components split
     * on "dirSep"), starting at "pBaseDir".  On success, *ppDir is the
     * innermost directory.  Fails with kXferErrTypeMismatch if a plain file
     * is in the way.
     */
    XferError CreateSubdirectories(FileEntry* pBaseDir,
        const std::string& dirPath, char dirSep, FileEntry** ppDir);

private:
    FileSystem& operator=(const FileSystem&);
    FileSystem(const FileSystem&);
};


/*
 * An archive or a filesystem.  The workers accept either, and need to know
 * which one they were handed.
 */
class XFERLIB_API XferContainer {
public:
    typedef enum Kind {
        kKindNone = 0,
        kKindArchive,
        kKindFileSystem,
    } Kind;

    XferContainer(void)
        : fKind(kKindNone), fpArchive(NULL), fpFileSystem(NULL)
        {}
    explicit XferContainer(Archive* pArchive)
        : fKind(kKindArchive), fpArchive(pArchive), fpFileSystem(NULL)
        {}
    explicit XferContainer(FileSystem* pFileSystem)
        : fKind(kKindFileSystem), fpArchive(NULL), fpFileSystem(pFileSystem)
        {}

    Kind GetKind(void) const { return fKind; }
    bool IsArchive(void) const { return fKind == kKindArchive; }
    bool IsFileSystem(void) const { return fKind == kKindFileSystem; }
    Archive* GetArchive(void) const { return fpArchive; }
    FileSystem* GetFileSystem(void) const { return fpFileSystem; }

    // Open a part of an entry for reading, from whichever we hold.
    XferError OpenPart(FileEntry* pEntry, FilePart part,
        GenericFD** ppGFD) const;

    // Returns the filesystem format, or kFSUnknown for archives.
    FileSystemType GetFSType(void) const;

    bool operator==(const XferContainer& other) const {
        return fKind == other.fKind && fpArchive == other.fpArchive &&
            fpFileSystem == other.fpFileSystem;
    }

private:
    Kind        fKind;
    Archive*    fpArchive;
    FileSystem* fpFileSystem;
};


/*
 * Snapshot of a file's attributes.  Taken when a transfer is planned, so
 * that later changes to the source can't alter the plan.
 */
class XFERLIB_API FileAttribs {
public:
    FileAttribs(void);
    explicit FileAttribs(const FileEntry* pEntry);

    std::string fullPathName;   // full path, using fullPathSep
    char        fullPathSep;
    std::string fileNameOnly;
    bool        isDirectory;
    xf_off_t    dataLength;
    xf_off_t    rsrcLength;     // -1 if no resource fork
    uint32_t    fileType;
    uint32_t    auxType;
    uint32_t    hfsFileType;
    uint32_t    hfsCreator;
    uint32_t    access;
    time_t      createWhen;
    time_t      modWhen;

    // True if any of the type fields is nonzero.
    bool HasTypeInfo(void) const {
        return fileType != 0 || auxType != 0 || hfsFileType != 0 ||
            hfsCreator != 0;
    }

    /*
     * Copy the attributes to a file entry.  If the destination can only
     * hold one typing scheme, the other is converted when possible (ProDOS
     * types ride in HFS types as 'pXYY'/'pdos').  Dates are copied only if
     * valid.  Doesn't call SaveChanges.
     */
    void CopyAttrsTo(FileEntry* pEntry) const;

    // ProDOS types, pulled out of a 'pdos' HFS type if that's all we have.
    void GetProDOSTypes(uint32_t* pFileType, uint32_t* pAuxType) const;
};

/* HFS creator used to carry ProDOS types */
const uint32_t kPdosCreator = 0x70646f73;      // 'pdos'

}   // namespace XferLib

#endif /*XFERLIB_XFERLIB_H*/
