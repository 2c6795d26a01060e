/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Information passed to the application's callback while files are being
 * added, copied, extracted, or deleted.
 */
#ifndef XFERLIB_CALLBACKFACTS_H
#define XFERLIB_CALLBACKFACTS_H

#include "XferLib.h"

namespace XferLib {

/*
 * The callback decides what happens next.  Only some results make sense
 * for each reason; anything else is treated as Cancel.
 */
class XFERLIB_API CallbackFacts {
public:
    typedef enum Reason {
        kReasonUnknown = 0,

        // Just a progress update.  Percent complete in progressPercent.
        kReasonProgress,

        // Query cancellation status, so a GUI can interrupt between files.
        // Options: Continue, Cancel
        kReasonQueryCancel,

        // Resource fork was dropped because the target can't hold it.
        // Options: Continue, Cancel
        kReasonResourceForkIgnored,

        // File with same name already exists.
        // Options: Overwrite, Skip, Cancel
        kReasonFileNameExists,

        // Pathname exceeded target storage limits.
        // Options: Skip, Cancel
        kReasonPathTooLong,

        // Failed to set all file attributes.
        // Options: Continue, Cancel
        kReasonAttrFailure,

        // Unable to overwrite existing file.
        // Options: Continue, Cancel
        kReasonOverwriteFailure,

        // Operation has failed completely.  Reason in failMessage.
        // Options: Cancel
        kReasonFailure,
    } Reason;

    typedef enum Result {
        kResultUnknown = 0,
        kResultContinue,        // keep going
        kResultCancel,          // abort the entire operation
        kResultSkip,            // skip this entry
        kResultOverwrite,       // overwrite existing entry with same name
    } Result;

    typedef enum DOSConvMode {
        kDOSConvUnknown = 0,
        kDOSConvNone,
        kDOSConvFromDOS,        // strip the high bit
        kDOSConvToDOS,          // set the high bit
    } DOSConvMode;

    CallbackFacts(void)
        : reason(kReasonUnknown), origDirSep('\0'), origModWhen(kDateNone),
          newDirSep('\0'), newModWhen(kDateNone), progressPercent(-1),
          part(kPartUnknown), dosConv(kDOSConvUnknown)
        {}
    explicit CallbackFacts(Reason why)
        : reason(why), origDirSep('\0'), origModWhen(kDateNone),
          newDirSep('\0'), newModWhen(kDateNone), progressPercent(-1),
          part(kPartUnknown), dosConv(kDOSConvUnknown)
        {}
    CallbackFacts(Reason why, const std::string& origName, char origSep)
        : reason(why), origPathName(origName), origDirSep(origSep),
          origModWhen(kDateNone), newDirSep('\0'), newModWhen(kDateNone),
          progressPercent(-1), part(kPartUnknown), dosConv(kDOSConvUnknown)
        {}

    Reason      reason;

    std::string origPathName;
    char        origDirSep;
    time_t      origModWhen;

    std::string newPathName;
    char        newDirSep;
    time_t      newModWhen;

    int         progressPercent;
    FilePart    part;
    DOSConvMode dosConv;
    std::string failMessage;
};

/*
 * Callback function.  "vState" is whatever the application passed in
 * along with the function pointer.
 */
typedef CallbackFacts::Result (*XferCallback)(const CallbackFacts* pFacts,
    void* vState);

}   // namespace XferLib

#endif /*XFERLIB_CALLBACKFACTS_H*/
