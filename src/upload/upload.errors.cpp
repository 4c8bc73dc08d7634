#include "upload.errors.hh"

objupload::UploadError::UploadError(ObjUploadStatusCode code,
                                    const std::string& what)
  : std::runtime_error(what)
  , code_{ code }
{
}

const char*
objupload::status_message(ObjUploadStatusCode code) noexcept
{
    switch (code) {
        case ObjUploadStatusCode_Success:
            return "Success";
        case ObjUploadStatusCode_InvalidArgument:
            return "Invalid argument";
        case ObjUploadStatusCode_InvalidSettings:
            return "Invalid settings";
        case ObjUploadStatusCode_FileNotFound:
            return "File not found";
        case ObjUploadStatusCode_IOError:
            return "I/O error";
        case ObjUploadStatusCode_BackendError:
            return "Backend error";
        case ObjUploadStatusCode_InvariantViolation:
            return "Invariant violation";
        case ObjUploadStatusCode_InternalError:
            return "Internal error";
        case ObjUploadStatusCode_OutOfMemory:
            return "Out of memory";
        default:
            return "Unknown error";
    }
}
