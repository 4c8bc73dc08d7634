#ifndef H_OBJUPLOAD_TYPES_V0
#define H_OBJUPLOAD_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        ObjUploadStatusCode_Success = 0,
        ObjUploadStatusCode_InvalidArgument,
        ObjUploadStatusCode_InvalidSettings,
        ObjUploadStatusCode_FileNotFound,
        ObjUploadStatusCode_IOError,
        ObjUploadStatusCode_BackendError,
        ObjUploadStatusCode_InvariantViolation,
        ObjUploadStatusCode_InternalError,
        ObjUploadStatusCode_OutOfMemory,
        ObjUploadStatusCodeCount,
    } ObjUploadStatusCode;

    typedef enum
    {
        ObjUploadLogLevel_Debug,
        ObjUploadLogLevel_Info,
        ObjUploadLogLevel_Warning,
        ObjUploadLogLevel_Error,
        ObjUploadLogLevel_None,
        ObjUploadLogLevelCount
    } ObjUploadLogLevel;

    /**
     * @brief How a file larger than the part size threshold is cut into
     * parts.
     * @details FixedSize cuts parts of exactly the threshold size, leaving the
     * remainder in a smaller final part. EvenByCount cuts ceil(size/threshold)
     * parts of equal size and folds the remainder into the final part.
     */
    typedef enum
    {
        ObjUploadPartSplit_FixedSize = 0,
        ObjUploadPartSplit_EvenByCount,
        ObjUploadPartSplitCount
    } ObjUploadPartSplit;

    typedef enum
    {
        ObjUploadProgressPhase_Started = 0,
        ObjUploadProgressPhase_DataTransferred,
        ObjUploadProgressPhase_Completed,
        ObjUploadProgressPhase_Failed,
        ObjUploadProgressPhaseCount
    } ObjUploadProgressPhase;

    /**
     * @brief A progress event for one tracked transfer.
     * @details A tracked transfer is either the whole-file put (part_number
     * 0) or a single part of a multipart upload. The object_* fields hold the
     * running total across all parts of the object.
     */
    typedef struct
    {
        ObjUploadProgressPhase phase;
        uint32_t part_number;           /**< 0 for a whole-file transfer */
        uint64_t consumed_bytes;        /**< Bytes sent in this transfer */
        uint64_t total_bytes;           /**< Bytes in this transfer */
        uint64_t object_consumed_bytes; /**< Bytes sent for the object */
        uint64_t object_total_bytes;    /**< Bytes in the object */
    } ObjUploadProgressEvent;

    /**
     * @brief Receives progress events. Calls are serialized, never concurrent.
     */
    typedef void (*ObjUploadProgressCallback)(
      const ObjUploadProgressEvent* event,
      void* user_data);

    /**
     * @brief S3 settings for the destination bucket.
     */
    typedef struct
    {
        const char* endpoint;
        const char* bucket_name;
        const char* access_key_id;
        const char* secret_access_key;
    } ObjUploadS3Settings;

#ifdef __cplusplus
}
#endif

#endif // H_OBJUPLOAD_TYPES_V0
