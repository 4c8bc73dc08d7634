#ifndef H_OBJUPLOAD_V0
#define H_OBJUPLOAD_V0

#include "objupload.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

#define OBJUPLOAD_API_VERSION 0

#define OBJUPLOAD_DEFAULT_PART_SIZE ((uint64_t)1 << 30) /* 1 GiB */

    /**
     * @brief The settings for uploading one file.
     * @details Files of at most @p part_size bytes are uploaded with a single
     * request. Larger files are uploaded in parts of about @p part_size bytes.
     * A zero @p part_size selects OBJUPLOAD_DEFAULT_PART_SIZE, and a zero
     * @p max_concurrency selects sequential upload. Otherwise @p part_size
     * must lie in [5 MiB, 5 GiB] (from 10 MiB with
     * ObjUploadPartSplit_EvenByCount) and @p max_concurrency may be at most
     * 64.
     */
    typedef struct ObjUploadSettings_s
    {
        const char* file_path;            /**< Local file to upload. */
        const char* object_key;           /**< Destination object name. */
        ObjUploadS3Settings* s3_settings; /**< Destination bucket. */
        uint64_t part_size;               /**< Simple/multipart threshold. */
        ObjUploadPartSplit part_split;    /**< How to cut parts. */
        uint32_t max_concurrency;         /**< Parts in flight at once. */
        uint32_t max_retries; /**< Retries of a failed transfer. */
        bool abort_on_failure; /**< Abort an abandoned multipart upload. */
        ObjUploadProgressCallback progress_callback; /**< May be NULL. */
        void* progress_user_data; /**< Passed back to the callback. */
    } ObjUploadSettings;

    /**
     * @brief Get the version of the upload API.
     * @return The version of the upload API.
     */
    uint32_t ObjUpload_get_api_version();

    /**
     * @brief Set the log level for the upload API.
     * @param level The log level.
     * @return ObjUploadStatusCode_Success on success, or an error code on
     * failure.
     */
    ObjUploadStatusCode ObjUpload_set_log_level(ObjUploadLogLevel level);

    /**
     * @brief Get the log level for the upload API.
     * @return The log level for the upload API.
     */
    ObjUploadLogLevel ObjUpload_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* ObjUpload_get_status_message(ObjUploadStatusCode status);

    /**
     * @brief Upload a local file to an object in an S3 bucket.
     * @details Blocks until the object is complete or the upload has failed.
     * No partially uploaded object ever becomes visible.
     * @param settings The settings for the upload.
     * @return ObjUploadStatusCode_Success on success, or an error code on
     * failure.
     */
    ObjUploadStatusCode ObjUpload_upload_file(const ObjUploadSettings* settings);

#ifdef __cplusplus
}
#endif

#endif // H_OBJUPLOAD_V0
