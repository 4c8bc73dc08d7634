#include "objupload.h"
#include "local.file.hh"
#include "macros.hh"
#include "s3.backend.hh"
#include "upload.config.hh"
#include "upload.orchestrator.hh"

#include <cstdint> // uint32_t

extern "C"
{
    uint32_t ObjUpload_get_api_version()
    {
        return OBJUPLOAD_API_VERSION;
    }

    ObjUploadStatusCode ObjUpload_set_log_level(ObjUploadLogLevel level_)
    {
        LogLevel level;
        switch (level_) {
            case ObjUploadLogLevel_Debug:
                level = LogLevel_Debug;
                break;
            case ObjUploadLogLevel_Info:
                level = LogLevel_Info;
                break;
            case ObjUploadLogLevel_Warning:
                level = LogLevel_Warning;
                break;
            case ObjUploadLogLevel_Error:
                level = LogLevel_Error;
                break;
            case ObjUploadLogLevel_None:
                level = LogLevel_None;
                break;
            default:
                return ObjUploadStatusCode_InvalidArgument;
        }

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return ObjUploadStatusCode_InternalError;
        }
        return ObjUploadStatusCode_Success;
    }

    ObjUploadLogLevel ObjUpload_get_log_level()
    {
        ObjUploadLogLevel level;
        switch (Logger::get_log_level()) {
            case LogLevel_Debug:
                level = ObjUploadLogLevel_Debug;
                break;
            case LogLevel_Info:
                level = ObjUploadLogLevel_Info;
                break;
            case LogLevel_Warning:
                level = ObjUploadLogLevel_Warning;
                break;
            case LogLevel_None:
                level = ObjUploadLogLevel_None;
                break;
            default:
                level = ObjUploadLogLevel_Error;
                break;
        }
        return level;
    }

    const char* ObjUpload_get_status_message(ObjUploadStatusCode code)
    {
        return objupload::status_message(code);
    }

    ObjUploadStatusCode ObjUpload_upload_file(const ObjUploadSettings* settings)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");
        EXPECT_VALID_ARGUMENT(settings->s3_settings,
                              "Null pointer: s3_settings");

        try {
            const auto config = objupload::make_config(settings);
            if (!objupload::validate_config(config)) {
                return ObjUploadStatusCode_InvalidSettings;
            }

            // report a missing or unreadable file before reaching out to
            // the store
            {
                objupload::LocalFile source(config.file_path);
            }

            std::shared_ptr<objupload::ProgressReporter> reporter;
            if (settings->progress_callback != nullptr) {
                reporter = std::make_shared<objupload::CallbackProgressReporter>(
                  settings->progress_callback, settings->progress_user_data);
            }

            auto pool = std::make_shared<objupload::S3ConnectionPool>(
              config.max_concurrency,
              config.s3.endpoint,
              config.s3.access_key_id,
              config.s3.secret_access_key);
            auto backend = std::make_shared<objupload::S3Backend>(
              config.s3.bucket_name, pool);

            objupload::UploadOrchestrator orchestrator(
              config, backend, reporter);
            orchestrator.upload();
        } catch (const objupload::UploadError& e) {
            LOG_ERROR("Error uploading file: ", e.what());
            return e.code();
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for upload");
            return ObjUploadStatusCode_OutOfMemory;
        } catch (const std::exception& e) {
            LOG_ERROR("Error uploading file: ", e.what());
            return ObjUploadStatusCode_InternalError;
        }

        return ObjUploadStatusCode_Success;
    }
}
