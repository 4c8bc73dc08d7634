#pragma once

#include "logger.types.h"
#include "objupload.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace objupload {
struct S3Config
{
    std::string endpoint;
    std::string bucket_name;
    std::string access_key_id;
    std::string secret_access_key;
};

/**
 * @brief Everything one upload needs, fixed before the upload starts.
 */
struct UploadConfig
{
    S3Config s3;
    std::string file_path;
    std::string object_key;

    uint64_t part_size{ OBJUPLOAD_DEFAULT_PART_SIZE };
    ObjUploadPartSplit part_split{ ObjUploadPartSplit_FixedSize };
    uint32_t max_concurrency{ 1 };
    uint32_t max_retries{ 0 };
    bool abort_on_failure{ true };

    LogLevel log_level{ LogLevel_Info };
    bool show_progress{ true };
};

/**
 * @brief Check the options that shape a transfer: part size, split policy
 * and concurrency.
 * @return True if they are valid. Each problem is logged.
 */
[[nodiscard]]
bool
validate_transfer_options(const UploadConfig& config);

/**
 * @brief Check that every part planned from the part size is one an S3 store
 * accepts, between 5 MiB and 5 GiB.
 * @details With ObjUploadPartSplit_EvenByCount parts may be as small as half
 * the part size, so the lower bound doubles.
 */
[[nodiscard]]
bool
validate_s3_part_size(const UploadConfig& config);

/**
 * @brief Check a whole configuration, transfer options and S3 part size
 * included.
 * @return True if it is valid. Each problem is logged.
 */
[[nodiscard]]
bool
validate_config(const UploadConfig& config);

/**
 * @brief Copy C API settings into a configuration, trimming strings and
 * substituting defaults for zero values.
 * @throws std::runtime_error if @p settings is null.
 */
UploadConfig
make_config(const ObjUploadSettings* settings);

/**
 * @brief Merge a JSON configuration file into @p config.
 * @details Recognized keys are "endpoint", "bucket", "object", "file",
 * "part_size", "split", "concurrency", "retries", "abort_on_failure",
 * "log_level" and "progress". Comments are allowed. Unknown keys are an
 * error. Credentials are never read from the file.
 * @return True if the file was read and every key was valid. On failure
 * @p config may be partially updated.
 */
[[nodiscard]]
bool
load_config_file(std::string_view path, UploadConfig& config);

/// @brief Parse "fixed" or "even".
[[nodiscard]]
bool
parse_part_split(std::string_view name, ObjUploadPartSplit& split);

/// @brief Parse "debug", "info", "warning", "error" or "none".
[[nodiscard]]
bool
parse_log_level(std::string_view name, LogLevel& level);
} // namespace objupload
