#include "macros.hh"
#include "part.planner.hh"
#include "thread.pool.hh"
#include "upload.common.hh"
#include "upload.config.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <string_view>

namespace {
[[nodiscard]]
bool
validate_s3_config(const objupload::S3Config& s3)
{
    using objupload::is_empty_string;

    if (is_empty_string(s3.endpoint, "S3 endpoint is empty")) {
        return false;
    }
    if (const auto pos = s3.endpoint.find("://"); pos != std::string::npos) {
        const std::string_view endpoint(s3.endpoint);
        if (!endpoint.starts_with("http://") &&
            !endpoint.starts_with("https://")) {
            LOG_ERROR("Invalid S3 endpoint scheme: ", s3.endpoint);
            return false;
        }
        if (endpoint.size() == pos + 3) {
            LOG_ERROR("S3 endpoint has no host: ", s3.endpoint);
            return false;
        }
    }
    if (is_empty_string(s3.access_key_id, "S3 access key ID is empty")) {
        return false;
    }
    if (is_empty_string(s3.secret_access_key,
                        "S3 secret access key is empty")) {
        return false;
    }

    std::string trimmed = objupload::trim(s3.bucket_name);
    if (trimmed.length() < 3 || trimmed.length() > 63) {
        LOG_ERROR("Invalid length for S3 bucket name: ",
                  trimmed.length(),
                  ". Must be between 3 "
                  "and 63 characters");
        return false;
    }

    return true;
}

std::string
trim_c_str(const char* s)
{
    if (s == nullptr) {
        return {};
    }
    return objupload::trim(s);
}

template<typename T>
[[nodiscard]]
bool
get_unsigned(const nlohmann::json& value, std::string_view key, T& out)
{
    if (!value.is_number_unsigned()) {
        LOG_ERROR("Config key '", key, "' must be a nonnegative integer");
        return false;
    }

    const auto n = value.get<uint64_t>();
    if (n > std::numeric_limits<T>::max()) {
        LOG_ERROR("Config key '", key, "' is out of range: ", n);
        return false;
    }

    out = static_cast<T>(n);
    return true;
}

[[nodiscard]]
bool
get_string(const nlohmann::json& value, std::string_view key, std::string& out)
{
    if (!value.is_string()) {
        LOG_ERROR("Config key '", key, "' must be a string");
        return false;
    }

    out = objupload::trim(value.get<std::string>());
    return true;
}

[[nodiscard]]
bool
get_bool(const nlohmann::json& value, std::string_view key, bool& out)
{
    if (!value.is_boolean()) {
        LOG_ERROR("Config key '", key, "' must be true or false");
        return false;
    }

    out = value.get<bool>();
    return true;
}
} // namespace

bool
objupload::validate_transfer_options(const UploadConfig& config)
{
    if (config.part_size == 0) {
        LOG_ERROR("Part size must be positive");
        return false;
    }

    if (config.part_split >= ObjUploadPartSplitCount) {
        LOG_ERROR("Invalid part split: ", config.part_split);
        return false;
    }

    if (config.max_concurrency == 0) {
        LOG_ERROR("Concurrency must be at least 1");
        return false;
    }

    if (config.max_concurrency > max_pool_workers) {
        LOG_ERROR("Concurrency must be at most ",
                  max_pool_workers,
                  ", got ",
                  config.max_concurrency);
        return false;
    }

    return true;
}

bool
objupload::validate_s3_part_size(const UploadConfig& config)
{
    // even parts come out between half the threshold and the threshold plus
    // a remainder of fewer than max_part_count bytes
    uint64_t min_size = min_s3_part_size;
    uint64_t max_size = max_s3_part_size;
    if (config.part_split == ObjUploadPartSplit_EvenByCount) {
        min_size = 2 * min_s3_part_size;
        max_size = max_s3_part_size - max_part_count;
    }

    if (config.part_size < min_size || config.part_size > max_size) {
        LOG_ERROR("Part size ",
                  format_bytes(config.part_size),
                  " is outside the range the store accepts [",
                  format_bytes(min_size),
                  ", ",
                  format_bytes(max_size),
                  "]");
        return false;
    }

    return true;
}

bool
objupload::validate_config(const UploadConfig& config)
{
    if (!validate_s3_config(config.s3)) {
        return false;
    }

    if (is_empty_string(config.file_path, "File path is empty")) {
        return false;
    }

    if (is_empty_string(config.object_key, "Object name is empty")) {
        return false;
    }

    return validate_transfer_options(config) && validate_s3_part_size(config);
}

objupload::UploadConfig
objupload::make_config(const ObjUploadSettings* settings)
{
    EXPECT(settings, "Null pointer: settings");

    UploadConfig config;
    config.file_path = trim_c_str(settings->file_path);
    config.object_key = trim_c_str(settings->object_key);

    if (settings->s3_settings != nullptr) {
        config.s3 = {
            .endpoint = trim_c_str(settings->s3_settings->endpoint),
            .bucket_name = trim_c_str(settings->s3_settings->bucket_name),
            .access_key_id = trim_c_str(settings->s3_settings->access_key_id),
            .secret_access_key =
              trim_c_str(settings->s3_settings->secret_access_key),
        };
    }

    if (settings->part_size > 0) {
        config.part_size = settings->part_size;
    }
    config.part_split = settings->part_split;
    config.max_concurrency = std::max(settings->max_concurrency, 1u);
    config.max_retries = settings->max_retries;
    config.abort_on_failure = settings->abort_on_failure;
    config.show_progress = settings->progress_callback != nullptr;
    config.log_level = Logger::get_log_level();

    return config;
}

bool
objupload::load_config_file(std::string_view path, UploadConfig& config)
{
    std::ifstream file{ std::string(path) };
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file ", path);
        return false;
    }

    auto json = nlohmann::json::parse(file,
                                      nullptr, // callback
                                      false,   // allow exceptions
                                      true     // ignore comments
    );

    if (json.is_discarded()) {
        LOG_ERROR("Invalid JSON in config file ", path);
        return false;
    }

    if (!json.is_object()) {
        LOG_ERROR("Config file ", path, " must hold a JSON object");
        return false;
    }

    for (const auto& [key, value] : json.items()) {
        bool ok;
        if (key == "endpoint") {
            ok = get_string(value, key, config.s3.endpoint);
        } else if (key == "bucket") {
            ok = get_string(value, key, config.s3.bucket_name);
        } else if (key == "object") {
            ok = get_string(value, key, config.object_key);
        } else if (key == "file") {
            ok = get_string(value, key, config.file_path);
        } else if (key == "part_size") {
            ok = get_unsigned(value, key, config.part_size);
        } else if (key == "concurrency") {
            ok = get_unsigned(value, key, config.max_concurrency);
        } else if (key == "retries") {
            ok = get_unsigned(value, key, config.max_retries);
        } else if (key == "abort_on_failure") {
            ok = get_bool(value, key, config.abort_on_failure);
        } else if (key == "progress") {
            ok = get_bool(value, key, config.show_progress);
        } else if (key == "split") {
            std::string name;
            ok = get_string(value, key, name) &&
                 parse_part_split(name, config.part_split);
        } else if (key == "log_level") {
            std::string name;
            ok = get_string(value, key, name) &&
                 parse_log_level(name, config.log_level);
        } else {
            LOG_ERROR("Unknown config key '", key, "' in ", path);
            ok = false;
        }

        if (!ok) {
            return false;
        }
    }

    return true;
}

bool
objupload::parse_part_split(std::string_view name, ObjUploadPartSplit& split)
{
    if (name == "fixed") {
        split = ObjUploadPartSplit_FixedSize;
    } else if (name == "even") {
        split = ObjUploadPartSplit_EvenByCount;
    } else {
        LOG_ERROR("Invalid part split '", name, "'. Must be fixed or even");
        return false;
    }

    return true;
}

bool
objupload::parse_log_level(std::string_view name, LogLevel& level)
{
    if (name == "debug") {
        level = LogLevel_Debug;
    } else if (name == "info") {
        level = LogLevel_Info;
    } else if (name == "warning") {
        level = LogLevel_Warning;
    } else if (name == "error") {
        level = LogLevel_Error;
    } else if (name == "none") {
        level = LogLevel_None;
    } else {
        LOG_ERROR("Invalid log level '",
                  name,
                  "'. Must be debug, info, warning, error or none");
        return false;
    }

    return true;
}
