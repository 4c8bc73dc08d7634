#include "objupload.h"
#include "test.macros.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace {
std::string s3_endpoint, s3_bucket_name, s3_access_key_id,
  s3_secret_access_key;

bool
get_credentials()
{
    char* env = nullptr;
    if (!(env = std::getenv("OBJUPLOAD_S3_ENDPOINT"))) {
        LOG_ERROR("OBJUPLOAD_S3_ENDPOINT not set.");
        return false;
    }
    s3_endpoint = env;

    if (!(env = std::getenv("OBJUPLOAD_S3_BUCKET_NAME"))) {
        LOG_ERROR("OBJUPLOAD_S3_BUCKET_NAME not set.");
        return false;
    }
    s3_bucket_name = env;

    if (!(env = std::getenv("OBJUPLOAD_S3_ACCESS_KEY_ID"))) {
        LOG_ERROR("OBJUPLOAD_S3_ACCESS_KEY_ID not set.");
        return false;
    }
    s3_access_key_id = env;

    if (!(env = std::getenv("OBJUPLOAD_S3_SECRET_ACCESS_KEY"))) {
        LOG_ERROR("OBJUPLOAD_S3_SECRET_ACCESS_KEY not set.");
        return false;
    }
    s3_secret_access_key = env;

    return true;
}

struct ProgressTally
{
    std::atomic<size_t> started{ 0 };
    std::atomic<size_t> completed{ 0 };
    std::atomic<size_t> failed{ 0 };
    std::atomic<uint64_t> object_consumed_bytes{ 0 };
};

void
count_event(const ObjUploadProgressEvent* event, void* user_data)
{
    auto* tally = static_cast<ProgressTally*>(user_data);
    switch (event->phase) {
        case ObjUploadProgressPhase_Started:
            ++tally->started;
            break;
        case ObjUploadProgressPhase_Completed:
            ++tally->completed;
            break;
        case ObjUploadProgressPhase_Failed:
            ++tally->failed;
            break;
        default:
            break;
    }
    tally->object_consumed_bytes = event->object_consumed_bytes;
}

void
write_file(const std::string& path, size_t nbytes)
{
    std::vector<char> data(nbytes);
    for (size_t i = 0; i < nbytes; ++i) {
        data[i] = static_cast<char>(i % 251);
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

minio::s3::StatObjectResponse
stat_object(minio::s3::Client& client, const std::string& object_name)
{
    minio::s3::StatObjectArgs args;
    args.bucket = s3_bucket_name;
    args.object = object_name;
    return client.StatObject(args);
}

bool
remove_object(minio::s3::Client& client, const std::string& object_name)
{
    minio::s3::RemoveObjectArgs args;
    args.bucket = s3_bucket_name;
    args.object = object_name;
    return static_cast<bool>(client.RemoveObject(args));
}

void
upload(const std::string& path,
       const std::string& object_name,
       uint64_t part_size,
       uint32_t max_concurrency,
       ProgressTally& tally)
{
    ObjUploadS3Settings s3_settings{
        .endpoint = s3_endpoint.c_str(),
        .bucket_name = s3_bucket_name.c_str(),
        .access_key_id = s3_access_key_id.c_str(),
        .secret_access_key = s3_secret_access_key.c_str(),
    };
    ObjUploadSettings settings{
        .file_path = path.c_str(),
        .object_key = object_name.c_str(),
        .s3_settings = &s3_settings,
        .part_size = part_size,
        .part_split = ObjUploadPartSplit_FixedSize,
        .max_concurrency = max_concurrency,
        .max_retries = 1,
        .abort_on_failure = true,
        .progress_callback = count_event,
        .progress_user_data = &tally,
    };

    CHECK_OK(ObjUpload_upload_file(&settings));
}
} // namespace

int
main()
{
    if (!get_credentials()) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;

    const auto base_dir = fs::temp_directory_path() / TEST;
    const auto file_path = (base_dir / "data.bin").string();
    const std::string simple_object = "objupload-test/simple.bin";
    const std::string multipart_object = "objupload-test/multipart.bin";

    minio::s3::BaseUrl url(s3_endpoint);
    url.https = s3_endpoint.starts_with("https://");
    minio::creds::StaticProvider provider(s3_access_key_id,
                                          s3_secret_access_key);
    minio::s3::Client client(url, &provider);

    try {
        fs::create_directories(base_dir);

        // under the threshold: one request
        {
            write_file(file_path, 1 << 20);

            ProgressTally tally;
            upload(file_path, simple_object, 5 << 20, 1, tally);
            EXPECT_EQ(size_t, tally.started.load(), 1);
            EXPECT_EQ(size_t, tally.completed.load(), 1);
            EXPECT_EQ(uint64_t, tally.object_consumed_bytes.load(), 1 << 20);

            const auto stat = stat_object(client, simple_object);
            CHECK(stat);
            EXPECT_EQ(size_t, stat.size, 1 << 20);
        }

        // 12 MiB at 5 MiB: parts of 5, 5 and 2 MiB on two workers
        {
            write_file(file_path, 12 << 20);

            ProgressTally tally;
            upload(file_path, multipart_object, 5 << 20, 2, tally);
            EXPECT_EQ(size_t, tally.completed.load(), 3);
            EXPECT_EQ(size_t, tally.started.load(), 3 + tally.failed.load());

            const auto stat = stat_object(client, multipart_object);
            CHECK(stat);
            EXPECT_EQ(size_t, stat.size, 12 << 20);
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception: ", e.what());
    }

    // cleanup
    if (!remove_object(client, simple_object)) {
        LOG_WARNING("Failed to remove object ", simple_object);
    }
    if (!remove_object(client, multipart_object)) {
        LOG_WARNING("Failed to remove object ", multipart_object);
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
