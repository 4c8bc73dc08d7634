#include "macros.hh"
#include "part.planner.hh"
#include "s3.connection.hh"

#include <miniocpp/utils.h>

#include <algorithm>
#include <list>
#include <string_view>

namespace {
using objupload::max_s3_part_size;
using objupload::min_s3_part_size;

bool
report_progress(minio::http::ProgressFunctionArgs args)
{
    const auto* progress =
      static_cast<const objupload::TransferProgress*>(args.userdata);
    if (progress != nullptr && *progress && args.uploaded_bytes > 0) {
        (*progress)(static_cast<uint64_t>(args.uploaded_bytes));
    }

    return true; // keep going
}
} // namespace

objupload::S3Connection::S3Connection(const std::string& endpoint,
                                      const std::string& access_key_id,
                                      const std::string& secret_access_key)
{
    minio::s3::BaseUrl url(endpoint);
    url.https = endpoint.starts_with("https://");

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      access_key_id, secret_access_key);
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    CHECK(client_);
}

bool
objupload::S3Connection::check_connection()
{
    return static_cast<bool>(client_->ListBuckets());
}

bool
objupload::S3Connection::bucket_exists(std::string_view bucket_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    return response.exist;
}

bool
objupload::S3Connection::object_exists(std::string_view bucket_name,
                                       std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    minio::s3::StatObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->StatObject(args);
    // casts to true if response code in 200 range and error message is empty
    return static_cast<bool>(response);
}

std::string
objupload::S3Connection::put_object(std::string_view bucket_name,
                                    std::string_view object_name,
                                    std::istream& data,
                                    uint64_t nbytes,
                                    const TransferProgress& progress)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(nbytes <= max_s3_part_size,
           "Object of ",
           nbytes,
           " bytes is too large for a single request.");

    LOG_DEBUG("Putting object ",
              object_name,
              " (",
              nbytes,
              " bytes) in bucket ",
              bucket_name);

    // a part size no smaller than the object keeps the upload to one request
    const auto part_size = std::max(nbytes, min_s3_part_size);
    minio::s3::PutObjectArgs args(
      data, static_cast<long>(nbytes), static_cast<long>(part_size));
    args.bucket = bucket_name;
    args.object = object_name;
    args.progressfunc = report_progress;
    args.progress_userdata =
      const_cast<void*>(static_cast<const void*>(&progress));

    auto response = client_->PutObject(args);
    if (!response) {
        LOG_ERROR("Failed to put object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return {};
    }

    return response.etag;
}

bool
objupload::S3Connection::delete_object(std::string_view bucket_name,
                                       std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    LOG_DEBUG("Deleting object ", object_name, " from bucket ", bucket_name);
    minio::s3::RemoveObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->RemoveObject(args);
    if (!response) {
        LOG_ERROR("Failed to delete object ",
                  object_name,
                  " from bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

std::string
objupload::S3Connection::create_multipart_object(std::string_view bucket_name,
                                                 std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    LOG_DEBUG(
      "Creating multipart object ", object_name, " in bucket ", bucket_name);
    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->CreateMultipartUpload(args);
    if (!response) {
        LOG_ERROR("Failed to create multipart object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return {};
    }

    return response.upload_id;
}

std::string
objupload::S3Connection::upload_multipart_object_part(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  std::span<const uint8_t> data,
  unsigned int part_number,
  const TransferProgress& progress)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!data.empty(), "Number of bytes must be positive.");
    EXPECT(part_number, "Part number must be positive.");

    LOG_DEBUG("Uploading multipart object part ",
              part_number,
              " for object ",
              object_name,
              " in bucket ",
              bucket_name);

    std::string_view data_buffer(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    minio::s3::UploadPartArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.part_number = part_number;
    args.upload_id = upload_id;
    args.data = data_buffer;
    args.progressfunc = report_progress;
    args.progress_userdata =
      const_cast<void*>(static_cast<const void*>(&progress));

    auto response = client_->UploadPart(args);
    if (!response) {
        LOG_ERROR("Failed to upload part ",
                  part_number,
                  " for object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return {};
    }

    return response.etag;
}

bool
objupload::S3Connection::complete_multipart_object(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  const std::list<minio::s3::Part>& parts)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");
    EXPECT(!parts.empty(), "Parts list must not be empty.");

    LOG_DEBUG(
      "Completing multipart object ", object_name, " in bucket ", bucket_name);
    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;
    args.parts = parts;

    auto response = client_->CompleteMultipartUpload(args);
    if (!response) {
        LOG_ERROR("Failed to complete multipart object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

bool
objupload::S3Connection::abort_multipart_object(std::string_view bucket_name,
                                                std::string_view object_name,
                                                std::string_view upload_id)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload id must not be empty.");

    LOG_DEBUG(
      "Aborting multipart object ", object_name, " in bucket ", bucket_name);
    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.upload_id = upload_id;

    auto response = client_->AbortMultipartUpload(args);
    if (!response) {
        LOG_ERROR("Failed to abort multipart object ",
                  object_name,
                  " in bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

objupload::S3ConnectionPool::S3ConnectionPool(
  size_t n_connections,
  const std::string& endpoint,
  const std::string& access_key_id,
  const std::string& secret_access_key)
{
    for (size_t i = 0; i < n_connections; ++i) {
        auto connection = std::make_unique<S3Connection>(
          endpoint, access_key_id, secret_access_key);

        if (connection->check_connection()) {
            connections_.push_back(std::move(connection));
        }
    }

    EXPECT_STATUS(!connections_.empty(),
                  ObjUploadStatusCode_BackendError,
                  "Failed to connect to S3 endpoint ",
                  endpoint);
}

objupload::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    {
        std::scoped_lock lock(connections_mutex_);
        is_accepting_connections_ = false;
    }
    cv_.notify_all();
}

std::unique_ptr<objupload::S3Connection>
objupload::S3ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_ || connections_.empty()) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
objupload::S3ConnectionPool::return_connection(
  std::unique_ptr<S3Connection>&& conn)
{
    std::unique_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}
