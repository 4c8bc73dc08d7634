#include "macros.hh"
#include "s3.backend.hh"

#include <list>

objupload::S3Backend::S3Backend(
  std::string_view bucket_name,
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : bucket_name_{ bucket_name }
  , connection_pool_{ connection_pool }
{
    EXPECT(!bucket_name_.empty(), "Bucket name must not be empty");
    EXPECT(connection_pool_, "Null pointer: connection_pool");

    auto connection = get_connection_();

    bool exists = false;
    try {
        exists = connection->bucket_exists(bucket_name_);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    EXPECT_STATUS(exists,
                  ObjUploadStatusCode_BackendError,
                  "Bucket ",
                  bucket_name_,
                  " does not exist");
}

std::string
objupload::S3Backend::put_object(std::string_view object_key,
                                 std::istream& data,
                                 uint64_t nbytes,
                                 const TransferProgress& progress)
{
    auto connection = get_connection_();

    std::string etag;
    try {
        etag = connection->put_object(
          bucket_name_, object_key, data, nbytes, progress);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    // cleanup
    connection_pool_->return_connection(std::move(connection));

    return etag;
}

std::string
objupload::S3Backend::create_multipart_upload(std::string_view object_key)
{
    auto connection = get_connection_();

    std::string upload_id;
    try {
        upload_id =
          connection->create_multipart_object(bucket_name_, object_key);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    return upload_id;
}

std::string
objupload::S3Backend::upload_part(std::string_view object_key,
                                  std::string_view upload_id,
                                  uint32_t part_number,
                                  std::span<const uint8_t> data,
                                  const TransferProgress& progress)
{
    auto connection = get_connection_();

    std::string etag;
    try {
        etag = connection->upload_multipart_object_part(
          bucket_name_, object_key, upload_id, data, part_number, progress);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    return etag;
}

bool
objupload::S3Backend::complete_multipart_upload(
  std::string_view object_key,
  std::string_view upload_id,
  const std::vector<PartResult>& parts)
{
    std::list<minio::s3::Part> s3_parts;
    for (const auto& result : parts) {
        minio::s3::Part part;
        part.number = result.number;
        part.etag = result.etag;
        s3_parts.push_back(part);
    }

    auto connection = get_connection_();

    bool retval = false;
    try {
        retval = connection->complete_multipart_object(
          bucket_name_, object_key, upload_id, s3_parts);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}

bool
objupload::S3Backend::abort_multipart_upload(std::string_view object_key,
                                             std::string_view upload_id)
{
    auto connection = get_connection_();

    bool retval = false;
    try {
        retval = connection->abort_multipart_object(
          bucket_name_, object_key, upload_id);
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }

    connection_pool_->return_connection(std::move(connection));

    return retval;
}

std::unique_ptr<objupload::S3Connection>
objupload::S3Backend::get_connection_()
{
    auto connection = connection_pool_->get_connection();
    EXPECT_STATUS(connection,
                  ObjUploadStatusCode_BackendError,
                  "No S3 connection available");

    return connection;
}
