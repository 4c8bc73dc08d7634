#pragma once

#include "s3.connection.hh"
#include "storage.backend.hh"

#include <memory>
#include <string>

namespace objupload {
/**
 * @brief A bucket on an S3-compatible store.
 * @details Each call borrows a connection from the pool for its duration, so
 * up to as many calls as the pool has connections run at once.
 */
class S3Backend : public StorageBackend
{
  public:
    /**
     * @brief Bind to a bucket.
     * @throws UploadError with ObjUploadStatusCode_BackendError if the bucket
     * does not exist or cannot be reached with the pool's credentials.
     */
    S3Backend(std::string_view bucket_name,
              std::shared_ptr<S3ConnectionPool> connection_pool);

    std::string put_object(std::string_view object_key,
                           std::istream& data,
                           uint64_t nbytes,
                           const TransferProgress& progress) override;

    std::string create_multipart_upload(std::string_view object_key) override;

    std::string upload_part(std::string_view object_key,
                            std::string_view upload_id,
                            uint32_t part_number,
                            std::span<const uint8_t> data,
                            const TransferProgress& progress) override;

    bool complete_multipart_upload(
      std::string_view object_key,
      std::string_view upload_id,
      const std::vector<PartResult>& parts) override;

    bool abort_multipart_upload(std::string_view object_key,
                                std::string_view upload_id) override;

  private:
    std::string bucket_name_;
    std::shared_ptr<S3ConnectionPool> connection_pool_;

    std::unique_ptr<S3Connection> get_connection_();
};
} // namespace objupload
