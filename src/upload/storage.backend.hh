#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace objupload {
/// @brief A part acknowledged by the store.
struct PartResult
{
    uint32_t number;
    std::string etag;
};

/// @brief Called with the number of bytes sent so far in one transfer.
using TransferProgress = std::function<void(uint64_t)>;

/**
 * @brief The object store an upload goes to.
 * @details Every operation reports a remote failure by returning an empty
 * string or false, after logging the remote error. Operations may be called
 * from several threads at once.
 */
class StorageBackend
{
  public:
    virtual ~StorageBackend() = default;

    /**
     * @brief Upload a whole object in one request.
     * @param object_key The name of the object.
     * @param data Stream positioned at the first byte of the object.
     * @param nbytes Number of bytes to read from @p data.
     * @param progress Progress callback. May be empty.
     * @returns The etag of the object. Nonempty if and only if the operation
     * succeeds.
     */
    [[nodiscard]] virtual std::string put_object(
      std::string_view object_key,
      std::istream& data,
      uint64_t nbytes,
      const TransferProgress& progress) = 0;

    /**
     * @brief Begin a multipart upload.
     * @returns The upload id. Nonempty if and only if the operation succeeds.
     */
    [[nodiscard]] virtual std::string create_multipart_upload(
      std::string_view object_key) = 0;

    /**
     * @brief Upload one part of a multipart upload.
     * @details Uploading the same part number twice replaces the first copy.
     * @returns The etag of the part. Nonempty if and only if the operation
     * succeeds.
     */
    [[nodiscard]] virtual std::string upload_part(
      std::string_view object_key,
      std::string_view upload_id,
      uint32_t part_number,
      std::span<const uint8_t> data,
      const TransferProgress& progress) = 0;

    /**
     * @brief Assemble the uploaded parts into the object.
     * @param parts The parts, sorted by number.
     * @returns True if the object was successfully completed, otherwise
     * false.
     */
    [[nodiscard]] virtual bool complete_multipart_upload(
      std::string_view object_key,
      std::string_view upload_id,
      const std::vector<PartResult>& parts) = 0;

    /**
     * @brief Discard a multipart upload and the parts uploaded to it.
     * @returns True if the upload was successfully aborted, otherwise false.
     */
    [[nodiscard]] virtual bool abort_multipart_upload(
      std::string_view object_key,
      std::string_view upload_id) = 0;
};
} // namespace objupload
