#pragma once

#include "progress.hh"
#include "storage.backend.hh"
#include "upload.config.hh"
#include "upload.session.hh"

#include <memory>
#include <string>
#include <string_view>

namespace objupload {
enum class UploadStrategy
{
    Simple,
    Multipart
};

/// @brief The object an upload produced.
struct UploadResult
{
    std::string object_key;
    UploadStrategy strategy;
    uint64_t size;
    size_t part_count; // 0 for a simple upload
    std::string etag;  // empty for a multipart upload
};

/**
 * @brief Uploads one local file to one object.
 * @details Files up to the part size go up in one request. Larger files are
 * cut into parts that are uploaded one at a time through a single file
 * handle or, with a concurrency above 1, by a pool of workers that each read
 * through their own handle. The object becomes visible only once every part
 * has been accepted; a failure of any part fails the upload and parts that
 * have not started are skipped.
 */
class UploadOrchestrator
{
  public:
    /**
     * @throws UploadError with ObjUploadStatusCode_InvalidSettings if the
     * transfer options in @p config are invalid.
     */
    UploadOrchestrator(UploadConfig config,
                       std::shared_ptr<StorageBackend> backend,
                       std::shared_ptr<ProgressReporter> reporter);

    /**
     * @brief Upload @p local_path to @p object_key.
     * @throws UploadError on failure. The status code tells the kind.
     */
    UploadResult upload(std::string_view local_path,
                        std::string_view object_key);

    /// @brief Upload the file and object named in the configuration.
    UploadResult upload();

    /// @brief The session of the last multipart upload, null if none.
    std::shared_ptr<const UploadSession> last_session() const;

    static UploadStrategy choose_strategy(uint64_t file_size,
                                          uint64_t part_size) noexcept;

  private:
    UploadConfig config_;
    std::shared_ptr<StorageBackend> backend_;
    std::shared_ptr<ProgressReporter> reporter_;
    std::shared_ptr<UploadSession> session_;

    UploadResult put_whole_(LocalFile& file, std::string_view object_key);
    UploadResult put_multipart_(LocalFile& file, std::string_view object_key);

    void upload_parts_sequentially_(UploadSession& session,
                                    LocalFile& file,
                                    const std::vector<Part>& parts,
                                    ObjectProgress& object_progress);
    void upload_parts_concurrently_(UploadSession& session,
                                    const std::string& path,
                                    const std::vector<Part>& parts,
                                    ObjectProgress& object_progress);
};
} // namespace objupload
