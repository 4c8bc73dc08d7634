#pragma once

#include "local.file.hh"
#include "part.planner.hh"
#include "progress.hh"
#include "storage.backend.hh"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace objupload {
/**
 * @brief One multipart upload on the store.
 * @details The session moves from Uninitiated to Initiated when the store
 * issues an upload id, and from Initiated to Completed when the store
 * assembles the object. Any failure moves it to Abandoned, which is final.
 * Parts may be uploaded from several threads at once.
 */
class UploadSession
{
  public:
    enum class State
    {
        Uninitiated,
        Initiated,
        Completed,
        Abandoned
    };

    UploadSession(std::shared_ptr<StorageBackend> backend,
                  std::string_view object_key,
                  uint32_t max_retries);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    /**
     * @brief Ask the store for an upload id.
     * @throws UploadError with ObjUploadStatusCode_BackendError if the store
     * refuses.
     */
    void initiate();

    /**
     * @brief Read one part from @p source and upload it.
     * @details A store failure is retried up to max_retries times under the
     * same part number. On success the result is recorded.
     * @param source The file to read the part from.
     * @param part The byte range and number of the part.
     * @param buffer Scratch space for the part's bytes. Resized as needed.
     * @param reporter Receives the progress events. May be null.
     * @param object_progress Running total for the whole object.
     * @returns The recorded result.
     * @throws UploadError with ObjUploadStatusCode_IOError if the part cannot
     * be read, ObjUploadStatusCode_BackendError if the store refuses every
     * attempt, or ObjUploadStatusCode_InvariantViolation if the session is
     * not initiated or is abandoned while the part waits to retry. Any of
     * these abandons the session.
     */
    PartResult upload_part(LocalFile& source,
                           const Part& part,
                           std::vector<uint8_t>& buffer,
                           std::shared_ptr<ProgressReporter> reporter,
                           ObjectProgress& object_progress);

    /**
     * @brief Assemble the recorded parts into the object.
     * @param planned_parts The parts the object was planned with. The recorded
     * part numbers must match theirs exactly.
     * @throws UploadError with ObjUploadStatusCode_InvariantViolation if the
     * recorded parts do not match the plan, in which case the store is not
     * asked, or ObjUploadStatusCode_BackendError if the store refuses. Either
     * abandons the session.
     */
    void complete(const std::vector<Part>& planned_parts);

    /// @brief Mark the session failed. Does nothing once it has completed.
    /// Parts waiting to retry give up.
    void abandon();

    /**
     * @brief Discard an abandoned session's parts on the store.
     * @returns True if the store dropped the upload. False if it refused, or
     * if there was nothing to abort.
     */
    bool abort_remote() noexcept;

    State state() const;
    const std::string& object_key() const noexcept { return object_key_; }
    std::string upload_id() const;

    /// @brief Recorded results, sorted by part number.
    std::vector<PartResult> completed_parts() const;

    /// @brief Number of attempts made by upload_part, retries included.
    size_t part_attempts() const;

  private:
    std::shared_ptr<StorageBackend> backend_;
    std::string object_key_;
    uint32_t max_retries_;

    mutable std::mutex mutex_;
    std::condition_variable abandoned_cv_;
    State state_{ State::Uninitiated };
    std::string upload_id_;
    std::vector<PartResult> completed_parts_;
    size_t part_attempts_{ 0 };

    std::string send_part_(const Part& part,
                           std::span<const uint8_t> data,
                           std::shared_ptr<ProgressReporter> reporter,
                           ObjectProgress& object_progress);
    void record_(PartResult result);
    [[nodiscard]] bool matches_plan_(std::vector<PartResult>& parts,
                                     const std::vector<Part>& planned) const;
};

const char*
to_string(UploadSession::State state) noexcept;
} // namespace objupload
