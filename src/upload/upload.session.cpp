#include "macros.hh"
#include "upload.common.hh"
#include "upload.session.hh"

#include <algorithm>

objupload::UploadSession::UploadSession(
  std::shared_ptr<StorageBackend> backend,
  std::string_view object_key,
  uint32_t max_retries)
  : backend_{ std::move(backend) }
  , object_key_{ object_key }
  , max_retries_{ max_retries }
{
    EXPECT(backend_, "Null pointer: backend");
    EXPECT(!object_key_.empty(), "Object key must not be empty");
}

void
objupload::UploadSession::initiate()
{
    {
        std::scoped_lock lock(mutex_);
        EXPECT_STATUS(state_ == State::Uninitiated,
                      ObjUploadStatusCode_InvariantViolation,
                      "Cannot initiate a session that is ",
                      to_string(state_));
    }

    std::string upload_id = backend_->create_multipart_upload(object_key_);

    std::scoped_lock lock(mutex_);
    if (upload_id.empty()) {
        state_ = State::Abandoned;
        const std::string err = LOG_ERROR(
          "Failed to initiate multipart upload of object ", object_key_);
        throw UploadError(ObjUploadStatusCode_BackendError, err);
    }

    upload_id_ = std::move(upload_id);
    state_ = State::Initiated;
    LOG_DEBUG("Initiated multipart upload ",
              upload_id_,
              " of object ",
              object_key_);
}

objupload::PartResult
objupload::UploadSession::upload_part(
  LocalFile& source,
  const Part& part,
  std::vector<uint8_t>& buffer,
  std::shared_ptr<ProgressReporter> reporter,
  ObjectProgress& object_progress)
{
    {
        std::scoped_lock lock(mutex_);
        EXPECT_STATUS(state_ == State::Initiated,
                      ObjUploadStatusCode_InvariantViolation,
                      "Cannot upload part ",
                      part.number,
                      " to a session that is ",
                      to_string(state_));
    }

    try {
        buffer.resize(part.size);
        source.read_at(part.offset, { buffer.data(), buffer.size() });

        PartResult result{
            .number = part.number,
            .etag = send_part_(
              part, { buffer.data(), buffer.size() }, reporter, object_progress),
        };
        record_(result);

        return result;
    } catch (const UploadError&) {
        abandon();
        throw;
    } catch (const std::bad_alloc&) {
        abandon();
        const std::string err =
          LOG_ERROR("Failed to allocate ", part.size, " bytes for a part");
        throw UploadError(ObjUploadStatusCode_OutOfMemory, err);
    }
}

void
objupload::UploadSession::complete(const std::vector<Part>& planned_parts)
{
    std::vector<PartResult> parts;
    std::string upload_id;
    {
        std::scoped_lock lock(mutex_);
        EXPECT_STATUS(state_ == State::Initiated,
                      ObjUploadStatusCode_InvariantViolation,
                      "Cannot complete a session that is ",
                      to_string(state_));

        parts = completed_parts_;
        upload_id = upload_id_;
    }

    if (!matches_plan_(parts, planned_parts)) {
        abandon();
        const std::string err =
          LOG_ERROR("Recorded parts of object ",
                    object_key_,
                    " do not match its plan of ",
                    planned_parts.size(),
                    " parts");
        throw UploadError(ObjUploadStatusCode_InvariantViolation, err);
    }

    if (!backend_->complete_multipart_upload(object_key_, upload_id, parts)) {
        abandon();
        const std::string err = LOG_ERROR(
          "Failed to complete multipart upload of object ", object_key_);
        throw UploadError(ObjUploadStatusCode_BackendError, err);
    }

    std::scoped_lock lock(mutex_);
    state_ = State::Completed;
}

void
objupload::UploadSession::abandon()
{
    {
        std::scoped_lock lock(mutex_);
        if (state_ != State::Completed) {
            state_ = State::Abandoned;
        }
    }
    abandoned_cv_.notify_all();
}

bool
objupload::UploadSession::abort_remote() noexcept
{
    std::string upload_id;
    {
        std::scoped_lock lock(mutex_);
        if (state_ != State::Abandoned || upload_id_.empty()) {
            return false;
        }
        upload_id = upload_id_;
    }

    try {
        if (backend_->abort_multipart_upload(object_key_, upload_id)) {
            LOG_INFO("Aborted multipart upload of object ", object_key_);
            return true;
        }
        LOG_WARNING("Failed to abort multipart upload ",
                    upload_id,
                    " of object ",
                    object_key_,
                    ". Its parts remain on the store.");
    } catch (const std::exception& exc) {
        LOG_WARNING("Error aborting multipart upload ",
                    upload_id,
                    ": ",
                    exc.what());
    }

    return false;
}

objupload::UploadSession::State
objupload::UploadSession::state() const
{
    std::scoped_lock lock(mutex_);
    return state_;
}

std::string
objupload::UploadSession::upload_id() const
{
    std::scoped_lock lock(mutex_);
    return upload_id_;
}

std::vector<objupload::PartResult>
objupload::UploadSession::completed_parts() const
{
    std::vector<PartResult> parts;
    {
        std::scoped_lock lock(mutex_);
        parts = completed_parts_;
    }

    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) {
        return a.number < b.number;
    });
    return parts;
}

size_t
objupload::UploadSession::part_attempts() const
{
    std::scoped_lock lock(mutex_);
    return part_attempts_;
}

std::string
objupload::UploadSession::send_part_(const Part& part,
                                     std::span<const uint8_t> data,
                                     std::shared_ptr<ProgressReporter> reporter,
                                     ObjectProgress& object_progress)
{
    const std::string upload_id = this->upload_id();

    for (uint32_t attempt = 0;; ++attempt) {
        {
            std::scoped_lock lock(mutex_);
            if (state_ == State::Abandoned) {
                const std::string msg = LOG_DEBUG("Upload of object ",
                                                  object_key_,
                                                  " was abandoned before part ",
                                                  part.number,
                                                  " was sent");
                throw UploadError(ObjUploadStatusCode_InvariantViolation, msg);
            }
            ++part_attempts_;
        }

        ProgressTracker tracker(reporter, object_progress, part.number, part.size);
        tracker.start();

        LOG_DEBUG("Uploading part ",
                  part.number,
                  " (",
                  format_bytes(part.size),
                  " at offset ",
                  part.offset,
                  ") of object ",
                  object_key_);
        std::string etag = backend_->upload_part(
          object_key_,
          upload_id,
          part.number,
          data,
          [&tracker](uint64_t nbytes) { tracker.update(nbytes); });

        if (!etag.empty()) {
            tracker.complete();
            return etag;
        }
        tracker.fail();

        if (attempt >= max_retries_) {
            break;
        }

        const auto delay = retry_delay(attempt);
        LOG_WARNING("Retrying part ",
                    part.number,
                    " of object ",
                    object_key_,
                    " in ",
                    delay.count(),
                    " ms (retry ",
                    attempt + 1,
                    " of ",
                    max_retries_,
                    ")");

        // wake early if another part gives up on the session
        std::unique_lock lock(mutex_);
        abandoned_cv_.wait_for(
          lock, delay, [this] { return state_ == State::Abandoned; });
    }

    const std::string err = LOG_ERROR(
      "Failed to upload part ", part.number, " of object ", object_key_);
    throw UploadError(ObjUploadStatusCode_BackendError, err);
}

void
objupload::UploadSession::record_(PartResult result)
{
    std::scoped_lock lock(mutex_);
    completed_parts_.push_back(std::move(result));
}

bool
objupload::UploadSession::matches_plan_(std::vector<PartResult>& parts,
                                        const std::vector<Part>& planned) const
{
    std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) {
        return a.number < b.number;
    });

    if (parts.size() != planned.size()) {
        return false;
    }

    // planned parts are numbered 1..n in order
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].number != planned[i].number || parts[i].etag.empty()) {
            return false;
        }
    }

    return true;
}

const char*
objupload::to_string(UploadSession::State state) noexcept
{
    switch (state) {
        case UploadSession::State::Uninitiated:
            return "uninitiated";
        case UploadSession::State::Initiated:
            return "initiated";
        case UploadSession::State::Completed:
            return "completed";
        case UploadSession::State::Abandoned:
            return "abandoned";
    }
    return "unknown";
}
