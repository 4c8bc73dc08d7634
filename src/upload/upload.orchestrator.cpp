#include "macros.hh"
#include "thread.pool.hh"
#include "upload.common.hh"
#include "upload.orchestrator.hh"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

objupload::UploadOrchestrator::UploadOrchestrator(
  UploadConfig config,
  std::shared_ptr<StorageBackend> backend,
  std::shared_ptr<ProgressReporter> reporter)
  : config_{ std::move(config) }
  , backend_{ std::move(backend) }
  , reporter_{ std::move(reporter) }
{
    EXPECT(backend_, "Null pointer: backend");
    EXPECT_STATUS(validate_transfer_options(config_),
                  ObjUploadStatusCode_InvalidSettings,
                  "Invalid upload settings");
}

objupload::UploadResult
objupload::UploadOrchestrator::upload()
{
    return upload(config_.file_path, config_.object_key);
}

objupload::UploadResult
objupload::UploadOrchestrator::upload(std::string_view local_path,
                                      std::string_view object_key)
{
    EXPECT_STATUS(!object_key.empty(),
                  ObjUploadStatusCode_InvalidSettings,
                  "Object name is empty");

    session_.reset();

    // closed on every way out of this function
    LocalFile file(local_path);

    switch (choose_strategy(file.size(), config_.part_size)) {
        case UploadStrategy::Simple:
            return put_whole_(file, object_key);
        case UploadStrategy::Multipart:
            return put_multipart_(file, object_key);
    }

    throw std::runtime_error("Unknown upload strategy");
}

std::shared_ptr<const objupload::UploadSession>
objupload::UploadOrchestrator::last_session() const
{
    return session_;
}

objupload::UploadStrategy
objupload::UploadOrchestrator::choose_strategy(uint64_t file_size,
                                               uint64_t part_size) noexcept
{
    return file_size > part_size ? UploadStrategy::Multipart
                                 : UploadStrategy::Simple;
}

objupload::UploadResult
objupload::UploadOrchestrator::put_whole_(LocalFile& file,
                                          std::string_view object_key)
{
    LOG_INFO("Uploading ",
             file.path(),
             " (",
             format_bytes(file.size()),
             ") to ",
             object_key,
             " in a single request");

    ObjectProgress object_progress(file.size());

    for (uint32_t attempt = 0;; ++attempt) {
        ProgressTracker tracker(reporter_, object_progress, 0, file.size());
        tracker.start();

        std::istream& data = file.rewind();
        std::string etag = backend_->put_object(
          object_key, data, file.size(), [&tracker](uint64_t nbytes) {
              tracker.update(nbytes);
          });

        if (!etag.empty()) {
            tracker.complete();
            return {
                .object_key = std::string(object_key),
                .strategy = UploadStrategy::Simple,
                .size = file.size(),
                .part_count = 0,
                .etag = etag,
            };
        }
        tracker.fail();

        if (attempt >= config_.max_retries) {
            break;
        }

        const auto delay = retry_delay(attempt);
        LOG_WARNING("Retrying upload of object ",
                    object_key,
                    " in ",
                    delay.count(),
                    " ms (retry ",
                    attempt + 1,
                    " of ",
                    config_.max_retries,
                    ")");
        std::this_thread::sleep_for(delay);
    }

    const std::string err =
      LOG_ERROR("Failed to upload ", file.path(), " to object ", object_key);
    throw UploadError(ObjUploadStatusCode_BackendError, err);
}

objupload::UploadResult
objupload::UploadOrchestrator::put_multipart_(LocalFile& file,
                                              std::string_view object_key)
{
    const auto n_parts = part_count(file.size(), config_.part_size);
    EXPECT_STATUS(n_parts <= max_part_count,
                  ObjUploadStatusCode_InvalidSettings,
                  "Part size ",
                  config_.part_size,
                  " is too small for a file of ",
                  file.size(),
                  " bytes: ",
                  n_parts,
                  " parts exceeds the limit of ",
                  max_part_count);

    const auto parts =
      plan_parts(file.size(), config_.part_size, config_.part_split);

    session_ = std::make_shared<UploadSession>(
      backend_, object_key, config_.max_retries);
    session_->initiate();

    LOG_INFO("start upload parts, total: ",
             parts.size(),
             " (",
             format_bytes(file.size()),
             " to ",
             object_key,
             ")");

    ObjectProgress object_progress(file.size());
    try {
        if (config_.max_concurrency > 1 && parts.size() > 1) {
            upload_parts_concurrently_(
              *session_, file.path(), parts, object_progress);
        } else {
            upload_parts_sequentially_(*session_, file, parts, object_progress);
        }

        session_->complete(parts);
    } catch (const std::exception&) {
        session_->abandon();
        if (config_.abort_on_failure) {
            session_->abort_remote();
        } else {
            LOG_WARNING("Multipart upload ",
                        session_->upload_id(),
                        " of object ",
                        object_key,
                        " was abandoned. Its parts remain on the store.");
        }
        throw;
    }

    return {
        .object_key = std::string(object_key),
        .strategy = UploadStrategy::Multipart,
        .size = file.size(),
        .part_count = parts.size(),
        .etag = {},
    };
}

void
objupload::UploadOrchestrator::upload_parts_sequentially_(
  UploadSession& session,
  LocalFile& file,
  const std::vector<Part>& parts,
  ObjectProgress& object_progress)
{
    std::vector<uint8_t> buffer;
    for (const auto& part : parts) {
        LOG_INFO("upload part ", part.number);
        session.upload_part(file, part, buffer, reporter_, object_progress);
    }
}

void
objupload::UploadOrchestrator::upload_parts_concurrently_(
  UploadSession& session,
  const std::string& path,
  const std::vector<Part>& parts,
  ObjectProgress& object_progress)
{
    std::atomic<bool> failed{ false };
    std::mutex error_mutex;
    std::exception_ptr first_error;

    {
        const auto n_workers = static_cast<unsigned int>(
          std::min<size_t>(config_.max_concurrency, parts.size()));
        ThreadPool pool(n_workers, [](const std::string& err) {
            LOG_DEBUG("Part upload failed: ", err);
        });
        LOG_DEBUG("Uploading ",
                  parts.size(),
                  " parts on ",
                  pool.n_workers(),
                  " workers");

        // the first failure stops parts that have not started
        const auto fail = [&](std::exception_ptr error) {
            {
                std::scoped_lock lock(error_mutex);
                if (!first_error) {
                    first_error = std::move(error);
                }
                failed = true;
            }
            if (const auto n_dropped = pool.cancel_pending(); n_dropped > 0) {
                LOG_DEBUG("Cancelled ", n_dropped, " queued parts");
            }
        };

        for (const auto& part : parts) {
            if (failed) {
                break;
            }

            const bool pushed = pool.push_job([&, part](std::string& err) {
                if (failed) {
                    return true; // cancelled by an earlier failure
                }

                try {
                    LOG_INFO("upload part ", part.number);
                    LocalFile reader(path);
                    std::vector<uint8_t> buffer;
                    session.upload_part(
                      reader, part, buffer, reporter_, object_progress);
                    return true;
                } catch (const UploadError& exc) {
                    // another part abandoned the session; it reports
                    if (exc.code() == ObjUploadStatusCode_InvariantViolation &&
                        session.state() == UploadSession::State::Abandoned) {
                        return true;
                    }

                    err = exc.what();
                    fail(std::current_exception());
                } catch (const std::exception& exc) {
                    err = exc.what();
                    fail(std::current_exception());
                }
                return false;
            });

            if (!pushed) {
                fail(std::make_exception_ptr(
                  std::runtime_error("Failed to queue upload of part " +
                                     std::to_string(part.number))));
                break;
            }
        }

        pool.await_stop();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}
