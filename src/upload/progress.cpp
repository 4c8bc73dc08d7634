#include "macros.hh"
#include "progress.hh"

#include <algorithm>
#include <string>

objupload::ObjectProgress::ObjectProgress(uint64_t total_bytes)
  : total_bytes_{ total_bytes }
  , consumed_bytes_{ 0 }
{
}

uint64_t
objupload::ObjectProgress::consumed_bytes() const noexcept
{
    return consumed_bytes_.load();
}

uint64_t
objupload::ObjectProgress::add(uint64_t nbytes) noexcept
{
    return consumed_bytes_.fetch_add(nbytes) + nbytes;
}

uint64_t
objupload::ObjectProgress::subtract(uint64_t nbytes) noexcept
{
    return consumed_bytes_.fetch_sub(nbytes) - nbytes;
}

objupload::ProgressTracker::ProgressTracker(
  std::shared_ptr<ProgressReporter> reporter,
  ObjectProgress& object_progress,
  uint32_t part_number,
  uint64_t total_bytes)
  : reporter_{ std::move(reporter) }
  , object_progress_{ object_progress }
  , part_number_{ part_number }
  , total_bytes_{ total_bytes }
{
}

objupload::ProgressTracker::~ProgressTracker() noexcept
{
    if (state_ == State::Running) {
        fail();
    }
}

void
objupload::ProgressTracker::start()
{
    EXPECT(state_ == State::Idle,
           "Transfer of part ",
           part_number_,
           " has already started.");

    state_ = State::Running;
    consumed_bytes_ = 0;
    emit_(ObjUploadProgressPhase_Started, object_progress_.consumed_bytes());
}

void
objupload::ProgressTracker::update(uint64_t consumed_bytes)
{
    if (state_ != State::Running) {
        return;
    }

    consumed_bytes = std::min(consumed_bytes, total_bytes_);
    if (consumed_bytes <= consumed_bytes_) {
        return; // never report a decrease
    }

    const auto delta = consumed_bytes - consumed_bytes_;
    consumed_bytes_ = consumed_bytes;

    emit_(ObjUploadProgressPhase_DataTransferred,
          object_progress_.add(delta));
}

void
objupload::ProgressTracker::complete()
{
    if (state_ != State::Running) {
        return;
    }

    state_ = State::Done;

    const auto delta = total_bytes_ - consumed_bytes_;
    consumed_bytes_ = total_bytes_;
    emit_(ObjUploadProgressPhase_Completed, object_progress_.add(delta));
}

void
objupload::ProgressTracker::fail()
{
    if (state_ != State::Running) {
        return;
    }

    state_ = State::Done;
    emit_(ObjUploadProgressPhase_Failed,
          object_progress_.subtract(consumed_bytes_));
}

void
objupload::ProgressTracker::emit_(ObjUploadProgressPhase phase,
                                  uint64_t object_consumed_bytes)
{
    if (!reporter_) {
        return;
    }

    const ProgressEvent event{
        .phase = phase,
        .part_number = part_number_,
        .consumed_bytes = consumed_bytes_,
        .total_bytes = total_bytes_,
        .object_consumed_bytes = object_consumed_bytes,
        .object_total_bytes = object_progress_.total_bytes(),
    };

    try {
        reporter_->on_event(event);
    } catch (const std::exception& exc) {
        LOG_WARNING("Progress reporter failed: ", exc.what());
    }
}

objupload::ConsoleProgressReporter::ConsoleProgressReporter(std::ostream& out)
  : out_{ out }
{
}

void
objupload::ConsoleProgressReporter::on_event(const ProgressEvent& event)
{
    std::scoped_lock lock(mutex_);

    std::string part;
    if (event.part_number > 0) {
        part = "part " + std::to_string(event.part_number) + " ";
    }

    switch (event.phase) {
        case ObjUploadProgressPhase_Started:
            out_ << part << "started, consumed bytes: " << event.consumed_bytes
                 << ", total bytes: " << event.total_bytes << "."
                 << std::endl;
            break;
        case ObjUploadProgressPhase_DataTransferred:
            out_ << "\ruploading consumed bytes: " << event.consumed_bytes
                 << ", total bytes: " << event.total_bytes << ", "
                 << percent_of(event.consumed_bytes, event.total_bytes)
                 << "%.";
            if (event.part_number > 0) {
                out_ << " object: "
                     << percent_of(event.object_consumed_bytes,
                                   event.object_total_bytes)
                     << "%.";
            }
            out_.flush();
            break;
        case ObjUploadProgressPhase_Completed:
            out_ << "\n" << part
                 << "completed, consumed bytes: " << event.consumed_bytes
                 << ", total bytes: " << event.total_bytes << "."
                 << std::endl;
            break;
        case ObjUploadProgressPhase_Failed:
            out_ << "\n" << part
                 << "failed, consumed bytes: " << event.consumed_bytes
                 << ", total bytes: " << event.total_bytes << "."
                 << std::endl;
            break;
        default:
            break;
    }
}

objupload::CallbackProgressReporter::CallbackProgressReporter(
  ObjUploadProgressCallback callback,
  void* user_data)
  : callback_{ callback }
  , user_data_{ user_data }
{
    EXPECT(callback_, "Null pointer: callback");
}

void
objupload::CallbackProgressReporter::on_event(const ProgressEvent& event)
{
    std::scoped_lock lock(mutex_);
    callback_(&event, user_data_);
}

unsigned int
objupload::percent_of(uint64_t consumed, uint64_t total) noexcept
{
    if (total == 0) {
        return 100;
    }

    return static_cast<unsigned int>(
      static_cast<double>(std::min(consumed, total)) * 100.0 /
      static_cast<double>(total));
}
