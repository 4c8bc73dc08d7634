#pragma once

#include "objupload.types.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>

namespace objupload {
using ProgressEvent = ObjUploadProgressEvent;

/**
 * @brief Receives the lifecycle events of every tracked transfer.
 * @details Implementations must return promptly. Exceptions thrown from
 * on_event are logged and otherwise ignored; they never abort a transfer.
 */
class ProgressReporter
{
  public:
    virtual ~ProgressReporter() = default;

    virtual void on_event(const ProgressEvent& event) = 0;
};

/// @brief Bytes sent for the whole object, shared by all transfers.
class ObjectProgress
{
  public:
    explicit ObjectProgress(uint64_t total_bytes);

    uint64_t total_bytes() const noexcept { return total_bytes_; }
    uint64_t consumed_bytes() const noexcept;

    /// @return The new consumed byte count.
    uint64_t add(uint64_t nbytes) noexcept;
    /// @return The new consumed byte count.
    uint64_t subtract(uint64_t nbytes) noexcept;

  private:
    const uint64_t total_bytes_;
    std::atomic<uint64_t> consumed_bytes_;
};

/**
 * @brief Emits the events of one tracked transfer.
 * @details Started is emitted once with zero consumed bytes, DataTransferred
 * only with nondecreasing consumed bytes, and exactly one of Completed or
 * Failed at the end. A tracker destroyed while its transfer is in flight
 * emits Failed. A failed transfer gives its bytes back to the object count so
 * that a retry does not count them twice.
 */
class ProgressTracker
{
  public:
    ProgressTracker(std::shared_ptr<ProgressReporter> reporter,
                    ObjectProgress& object_progress,
                    uint32_t part_number,
                    uint64_t total_bytes);
    ~ProgressTracker() noexcept;

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void start();
    void update(uint64_t consumed_bytes);
    void complete();
    void fail();

    uint64_t consumed_bytes() const noexcept { return consumed_bytes_; }

  private:
    enum class State
    {
        Idle,
        Running,
        Done
    };

    std::shared_ptr<ProgressReporter> reporter_;
    ObjectProgress& object_progress_;
    const uint32_t part_number_;
    const uint64_t total_bytes_;

    State state_{ State::Idle };
    uint64_t consumed_bytes_{ 0 };

    void emit_(ObjUploadProgressPhase phase, uint64_t object_consumed_bytes);
};

/**
 * @brief Renders progress as text lines.
 */
class ConsoleProgressReporter : public ProgressReporter
{
  public:
    explicit ConsoleProgressReporter(std::ostream& out);

    void on_event(const ProgressEvent& event) override;

  private:
    std::mutex mutex_;
    std::ostream& out_;
};

/**
 * @brief Forwards events to a C callback, one call at a time.
 */
class CallbackProgressReporter : public ProgressReporter
{
  public:
    CallbackProgressReporter(ObjUploadProgressCallback callback,
                             void* user_data);

    void on_event(const ProgressEvent& event) override;

  private:
    std::mutex mutex_;
    ObjUploadProgressCallback callback_;
    void* user_data_;
};

/**
 * @brief Percentage of @p consumed in @p total, 100 if @p total is zero.
 */
unsigned int
percent_of(uint64_t consumed, uint64_t total) noexcept;
} // namespace objupload
