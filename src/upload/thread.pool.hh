#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace objupload {
/// Upper bound on the number of workers in a single pool.
constexpr unsigned int max_pool_workers = 64;

/**
 * @brief Fixed set of workers that run part uploads pulled from a FIFO queue.
 *
 * Workers spend most of their time waiting on the network, so the pool is
 * sized from the requested concurrency and not from the number of cores.
 */
class ThreadPool
{
  public:
    using Task = std::function<bool(std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    // The error handler `err` is called when a job returns false. The
    // std::string& argument to the error handler is a diagnostic message from
    // the failing job.
    ThreadPool(unsigned int n_workers, ErrorCallback&& err);
    ~ThreadPool() noexcept;

    /**
     * @brief Push a job onto the job queue.
     *
     * @param job The job to push onto the queue.
     * @return true if the job was successfully pushed onto the queue, false
     * otherwise.
     */
    [[nodiscard]] bool push_job(Task&& job);

    /**
     * @brief Drop every job that no worker has picked up yet.
     * @return The number of jobs dropped.
     * @note Jobs already running are not interrupted.
     */
    size_t cancel_pending() noexcept;

    /**
     * @brief Block until all jobs on the queue have processed, then spin down
     * the workers.
     * @note After calling this function, the job queue no longer accepts jobs.
     */
    void await_stop() noexcept;

    /// Number of workers started, after clamping to [1, max_pool_workers].
    [[nodiscard]] size_t n_workers() const noexcept;

  private:
    ErrorCallback error_handler_;

    std::vector<std::thread> workers_;
    std::mutex jobs_mutex_;
    std::condition_variable cv_;
    std::queue<Task> jobs_;

    bool is_accepting_jobs_{ true };

    std::optional<Task> pop_from_job_queue_() noexcept;
    [[nodiscard]] bool should_stop_() const noexcept;
    void process_tasks_();
};
} // namespace objupload
