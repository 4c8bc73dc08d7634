#include "thread.pool.hh"

#include <algorithm>

objupload::ThreadPool::ThreadPool(unsigned int n_workers, ErrorCallback&& err)
  : error_handler_{ std::move(err) }
{
    n_workers = std::clamp(n_workers, 1u, max_pool_workers);

    workers_.reserve(n_workers);
    for (unsigned int i = 0; i < n_workers; ++i) {
        workers_.emplace_back([this] { process_tasks_(); });
    }
}

objupload::ThreadPool::~ThreadPool() noexcept
{
    cancel_pending();
    await_stop();
}

bool
objupload::ThreadPool::push_job(Task&& job)
{
    std::unique_lock lock(jobs_mutex_);
    if (!is_accepting_jobs_) {
        return false;
    }

    jobs_.push(std::move(job));
    cv_.notify_one();

    return true;
}

size_t
objupload::ThreadPool::cancel_pending() noexcept
{
    std::scoped_lock lock(jobs_mutex_);
    const size_t n_dropped = jobs_.size();
    std::queue<Task>().swap(jobs_);

    // idle workers may now be able to stop
    cv_.notify_all();
    return n_dropped;
}

void
objupload::ThreadPool::await_stop() noexcept
{
    {
        std::scoped_lock lock(jobs_mutex_);
        is_accepting_jobs_ = false;

        cv_.notify_all();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t
objupload::ThreadPool::n_workers() const noexcept
{
    return workers_.size();
}

std::optional<objupload::ThreadPool::Task>
objupload::ThreadPool::pop_from_job_queue_() noexcept
{
    if (jobs_.empty()) {
        return std::nullopt;
    }

    auto job = std::move(jobs_.front());
    jobs_.pop();
    return job;
}

bool
objupload::ThreadPool::should_stop_() const noexcept
{
    return !is_accepting_jobs_ && jobs_.empty();
}

void
objupload::ThreadPool::process_tasks_()
{
    while (true) {
        std::unique_lock lock(jobs_mutex_);
        cv_.wait(lock, [&] { return should_stop_() || !jobs_.empty(); });

        if (should_stop_()) {
            break;
        }

        if (auto job = pop_from_job_queue_(); job.has_value()) {
            lock.unlock();
            if (std::string err_msg; !job.value()(err_msg)) {
                error_handler_(err_msg);
            }
        }
    }
}
