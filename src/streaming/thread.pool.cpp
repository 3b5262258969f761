#include "thread.pool.hh"
#include "macros.hh"

#include <algorithm>

s3zip::ThreadPool::ThreadPool(unsigned int n_threads, ErrorCallback&& err)
  : error_handler_{ std::move(err) }
{
    // uploads are I/O bound, so don't clamp to hardware concurrency
    n_threads = std::max(n_threads, 1u);

    for (auto i = 0; i < n_threads; ++i) {
        threads_.emplace_back([this] { process_tasks_(); });
    }
}

s3zip::ThreadPool::~ThreadPool() noexcept
{
    await_stop();
}

bool
s3zip::ThreadPool::push_job(Task&& job)
{
    std::unique_lock lock(jobs_mutex_);
    if (!is_accepting_jobs_) {
        return false;
    }

    jobs_.push(std::move(job));
    jobs_cv_.notify_one();

    return true;
}

void
s3zip::ThreadPool::await_stop() noexcept
{
    {
        std::scoped_lock lock(jobs_mutex_);
        is_accepting_jobs_ = false;

        jobs_cv_.notify_all();
    }

    // spin down threads
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::optional<s3zip::ThreadPool::Task>
s3zip::ThreadPool::pop_from_job_queue_() noexcept
{
    if (jobs_.empty()) {
        return std::nullopt;
    }

    auto job = std::move(jobs_.front());
    jobs_.pop();
    return job;
}

bool
s3zip::ThreadPool::should_stop_() const noexcept
{
    return !is_accepting_jobs_ && jobs_.empty();
}

void
s3zip::ThreadPool::process_tasks_()
{
    while (true) {
        std::unique_lock lock(jobs_mutex_);
        jobs_cv_.wait(lock, [&] { return should_stop_() || !jobs_.empty(); });

        if (should_stop_()) {
            break;
        }

        if (auto job = pop_from_job_queue_(); job.has_value()) {
            lock.unlock();

            std::string err_msg;
            bool success = false;
            try {
                success = job.value()(err_msg);
            } catch (const std::exception& exc) {
                err_msg = exc.what();
            }

            if (!success) {
                LOG_ERROR(err_msg);
                error_handler_(err_msg);
            }
        }
    }
}
