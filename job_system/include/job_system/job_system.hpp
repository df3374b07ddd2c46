#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <thread>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <new>
#include <stdexcept>
#include <random>

namespace job_system {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Fixed-size pool of worker threads with per-worker deques and work stealing.
 *
 * The first job that throws puts the system into the failed state: its
 * exception is kept for rethrow_if_error() and every job still queued is
 * dropped without running. Jobs already executing on other workers finish.
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<std::size_t> jobs_executed{0};
        std::atomic<std::size_t> jobs_stolen{0};
        std::atomic<std::size_t> jobs_cancelled{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<std::size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    // Completion tracking, guarded by completion_mutex_
    std::size_t total_submitted_{0};
    std::size_t total_completed_{0};
    mutable std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    // First failure wins; later failures are counted only
    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::exception_ptr first_error_;
    mutable std::mutex error_mutex_;

    void record_error(ErrorType type, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (error_type_.load(std::memory_order_relaxed) == ErrorType::None) {
            first_error_ = error;
            error_type_.store(type, std::memory_order_release);
        }
    }

    void mark_completed() {
        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            ++total_completed_;
        }
        completion_cv_.notify_all();
    }

    // Try to steal half the tasks from a victim worker
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        // Steal from the front to stay away from the owner's end
        std::size_t steal_count = std::max(std::size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);

        for (std::size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }

        return stolen;
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                if (data->tasks.empty() && !data->stop.load() && workers_.size() > 1) {
                    lock.unlock();

                    for (std::size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (!job) continue;

            if (has_error()) {
                data->jobs_cancelled.fetch_add(1);
                mark_completed();
                continue;
            }

            // Worker threads must not throw; the failure is handed to the waiter
            try {
                job->execute();
            } catch (const std::bad_alloc&) {
                record_error(ErrorType::OutOfMemory, std::current_exception());
            } catch (const std::exception&) {
                record_error(ErrorType::Exception, std::current_exception());
            } catch (...) {
                record_error(ErrorType::Unhandled, std::current_exception());
            }

            data->jobs_executed.fetch_add(1);
            mark_completed();
        }
    }

    void push(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            ++total_submitted_;
        }
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                // Oldest job sits at the back, where the owner pops
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

public:
    explicit JobSystem(std::size_t num_threads = 0) {
        std::size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (is_running_.load()) return;

        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            total_submitted_ = 0;
            total_completed_ = 0;
        }
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_error_ = nullptr;
            error_type_.store(ErrorType::None, std::memory_order_release);
        }

        for (auto& worker : workers_) {
            worker->stop.store(false);
            auto* data = worker.get();
            worker->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        std::size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        push(workers_[worker_idx].get(), std::move(job), mode);
    }

    void submit_to_worker(std::size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }

        push(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    /**
     * Block until every submitted job has run or been cancelled.
     * Jobs may submit further jobs; those are waited for as well.
     */
    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        completion_cv_.wait(lock, [this] {
            return total_submitted_ == total_completed_;
        });
    }

    /**
     * Rethrow the first exception raised by a job since start(), if any.
     */
    void rethrow_if_error() const {
        if (!has_error()) return;
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error = first_error_;
        }
        if (error) std::rethrow_exception(error);
    }

    std::size_t get_num_workers() const {
        return workers_.size();
    }

    // Submitted but not yet completed or cancelled
    std::size_t get_pending_count() const {
        std::lock_guard<std::mutex> lock(completion_mutex_);
        return total_submitted_ - total_completed_;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    struct SystemStatistics {
        std::size_t total_jobs_executed;
        std::size_t total_jobs_stolen;
        std::size_t total_jobs_cancelled;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0, 0};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
            stats.total_jobs_cancelled += worker->jobs_cancelled.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
