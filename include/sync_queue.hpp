#ifndef MEMSYNC_SYNC_QUEUE_HPP
#define MEMSYNC_SYNC_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include "sync_result.hpp"

namespace memsync {

/**
 * @brief Single-consumer task queue serializing all work on one repository.
 *
 * Tasks run one at a time, in submission order, on a dedicated worker
 * thread. Each submission returns a future for its result. Destruction stops
 * intake, finishes everything already queued and joins the worker.
 */
class SyncQueue {
  public:
    using Task = std::function<SyncResult()>;

    /**
     * @param max_pending Waiting tasks allowed before @ref try_enqueue refuses.
     */
    explicit SyncQueue(size_t max_pending);
    ~SyncQueue();
    SyncQueue(const SyncQueue&) = delete;
    SyncQueue& operator=(const SyncQueue&) = delete;

    /**
     * @brief Queue @p task regardless of the pending limit.
     *
     * After @ref shutdown the returned future is ready with
     * `GIT_SYNC_QUEUE_STOPPED`.
     */
    std::future<SyncResult> enqueue(std::string label, Task task);

    /**
     * @brief Queue @p task unless `max_pending` tasks are already waiting.
     *
     * A refused task yields a ready future with `GIT_SYNC_QUEUE_FULL`.
     */
    std::future<SyncResult> try_enqueue(std::string label, Task task);

    /// Tasks waiting to start; the running one is not counted.
    size_t pending() const;

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    /// Refuse new tasks, run the queued ones and join the worker.
    void shutdown();

    /// `true` when called from inside a running task.
    bool on_worker_thread() const;

  private:
    struct Item {
        std::string label;
        Task task;
        std::promise<SyncResult> promise;
    };

    std::future<SyncResult> push(std::string label, Task task, bool bounded);
    void worker();

    const size_t max_pending_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Item> items_;
    bool stopping_ = false;
    bool busy_ = false;
    std::thread thread_;
};

} // namespace memsync

#endif // MEMSYNC_SYNC_QUEUE_HPP
