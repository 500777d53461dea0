#include "sync_queue.hpp"
#include <exception>
#include <utility>
#include "logger.hpp"

namespace memsync {

static std::future<SyncResult> ready(SyncResult result) {
    std::promise<SyncResult> p;
    p.set_value(std::move(result));
    return p.get_future();
}

SyncQueue::SyncQueue(size_t max_pending)
    : max_pending_(max_pending == 0 ? 1 : max_pending), thread_(&SyncQueue::worker, this) {}

SyncQueue::~SyncQueue() { shutdown(); }

std::future<SyncResult> SyncQueue::enqueue(std::string label, Task task) {
    return push(std::move(label), std::move(task), false);
}

std::future<SyncResult> SyncQueue::try_enqueue(std::string label, Task task) {
    return push(std::move(label), std::move(task), true);
}

std::future<SyncResult> SyncQueue::push(std::string label, Task task, bool bounded) {
    std::future<SyncResult> fut;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopping_)
            return ready(SyncResult::failure("Sync queue is shutting down; " + label +
                                                 " was not run",
                                             label, "GIT_SYNC_QUEUE_STOPPED"));
        if (bounded && items_.size() >= max_pending_) {
            log_warning("Sync queue full, request refused",
                        {{"task", label}, {"pending", std::to_string(items_.size())}});
            return ready(SyncResult::failure("Too many pending sync requests (" +
                                                 std::to_string(items_.size()) + "); " + label +
                                                 " was not queued",
                                             label, "GIT_SYNC_QUEUE_FULL"));
        }
        Item item{std::move(label), std::move(task), std::promise<SyncResult>()};
        fut = item.promise.get_future();
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return fut;
}

size_t SyncQueue::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
}

void SyncQueue::wait_idle() {
    std::unique_lock<std::mutex> lk(mtx_);
    idle_cv_.wait(lk, [this] { return items_.empty() && !busy_; });
}

void SyncQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

bool SyncQueue::on_worker_thread() const { return thread_.get_id() == std::this_thread::get_id(); }

void SyncQueue::worker() {
    while (true) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty() || stopping_; });
        if (items_.empty() && stopping_)
            break;
        Item item = std::move(items_.front());
        items_.pop_front();
        busy_ = true;
        lk.unlock();

        try {
            item.promise.set_value(item.task());
        } catch (const std::exception& e) {
            log_error("Queued task raised", {{"task", item.label}, {"error", e.what()}});
            item.promise.set_value(SyncResult::failure(std::string("Unexpected error: ") +
                                                           e.what(),
                                                       item.label, "GIT_SYNC_UNEXPECTED_ERROR"));
        } catch (...) {
            item.promise.set_exception(std::current_exception());
        }

        lk.lock();
        busy_ = false;
        if (items_.empty())
            idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

} // namespace memsync
