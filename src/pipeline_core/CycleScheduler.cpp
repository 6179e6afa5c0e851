#include "gatesense/pipeline/CycleScheduler.h"
#include <iostream>

namespace gatesense {

std::string toString(CycleKind kind) {
    switch (kind) {
        case CycleKind::Discovery:   return "discovery";
        case CycleKind::Enforcement: return "enforcement";
        case CycleKind::Duplicates:  return "duplicates";
    }
    return "unknown";
}

bool discoveryDue(int64_t accepted_scans, int64_t accepted_at_last_run, int first_at, int every) {
    if (accepted_at_last_run <= 0) return accepted_scans >= first_at;
    return accepted_scans - accepted_at_last_run >= every;
}

CycleScheduler::CycleScheduler(Runner runner, int worker_threads, FailureHook on_failure)
    : runner_(std::move(runner)),
      on_failure_(std::move(on_failure)),
      worker_count_(worker_threads < 1 ? 1 : worker_threads) {}

CycleScheduler::~CycleScheduler() {
    stop();
}

void CycleScheduler::start() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!workers_.empty()) return;
    stopping_ = false;
    for (int i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&CycleScheduler::workerLoop, this);
    }
    std::cout << "[Scheduler] Started " << worker_count_ << " workers" << std::endl;
}

void CycleScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (workers_.empty()) return;
        stopping_ = true;
        queue_.clear();
        queued_.clear();
    }
    queue_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    workers_.clear();
    idle_cv_.notify_all();
}

bool CycleScheduler::enqueue(const std::string& session_id, CycleKind kind) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ || cancelled_.count(session_id)) return false;
        if (!queued_.insert({session_id, static_cast<int>(kind)}).second) return false;
        queue_.push_back(Job{session_id, kind});
    }
    queue_cv_.notify_one();
    return true;
}

void CycleScheduler::deactivate(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    cancelled_.insert(session_id);
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->session_id == session_id) {
            queued_.erase({it->session_id, static_cast<int>(it->kind)});
            it = queue_.erase(it);
            ++stats_.dropped_inactive;
        } else {
            ++it;
        }
    }
    if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
}

void CycleScheduler::reactivate(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    cancelled_.erase(session_id);
}

bool CycleScheduler::isCancelled(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return cancelled_.count(session_id) > 0;
}

std::mutex& CycleScheduler::sessionMutex(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& slot = session_locks_[session_id];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

void CycleScheduler::waitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && running_ == 0) || workers_.empty(); });
}

CycleScheduler::Stats CycleScheduler::stats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return stats_;
}

void CycleScheduler::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) return;
            job = queue_.front();
            queue_.pop_front();
            queued_.erase({job.session_id, static_cast<int>(job.kind)});
            ++running_;
        }

        execute(job);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --running_;
            if (queue_.empty() && running_ == 0) idle_cv_.notify_all();
        }
    }
}

void CycleScheduler::execute(const Job& job) {
    if (isCancelled(job.session_id)) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ++stats_.dropped_inactive;
        return;
    }

    std::unique_lock<std::mutex> session_lock(sessionMutex(job.session_id), std::try_to_lock);
    if (!session_lock.owns_lock()) {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ++stats_.skipped_busy;
        return;
    }

    try {
        runner_(job.session_id, job.kind);
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ++stats_.completed;
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            ++stats_.failed;
        }
        std::cerr << "[Scheduler] " << toString(job.kind) << " cycle for session " << job.session_id
                  << " failed: " << e.what() << std::endl;
        if (on_failure_) on_failure_(job.session_id, job.kind, e.what());
    }
}

} // namespace gatesense
