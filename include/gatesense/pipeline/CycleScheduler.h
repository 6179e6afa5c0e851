#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace gatesense {

enum class CycleKind : int {
    Discovery   = 0,   // clustering, materialization, orphan backfill
    Enforcement = 1,   // binding learner
    Duplicates  = 2    // duplicate gate detection
};

std::string toString(CycleKind kind);

// First discovery once `first_at` accepted scans exist, then every `every` more
bool discoveryDue(int64_t accepted_scans, int64_t accepted_at_last_run, int first_at, int every);

// Background cycles on a small worker pool. At most one cycle per session runs
// at a time; a job whose session is busy is dropped and picked up again by the
// next trigger. Identical (session, kind) requests collapse while queued.
class CycleScheduler {
public:
    using Runner      = std::function<void(const std::string& session_id, CycleKind kind)>;
    using FailureHook = std::function<void(const std::string& session_id, CycleKind kind, const std::string& what)>;

    struct Stats {
        uint64_t completed = 0;
        uint64_t failed = 0;
        uint64_t skipped_busy = 0;
        uint64_t dropped_inactive = 0;
    };

    CycleScheduler(Runner runner, int worker_threads, FailureHook on_failure = {});
    ~CycleScheduler();

    CycleScheduler(const CycleScheduler&) = delete;
    CycleScheduler& operator=(const CycleScheduler&) = delete;

    void start();
    // Joins the workers; queued jobs are discarded
    void stop();

    // false when the same job is already queued or the session is deactivated
    bool enqueue(const std::string& session_id, CycleKind kind);

    // In-flight cycles of a deactivated session stop at their next unit boundary
    void deactivate(const std::string& session_id);
    void reactivate(const std::string& session_id);
    bool isCancelled(const std::string& session_id) const;

    // Serializes foreground (operator) cycles with background ones
    std::mutex& sessionMutex(const std::string& session_id);

    // Blocks until nothing is queued or running
    void waitIdle();

    Stats stats() const;

private:
    struct Job {
        std::string session_id;
        CycleKind   kind;
    };

    Runner      runner_;
    FailureHook on_failure_;
    int         worker_count_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> queue_;
    std::set<std::pair<std::string, int>> queued_;
    std::set<std::string> cancelled_;
    int  running_ = 0;
    bool stopping_ = false;
    Stats stats_;

    std::mutex sessions_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> session_locks_;

    std::vector<std::thread> workers_;

    void workerLoop();
    void execute(const Job& job);
};

} // namespace gatesense
