/*
 * engram - Asynchronous formation queue
 *
 * Bounded FIFO buffer drained by one background consumer thread that runs
 * the formation pipeline once per task. submit() never blocks: a full or
 * stopped queue rejects the task with a FAILED status and event.
 */
#ifndef ENGRAM_MEMORY_QUEUE_HPP
#define ENGRAM_MEMORY_QUEUE_HPP

#include "formation.hpp"
#include <deque>
#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace engram {

enum class AsyncStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

inline const char* async_status_to_string(AsyncStatus s) {
    switch (s) {
        case AsyncStatus::PENDING: return "pending";
        case AsyncStatus::IN_PROGRESS: return "in_progress";
        case AsyncStatus::COMPLETED: return "completed";
        case AsyncStatus::FAILED: return "failed";
    }
    return "failed";
}

struct QueueStatus {
    std::string request_id;
    AsyncStatus status;
    std::string message;

    QueueStatus() : status(AsyncStatus::PENDING) {}
};

typedef std::function<void(const QueueStatus&)> QueueStatusSink;

class FormationQueue {
public:
    // The pipeline must outlive the queue
    FormationQueue(FormationPipeline& pipeline, size_t capacity);
    ~FormationQueue();

    // Called from both the submitting thread and the consumer thread
    void set_status_sink(QueueStatusSink sink);

    // Register a listener for every formation event, including rejections
    void on_formation(FormationListener* listener);

    bool start();

    // Returns the request id. Never blocks on a full buffer.
    std::string submit(const FormationCandidate& candidate);

    // Stop accepting work and wait up to timeout_ms for the buffer to drain.
    // Tasks still queued at the deadline are abandoned. Returns true when
    // everything submitted before the call was processed.
    bool stop(int timeout_ms);

    // Wait until queued work is done without stopping; false on timeout
    bool wait_for_formations(int timeout_ms);

    size_t pending() const;
    size_t capacity() const { return capacity_; }
    bool is_running() const;

private:
    struct Task {
        std::string id;
        FormationCandidate candidate;
    };

    FormationPipeline& pipeline_;
    size_t capacity_;

    std::deque<Task> tasks_;
    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    bool started_;
    bool stopping_;
    std::atomic<bool> stop_;
    bool busy_;
    size_t reserved_;   // admitted, PENDING not yet reported
    std::mutex join_mutex_;

    std::mutex sink_mutex_;
    QueueStatusSink sink_;

    void worker();
    bool idle_locked() const;   // requires mutex_
    void join_worker();
    void report(const std::string& id, AsyncStatus status, const std::string& message);
    void reject(const std::string& id, const FormationCandidate& candidate, const std::string& message);
};

} // namespace engram

#endif // ENGRAM_MEMORY_QUEUE_HPP
