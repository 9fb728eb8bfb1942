/*
 * engram - Formation Queue Implementation
 */
#include <engram/memory/queue.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <chrono>
#include <vector>

namespace engram {

FormationQueue::FormationQueue(FormationPipeline& pipeline, size_t capacity)
    : pipeline_(pipeline)
    , capacity_(capacity > 0 ? capacity : 100)
    , started_(false)
    , stopping_(false)
    , stop_(false)
    , busy_(false)
    , reserved_(0)
{
}

FormationQueue::~FormationQueue() {
    stop(0);
    join_worker();
}

void FormationQueue::set_status_sink(QueueStatusSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = sink;
}

void FormationQueue::on_formation(FormationListener* listener) {
    pipeline_.add_listener(listener);
}

bool FormationQueue::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (started_ || stopping_) {
        return false;
    }
    started_ = true;
    worker_ = std::thread([this] { worker(); });
    LOG_DEBUG("Formation queue started (capacity %zu)", capacity_);
    return true;
}

std::string FormationQueue::submit(const FormationCandidate& candidate) {
    std::string id = generate_short_id();
    std::string rejection;

    // Admission reserves a slot; the task becomes visible to the consumer
    // only after PENDING has been reported
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_) {
            rejection = "Memory queue stopped";
        } else if (tasks_.size() + reserved_ >= capacity_) {
            rejection = "Memory queue full";
        } else {
            ++reserved_;
        }
    }

    if (!rejection.empty()) {
        LOG_WARN("Formation task %s rejected: %s", id.c_str(), rejection.c_str());
        reject(id, candidate, rejection);
        return id;
    }

    report(id, AsyncStatus::PENDING, "Memory queued");

    bool abandoned = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        --reserved_;
        if (stop_) {
            abandoned = true;
        } else {
            Task task;
            task.id = id;
            task.candidate = candidate;
            tasks_.push_back(task);
        }
    }

    if (abandoned) {
        report(id, AsyncStatus::FAILED, "Abandoned at shutdown");
        idle_.notify_all();
        return id;
    }
    condition_.notify_one();
    return id;
}

bool FormationQueue::stop(int timeout_ms) {
    std::vector<Task> abandoned;
    bool drained = false;

    {
        std::unique_lock<std::mutex> lock(mutex_);
        stopping_ = true;

        if (started_ && !stop_) {
            idle_.wait_for(lock, std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0),
                           [this] { return idle_locked(); });
        }

        drained = idle_locked();
        abandoned.assign(tasks_.begin(), tasks_.end());
        tasks_.clear();
        stop_ = true;
    }
    condition_.notify_all();
    idle_.notify_all();

    for (size_t i = 0; i < abandoned.size(); ++i) {
        report(abandoned[i].id, AsyncStatus::FAILED, "Abandoned at shutdown");
    }
    if (!abandoned.empty()) {
        LOG_WARN("Formation queue abandoned %zu task(s) at shutdown", abandoned.size());
    }

    // A task still running at the deadline is joined by the destructor
    if (drained) {
        join_worker();
    }
    return drained;
}

bool FormationQueue::wait_for_formations(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0),
                          [this] { return idle_locked(); });
}

size_t FormationQueue::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool FormationQueue::is_running() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return started_ && !stop_;
}

bool FormationQueue::idle_locked() const {
    return tasks_.empty() && !busy_ && reserved_ == 0;
}

void FormationQueue::join_worker() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

void FormationQueue::worker() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_) {
                return;
            }

            task = tasks_.front();
            tasks_.pop_front();
            busy_ = true;
        }

        report(task.id, AsyncStatus::IN_PROGRESS, "Storing memory...");

        // process() converts its own failures into events
        FormationEvent event = pipeline_.process(task.candidate, task.id);
        switch (event.type) {
            case FormationEventType::CREATED:
                report(task.id, AsyncStatus::COMPLETED, "Memory stored");
                break;
            case FormationEventType::SKIPPED:
                report(task.id, AsyncStatus::COMPLETED, "Memory already remembered");
                break;
            case FormationEventType::SUPERSEDED:
                report(task.id, AsyncStatus::COMPLETED, "Memory updated");
                break;
            case FormationEventType::FAILED:
                report(task.id, AsyncStatus::FAILED, "Failed: " + event.reason);
                break;
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_.notify_all();
    }
}

void FormationQueue::report(const std::string& id, AsyncStatus status, const std::string& message) {
    QueueStatusSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink) return;

    QueueStatus st;
    st.request_id = id;
    st.status = status;
    st.message = message;
    try {
        sink(st);
    } catch (const std::exception& e) {
        LOG_WARN("Queue status sink threw exception: %s", e.what());
    } catch (...) {
        LOG_WARN("Queue status sink threw unknown exception");
    }
}

void FormationQueue::reject(const std::string& id, const FormationCandidate& candidate,
                            const std::string& message) {
    report(id, AsyncStatus::FAILED, message);

    FormationEvent event;
    event.type = FormationEventType::FAILED;
    event.request_id = id;
    event.content = candidate.content;
    event.reason = to_lower(message);
    pipeline_.notify(event);
}

} // namespace engram
