/*
 * engram - Formation queue tests
 */
#include "test_harness.hpp"
#include "fakes.hpp"
#include <engram/memory/queue.hpp>
#include <chrono>
#include <map>

using namespace engram;

static MemoryConfig config_for(const TempDb& db) {
    MemoryConfig cfg;
    cfg.db_path = db.path();
    return cfg;
}

static FormationCandidate candidate(const std::string& content) {
    FormationCandidate c;
    c.content = content;
    c.category = MemoryCategory::FACT;
    c.has_category = true;
    return c;
}

// Distinct contents so no candidate deduplicates another
static std::string note(int i) {
    static const char* const WORDS[] = {
        "alpha", "bravo", "charlie", "delta", "echo", "foxtrot", "golf", "hotel",
        "india", "juliet", "kilo", "lima", "mike", "november", "oscar", "papa"
    };
    return std::string("remember ") + WORDS[i % 16] + " " + WORDS[(i * 7 + 3) % 16] +
           " item" + std::to_string(i);
}

class EventLog : public FormationListener {
public:
    void on_formation(const FormationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<FormationEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    std::mutex mutex_;
    std::vector<FormationEvent> events_;
};

class StatusLog {
public:
    void add(const QueueStatus& st) {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_.push_back(st);
    }

    int count(AsyncStatus status, const std::string& message = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (size_t i = 0; i < statuses_.size(); ++i) {
            if (statuses_[i].status != status) continue;
            if (!message.empty() && statuses_[i].message != message) continue;
            ++n;
        }
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<QueueStatus> statuses_;
};

static bool wait_until_pending(FormationQueue& queue, size_t n, int timeout_ms) {
    for (int waited = 0; waited < timeout_ms; waited += 5) {
        if (queue.pending() == n) return true;
        sleep_ms(5);
    }
    return queue.pending() == n;
}

TEST(every_submitted_task_yields_one_event) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    EventLog log;
    StatusLog statuses;

    FormationQueue queue(pipeline, 100);
    queue.on_formation(&log);
    queue.set_status_sink([&statuses](const QueueStatus& st) { statuses.add(st); });
    CHECK(queue.start());

    const int N = 12;
    for (int i = 0; i < N; ++i) {
        std::string id = queue.submit(candidate(note(i)));
        CHECK_EQ(id.size(), 8u);
    }
    queue.submit(candidate("   "));

    CHECK(queue.stop(10000));
    CHECK(!queue.is_running());

    std::vector<FormationEvent> events = log.events();
    CHECK_EQ(events.size(), static_cast<size_t>(N + 1));
    CHECK_EQ(statuses.count(AsyncStatus::PENDING, "Memory queued"), N + 1);
    CHECK_EQ(statuses.count(AsyncStatus::IN_PROGRESS, "Storing memory..."), N + 1);
    CHECK_EQ(statuses.count(AsyncStatus::COMPLETED, "Memory stored"), N);
    CHECK_EQ(statuses.count(AsyncStatus::FAILED), 1);
    CHECK_EQ(mgr.count("").value, N);
}

TEST(tasks_run_in_submission_order) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    EventLog log;

    FormationQueue queue(pipeline, 16);
    queue.on_formation(&log);

    // Buffered before the consumer exists
    std::vector<std::string> ids;
    for (int i = 0; i < 6; ++i) ids.push_back(queue.submit(candidate(note(i))));
    CHECK_EQ(queue.pending(), 6u);

    CHECK(queue.start());
    CHECK(!queue.start());
    CHECK(queue.wait_for_formations(10000));

    std::vector<FormationEvent> events = log.events();
    CHECK_EQ(events.size(), ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        CHECK_EQ(events[i].request_id, ids[i]);
    }
    CHECK(queue.stop(1000));
}

TEST(full_buffer_rejects_without_blocking) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    EventLog log;
    StatusLog statuses;

    FormationQueue queue(pipeline, 2);
    queue.on_formation(&log);
    queue.set_status_sink([&statuses](const QueueStatus& st) { statuses.add(st); });
    CHECK(queue.start());

    emb.block();
    queue.submit(candidate(note(0)));
    CHECK(wait_until_pending(queue, 0, 5000));   // consumer is now stuck in embed()

    int64_t started = current_timestamp_ms();
    for (int i = 1; i <= 5; ++i) {
        queue.submit(candidate(note(i)));
    }
    int64_t elapsed = current_timestamp_ms() - started;
    CHECK(elapsed < 1000);
    CHECK_EQ(queue.pending(), 2u);

    std::vector<FormationEvent> rejected = log.events();
    CHECK_EQ(rejected.size(), 3u);
    for (size_t i = 0; i < rejected.size(); ++i) {
        CHECK(rejected[i].type == FormationEventType::FAILED);
        CHECK_EQ(rejected[i].reason, "memory queue full");
    }
    CHECK_EQ(statuses.count(AsyncStatus::FAILED, "Memory queue full"), 3);

    emb.release();
    CHECK(queue.stop(10000));

    // One event per submission: 3 processed plus 3 rejected
    CHECK_EQ(log.events().size(), 6u);
    CHECK_EQ(mgr.count("").value, 3);
}

TEST(stop_deadline_abandons_queued_tasks) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    EventLog log;
    StatusLog statuses;

    {
        FormationQueue queue(pipeline, 10);
        queue.on_formation(&log);
        queue.set_status_sink([&statuses](const QueueStatus& st) { statuses.add(st); });
        CHECK(queue.start());

        emb.block();
        queue.submit(candidate(note(0)));
        CHECK(wait_until_pending(queue, 0, 5000));
        queue.submit(candidate(note(1)));
        queue.submit(candidate(note(2)));

        int64_t started = current_timestamp_ms();
        CHECK(!queue.stop(50));
        CHECK(current_timestamp_ms() - started < 2000);
        CHECK_EQ(queue.pending(), 0u);
        CHECK_EQ(statuses.count(AsyncStatus::FAILED, "Abandoned at shutdown"), 2);

        // Submissions after stop are rejected, not queued
        queue.submit(candidate(note(3)));
        CHECK_EQ(statuses.count(AsyncStatus::FAILED, "Memory queue stopped"), 1);

        // Let the in-flight task finish; the destructor joins the consumer
        emb.release();
    }

    std::vector<FormationEvent> events = log.events();
    CHECK_EQ(events.size(), 2u);
    int created = 0;
    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].type == FormationEventType::CREATED) ++created;
    }
    CHECK_EQ(created, 1);
    CHECK_EQ(mgr.count("").value, 1);
}

TEST(wait_for_formations_keeps_queue_running) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    FormationQueue queue(pipeline, 10);
    CHECK(queue.start());
    for (int i = 0; i < 3; ++i) queue.submit(candidate(note(i)));

    CHECK(queue.wait_for_formations(10000));
    CHECK(queue.is_running());
    CHECK_EQ(queue.pending(), 0u);
    CHECK_EQ(mgr.count("").value, 3);

    queue.submit(candidate(note(3)));
    CHECK(queue.wait_for_formations(10000));
    CHECK_EQ(mgr.count("").value, 4);

    emb.block();
    queue.submit(candidate(note(4)));
    CHECK(!queue.wait_for_formations(50));
    emb.release();
    CHECK(queue.stop(10000));
}

TEST(status_sink_exceptions_are_contained) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    EventLog log;

    FormationQueue queue(pipeline, 10);
    queue.on_formation(&log);
    queue.set_status_sink([](const QueueStatus&) { throw std::runtime_error("ui gone"); });
    CHECK(queue.start());
    queue.submit(candidate(note(0)));
    CHECK(queue.stop(10000));
    CHECK_EQ(log.events().size(), 1u);
    CHECK(log.events()[0].type == FormationEventType::CREATED);
}

TEST(pending_is_reported_before_work_starts) {
    TempDb db;
    // No provider: every formation fails immediately on the consumer thread
    MemoryManager mgr(config_for(db), NULL);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    std::mutex mutex;
    std::map<std::string, std::vector<AsyncStatus> > seen;

    const int N = 2000;
    FormationQueue queue(pipeline, N);
    queue.set_status_sink([&mutex, &seen](const QueueStatus& st) {
        std::lock_guard<std::mutex> lock(mutex);
        seen[st.request_id].push_back(st.status);
    });
    CHECK(queue.start());

    for (int i = 0; i < N; ++i) {
        queue.submit(candidate(note(i)));
    }
    CHECK(queue.stop(30000));

    std::lock_guard<std::mutex> lock(mutex);
    CHECK_EQ(seen.size(), static_cast<size_t>(N));
    int out_of_order = 0;
    for (std::map<std::string, std::vector<AsyncStatus> >::const_iterator it = seen.begin();
         it != seen.end(); ++it) {
        const std::vector<AsyncStatus>& s = it->second;
        if (s.size() != 3 || s[0] != AsyncStatus::PENDING ||
            s[1] != AsyncStatus::IN_PROGRESS || s[2] != AsyncStatus::FAILED) {
            ++out_of_order;
        }
    }
    CHECK_EQ(out_of_order, 0);
}

TEST(concurrent_stops_join_once) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    FormationQueue queue(pipeline, 10);
    CHECK(queue.start());
    for (int i = 0; i < 3; ++i) queue.submit(candidate(note(i)));

    bool first = false;
    bool second = false;
    std::thread a([&queue, &first] { first = queue.stop(10000); });
    std::thread b([&queue, &second] { second = queue.stop(10000); });
    a.join();
    b.join();

    CHECK(first);
    CHECK(second);
    CHECK(!queue.is_running());
    CHECK_EQ(mgr.count("").value, 3);
}

int main() {
    quiet_logs();

    std::cout << "=== Formation queue ===\n";
    RUN_TEST(every_submitted_task_yields_one_event);
    RUN_TEST(tasks_run_in_submission_order);
    RUN_TEST(full_buffer_rejects_without_blocking);
    RUN_TEST(stop_deadline_abandons_queued_tasks);
    RUN_TEST(wait_for_formations_keeps_queue_running);
    RUN_TEST(status_sink_exceptions_are_contained);
    RUN_TEST(pending_is_reported_before_work_starts);
    RUN_TEST(concurrent_stops_join_once);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
