/*
 * engram - Formation pipeline tests
 */
#include "test_harness.hpp"
#include "fakes.hpp"
#include <engram/memory/formation.hpp>

using namespace engram;

static MemoryConfig config_for(const TempDb& db) {
    MemoryConfig cfg;
    cfg.db_path = db.path();
    return cfg;
}

static std::vector<float> vec3(float a, float b, float c) {
    std::vector<float> v;
    v.push_back(a);
    v.push_back(b);
    v.push_back(c);
    return v;
}

static FormationCandidate candidate(const std::string& content, const std::string& agent = "@coder") {
    FormationCandidate c;
    c.content = content;
    c.agent_handle = agent;
    return c;
}

class RecordingListener : public FormationListener {
public:
    void on_formation(const FormationEvent& event) override {
        events.push_back(event);
    }
    std::vector<FormationEvent> events;
};

class ThrowingListener : public FormationListener {
public:
    ThrowingListener() : calls(0) {}
    void on_formation(const FormationEvent&) override {
        ++calls;
        throw std::runtime_error("listener bug");
    }
    int calls;
};

// Vectors for the dark/light mode scenarios: cos(dark, light) = 0.9
static void pin_mode_vectors(FakeEmbedder& emb) {
    emb.pin("User prefers dark mode", vec3(1.0f, 0.0f, 0.0f));
    emb.pin("User prefers light mode", vec3(0.9f, 0.43589f, 0.0f));
    emb.pin("User really prefers dark mode", vec3(0.99f, 0.14107f, 0.0f));
    emb.pin("Project uses tabs", vec3(0.0f, 0.0f, 1.0f));
}

// Scenario A
TEST(new_candidate_is_created) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    FormationCandidate c = candidate("User prefers dark mode");
    c.category = MemoryCategory::PREFERENCE;
    c.has_category = true;
    c.source_session_id = "s-1";
    c.source_message_id = "m-9";

    FormationEvent e = pipeline.process(c, "req00001");
    CHECK(e.type == FormationEventType::CREATED);
    CHECK_EQ(e.request_id, "req00001");
    CHECK_EQ(e.content, "User prefers dark mode");

    MemoryResult<Memory> m = mgr.get(e.memory_id);
    CHECK(m.success);
    CHECK(m.value.status == MemoryStatus::ACTIVE);
    CHECK(m.value.category == MemoryCategory::PREFERENCE);
    CHECK_EQ(m.value.confidence, 1.0);
    CHECK_EQ(m.value.agent_handle, "@coder");
    CHECK_EQ(m.value.source_message_id, "m-9");
    CHECK(m.value.has_embedding());
}

// Scenario B
TEST(changed_preference_supersedes) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    FormationEvent first = pipeline.process(candidate("User prefers dark mode"), "r1");
    FormationEvent second = pipeline.process(candidate("User prefers light mode"), "r2");
    CHECK(first.type == FormationEventType::CREATED);
    CHECK(second.type == FormationEventType::SUPERSEDED);
    CHECK_EQ(second.superseded_id, first.memory_id);
    CHECK_EQ(second.reason, "updated via memory formation");
    CHECK(second.similarity > 0.85 && second.similarity < 0.95);

    MemoryResult<Memory> old_m = mgr.get(first.memory_id);
    CHECK(old_m.value.status == MemoryStatus::SUPERSEDED);
    CHECK_EQ(old_m.value.superseded_by_id, second.memory_id);

    MemoryResult<Memory> new_m = mgr.get(second.memory_id);
    CHECK(new_m.value.status == MemoryStatus::ACTIVE);
    CHECK_EQ(new_m.value.supersedes_id, first.memory_id);
    CHECK_EQ(mgr.count("").value, 1);
}

TEST(equivalent_candidate_is_skipped) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    FormationEvent first = pipeline.process(candidate("User prefers dark mode"), "r1");
    FormationEvent dup = pipeline.process(candidate("User really prefers dark mode"), "r2");
    FormationEvent same = pipeline.process(candidate("User prefers dark mode"), "r3");

    CHECK(dup.type == FormationEventType::SKIPPED);
    CHECK_EQ(dup.memory_id, first.memory_id);
    CHECK_EQ(dup.reason, "already remembered");
    CHECK(same.type == FormationEventType::SKIPPED);
    CHECK_EQ(mgr.count("").value, 1);

    // The duplicate probe leaves access bookkeeping alone
    MemoryResult<std::vector<Memory> > all = mgr.list("", 0, 0);
    CHECK_EQ(all.value[0].access_count, 0);
}

TEST(unrelated_candidate_is_created_beside) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    CHECK(pipeline.process(candidate("User prefers dark mode"), "r1").type == FormationEventType::CREATED);
    FormationEvent e = pipeline.process(candidate("Project uses tabs"), "r2");
    CHECK(e.type == FormationEventType::CREATED);
    CHECK_EQ(mgr.count("").value, 2);
}

TEST(other_agents_memories_are_not_superseded) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    FormationPipeline pipeline(mgr, NULL, FormationConfig());

    CHECK(pipeline.process(candidate("User prefers dark mode", "@writer"), "r1").type ==
          FormationEventType::CREATED);
    FormationEvent e = pipeline.process(candidate("User prefers light mode", "@coder"), "r2");
    CHECK(e.type == FormationEventType::CREATED);
    CHECK_EQ(mgr.count("").value, 2);
}

TEST(duplicate_threshold_is_tunable) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());

    FormationConfig strict;
    strict.duplicate_threshold = 0.92;
    FormationPipeline pipeline(mgr, NULL, strict);

    CHECK(pipeline.process(candidate("User prefers dark mode"), "r1").type == FormationEventType::CREATED);
    // 0.9 similarity is below the raised threshold
    FormationEvent e = pipeline.process(candidate("User prefers light mode"), "r2");
    CHECK(e.type == FormationEventType::CREATED);
}

TEST(failures_become_events) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    RecordingListener listener;
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    pipeline.add_listener(&listener);

    FormationEvent empty = pipeline.process(candidate("   "), "r1");
    CHECK(empty.type == FormationEventType::FAILED);

    emb.set_failing(true);
    FormationEvent down = pipeline.process(candidate("something new"), "r2");
    CHECK(down.type == FormationEventType::FAILED);
    CHECK(down.reason.find("fake embedder offline") != std::string::npos);

    CHECK_EQ(listener.events.size(), 2u);
    CHECK_EQ(listener.events[1].request_id, "r2");
    CHECK_EQ(mgr.count("").value, 0);

    MemoryManager bare(config_for(db), NULL);
    CHECK(bare.initialize());
    FormationPipeline no_provider(bare, NULL, FormationConfig());
    FormationEvent unavailable = no_provider.process(candidate("anything"), "r3");
    CHECK(unavailable.type == FormationEventType::FAILED);
    CHECK_EQ(unavailable.reason, "embedding provider unavailable");
}

TEST(listener_failures_are_isolated) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());

    ThrowingListener bad;
    RecordingListener good;
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    pipeline.add_listener(&bad);
    pipeline.add_listener(&good);
    pipeline.add_listener(&good);

    FormationEvent e = pipeline.process(candidate("the ci runs on every push"), "r1");
    CHECK(e.type == FormationEventType::CREATED);
    CHECK_EQ(bad.calls, 1);
    CHECK_EQ(good.events.size(), 1u);
    CHECK(good.events[0].type == FormationEventType::CREATED);

    pipeline.remove_listener(&good);
    pipeline.process(candidate("the ci also runs nightly builds"), "r2");
    CHECK_EQ(good.events.size(), 1u);
    CHECK_EQ(bad.calls, 2);
}

TEST(classifier_supplies_category) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());

    FakeClassifier cls;
    cls.category = MemoryCategory::CORRECTION;
    FormationPipeline pipeline(mgr, &cls, FormationConfig());

    FormationEvent e = pipeline.process(candidate("actually the port is 8080"), "r1");
    CHECK(e.type == FormationEventType::CREATED);
    CHECK_EQ(cls.classify_calls, 1);
    CHECK(mgr.get(e.memory_id).value.category == MemoryCategory::CORRECTION);

    // An explicit category skips classification
    FormationCandidate c = candidate("the api lives under /v2");
    c.category = MemoryCategory::FACT;
    c.has_category = true;
    pipeline.process(c, "r2");
    CHECK_EQ(cls.classify_calls, 1);

    cls.classify_fails = true;
    FormationEvent failed = pipeline.process(candidate("the database is sqlite"), "r3");
    CHECK(failed.type == FormationEventType::FAILED);
}

TEST(classifier_judges_matches) {
    TempDb db;
    FakeEmbedder emb;
    pin_mode_vectors(emb);
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());

    FakeClassifier cls;
    FormationPipeline pipeline(mgr, &cls, FormationConfig());

    FormationEvent first = pipeline.process(candidate("User prefers dark mode"), "r1");
    CHECK(first.type == FormationEventType::CREATED);
    CHECK_EQ(cls.judge_calls, 0);

    // Judged a duplicate even though similarity alone would supersede
    cls.action = JudgeAction::DUPLICATE;
    cls.target = first.memory_id;
    cls.reason = "same preference";
    FormationEvent dup = pipeline.process(candidate("User prefers light mode"), "r2");
    CHECK(dup.type == FormationEventType::SKIPPED);
    CHECK_EQ(dup.reason, "same preference");
    CHECK_EQ(cls.judge_calls, 1);
    CHECK_EQ(cls.last_existing.size(), 1u);
    CHECK_EQ(cls.last_existing[0].id, first.memory_id);

    // Unknown target falls back to the best match
    cls.action = JudgeAction::SUPERSEDE;
    cls.target = "not-a-candidate";
    cls.reason = "";
    FormationEvent sup = pipeline.process(candidate("User prefers light mode"), "r3");
    CHECK(sup.type == FormationEventType::SUPERSEDED);
    CHECK_EQ(sup.superseded_id, first.memory_id);
    CHECK_EQ(sup.reason, "updated via memory formation");

    cls.action = JudgeAction::NEW;
    FormationEvent beside = pipeline.process(candidate("User prefers dark mode"), "r4");
    CHECK(beside.type == FormationEventType::CREATED);
    CHECK_EQ(mgr.count("").value, 2);

    cls.judge_fails = true;
    FormationEvent failed = pipeline.process(candidate("User prefers dark mode"), "r5");
    CHECK(failed.type == FormationEventType::FAILED);
}

TEST(notify_delivers_external_events) {
    TempDb db;
    FakeEmbedder emb;
    MemoryManager mgr(config_for(db), &emb);
    CHECK(mgr.initialize());
    RecordingListener listener;
    FormationPipeline pipeline(mgr, NULL, FormationConfig());
    pipeline.add_listener(&listener);

    FormationEvent e;
    e.type = FormationEventType::FAILED;
    e.request_id = "abcd1234";
    e.reason = "memory queue full";
    pipeline.notify(e);
    CHECK_EQ(listener.events.size(), 1u);
    CHECK_EQ(listener.events[0].reason, "memory queue full");
}

int main() {
    quiet_logs();

    std::cout << "=== Decisions ===\n";
    RUN_TEST(new_candidate_is_created);
    RUN_TEST(changed_preference_supersedes);
    RUN_TEST(equivalent_candidate_is_skipped);
    RUN_TEST(unrelated_candidate_is_created_beside);
    RUN_TEST(other_agents_memories_are_not_superseded);
    RUN_TEST(duplicate_threshold_is_tunable);

    std::cout << "\n=== Failures and listeners ===\n";
    RUN_TEST(failures_become_events);
    RUN_TEST(listener_failures_are_isolated);
    RUN_TEST(notify_delivers_external_events);

    std::cout << "\n=== Classifier ===\n";
    RUN_TEST(classifier_supplies_category);
    RUN_TEST(classifier_judges_matches);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
