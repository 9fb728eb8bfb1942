/*
 * engram - Embedding provider and classifier response parsing tests
 */
#include "test_harness.hpp"
#include <engram/embedding/ollama.hpp>
#include <engram/embedding/openai.hpp>
#include <engram/classifier/ollama.hpp>

using namespace engram;

TEST(ollama_embeddings_accepted_at_configured_dimension) {
    Json body = Json::parse("{\"model\":\"nomic-embed-text\",\"embeddings\":[[0.5,-1,2.25]]}");
    EmbeddingResult r = parse_ollama_embeddings(body, 3);
    CHECK(r.success);
    CHECK_EQ(r.vector.size(), 3u);
    CHECK_EQ(r.vector[0], 0.5f);
    CHECK_EQ(r.vector[1], -1.0f);
    CHECK_EQ(r.vector[2], 2.25f);
}

TEST(ollama_dimension_mismatch_is_a_failure) {
    Json body = Json::parse("{\"embeddings\":[[0.1,0.2,0.3,0.4]]}");
    EmbeddingResult r = parse_ollama_embeddings(body, 768);
    CHECK(!r.success);
    CHECK(r.vector.empty());
    CHECK(r.error.find("expected dimension 768, got 4") != std::string::npos);
}

TEST(ollama_missing_embeddings_fail_cleanly) {
    const char* bodies[] = {
        "{}",
        "{\"embeddings\":[]}",
        "{\"embeddings\":[[]]}",
        "{\"embeddings\":\"oops\"}",
        "{\"error\":\"model not found\"}",
        "[]"
    };
    for (size_t i = 0; i < sizeof(bodies) / sizeof(bodies[0]); ++i) {
        EmbeddingResult r = parse_ollama_embeddings(Json::parse(bodies[i]), 3);
        CHECK(!r.success);
        CHECK(r.error.find("ollama embed:") == 0);
    }
}

TEST(ollama_non_numeric_values_rejected) {
    Json body = Json::parse("{\"embeddings\":[[0.1,\"x\",0.3]]}");
    EmbeddingResult r = parse_ollama_embeddings(body, 3);
    CHECK(!r.success);
}

TEST(openai_embedding_read_from_first_data_entry) {
    Json body = Json::parse(
        "{\"object\":\"list\",\"data\":[{\"object\":\"embedding\",\"index\":0,"
        "\"embedding\":[1,0,-0.5]}],\"model\":\"text-embedding-3-small\"}");
    EmbeddingResult r = parse_openai_embeddings("openai", body, 3);
    CHECK(r.success);
    CHECK_EQ(r.vector.size(), 3u);
    CHECK_EQ(r.vector[2], -0.5f);
}

TEST(openai_dimension_mismatch_is_a_failure) {
    Json body = Json::parse("{\"data\":[{\"embedding\":[1,2]}]}");
    EmbeddingResult r = parse_openai_embeddings("voyage", body, 1024);
    CHECK(!r.success);
    CHECK(r.error.find("voyage embed: expected dimension 1024, got 2") == 0);
}

TEST(openai_missing_embedding_fails_cleanly) {
    EmbeddingResult empty = parse_openai_embeddings("openai", Json::parse("{\"data\":[]}"), 3);
    CHECK(!empty.success);
    CHECK_EQ(empty.error, std::string("openai embed: no embedding in response"));

    EmbeddingResult no_field = parse_openai_embeddings(
        "openai", Json::parse("{\"data\":[{\"index\":0}]}"), 3);
    CHECK(!no_field.success);

    // API error objects surface their message
    EmbeddingResult api_error = parse_openai_embeddings(
        "openai", Json::parse("{\"error\":{\"message\":\"Incorrect API key provided\"}}"), 3);
    CHECK(!api_error.success);
    CHECK_EQ(api_error.error, std::string("openai embed: Incorrect API key provided"));
}

TEST(chat_reply_unwraps_message_content) {
    Json body = Json::parse(
        "{\"model\":\"m\",\"message\":{\"role\":\"assistant\","
        "\"content\":\"{\\\"category\\\":\\\"pattern\\\"}\"},\"done\":true}");
    Json reply;
    std::string error;
    CHECK(parse_chat_reply(body, reply, error));
    CHECK_EQ(reply.get_string("category"), std::string("pattern"));
}

TEST(chat_reply_rejects_non_json_content) {
    Json reply;
    std::string error;

    CHECK(!parse_chat_reply(Json::parse("{\"message\":{\"content\":\"sure, here you go\"}}"),
                            reply, error));
    CHECK(error.find("invalid JSON") != std::string::npos);

    error.clear();
    CHECK(!parse_chat_reply(Json::parse("{\"message\":{\"content\":\"[1,2]\"}}"), reply, error));
    CHECK_EQ(error, std::string("model reply is not a JSON object"));

    error.clear();
    CHECK(!parse_chat_reply(Json::parse("{\"done\":true}"), reply, error));
    CHECK(!error.empty());
}

TEST(category_reply_known_categories) {
    ClassifyResult r = parse_category_reply(
        Json::parse("{\"category\":\" Preference \",\"confidence\":0.9}"));
    CHECK(r.success);
    CHECK(r.category == MemoryCategory::PREFERENCE);
    CHECK(r.confidence > 0.89 && r.confidence < 0.91);

    CHECK(parse_category_reply(Json::parse("{\"category\":\"correction\"}")).category ==
          MemoryCategory::CORRECTION);
}

TEST(category_reply_unknown_falls_back_to_fact) {
    ClassifyResult unknown = parse_category_reply(Json::parse("{\"category\":\"opinion\"}"));
    CHECK(unknown.success);
    CHECK(unknown.category == MemoryCategory::FACT);

    ClassifyResult missing = parse_category_reply(Json::parse("{}"));
    CHECK(missing.success);
    CHECK(missing.category == MemoryCategory::FACT);

    ClassifyResult wrong_type = parse_category_reply(Json::parse("{\"category\":3,\"confidence\":7}"));
    CHECK(wrong_type.success);
    CHECK(wrong_type.category == MemoryCategory::FACT);
    CHECK_EQ(wrong_type.confidence, 1.0);
}

TEST(judge_reply_actions) {
    JudgeResult fresh = parse_judge_reply(Json::parse(
        "{\"action\":\"NEW\",\"reason\":\"unrelated\",\"target_id\":\"abc\"}"));
    CHECK(fresh.success);
    CHECK(fresh.action == JudgeAction::NEW);
    CHECK(fresh.target_id.empty());
    CHECK_EQ(fresh.reason, std::string("unrelated"));

    JudgeResult dup = parse_judge_reply(Json::parse(
        "{\"action\":\"duplicate\",\"reason\":\"same\",\"target_id\":\" m-1 \"}"));
    CHECK(dup.success);
    CHECK(dup.action == JudgeAction::DUPLICATE);
    CHECK_EQ(dup.target_id, std::string("m-1"));

    JudgeResult sup = parse_judge_reply(Json::parse(
        "{\"action\":\"supersede\",\"reason\":\"moved to Berlin\",\"target_id\":\"m-2\"}"));
    CHECK(sup.success);
    CHECK(sup.action == JudgeAction::SUPERSEDE);
    CHECK_EQ(sup.target_id, std::string("m-2"));
}

TEST(judge_reply_unknown_action_is_an_error) {
    JudgeResult merge = parse_judge_reply(Json::parse("{\"action\":\"merge\",\"target_id\":\"m-1\"}"));
    CHECK(!merge.success);
    CHECK(merge.error.find("unknown action 'merge'") != std::string::npos);

    JudgeResult missing = parse_judge_reply(Json::parse("{\"reason\":\"?\"}"));
    CHECK(!missing.success);
}

int main() {
    quiet_logs();

    std::cout << "=== Embedding responses ===\n";
    RUN_TEST(ollama_embeddings_accepted_at_configured_dimension);
    RUN_TEST(ollama_dimension_mismatch_is_a_failure);
    RUN_TEST(ollama_missing_embeddings_fail_cleanly);
    RUN_TEST(ollama_non_numeric_values_rejected);
    RUN_TEST(openai_embedding_read_from_first_data_entry);
    RUN_TEST(openai_dimension_mismatch_is_a_failure);
    RUN_TEST(openai_missing_embedding_fails_cleanly);

    std::cout << "\n=== Classifier replies ===\n";
    RUN_TEST(chat_reply_unwraps_message_content);
    RUN_TEST(chat_reply_rejects_non_json_content);
    RUN_TEST(category_reply_known_categories);
    RUN_TEST(category_reply_unknown_falls_back_to_fact);
    RUN_TEST(judge_reply_actions);
    RUN_TEST(judge_reply_unknown_action_is_an_error);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
