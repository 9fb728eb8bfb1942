/*
 * engram - Vector math and blob codec tests
 */
#include "test_harness.hpp"
#include <engram/embedding/vector.hpp>
#include <cmath>

using namespace engram;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

TEST(cosine_basic_angles) {
    std::vector<float> x(3, 0.0f), y(3, 0.0f), neg(3, 0.0f);
    x[0] = 1.0f;
    y[1] = 2.0f;
    neg[0] = -3.0f;

    CHECK(near(cosine_similarity(x, x), 1.0));
    CHECK(near(cosine_similarity(x, y), 0.0));
    CHECK(near(cosine_similarity(x, neg), -1.0));
}

TEST(cosine_is_scale_invariant) {
    std::vector<float> a, b;
    a.push_back(0.3f); a.push_back(0.4f); a.push_back(0.5f);
    for (size_t i = 0; i < a.size(); ++i) b.push_back(a[i] * 10.0f);
    CHECK(near(cosine_similarity(a, b), 1.0));
}

TEST(cosine_degenerate_inputs_are_zero) {
    std::vector<float> empty;
    std::vector<float> zero(4, 0.0f);
    std::vector<float> one(4, 1.0f);
    std::vector<float> shorter(3, 1.0f);

    CHECK_EQ(cosine_similarity(empty, empty), 0.0);
    CHECK_EQ(cosine_similarity(zero, one), 0.0);
    CHECK_EQ(cosine_similarity(one, shorter), 0.0);
}

TEST(blob_layout_is_versioned_little_endian) {
    std::vector<float> v;
    v.push_back(1.0f);
    v.push_back(-2.5f);

    std::string blob = encode_vector(v);
    CHECK_EQ(blob.size(), VECTOR_BLOB_HEADER_SIZE + 8);
    CHECK_EQ(blob[0], 'E');
    CHECK_EQ(blob[1], 'V');
    CHECK_EQ(static_cast<int>(blob[2]), 1);
    CHECK_EQ(static_cast<int>(blob[4]), 2);
    CHECK_EQ(static_cast<int>(blob[5]), 0);
    // 1.0f = 0x3F800000, stored low byte first
    CHECK_EQ(static_cast<unsigned char>(blob[8]), 0x00);
    CHECK_EQ(static_cast<unsigned char>(blob[11]), 0x3F);

    std::vector<float> out;
    CHECK(decode_vector(blob.data(), blob.size(), out));
    CHECK_EQ(out.size(), 2u);
    CHECK_EQ(out[1], -2.5f);
}

TEST(decode_rejects_corrupt_blobs) {
    std::vector<float> v(4, 0.5f);
    std::string blob = encode_vector(v);
    std::vector<float> out(1, 9.0f);

    CHECK(!decode_vector(blob.data(), blob.size() - 1, out));
    CHECK(!decode_vector(blob.data(), 3, out));
    CHECK(!decode_vector(NULL, 0, out));

    std::string bad_magic = blob;
    bad_magic[0] = 'X';
    CHECK(!decode_vector(bad_magic.data(), bad_magic.size(), out));

    std::string bad_version = blob;
    bad_version[2] = 7;
    CHECK(!decode_vector(bad_version.data(), bad_version.size(), out));

    // out is untouched on failure
    CHECK_EQ(out.size(), 1u);
    CHECK_EQ(out[0], 9.0f);
}

TEST(empty_vector_round_trips) {
    std::vector<float> v;
    std::string blob = encode_vector(v);
    CHECK_EQ(blob.size(), VECTOR_BLOB_HEADER_SIZE);
    std::vector<float> out(2, 1.0f);
    CHECK(decode_vector(blob.data(), blob.size(), out));
    CHECK(out.empty());
}

int main() {
    quiet_logs();

    std::cout << "=== Cosine similarity ===\n";
    RUN_TEST(cosine_basic_angles);
    RUN_TEST(cosine_is_scale_invariant);
    RUN_TEST(cosine_degenerate_inputs_are_zero);

    std::cout << "\n=== Blob codec ===\n";
    RUN_TEST(blob_layout_is_versioned_little_endian);
    RUN_TEST(decode_rejects_corrupt_blobs);
    RUN_TEST(empty_vector_round_trips);

    TEST_SUMMARY();
    return failed > 0 ? 1 : 0;
}
