/*
 * engram - Vector math and blob encoding
 *
 * Blob layout, version 1:
 *   'E' 'V' 0x01 0x00 | uint32 dimension (LE) | dimension x float32 (LE)
 */
#ifndef ENGRAM_EMBEDDING_VECTOR_HPP
#define ENGRAM_EMBEDDING_VECTOR_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace engram {

static const uint8_t VECTOR_BLOB_VERSION = 1;
static const size_t VECTOR_BLOB_HEADER_SIZE = 8;

// dot(a,b) / (|a| * |b|). 0 for empty, mismatched or zero-norm input.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

std::string encode_vector(const std::vector<float>& v);

// False (out untouched) on a bad header, unknown version or size mismatch
bool decode_vector(const void* data, size_t size, std::vector<float>& out);

} // namespace engram

#endif // ENGRAM_EMBEDDING_VECTOR_HPP
