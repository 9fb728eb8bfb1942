#include <engram/embedding/vector.hpp>
#include <cmath>
#include <cstring>

namespace engram {

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-8) return 0.0;
    return dot / denom;
}

static void put_u32_le(std::string& out, uint32_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>((v >> 16) & 0xFF);
    out += static_cast<char>((v >> 24) & 0xFF);
}

static uint32_t get_u32_le(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::string encode_vector(const std::vector<float>& v) {
    std::string out;
    out.reserve(VECTOR_BLOB_HEADER_SIZE + v.size() * 4);
    out += 'E';
    out += 'V';
    out += static_cast<char>(VECTOR_BLOB_VERSION);
    out += '\0';
    put_u32_le(out, static_cast<uint32_t>(v.size()));

    for (size_t i = 0; i < v.size(); ++i) {
        uint32_t bits;
        std::memcpy(&bits, &v[i], sizeof(bits));
        put_u32_le(out, bits);
    }
    return out;
}

bool decode_vector(const void* data, size_t size, std::vector<float>& out) {
    if (!data || size < VECTOR_BLOB_HEADER_SIZE) return false;

    const unsigned char* p = static_cast<const unsigned char*>(data);
    if (p[0] != 'E' || p[1] != 'V' || p[2] != VECTOR_BLOB_VERSION) return false;

    uint32_t dim = get_u32_le(p + 4);
    if (size != VECTOR_BLOB_HEADER_SIZE + static_cast<size_t>(dim) * 4) return false;

    std::vector<float> v(dim);
    const unsigned char* cur = p + VECTOR_BLOB_HEADER_SIZE;
    for (uint32_t i = 0; i < dim; ++i, cur += 4) {
        uint32_t bits = get_u32_le(cur);
        std::memcpy(&v[i], &bits, sizeof(bits));
    }
    out.swap(v);
    return true;
}

} // namespace engram
