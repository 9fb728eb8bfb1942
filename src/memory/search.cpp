#include <engram/memory/search.hpp>
#include <engram/embedding/vector.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>

namespace engram {

namespace {

struct BySimilarityDesc {
    bool operator()(const SearchResult& a, const SearchResult& b) const {
        return a.similarity > b.similarity;
    }
};

} // namespace

MemorySearch::MemorySearch(MemoryStore& store, EmbeddingProvider* embedder)
    : store_(store)
    , embedder_(embedder)
{}

MemoryResult<std::vector<float> > MemorySearch::embed(const std::string& text) {
    if (!embedder_) {
        return MemoryResult<std::vector<float> >::fail(
            MemoryError::PROVIDER_UNAVAILABLE, "no embedding provider configured");
    }

    EmbeddingResult r = embedder_->embed(text);
    if (!r.success) {
        return MemoryResult<std::vector<float> >::fail(MemoryError::PROVIDER_UNAVAILABLE, r.error);
    }
    if (r.vector.empty()) {
        return MemoryResult<std::vector<float> >::fail(
            MemoryError::PROVIDER_UNAVAILABLE, embedder_->name() + " returned an empty vector");
    }
    return MemoryResult<std::vector<float> >::ok(r.vector);
}

SearchOutcome MemorySearch::search(const std::string& query, const SearchOptions& opts) {
    if (!embedder_) {
        return SearchOutcome::fail(MemoryError::PROVIDER_UNAVAILABLE,
                                   "semantic search requires an embedding provider");
    }
    if (trim(query).empty()) {
        return SearchOutcome::fail(MemoryError::VALIDATION, "query is empty");
    }

    MemoryResult<std::vector<float> > vec = embed(query);
    if (!vec.success) {
        return SearchOutcome::fail_from(vec);
    }
    return search_vector(vec.value, opts);
}

SearchOutcome MemorySearch::search_vector(const std::vector<float>& query, const SearchOptions& opts) {
    if (opts.threshold < 0.0 || opts.threshold > 1.0) {
        return SearchOutcome::fail(MemoryError::VALIDATION, "threshold must be within [0, 1]");
    }
    if (query.empty()) {
        return SearchOutcome::fail(MemoryError::VALIDATION, "query vector is empty");
    }
    int limit = opts.limit > 0 ? opts.limit : 10;

    std::vector<Memory> candidates;
    if (!store_.search_candidates(opts.agent_handle, opts.path_scope, candidates)) {
        return SearchOutcome::fail(MemoryError::STORAGE, store_.last_error());
    }

    // Candidates arrive newest first; the stable sort keeps that order
    // among equal similarities.
    std::vector<SearchResult> results;
    size_t skipped = 0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (candidates[i].embedding.size() != query.size()) {
            ++skipped;
            continue;
        }
        double sim = cosine_similarity(query, candidates[i].embedding);
        if (sim < opts.threshold) continue;

        SearchResult r;
        r.memory = candidates[i];
        r.similarity = sim;
        results.push_back(r);
    }
    if (skipped > 0) {
        LOG_DEBUG("Search skipped %zu memories with mismatched embedding dimension", skipped);
    }

    std::stable_sort(results.begin(), results.end(), BySimilarityDesc());
    if (results.size() > static_cast<size_t>(limit)) {
        results.resize(limit);
    }

    if (opts.record_access && !results.empty()) {
        int64_t now = current_timestamp_ms();
        std::vector<std::string> ids;
        for (size_t i = 0; i < results.size(); ++i) {
            ids.push_back(results[i].memory.id);
        }
        if (store_.record_access(ids, now)) {
            for (size_t i = 0; i < results.size(); ++i) {
                results[i].memory.access_count += 1;
                results[i].memory.last_accessed_at = now;
            }
        } else {
            LOG_WARN("Failed to record memory access: %s", store_.last_error().c_str());
        }
    }

    LOG_DEBUG("Search: %zu candidates, %zu results (threshold %.2f)",
              candidates.size(), results.size(), opts.threshold);
    return SearchOutcome::ok(results);
}

} // namespace engram
