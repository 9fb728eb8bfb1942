/*
 * engram - Semantic retrieval
 *
 * Linear scan over active embedded memories ranked by cosine similarity.
 * There is no degraded mode: without an embedding provider every search
 * fails with PROVIDER_UNAVAILABLE.
 */
#ifndef ENGRAM_MEMORY_SEARCH_HPP
#define ENGRAM_MEMORY_SEARCH_HPP

#include "types.hpp"
#include "errors.hpp"
#include "store.hpp"
#include "../embedding/provider.hpp"
#include <vector>

namespace engram {

typedef MemoryResult<std::vector<SearchResult> > SearchOutcome;

class MemorySearch {
public:
    // embedder may be null
    MemorySearch(MemoryStore& store, EmbeddingProvider* embedder);

    bool available() const { return embedder_ != nullptr; }

    // Embed query, then rank. Results at or above opts.threshold, best first,
    // newer first on equal similarity, at most opts.limit.
    SearchOutcome search(const std::string& query, const SearchOptions& opts);

    // Rank against an already computed query vector. Candidates whose
    // dimension differs from the query are skipped.
    SearchOutcome search_vector(const std::vector<float>& query, const SearchOptions& opts);

    MemoryResult<std::vector<float> > embed(const std::string& text);

private:
    MemoryStore& store_;
    EmbeddingProvider* embedder_;
};

} // namespace engram

#endif // ENGRAM_MEMORY_SEARCH_HPP
