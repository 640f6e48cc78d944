/**
 * @file text_query_resolver.hpp
 * @brief Ranked cross-modal search of items by a text embedding
 */

#pragma once

#include <matching/similarity_index.hpp>
#include <vector>

namespace Stonetrail {

class TextQueryResolver {
public:
    TextQueryResolver(const SimilarityIndex& index, float threshold, std::size_t top_k);

    /**
     * @brief Up to top_k matches with similarity >= threshold, best first
     */
    std::vector<Match> resolve_text(const Embedding& query) const;

    float threshold() const { return threshold_; }
    std::size_t top_k() const { return top_k_; }

private:
    const SimilarityIndex& index_;
    float threshold_;
    std::size_t top_k_;
};

} // namespace Stonetrail
