/**
 * @file similarity_index.hpp
 * @brief Nearest-neighbor capability over canonical item embeddings
 */

#pragma once

#include <core/types.hpp>
#include <cstddef>
#include <vector>

namespace Stonetrail {

/**
 * @brief Cosine-similarity index keyed by item id.
 *
 * nearest() returns at most k matches ordered by similarity descending,
 * ties broken by item id ascending. Similarities reported are exact cosine
 * values even when candidate generation is approximate.
 *
 * Implementations are safe for concurrent nearest() calls and serialize
 * insert()/remove() against them (single writer, many readers).
 */
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() = default;

    virtual std::size_t dimensions() const = 0;
    virtual std::size_t size() const = 0;

    /**
     * @brief Insert or replace the vector of an item
     * @throws std::invalid_argument on dimension mismatch or zero vector
     */
    virtual void insert(ItemId id, const Embedding& embedding) = 0;

    virtual bool remove(ItemId id) = 0;

    virtual std::vector<Match> nearest(const Embedding& query, std::size_t k) const = 0;
};

/**
 * @brief Order matches by similarity desc, then item id asc
 */
void sort_matches(std::vector<Match>& matches);

/**
 * @brief Validate dimensions and return the L2-normalized copy of v
 * @throws std::invalid_argument
 */
Embedding normalized_copy(const Embedding& v, std::size_t expected_dimensions);

} // namespace Stonetrail
