/**
 * @file identity_resolver.hpp
 * @brief Decides whether a photo embedding depicts an already registered item
 */

#pragma once

#include <matching/similarity_index.hpp>
#include <optional>

namespace Stonetrail {

/**
 * @brief Image-to-item matcher
 *
 * A Match is declared iff the nearest canonical embedding has cosine
 * similarity >= threshold. Equal similarities resolve to the lowest item id.
 */
class IdentityResolver {
public:
    IdentityResolver(const SimilarityIndex& index, float threshold);

    std::optional<Match> resolve(const Embedding& query) const;

    float threshold() const { return threshold_; }

private:
    const SimilarityIndex& index_;
    float threshold_;
};

} // namespace Stonetrail
