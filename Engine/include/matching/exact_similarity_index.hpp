/**
 * @file exact_similarity_index.hpp
 * @brief Linear-scan cosine index for small catalogs
 */

#pragma once

#include <matching/similarity_index.hpp>
#include <Eigen/Core>
#include <map>
#include <shared_mutex>

namespace Stonetrail {

class ExactSimilarityIndex final : public SimilarityIndex {
public:
    explicit ExactSimilarityIndex(std::size_t dimensions);

    std::size_t dimensions() const override { return dimensions_; }
    std::size_t size() const override;

    void insert(ItemId id, const Embedding& embedding) override;
    bool remove(ItemId id) override;
    std::vector<Match> nearest(const Embedding& query, std::size_t k) const override;

private:
    std::size_t dimensions_;
    mutable std::shared_mutex mutex_;
    std::map<ItemId, Eigen::VectorXf> vectors_;  // Unit length
};

} // namespace Stonetrail
