/**
 * @file hnsw_similarity_index.hpp
 * @brief Approximate cosine index on hnswlib
 */

#pragma once

#include <matching/similarity_index.hpp>
#include <config/engine_config.hpp>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace hnswlib {
template <typename dist_t> class HierarchicalNSW;
class InnerProductSpace;
}

namespace Stonetrail {

/**
 * @brief HNSW graph over unit vectors with inner-product distance.
 *
 * Candidates from the graph are re-scored against the stored unit vectors,
 * so reported similarities are exact and threshold decisions never rest on
 * an approximated score. Only recall is approximate.
 */
class HnswSimilarityIndex final : public SimilarityIndex {
public:
    HnswSimilarityIndex(std::size_t dimensions, const HnswParameters& params = {});
    ~HnswSimilarityIndex() override;

    HnswSimilarityIndex(const HnswSimilarityIndex&) = delete;
    HnswSimilarityIndex& operator=(const HnswSimilarityIndex&) = delete;

    std::size_t dimensions() const override { return dimensions_; }
    std::size_t size() const override;

    void insert(ItemId id, const Embedding& embedding) override;
    bool remove(ItemId id) override;
    std::vector<Match> nearest(const Embedding& query, std::size_t k) const override;

private:
    void grow_if_full();

    std::size_t dimensions_;
    HnswParameters params_;
    std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unique_ptr<hnswlib::InnerProductSpace> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;
    std::unordered_map<ItemId, Embedding> vectors_;  // Live unit vectors
};

} // namespace Stonetrail
