#include <matching/hnsw_similarity_index.hpp>
#include <utils/logger.hpp>
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <mutex>

namespace Stonetrail {

namespace {

float dot(const Embedding& a, const Embedding& b) {
    double sum = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return static_cast<float>(sum);
}

} // namespace

HnswSimilarityIndex::HnswSimilarityIndex(std::size_t dimensions, const HnswParameters& params)
    : dimensions_(dimensions), params_(params), capacity_(std::max<std::size_t>(params.initial_capacity, 16)) {
    space_ = std::make_unique<hnswlib::InnerProductSpace>(dimensions_);
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), capacity_, params_.m, params_.ef_construction);
    index_->setEf(params_.ef_search);
}

HnswSimilarityIndex::~HnswSimilarityIndex() = default;

std::size_t HnswSimilarityIndex::size() const {
    std::shared_lock lock(mutex_);
    return vectors_.size();
}

void HnswSimilarityIndex::grow_if_full() {
    // Deleted elements still occupy slots
    if (index_->getCurrentElementCount() < capacity_) return;
    capacity_ *= 2;
    index_->resizeIndex(capacity_);
    Logger::debug("HNSW index resized to " + std::to_string(capacity_));
}

void HnswSimilarityIndex::insert(ItemId id, const Embedding& embedding) {
    Embedding unit = normalized_copy(embedding, dimensions_);

    std::unique_lock lock(mutex_);
    grow_if_full();
    // addPoint updates the vector and clears the deleted mark of an existing label
    index_->addPoint(unit.data(), static_cast<hnswlib::labeltype>(id));
    vectors_[id] = std::move(unit);
}

bool HnswSimilarityIndex::remove(ItemId id) {
    std::unique_lock lock(mutex_);
    auto it = vectors_.find(id);
    if (it == vectors_.end()) return false;
    index_->markDelete(static_cast<hnswlib::labeltype>(id));
    vectors_.erase(it);
    return true;
}

std::vector<Match> HnswSimilarityIndex::nearest(const Embedding& query, std::size_t k) const {
    if (k == 0) return {};

    Embedding unit = normalized_copy(query, dimensions_);

    std::vector<Match> matches;
    {
        std::shared_lock lock(mutex_);
        if (vectors_.empty()) return {};

        std::size_t fetch = std::min(std::max(k, params_.ef_search), vectors_.size());
        auto result = index_->searchKnn(unit.data(), fetch);

        matches.reserve(result.size());
        while (!result.empty()) {
            ItemId id = static_cast<ItemId>(result.top().second);
            result.pop();
            auto it = vectors_.find(id);
            if (it == vectors_.end()) continue;
            matches.push_back(Match{id, dot(it->second, unit)});
        }
    }

    sort_matches(matches);
    if (matches.size() > k) matches.resize(k);
    return matches;
}

} // namespace Stonetrail
