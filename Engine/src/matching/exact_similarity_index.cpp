#include <matching/exact_similarity_index.hpp>
#include <algorithm>
#include <mutex>

namespace Stonetrail {

ExactSimilarityIndex::ExactSimilarityIndex(std::size_t dimensions) : dimensions_(dimensions) {}

std::size_t ExactSimilarityIndex::size() const {
    std::shared_lock lock(mutex_);
    return vectors_.size();
}

void ExactSimilarityIndex::insert(ItemId id, const Embedding& embedding) {
    Embedding unit = normalized_copy(embedding, dimensions_);
    Eigen::VectorXf v = Eigen::Map<const Eigen::VectorXf>(unit.data(), static_cast<Eigen::Index>(unit.size()));

    std::unique_lock lock(mutex_);
    vectors_[id] = std::move(v);
}

bool ExactSimilarityIndex::remove(ItemId id) {
    std::unique_lock lock(mutex_);
    return vectors_.erase(id) > 0;
}

std::vector<Match> ExactSimilarityIndex::nearest(const Embedding& query, std::size_t k) const {
    if (k == 0) return {};

    Embedding unit = normalized_copy(query, dimensions_);
    Eigen::Map<const Eigen::VectorXf> q(unit.data(), static_cast<Eigen::Index>(unit.size()));

    std::vector<Match> matches;
    {
        std::shared_lock lock(mutex_);
        matches.reserve(vectors_.size());
        for (const auto& [id, v] : vectors_) {
            matches.push_back(Match{id, v.dot(q)});
        }
    }

    sort_matches(matches);
    if (matches.size() > k) matches.resize(k);
    return matches;
}

} // namespace Stonetrail
