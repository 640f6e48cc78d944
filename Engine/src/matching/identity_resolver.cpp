#include <matching/identity_resolver.hpp>

namespace Stonetrail {

IdentityResolver::IdentityResolver(const SimilarityIndex& index, float threshold)
    : index_(index), threshold_(threshold) {}

std::optional<Match> IdentityResolver::resolve(const Embedding& query) const {
    // nearest() already orders equal scores by lowest id
    auto best = index_.nearest(query, 1);
    if (best.empty() || best.front().similarity < threshold_) {
        return std::nullopt;
    }
    return best.front();
}

} // namespace Stonetrail
