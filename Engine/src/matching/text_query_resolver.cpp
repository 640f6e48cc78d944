#include <matching/text_query_resolver.hpp>

namespace Stonetrail {

TextQueryResolver::TextQueryResolver(const SimilarityIndex& index, float threshold, std::size_t top_k)
    : index_(index), threshold_(threshold), top_k_(top_k) {}

std::vector<Match> TextQueryResolver::resolve_text(const Embedding& query) const {
    std::vector<Match> out;
    for (const auto& m : index_.nearest(query, top_k_)) {
        if (m.similarity < threshold_) break;
        out.push_back(m);
    }
    return out;
}

} // namespace Stonetrail
