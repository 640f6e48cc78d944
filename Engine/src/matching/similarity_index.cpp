#include <matching/similarity_index.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Stonetrail {

void sort_matches(std::vector<Match>& matches) {
    std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.item_id < b.item_id;
    });
}

Embedding normalized_copy(const Embedding& v, std::size_t expected_dimensions) {
    if (v.size() != expected_dimensions) {
        throw std::invalid_argument("Embedding has " + std::to_string(v.size()) +
                                    " dimensions, expected " + std::to_string(expected_dimensions));
    }

    double norm_sq = 0.0;
    for (float x : v) {
        if (!std::isfinite(x)) {
            throw std::invalid_argument("Embedding contains a non-finite component");
        }
        norm_sq += static_cast<double>(x) * x;
    }
    if (norm_sq == 0.0) {
        throw std::invalid_argument("Embedding has zero norm");
    }

    const double inv = 1.0 / std::sqrt(norm_sq);
    Embedding out(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(v[i] * inv);
    }
    return out;
}

} // namespace Stonetrail
