#include "tessera/search/fusion.hpp"

#include <algorithm>
#include <unordered_map>

namespace tessera::search::fusion {

auto ReciprocalRankFusion::fuse(const std::vector<SearchResult>& vector_results,
                                const std::vector<SearchResult>& text_results,
                                std::size_t top_k) const -> std::vector<FusedResult> {
    std::unordered_map<DocumentId, FusedResult, DocumentIdHash> results;
    results.reserve(vector_results.size() + text_results.size());

    for (std::size_t i = 0; i < vector_results.size(); ++i) {
        const auto& res = vector_results[i];
        auto& fused = results[res.id];
        if (fused.vector_rank != 0) continue;  // keep the best rank of a duplicate
        fused.id = res.id;
        fused.vector_score = res.score;
        fused.vector_rank = static_cast<std::uint32_t>(i + 1);
    }

    for (std::size_t i = 0; i < text_results.size(); ++i) {
        const auto& res = text_results[i];
        auto& fused = results[res.id];
        if (fused.text_rank != 0) continue;
        fused.id = res.id;
        fused.text_score = res.score;
        fused.text_rank = static_cast<std::uint32_t>(i + 1);
    }

    std::vector<FusedResult> output;
    output.reserve(results.size());
    for (auto& [id, result] : results) {
        result.fused_score = score(result.vector_rank, result.text_rank);
        output.push_back(std::move(result));
    }

    // Sort by fused score descending, ties by id
    std::sort(output.begin(), output.end(), [](const FusedResult& a, const FusedResult& b) {
        if (a.fused_score != b.fused_score) return a.fused_score > b.fused_score;
        return a.id < b.id;
    });

    if (output.size() > top_k) {
        output.resize(top_k);
    }
    return output;
}

} // namespace tessera::search::fusion
