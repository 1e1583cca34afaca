#pragma once

/** \file fusion.hpp
 *  \brief Reciprocal Rank Fusion of vector and lexical rankings.
 *
 * RRF is parameter-free (except for k) and robust across different score distributions:
 * fused(d) = sum over sources containing d of 1 / (k + rank), with 1-based ranks.
 * A document found by only one source keeps that source's contribution.
 */

#include <cstdint>
#include <optional>
#include <vector>

#include "tessera/document.hpp"

namespace tessera::search::fusion {

/** \brief Result from a single search method, already in rank order. */
struct SearchResult {
    DocumentId id;
    float score{0.0f};  // native score of the source
};

/** \brief Combined result from both search methods. */
struct FusedResult {
    DocumentId id;
    float fused_score{0.0f};
    std::optional<float> vector_score;
    std::optional<float> text_score;
    std::uint32_t vector_rank{0};   // 0 if absent
    std::uint32_t text_rank{0};     // 0 if absent
};

class ReciprocalRankFusion {
public:
    explicit ReciprocalRankFusion(float k = 60.0f) : k_(k) {}

    /** \brief Fuse two ranked lists; sorted by fused score descending, ties by id. */
    auto fuse(const std::vector<SearchResult>& vector_results,
              const std::vector<SearchResult>& text_results,
              std::size_t top_k) const -> std::vector<FusedResult>;

    /** \brief RRF score for ranks (0 = absent from that source). */
    auto score(std::uint32_t vector_rank, std::uint32_t text_rank) const -> float {
        float s = 0.0f;
        if (vector_rank > 0) s += 1.0f / (k_ + static_cast<float>(vector_rank));
        if (text_rank > 0) s += 1.0f / (k_ + static_cast<float>(text_rank));
        return s;
    }

    auto k() const noexcept -> float { return k_; }

private:
    float k_;
};

} // namespace tessera::search::fusion
