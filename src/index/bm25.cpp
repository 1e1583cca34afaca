#include "tessera/index/bm25.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <mutex>
#include <shared_mutex>

namespace tessera::index {

namespace {

constexpr std::size_t kTermStripes = 64;

struct Posting {
    roaring::Roaring docs;
};

/** \brief Per-document statistics; term_freqs sorted by term id. */
struct DocStats {
    std::uint32_t length{0};
    std::vector<std::pair<std::uint32_t, std::uint32_t>> term_freqs;
};

auto top_k(std::unordered_map<std::uint32_t, float>&& scores, std::uint32_t k)
    -> std::vector<LexicalHit> {
    std::vector<LexicalHit> hits;
    hits.reserve(scores.size());
    for (const auto& [handle, score] : scores) {
        hits.push_back(LexicalHit{handle, score});
    }
    const auto better = [](const LexicalHit& a, const LexicalHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.handle < b.handle;
    };
    if (hits.size() > k) {
        std::partial_sort(hits.begin(), hits.begin() + k, hits.end(), better);
        hits.resize(k);
    } else {
        std::sort(hits.begin(), hits.end(), better);
    }
    return hits;
}

} // anonymous namespace

// Bm25FieldIndex::Impl

class Bm25FieldIndex::Impl {
public:
    auto init(const BM25Params& params, const TokenizerOptions& tokenizer)
        -> std::expected<void, core::error>;
    auto add_document(std::uint32_t handle, std::string_view text)
        -> std::expected<void, core::error>;
    auto remove_document(std::uint32_t handle) -> bool;
    auto accumulate(const std::vector<std::pair<std::string, std::uint32_t>>& query_terms,
                    const roaring::Roaring* allow,
                    std::unordered_map<std::uint32_t, float>& scores) const -> void;
    auto document_frequency(std::string_view term) const -> std::size_t;
    auto idf(std::string_view term) const -> float;
    auto get_stats() const noexcept -> BM25Stats;
    auto clear() -> void;

    BM25Params params_;
    TokenizerOptions tokenizer_;
    bool initialized_{false};

    // Lock order: dict_mutex_ -> docs_mutex_ -> term_locks_
    mutable std::shared_mutex dict_mutex_;
    std::unordered_map<std::string, std::uint32_t> term_to_id_;
    std::vector<std::string> id_to_term_;
    std::vector<std::unique_ptr<Posting>> postings_;
    mutable std::array<std::mutex, kTermStripes> term_locks_{};

    mutable std::shared_mutex docs_mutex_;
    std::unordered_map<std::uint32_t, DocStats> doc_stats_;

    // Eventually consistent corpus statistics
    std::atomic<std::size_t> num_docs_{0};
    std::atomic<std::size_t> total_tokens_{0};

private:
    auto get_or_create_term_id(const std::string& term) -> std::uint32_t;
    auto normalized_term(std::string_view term) const -> std::string;
    auto compute_idf(std::size_t df) const noexcept -> float;
};

auto Bm25FieldIndex::Impl::init(const BM25Params& params, const TokenizerOptions& tokenizer)
    -> std::expected<void, core::error> {
    if (!(params.k1 > 0.0f)) {
        return core::fail(core::error_code::invalid_schema, "k1 must be positive", "index.bm25");
    }
    if (!(params.b >= 0.0f && params.b <= 1.0f)) {
        return core::fail(core::error_code::invalid_schema, "b must be between 0 and 1", "index.bm25");
    }
    if (tokenizer.min_length == 0 || tokenizer.max_length < tokenizer.min_length) {
        return core::fail(core::error_code::invalid_schema, "invalid token length bounds", "index.bm25");
    }
    params_ = params;
    tokenizer_ = tokenizer;
    initialized_ = true;
    return {};
}

auto Bm25FieldIndex::Impl::get_or_create_term_id(const std::string& term) -> std::uint32_t {
    {
        std::shared_lock lock(dict_mutex_);
        if (auto it = term_to_id_.find(term); it != term_to_id_.end()) return it->second;
    }
    std::unique_lock lock(dict_mutex_);
    if (auto it = term_to_id_.find(term); it != term_to_id_.end()) return it->second;

    const auto id = static_cast<std::uint32_t>(id_to_term_.size());
    term_to_id_.emplace(term, id);
    id_to_term_.push_back(term);
    postings_.push_back(std::make_unique<Posting>());
    return id;
}

auto Bm25FieldIndex::Impl::normalized_term(std::string_view term) const -> std::string {
    auto tokens = Tokenizer::tokenize(term, tokenizer_);
    return tokens.empty() ? std::string{} : std::move(tokens.front());
}

auto Bm25FieldIndex::Impl::compute_idf(std::size_t df) const noexcept -> float {
    if (df == 0) return 0.0f;
    // Statistics lag postings slightly under concurrent writes; keep N >= df
    const auto N = static_cast<float>(std::max(num_docs_.load(), df));
    const auto d = static_cast<float>(df);
    // IDF = log(1 + (N - df + 0.5) / (df + 0.5))
    return std::log(1.0f + (N - d + 0.5f) / (d + 0.5f));
}

auto Bm25FieldIndex::Impl::add_document(std::uint32_t handle, std::string_view text)
    -> std::expected<void, core::error> {
    if (!initialized_) {
        return core::fail(core::error_code::precondition_failed, "Index not initialized", "index.bm25");
    }

    // Replace prior contributions
    remove_document(handle);

    const auto term_counts = Tokenizer::term_frequencies(text, tokenizer_);

    DocStats stats;
    stats.term_freqs.reserve(term_counts.size());
    for (const auto& [term, count] : term_counts) {
        stats.term_freqs.emplace_back(get_or_create_term_id(term), count);
        stats.length += count;
    }
    std::sort(stats.term_freqs.begin(), stats.term_freqs.end());

    {
        std::shared_lock dict(dict_mutex_);
        for (const auto& [term_id, count] : stats.term_freqs) {
            std::lock_guard posting_lock(term_locks_[term_id % kTermStripes]);
            postings_[term_id]->docs.add(handle);
        }
    }

    const std::uint32_t length = stats.length;
    {
        std::unique_lock docs(docs_mutex_);
        doc_stats_[handle] = std::move(stats);
    }
    num_docs_.fetch_add(1);
    total_tokens_.fetch_add(length);
    return {};
}

auto Bm25FieldIndex::Impl::remove_document(std::uint32_t handle) -> bool {
    DocStats old;
    {
        std::unique_lock docs(docs_mutex_);
        auto it = doc_stats_.find(handle);
        if (it == doc_stats_.end()) return false;
        old = std::move(it->second);
        doc_stats_.erase(it);
    }
    {
        std::shared_lock dict(dict_mutex_);
        for (const auto& [term_id, count] : old.term_freqs) {
            if (term_id >= postings_.size()) continue;
            std::lock_guard posting_lock(term_locks_[term_id % kTermStripes]);
            postings_[term_id]->docs.remove(handle);
        }
    }
    num_docs_.fetch_sub(1);
    total_tokens_.fetch_sub(old.length);
    return true;
}

auto Bm25FieldIndex::Impl::accumulate(
    const std::vector<std::pair<std::string, std::uint32_t>>& query_terms,
    const roaring::Roaring* allow,
    std::unordered_map<std::uint32_t, float>& scores) const -> void {

    const std::size_t n_docs = num_docs_.load();
    if (n_docs == 0 || query_terms.empty()) return;
    const std::size_t tokens = total_tokens_.load();
    const float avg_doc_length = tokens > 0 ? static_cast<float>(tokens) / static_cast<float>(n_docs) : 1.0f;

    std::shared_lock dict(dict_mutex_);
    std::shared_lock docs_lock(docs_mutex_);

    for (const auto& [term, query_tf] : query_terms) {
        auto it = term_to_id_.find(term);
        if (it == term_to_id_.end()) continue;
        const std::uint32_t term_id = it->second;

        roaring::Roaring docs;
        {
            std::lock_guard posting_lock(term_locks_[term_id % kTermStripes]);
            docs = postings_[term_id]->docs;
        }
        const float term_idf = compute_idf(docs.cardinality());
        if (term_idf <= 0.0f) continue;
        if (allow != nullptr) docs &= *allow;

        for (std::uint32_t handle : docs) {
            auto ds = doc_stats_.find(handle);
            if (ds == doc_stats_.end()) continue;
            const auto& tf_list = ds->second.term_freqs;
            auto tf_it = std::lower_bound(tf_list.begin(), tf_list.end(),
                                          std::pair<std::uint32_t, std::uint32_t>{term_id, 0});
            if (tf_it == tf_list.end() || tf_it->first != term_id) continue;

            // BM25 formula
            const auto doc_tf = static_cast<float>(tf_it->second);
            const float doc_len_norm = 1.0f - params_.b +
                params_.b * (static_cast<float>(ds->second.length) / avg_doc_length);
            const float numerator = doc_tf * (params_.k1 + 1.0f);
            const float denominator = doc_tf + params_.k1 * doc_len_norm;
            scores[handle] += term_idf * static_cast<float>(query_tf) * (numerator / denominator);
        }
    }
}

auto Bm25FieldIndex::Impl::document_frequency(std::string_view term) const -> std::size_t {
    const std::string normalized = normalized_term(term);
    if (normalized.empty()) return 0;
    std::shared_lock dict(dict_mutex_);
    auto it = term_to_id_.find(normalized);
    if (it == term_to_id_.end()) return 0;
    std::lock_guard posting_lock(term_locks_[it->second % kTermStripes]);
    return postings_[it->second]->docs.cardinality();
}

auto Bm25FieldIndex::Impl::idf(std::string_view term) const -> float {
    return compute_idf(document_frequency(term));
}

auto Bm25FieldIndex::Impl::get_stats() const noexcept -> BM25Stats {
    BM25Stats stats;
    stats.num_documents = num_docs_.load();
    stats.total_tokens = total_tokens_.load();
    stats.avg_doc_length = stats.num_documents > 0
        ? static_cast<float>(stats.total_tokens) / static_cast<float>(stats.num_documents)
        : 0.0f;
    std::shared_lock dict(dict_mutex_);
    for (std::uint32_t term_id = 0; term_id < postings_.size(); ++term_id) {
        std::lock_guard posting_lock(term_locks_[term_id % kTermStripes]);
        if (!postings_[term_id]->docs.isEmpty()) ++stats.vocabulary_size;
    }
    return stats;
}

auto Bm25FieldIndex::Impl::clear() -> void {
    std::unique_lock dict(dict_mutex_);
    std::unique_lock docs(docs_mutex_);
    term_to_id_.clear();
    id_to_term_.clear();
    postings_.clear();
    doc_stats_.clear();
    num_docs_.store(0);
    total_tokens_.store(0);
}

// Bm25FieldIndex public API

Bm25FieldIndex::Bm25FieldIndex() : impl_(std::make_unique<Impl>()) {}
Bm25FieldIndex::~Bm25FieldIndex() = default;
Bm25FieldIndex::Bm25FieldIndex(Bm25FieldIndex&&) noexcept = default;
Bm25FieldIndex& Bm25FieldIndex::operator=(Bm25FieldIndex&&) noexcept = default;

auto Bm25FieldIndex::init(const BM25Params& params, const TokenizerOptions& tokenizer)
    -> std::expected<void, core::error> {
    return impl_->init(params, tokenizer);
}

auto Bm25FieldIndex::add_document(std::uint32_t handle, std::string_view text)
    -> std::expected<void, core::error> {
    return impl_->add_document(handle, text);
}

auto Bm25FieldIndex::remove_document(std::uint32_t handle) -> bool {
    return impl_->remove_document(handle);
}

auto Bm25FieldIndex::accumulate(const std::vector<std::pair<std::string, std::uint32_t>>& query_terms,
                                const roaring::Roaring* allow,
                                std::unordered_map<std::uint32_t, float>& scores) const -> void {
    impl_->accumulate(query_terms, allow, scores);
}

auto Bm25FieldIndex::search(std::string_view query, std::uint32_t k,
                            const roaring::Roaring* allow) const
    -> std::expected<std::vector<LexicalHit>, core::error> {
    if (!impl_->initialized_) {
        return core::fail(core::error_code::precondition_failed, "Index not initialized", "index.bm25");
    }
    if (k == 0) {
        return core::fail(core::error_code::invalid_query, "k must be > 0", "index.bm25");
    }
    std::unordered_map<std::uint32_t, float> scores;
    impl_->accumulate(Tokenizer::term_frequencies(query, impl_->tokenizer_), allow, scores);
    return top_k(std::move(scores), k);
}

auto Bm25FieldIndex::document_frequency(std::string_view term) const -> std::size_t {
    return impl_->document_frequency(term);
}

auto Bm25FieldIndex::idf(std::string_view term) const -> float {
    return impl_->idf(term);
}

auto Bm25FieldIndex::contains(std::uint32_t handle) const -> bool {
    std::shared_lock docs(impl_->docs_mutex_);
    return impl_->doc_stats_.contains(handle);
}

auto Bm25FieldIndex::get_stats() const noexcept -> BM25Stats {
    return impl_->get_stats();
}

auto Bm25FieldIndex::is_initialized() const noexcept -> bool {
    return impl_->initialized_;
}

auto Bm25FieldIndex::size() const noexcept -> std::size_t {
    return impl_->num_docs_.load();
}

auto Bm25FieldIndex::clear() -> void {
    impl_->clear();
}

// LexicalIndex

class LexicalIndex::Impl {
public:
    std::vector<std::string> fields_;
    std::vector<Bm25FieldIndex> indexes_;    // parallel to fields_
    TokenizerOptions tokenizer_;
    bool initialized_{false};

    mutable std::mutex present_mutex_;
    roaring::Roaring present_;

    auto field_index(std::string_view field) const -> const Bm25FieldIndex* {
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i] == field) return &indexes_[i];
        }
        return nullptr;
    }
};

LexicalIndex::LexicalIndex() : impl_(std::make_unique<Impl>()) {}
LexicalIndex::~LexicalIndex() = default;
LexicalIndex::LexicalIndex(LexicalIndex&&) noexcept = default;
LexicalIndex& LexicalIndex::operator=(LexicalIndex&&) noexcept = default;

auto LexicalIndex::init(std::vector<std::string> fields, const BM25Params& params,
                        const TokenizerOptions& tokenizer)
    -> std::expected<void, core::error> {
    std::vector<Bm25FieldIndex> indexes;
    indexes.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].empty()) {
            return core::fail(core::error_code::invalid_schema, "empty text field name", "index.lexical");
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (fields[j] == fields[i]) {
                return core::fail(core::error_code::invalid_schema,
                                  "duplicate text field '" + fields[i] + "'", "index.lexical");
            }
        }
        Bm25FieldIndex index;
        if (auto r = index.init(params, tokenizer); !r) return std::unexpected(r.error());
        indexes.push_back(std::move(index));
    }
    impl_->fields_ = std::move(fields);
    impl_->indexes_ = std::move(indexes);
    impl_->tokenizer_ = tokenizer;
    impl_->initialized_ = true;
    return {};
}

auto LexicalIndex::insert(std::uint32_t handle, const std::map<std::string, std::string>& texts)
    -> std::expected<void, core::error> {
    if (!impl_->initialized_) {
        return core::fail(core::error_code::precondition_failed, "Index not initialized", "index.lexical");
    }
    for (std::size_t i = 0; i < impl_->fields_.size(); ++i) {
        auto it = texts.find(impl_->fields_[i]);
        const std::string_view text = it == texts.end() ? std::string_view{} : std::string_view{it->second};
        if (auto r = impl_->indexes_[i].add_document(handle, text); !r) return r;
    }
    std::lock_guard lock(impl_->present_mutex_);
    impl_->present_.add(handle);
    return {};
}

auto LexicalIndex::remove(std::uint32_t handle) -> bool {
    bool removed = false;
    for (auto& index : impl_->indexes_) {
        removed = index.remove_document(handle) || removed;
    }
    std::lock_guard lock(impl_->present_mutex_);
    if (impl_->present_.contains(handle)) {
        impl_->present_.remove(handle);
        removed = true;
    }
    return removed;
}

auto LexicalIndex::search(std::string_view query, std::uint32_t k,
                          const std::vector<std::string>& fields,
                          const roaring::Roaring* allow) const
    -> std::expected<std::vector<LexicalHit>, core::error> {
    if (!impl_->initialized_) {
        return core::fail(core::error_code::precondition_failed, "Index not initialized", "index.lexical");
    }
    if (k == 0) {
        return core::fail(core::error_code::invalid_query, "top_k must be > 0", "index.lexical");
    }

    std::vector<const Bm25FieldIndex*> targets;
    if (fields.empty()) {
        for (const auto& index : impl_->indexes_) targets.push_back(&index);
    } else {
        for (const auto& field : fields) {
            const auto* index = impl_->field_index(field);
            if (index == nullptr) {
                return core::fail(core::error_code::schema_mismatch,
                                  "field '" + field + "' is not an indexed text field", "index.lexical");
            }
            targets.push_back(index);
        }
    }

    const auto query_terms = Tokenizer::term_frequencies(query, impl_->tokenizer_);
    if (query_terms.empty()) {
        return std::vector<LexicalHit>{};
    }

    std::unordered_map<std::uint32_t, float> scores;
    for (const auto* index : targets) {
        index->accumulate(query_terms, allow, scores);
    }
    return top_k(std::move(scores), k);
}

auto LexicalIndex::contains(std::uint32_t handle) const -> bool {
    std::lock_guard lock(impl_->present_mutex_);
    return impl_->present_.contains(handle);
}

auto LexicalIndex::live_handles() const -> roaring::Roaring {
    std::lock_guard lock(impl_->present_mutex_);
    return impl_->present_;
}

auto LexicalIndex::fields() const -> const std::vector<std::string>& {
    return impl_->fields_;
}

auto LexicalIndex::field_stats(std::string_view field) const -> std::expected<BM25Stats, core::error> {
    const auto* index = impl_->field_index(field);
    if (index == nullptr) {
        return core::fail(core::error_code::schema_mismatch,
                          "field '" + std::string(field) + "' is not an indexed text field", "index.lexical");
    }
    return index->get_stats();
}

auto LexicalIndex::tokenizer_options() const noexcept -> const TokenizerOptions& {
    return impl_->tokenizer_;
}

auto LexicalIndex::size() const -> std::size_t {
    std::lock_guard lock(impl_->present_mutex_);
    return impl_->present_.cardinality();
}

auto LexicalIndex::clear() -> void {
    for (auto& index : impl_->indexes_) index.clear();
    std::lock_guard lock(impl_->present_mutex_);
    impl_->present_ = roaring::Roaring{};
}

} // namespace tessera::index
