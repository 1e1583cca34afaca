#pragma once

/** \file tokenizer.hpp
 *  \brief Tokenizer for indexed text fields and lexical queries.
 *
 * Splits on non-alphanumeric ASCII boundaries. Bytes >= 0x80 are treated as word characters so
 * UTF-8 sequences stay inside one token. Documents and queries must go through the same options.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera::index {

/** \brief Tokenization options. */
struct TokenizerOptions {
    bool lowercase{true};              /**< ASCII lowercasing */
    bool remove_stopwords{false};      /**< Drop common English stopwords */
    std::uint32_t min_length{1};       /**< Shorter tokens are dropped */
    std::uint32_t max_length{256};     /**< Longer tokens are dropped */
};

class Tokenizer {
public:
    /** \brief Tokenize text into terms, in order of appearance. */
    static auto tokenize(std::string_view text, const TokenizerOptions& options = {})
        -> std::vector<std::string>;

    /** \brief Distinct terms with their frequencies, sorted by term. */
    static auto term_frequencies(std::string_view text, const TokenizerOptions& options = {})
        -> std::vector<std::pair<std::string, std::uint32_t>>;

    /** \brief Check if word is a stopword (case-insensitive). */
    static auto is_stopword(std::string_view word) -> bool;
};

} // namespace tessera::index
