#include "tessera/index/tokenizer.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

namespace tessera::index {

namespace {

// Common English stopwords
const std::unordered_set<std::string> STOPWORDS = {
    "a", "an", "and", "are", "as", "at", "be", "been", "by", "for",
    "from", "has", "he", "in", "is", "it", "its", "of", "on", "that",
    "the", "to", "was", "will", "with", "this", "these", "those",
    "i", "you", "we", "they", "them", "their", "what", "which", "who",
    "when", "where", "why", "how", "all", "would", "there", "could"
};

inline auto is_word_byte(unsigned char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c >= 0x80;
}

inline auto ascii_lower(char c) noexcept -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace

auto Tokenizer::tokenize(std::string_view text, const TokenizerOptions& options)
    -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current_token;

    auto flush = [&] {
        if (current_token.empty()) return;
        if (current_token.size() >= options.min_length && current_token.size() <= options.max_length &&
            (!options.remove_stopwords || !is_stopword(current_token))) {
            tokens.push_back(std::move(current_token));
        }
        current_token.clear();
    };

    for (char c : text) {
        if (is_word_byte(static_cast<unsigned char>(c))) {
            current_token.push_back(options.lowercase ? ascii_lower(c) : c);
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

auto Tokenizer::term_frequencies(std::string_view text, const TokenizerOptions& options)
    -> std::vector<std::pair<std::string, std::uint32_t>> {
    std::map<std::string, std::uint32_t> counts;
    for (auto& token : tokenize(text, options)) {
        counts[std::move(token)]++;
    }
    return {counts.begin(), counts.end()};
}

auto Tokenizer::is_stopword(std::string_view word) -> bool {
    std::string lower_word(word);
    std::transform(lower_word.begin(), lower_word.end(), lower_word.begin(), ascii_lower);
    return STOPWORDS.contains(lower_word);
}

} // namespace tessera::index
