#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chunkwise::chunking {

/**
 * Splitting primitives shared by all strategies. Every function is pure.
 */
namespace text {

inline bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trimView(std::string_view s);

std::string trim(std::string_view s);

// True when s is empty or whitespace only
bool isBlank(std::string_view s);

// Number of whitespace-delimited tokens
size_t countWords(std::string_view s);

/**
 * Split at sentence-ending punctuation (. ! ?) followed by whitespace. The whitespace run is
 * consumed, pieces are trimmed and empty pieces dropped.
 */
std::vector<std::string> splitSentences(std::string_view s);

/**
 * Split at blank lines: any whitespace run holding at least two line feeds. Pieces are
 * trimmed and empty pieces dropped.
 */
std::vector<std::string> splitParagraphs(std::string_view s);

std::vector<std::string> splitWords(std::string_view s);

} // namespace text
} // namespace chunkwise::chunking
