#include <chunkwise/chunking/text_splitter.h>

namespace chunkwise::chunking::text {

namespace {

void pushTrimmed(std::vector<std::string>& out, std::string_view piece) {
    auto trimmed = trimView(piece);
    if (!trimmed.empty()) {
        out.emplace_back(trimmed);
    }
}

} // namespace

std::string_view trimView(std::string_view s) {
    size_t first = 0;
    while (first < s.size() && isSpace(s[first])) {
        ++first;
    }
    size_t last = s.size();
    while (last > first && isSpace(s[last - 1])) {
        --last;
    }
    return s.substr(first, last - first);
}

std::string trim(std::string_view s) {
    return std::string(trimView(s));
}

bool isBlank(std::string_view s) {
    for (char c : s) {
        if (!isSpace(c)) {
            return false;
        }
    }
    return true;
}

size_t countWords(std::string_view s) {
    size_t count = 0;
    bool in_word = false;
    for (char c : s) {
        bool is_space = isSpace(c);
        if (!in_word && !is_space) {
            ++count;
            in_word = true;
        } else if (in_word && is_space) {
            in_word = false;
        }
    }
    return count;
}

std::vector<std::string> splitSentences(std::string_view s) {
    std::vector<std::string> sentences;

    size_t start = 0;
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        if ((c == '.' || c == '!' || c == '?') && i + 1 < s.size() && isSpace(s[i + 1])) {
            pushTrimmed(sentences, s.substr(start, i + 1 - start));

            // Consume the whole whitespace run after the punctuation
            size_t next = i + 1;
            while (next < s.size() && isSpace(s[next])) {
                ++next;
            }
            start = next;
            i = next;
            continue;
        }
        ++i;
    }

    if (start < s.size()) {
        pushTrimmed(sentences, s.substr(start));
    }

    return sentences;
}

std::vector<std::string> splitParagraphs(std::string_view s) {
    std::vector<std::string> paragraphs;

    size_t start = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '\n') {
            ++i;
            continue;
        }

        // Extend over the whitespace run and remember the last line feed in it
        size_t run_end = i + 1;
        size_t last_newline = i;
        while (run_end < s.size() && isSpace(s[run_end])) {
            if (s[run_end] == '\n') {
                last_newline = run_end;
            }
            ++run_end;
        }

        if (last_newline > i) {
            pushTrimmed(paragraphs, s.substr(start, i - start));
            start = last_newline + 1;
            i = last_newline + 1;
        } else {
            ++i;
        }
    }

    if (start < s.size()) {
        pushTrimmed(paragraphs, s.substr(start));
    }

    return paragraphs;
}

std::vector<std::string> splitWords(std::string_view s) {
    std::vector<std::string> words;

    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && isSpace(s[i])) {
            ++i;
        }
        size_t begin = i;
        while (i < s.size() && !isSpace(s[i])) {
            ++i;
        }
        if (i > begin) {
            words.emplace_back(s.substr(begin, i - begin));
        }
    }

    return words;
}

} // namespace chunkwise::chunking::text
