#include <novelforge/context/tokens.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

namespace {

bool is_terminator(uint32_t cp) {
    return cp == '.' || cp == '!' || cp == '?' ||
           cp == 0x3002 || cp == 0xFF01 || cp == 0xFF1F;
}

// Byte length of the UTF-8 sequence starting with this lead byte
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

int64_t estimate_tokens(const std::string& text) {
    std::vector<uint32_t> cps = utf8_code_points(text);

    int64_t cjk = 0;
    int64_t other = 0;
    for (size_t i = 0; i < cps.size(); ++i) {
        if (cps[i] >= 0x4E00 && cps[i] <= 0x9FFF) ++cjk;
        else ++other;
    }

    // ceil(cjk / 1.5 + other / 4) == ceil((8 * cjk + 3 * other) / 12)
    int64_t numerator = 8 * cjk + 3 * other;
    return (numerator + 11) / 12;
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    size_t i = 0;
    while (i < text.size()) {
        size_t len = sequence_length(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = text.size() - i;
        std::string ch = text.substr(i, len);
        current += ch;
        i += len;

        std::vector<uint32_t> cp = utf8_code_points(ch);
        if (!cp.empty() && is_terminator(cp[0])) {
            // Keep runs like "?!" and closing quotes with the sentence
            while (i < text.size()) {
                char next = text[i];
                if (next == '.' || next == '!' || next == '?' || next == '"' || next == '\'') {
                    current += next;
                    ++i;
                } else {
                    break;
                }
            }
            sentences.push_back(current);
            current.clear();
        }
    }
    if (!trim(current).empty()) {
        sentences.push_back(current);
    }
    return sentences;
}

std::string truncate_at_sentence(const std::string& text, int64_t max_tokens) {
    if (max_tokens <= 0) return std::string();
    if (estimate_tokens(text) <= max_tokens) return text;

    std::vector<std::string> sentences = split_sentences(text);
    std::string result;
    for (size_t i = 0; i < sentences.size(); ++i) {
        std::string candidate = result + sentences[i];
        if (estimate_tokens(candidate) > max_tokens) break;
        result.swap(candidate);
    }
    return trim(result);
}

} // namespace novelforge
