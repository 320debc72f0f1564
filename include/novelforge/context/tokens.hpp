/*
 * NovelForge C++ - Token Estimation
 *
 * Model-independent token estimate over Unicode code points:
 *
 *   tokens = ceil(cjk / 1.5 + other / 4)
 *
 * where cjk counts code points in U+4E00..U+9FFF. The estimate is
 * monotone (removing characters never increases it) and subadditive
 * (the estimate of a concatenation never exceeds the sum of the parts),
 * which is what the context budget relies on.
 */
#ifndef novelforge_CONTEXT_TOKENS_HPP
#define novelforge_CONTEXT_TOKENS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

int64_t estimate_tokens(const std::string& text);

// Sentences including their terminator (. ! ? and the full-width forms);
// a trailing fragment without terminator is its own sentence
std::vector<std::string> split_sentences(const std::string& text);

// Longest prefix of whole sentences that fits max_tokens (may be empty)
std::string truncate_at_sentence(const std::string& text, int64_t max_tokens);

} // namespace novelforge

#endif // novelforge_CONTEXT_TOKENS_HPP
