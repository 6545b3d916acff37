#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace yview::utf8 {

// Decode into codepoints; invalid bytes decode as U+FFFD
std::vector<uint32_t> decode(std::string_view text);

// Encode a single codepoint
std::string encode(uint32_t codepoint);

// Cells a codepoint occupies: 0 for combining marks and control characters,
// 2 for East Asian wide characters and emoji, 1 otherwise
int codepointWidth(uint32_t codepoint);

// Split into glyphs: one base codepoint plus the zero-width marks following it
std::vector<std::string> glyphs(std::string_view text);

// Display width in cells
int width(std::string_view text);

// Longest prefix that fits into maxWidth cells
std::string truncate(std::string_view text, int maxWidth);

// Greedy word wrap; words wider than the width are split
std::vector<std::string> wrap(std::string_view text, int maxWidth);

} // namespace yview::utf8
