#include <yview/utf8.h>

#include <initializer_list>
#include <utility>

namespace yview::utf8 {

namespace {

// Decodes one codepoint and advances ptr past it
uint32_t decodeOne(const uint8_t*& ptr, const uint8_t* end) {
    uint32_t codepoint = 0;
    if ((*ptr & 0x80) == 0) {
        codepoint = *ptr++;
    } else if ((*ptr & 0xE0) == 0xC0) {
        codepoint = (*ptr++ & 0x1F) << 6;
        if (ptr < end) codepoint |= (*ptr++ & 0x3F);
    } else if ((*ptr & 0xF0) == 0xE0) {
        codepoint = (*ptr++ & 0x0F) << 12;
        if (ptr < end) codepoint |= (*ptr++ & 0x3F) << 6;
        if (ptr < end) codepoint |= (*ptr++ & 0x3F);
    } else if ((*ptr & 0xF8) == 0xF0) {
        codepoint = (*ptr++ & 0x07) << 18;
        if (ptr < end) codepoint |= (*ptr++ & 0x3F) << 12;
        if (ptr < end) codepoint |= (*ptr++ & 0x3F) << 6;
        if (ptr < end) codepoint |= (*ptr++ & 0x3F);
    } else {
        ptr++;
        return 0xFFFD;
    }
    return codepoint;
}

bool isControl(uint32_t cp) {
    return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp < 0xA0);
}

bool inRanges(uint32_t cp, std::initializer_list<std::pair<uint32_t, uint32_t>> ranges) {
    for (const auto& [lo, hi] : ranges) {
        if (cp >= lo && cp <= hi) return true;
    }
    return false;
}

} // namespace

int codepointWidth(uint32_t cp) {
    if (isControl(cp) || cp == 0x00AD) {
        return 0;
    }
    // Combining marks, zero-width spaces and joiners, variation selectors
    if (inRanges(cp, {{0x0300, 0x036F}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF},
                      {0x20D0, 0x20FF}, {0xFE20, 0xFE2F}, {0x200B, 0x200F},
                      {0x2028, 0x202F}, {0x2060, 0x206F}, {0xFE00, 0xFE0F},
                      {0xFEFF, 0xFEFF}, {0xE0100, 0xE01EF}})) {
        return 0;
    }
    // Hangul, CJK, kana, fullwidth forms and emoji
    if (inRanges(cp, {{0x1100, 0x115F}, {0x2E80, 0x303E}, {0x3041, 0x33FF},
                      {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA960, 0xA97F},
                      {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE30, 0xFE4F},
                      {0xFF01, 0xFF60}, {0xFFE0, 0xFFE6}, {0x1F300, 0x1F64F},
                      {0x1F900, 0x1F9FF}, {0x1FA00, 0x1FAFF}, {0x20000, 0x3134F}})) {
        return 2;
    }
    return 1;
}

std::vector<uint32_t> decode(std::string_view text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    auto ptr = reinterpret_cast<const uint8_t*>(text.data());
    auto end = ptr + text.size();
    while (ptr < end) {
        out.push_back(decodeOne(ptr, end));
    }
    return out;
}

std::string encode(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

std::vector<std::string> glyphs(std::string_view text) {
    std::vector<std::string> out;
    auto begin = reinterpret_cast<const uint8_t*>(text.data());
    auto ptr = begin;
    auto end = ptr + text.size();
    while (ptr < end) {
        auto start = ptr;
        uint32_t cp = decodeOne(ptr, end);
        auto bytes = text.substr(start - begin, ptr - start);
        // Marks stick to the glyph they modify
        if (!out.empty() && !isControl(cp) && codepointWidth(cp) == 0) {
            out.back() += bytes;
        } else {
            out.emplace_back(bytes);
        }
    }
    return out;
}

int width(std::string_view text) {
    int w = 0;
    auto ptr = reinterpret_cast<const uint8_t*>(text.data());
    auto end = ptr + text.size();
    while (ptr < end) {
        w += codepointWidth(decodeOne(ptr, end));
    }
    return w;
}

std::string truncate(std::string_view text, int maxWidth) {
    std::string out;
    int w = 0;
    for (const auto& g : glyphs(text)) {
        int gw = width(g);
        if (w + gw > maxWidth) break;
        out += g;
        w += gw;
    }
    return out;
}

std::vector<std::string> wrap(std::string_view text, int maxWidth) {
    std::vector<std::string> lines;
    if (maxWidth <= 0) maxWidth = 1;

    size_t lineStart = 0;
    while (lineStart <= text.size()) {
        size_t nl = text.find('\n', lineStart);
        std::string_view para = text.substr(
            lineStart, nl == std::string_view::npos ? std::string_view::npos : nl - lineStart);

        std::string current;
        int currentWidth = 0;
        size_t pos = 0;
        bool emitted = false;
        while (pos < para.size()) {
            size_t space = para.find(' ', pos);
            std::string_view word = para.substr(
                pos, space == std::string_view::npos ? std::string_view::npos : space - pos);
            pos = space == std::string_view::npos ? para.size() : space + 1;
            if (word.empty()) continue;

            int ww = width(word);
            if (currentWidth > 0 && currentWidth + 1 + ww > maxWidth) {
                lines.push_back(current);
                emitted = true;
                current.clear();
                currentWidth = 0;
            }
            if (currentWidth > 0) {
                current += ' ';
                currentWidth += 1;
            }
            // Hard-split words that do not fit on a line of their own
            auto parts = glyphs(word);
            for (const auto& g : parts) {
                int gw = width(g);
                if (currentWidth > 0 && currentWidth + gw > maxWidth) {
                    lines.push_back(current);
                    emitted = true;
                    current.clear();
                    currentWidth = 0;
                }
                current += g;
                currentWidth += gw;
            }
        }
        if (!current.empty() || !emitted) {
            lines.push_back(current);
        }

        if (nl == std::string_view::npos) break;
        lineStart = nl + 1;
    }
    return lines;
}

} // namespace yview::utf8
