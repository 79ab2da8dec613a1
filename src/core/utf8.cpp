#include <toad/core/utf8.h>

#include <iterator>

namespace toad::core {

namespace {

constexpr std::uint32_t kReplacement = 0xFFFD;

struct Range {
    std::uint32_t first;
    std::uint32_t last;
};

// East Asian Wide and Fullwidth blocks, plus the common emoji planes.
constexpr Range kWideRanges[] = {
    {0x1100, 0x115F},   {0x2E80, 0x303E},   {0x3041, 0x33FF},
    {0x3400, 0x4DBF},   {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},
    {0xAC00, 0xD7A3},   {0xF900, 0xFAFF},   {0xFE30, 0xFE4F},
    {0xFF00, 0xFF60},   {0xFFE0, 0xFFE6},   {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

constexpr Range kZeroWidthRanges[] = {
    {0x0300, 0x036F}, {0x200B, 0x200F}, {0x20D0, 0x20FF},
    {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F},
};

bool in_ranges(std::uint32_t cp, const Range* begin, const Range* end) {
    for (const Range* r = begin; r != end; ++r) {
        if (cp >= r->first && cp <= r->last) return true;
    }
    return false;
}

} // namespace

bool append_utf8(std::uint32_t code_point, std::string& out) {
    if (code_point == 0 || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
        return false;
    }
    if (code_point <= 0x7Fu) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FFu) {
        out.push_back(static_cast<char>(0xC0u | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    } else if (code_point <= 0xFFFFu) {
        out.push_back(static_cast<char>(0xE0u | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 12) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    }
    return true;
}

std::uint32_t next_code_point(std::string_view text, std::size_t& pos) {
    if (pos >= text.size()) return 0;
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    int extra = 0;
    std::uint32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        ++pos;
        return kReplacement;
    }

    if (pos + static_cast<std::size_t>(extra) >= text.size()) {
        ++pos;
        return kReplacement;
    }
    for (int i = 1; i <= extra; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + static_cast<std::size_t>(i)]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return kReplacement;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += static_cast<std::size_t>(extra) + 1;
    return cp;
}

int code_point_width(std::uint32_t code_point) {
    if (code_point == 0) return 0;
    if (code_point < 0x20 || (code_point >= 0x7F && code_point < 0xA0)) return 0;
    if (in_ranges(code_point, std::begin(kZeroWidthRanges), std::end(kZeroWidthRanges))) {
        return 0;
    }
    if (in_ranges(code_point, std::begin(kWideRanges), std::end(kWideRanges))) {
        return 2;
    }
    return 1;
}

int display_width(std::string_view text) {
    int width = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        width += code_point_width(next_code_point(text, pos));
    }
    return width;
}

std::vector<std::string> split_glyphs(std::string_view text) {
    std::vector<std::string> glyphs;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        const std::uint32_t cp = next_code_point(text, pos);
        std::string bytes(text.substr(start, pos - start));
        if (cp == kReplacement && bytes != "\xEF\xBF\xBD") {
            bytes = "\xEF\xBF\xBD";
        }
        if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) continue;
        if (code_point_width(cp) == 0 && !glyphs.empty()) {
            glyphs.back() += bytes;
        } else if (code_point_width(cp) > 0) {
            glyphs.push_back(std::move(bytes));
        }
    }
    return glyphs;
}

std::string truncate_to_width(std::string_view text, int max_columns) {
    std::string out;
    int used = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t start = pos;
        const int w = code_point_width(next_code_point(text, pos));
        if (used + w > max_columns) break;
        used += w;
        out.append(text.substr(start, pos - start));
    }
    return out;
}

}  // namespace toad::core
