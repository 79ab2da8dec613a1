#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace toad::core {

// Appends the UTF-8 encoding of code_point. Returns false for surrogates,
// NUL and values beyond U+10FFFF.
bool append_utf8(std::uint32_t code_point, std::string& out);

// Decodes one code point starting at pos and advances pos past it.
// Malformed sequences yield U+FFFD and consume a single byte.
std::uint32_t next_code_point(std::string_view text, std::size_t& pos);

// Number of terminal columns a code point occupies (0, 1 or 2).
int code_point_width(std::uint32_t code_point);

int display_width(std::string_view text);

// One grapheme-sized unit per entry: the UTF-8 bytes of a single code point
// (zero-width marks are folded into the preceding entry).
std::vector<std::string> split_glyphs(std::string_view text);

// Longest prefix of text that fits in max_columns.
std::string truncate_to_width(std::string_view text, int max_columns);

}  // namespace toad::core
