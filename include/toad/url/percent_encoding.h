#pragma once
#include <string>
#include <string_view>

namespace toad::url {

// Encodes everything except unreserved characters. When encode_path_chars is
// false the path delimiters (/ : @ and sub-delims) are left alone as well.
std::string percent_encode(std::string_view input, bool encode_path_chars = true);

std::string percent_decode(std::string_view input);

} // namespace toad::url
