#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toad::url {

struct DataURL {
    std::string media_type;   // lowercased, without parameters
    std::string charset;
    std::vector<uint8_t> body;
};

// Decodes "data:[<mediatype>][;base64],<payload>". The media type defaults
// to text/plain. Returns nullopt when the comma is missing or the base64
// payload is malformed.
std::optional<DataURL> decode_data_url(std::string_view input);

std::optional<std::vector<uint8_t>> base64_decode(std::string_view input);

} // namespace toad::url
