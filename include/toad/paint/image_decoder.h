#pragma once
#include <toad/paint/image_reducer.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toad::paint {

// Decodes PNG, JPEG, GIF (first frame) and BMP bytes into RGBA pixels.
// On failure returns nullopt and sets err to the decoder's reason.
std::optional<PixelMatrix> decode_image(const std::vector<std::uint8_t>& bytes, std::string& err);

} // namespace toad::paint
