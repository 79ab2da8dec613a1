#include <toad/paint/image_decoder.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <climits>
#include <cstring>

namespace toad::paint {

std::optional<PixelMatrix> decode_image(const std::vector<std::uint8_t>& bytes, std::string& err) {
    if (bytes.empty()) {
        err = "empty image data";
        return std::nullopt;
    }
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        err = "image data too large";
        return std::nullopt;
    }

    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                  &w, &h, &channels, 4);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        err = reason ? reason : "unsupported image format";
        return std::nullopt;
    }

    PixelMatrix image;
    image.width = w;
    image.height = h;
    image.rgba.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4);
    std::memcpy(image.rgba.data(), pixels, image.rgba.size());
    stbi_image_free(pixels);
    return image;
}

} // namespace toad::paint
