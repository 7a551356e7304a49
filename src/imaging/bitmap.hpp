#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace docanalyst::imaging {

enum class PixelFormat {
    Gray8,
    Rgb8,
    Rgba8
};

inline std::size_t channel_count(const PixelFormat format) {
    switch (format) {
        case PixelFormat::Gray8:
            return 1;
        case PixelFormat::Rgb8:
            return 3;
        case PixelFormat::Rgba8:
            return 4;
        default:
            return 0;
    }
}

// Tightly packed, row-major, 8 bits per channel.
struct Bitmap {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    PixelFormat format = PixelFormat::Rgb8;
    std::vector<std::uint8_t> pixels;

    std::size_t stride() const {
        return static_cast<std::size_t>(width) * channel_count(format);
    }

    bool is_valid() const {
        return width > 0 && height > 0 &&
               pixels.size() == stride() * static_cast<std::size_t>(height);
    }
};

}  // namespace docanalyst::imaging
