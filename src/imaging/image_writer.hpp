#pragma once

#include <filesystem>
#include <string>
#include "core/errors/adapter_errors.hpp"
#include "imaging/bitmap.hpp"

namespace docanalyst::imaging {

// Persists an in-memory bitmap to a file in a compressed format.
class ImageWriter {
public:
    virtual ~ImageWriter() = default;

    virtual core::errors::Result<std::filesystem::path> write(
        const Bitmap& bitmap, const std::filesystem::path& path) const = 0;

    // Including the leading dot, e.g. ".jpg".
    virtual std::string file_extension() const = 0;
};

}  // namespace docanalyst::imaging
