#pragma once

#include <filesystem>
#include <string>
#include "core/errors/adapter_errors.hpp"
#include "imaging/bitmap.hpp"
#include "imaging/image_writer.hpp"

namespace docanalyst::imaging {

// libjpeg-backed encoder. RGBA input is flattened to RGB; alpha is dropped.
class JpegImageCodec final : public ImageWriter {
public:
    explicit JpegImageCodec(int quality = 85);

    core::errors::Result<std::filesystem::path> write(
        const Bitmap& bitmap, const std::filesystem::path& path) const override;

    std::string file_extension() const override { return ".jpg"; }

    // Decodes to Gray8 or Rgb8.
    static core::errors::Result<Bitmap> read(const std::filesystem::path& path);

    int quality() const { return quality_; }

private:
    int quality_;
};

}  // namespace docanalyst::imaging
