#include "imaging/temp_image_set.hpp"

#include <system_error>
#include <utility>
#include "core/config/unique_id.hpp"
#include "core/logging/logger.hpp"

namespace docanalyst::imaging {

using core::errors::AdapterError;
using core::errors::ErrorCategory;

TempImageSet::TempImageSet(std::filesystem::path directory, std::string prefix)
    : directory_(std::move(directory)), prefix_(std::move(prefix)) {}

TempImageSet::~TempImageSet() {
    release_all();
}

core::errors::Result<std::filesystem::path> TempImageSet::add(
    const ImageWriter& writer, const Bitmap& bitmap) {
    const auto path =
        directory_ / (prefix_ + core::config::generate_unique_hex() +
                      writer.file_extension());

    // Owned before writing so a partial file is still cleaned up.
    paths_.push_back(path);
    auto written = writer.write(bitmap, path);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    DOCANALYST_LOG_DEBUG("Saved temp image: " + path.string());
    return path;
}

std::size_t TempImageSet::release_all() {
    std::size_t removed = 0;
    for (const auto& path : paths_) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            ++removed;
            DOCANALYST_LOG_DEBUG("Cleaned up temp file: " + path.string());
        } else if (ec) {
            DOCANALYST_LOG_DEBUG("Failed to clean up " + path.string() + ": " +
                                 ec.message());
        } else {
            DOCANALYST_LOG_DEBUG("Temp file already gone: " + path.string());
        }
    }
    paths_.clear();
    return removed;
}

}  // namespace docanalyst::imaging
