#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/adapter_errors.hpp"
#include "imaging/bitmap.hpp"
#include "imaging/image_writer.hpp"

namespace docanalyst::imaging {

// Owns the temporary image files of one request. Every file added is removed
// when the set is destroyed; removal failures are logged, never thrown.
class TempImageSet {
public:
    TempImageSet(std::filesystem::path directory, std::string prefix);
    ~TempImageSet();

    TempImageSet(const TempImageSet&) = delete;
    TempImageSet& operator=(const TempImageSet&) = delete;

    // Writes `bitmap` to <directory>/<prefix><32 hex><extension>.
    core::errors::Result<std::filesystem::path> add(const ImageWriter& writer,
                                                    const Bitmap& bitmap);

    const std::vector<std::filesystem::path>& paths() const { return paths_; }

    // Removes every owned file now. Returns how many were actually deleted.
    std::size_t release_all();

private:
    std::filesystem::path directory_;
    std::string prefix_;
    std::vector<std::filesystem::path> paths_;
};

}  // namespace docanalyst::imaging
