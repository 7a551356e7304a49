#include "imaging/jpeg_image_codec.hpp"

#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <vector>
#include <jpeglib.h>

namespace docanalyst::imaging {

using core::errors::AdapterError;
using core::errors::ErrorCategory;

namespace {

// libjpeg's default error_exit terminates the process; route it back here.
struct JpegErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void on_jpeg_error(j_common_ptr cinfo) {
    auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

using FileHandle = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

FileHandle open_file(const std::filesystem::path& path, const char* mode) {
    return FileHandle(std::fopen(path.c_str(), mode), &std::fclose);
}

// No objects with destructors may live in this frame: on_jpeg_error jumps
// back into it.
bool compress_rows(std::FILE* fp, const std::uint8_t* rows, const Bitmap& bitmap,
                   const int components, const int quality,
                   JpegErrorManager& errors) {
    jpeg_compress_struct cinfo;
    cinfo.err = jpeg_std_error(&errors.base);
    errors.base.error_exit = on_jpeg_error;
    errors.message[0] = '\0';
    if (setjmp(errors.jump) != 0) {
        jpeg_destroy_compress(&cinfo);
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, fp);
    cinfo.image_width = bitmap.width;
    cinfo.image_height = bitmap.height;
    cinfo.input_components = components;
    cinfo.in_color_space = components == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    const std::size_t row_bytes =
        static_cast<std::size_t>(bitmap.width) * static_cast<std::size_t>(components);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row_pointer = const_cast<JSAMPROW>(
            rows + static_cast<std::size_t>(cinfo.next_scanline) * row_bytes);
        jpeg_write_scanlines(&cinfo, &row_pointer, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
}

// Same constraint as compress_rows; `out` lives in the caller's frame.
bool decompress_rows(std::FILE* fp, Bitmap& out, JpegErrorManager& errors) {
    jpeg_decompress_struct cinfo;
    cinfo.err = jpeg_std_error(&errors.base);
    errors.base.error_exit = on_jpeg_error;
    errors.message[0] = '\0';
    if (setjmp(errors.jump) != 0) {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, fp);
    static_cast<void>(jpeg_read_header(&cinfo, TRUE));
    cinfo.out_color_space =
        cinfo.num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_start_decompress(&cinfo);

    out.width = cinfo.output_width;
    out.height = cinfo.output_height;
    out.format = cinfo.output_components == 1 ? PixelFormat::Gray8 : PixelFormat::Rgb8;
    out.pixels.resize(out.stride() * static_cast<std::size_t>(out.height));

    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row_pointer =
            out.pixels.data() +
            static_cast<std::size_t>(cinfo.output_scanline) * out.stride();
        jpeg_read_scanlines(&cinfo, &row_pointer, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return true;
}

std::vector<std::uint8_t> drop_alpha(const Bitmap& bitmap) {
    const std::size_t pixel_count =
        static_cast<std::size_t>(bitmap.width) * static_cast<std::size_t>(bitmap.height);
    std::vector<std::uint8_t> rgb(pixel_count * 3);
    for (std::size_t i = 0; i < pixel_count; ++i) {
        rgb[i * 3 + 0] = bitmap.pixels[i * 4 + 0];
        rgb[i * 3 + 1] = bitmap.pixels[i * 4 + 1];
        rgb[i * 3 + 2] = bitmap.pixels[i * 4 + 2];
    }
    return rgb;
}

}  // namespace

JpegImageCodec::JpegImageCodec(const int quality) : quality_(quality) {}

core::errors::Result<std::filesystem::path> JpegImageCodec::write(
    const Bitmap& bitmap, const std::filesystem::path& path) const {
    if (!bitmap.is_valid()) {
        return AdapterError{ErrorCategory::Input,
                            "Bitmap dimensions do not match its pixel buffer.",
                            "invalid_bitmap"};
    }
    if (bitmap.width > JPEG_MAX_DIMENSION || bitmap.height > JPEG_MAX_DIMENSION) {
        return AdapterError{ErrorCategory::Input,
                            "Bitmap is too large for JPEG encoding.",
                            "bitmap_too_large"};
    }

    std::vector<std::uint8_t> flattened;
    const std::uint8_t* rows = bitmap.pixels.data();
    int components = 3;
    if (bitmap.format == PixelFormat::Gray8) {
        components = 1;
    } else if (bitmap.format == PixelFormat::Rgba8) {
        flattened = drop_alpha(bitmap);
        rows = flattened.data();
    }

    FileHandle file = open_file(path, "wb");
    if (!file) {
        return AdapterError{ErrorCategory::Io,
                            "Unable to open image file for writing: " + path.string(),
                            "image_open_failed"};
    }

    JpegErrorManager errors;
    if (!compress_rows(file.get(), rows, bitmap, components, quality_, errors)) {
        return AdapterError{ErrorCategory::Io,
                            "JPEG encoding failed for " + path.string() + ": " +
                                errors.message,
                            "image_encode_failed"};
    }

    std::FILE* raw = file.release();
    if (std::fclose(raw) != 0) {
        return AdapterError{ErrorCategory::Io,
                            "Unable to flush image file: " + path.string(),
                            "image_write_failed"};
    }
    return path;
}

core::errors::Result<Bitmap> JpegImageCodec::read(const std::filesystem::path& path) {
    FileHandle file = open_file(path, "rb");
    if (!file) {
        return AdapterError{ErrorCategory::Io,
                            "Unable to open image file: " + path.string(),
                            "image_open_failed",
                            "Images must be JPEG files."};
    }

    Bitmap bitmap;
    JpegErrorManager errors;
    if (!decompress_rows(file.get(), bitmap, errors)) {
        return AdapterError{ErrorCategory::Io,
                            "JPEG decoding failed for " + path.string() + ": " +
                                errors.message,
                            "image_decode_failed",
                            "Images must be JPEG files."};
    }
    return bitmap;
}

}  // namespace docanalyst::imaging
