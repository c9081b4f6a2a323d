#include "image_codec.hpp"

#include "errors.hpp"

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <jpeglib.h>
#include <png.h>
#include <webp/decode.h>
#include <webp/encode.h>

namespace {

// Refuse to allocate more than this for one decoded image.
constexpr size_t kMaxPixelBytes = 256u * 1024u * 1024u;

bool is_png_data(const std::string& data) {
    static const unsigned char sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    return data.size() >= 8 && std::memcmp(data.data(), sig, 8) == 0;
}

bool is_jpeg_data(const std::string& data) {
    return data.size() >= 3 &&
           static_cast<unsigned char>(data[0]) == 0xFF &&
           static_cast<unsigned char>(data[1]) == 0xD8 &&
           static_cast<unsigned char>(data[2]) == 0xFF;
}

// RIFF container with a WEBP form type.
bool is_webp_data(const std::string& data) {
    return data.size() >= 12 &&
           std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WEBP", 4) == 0;
}

// -------------------- libpng glue --------------------
struct PngReadContext {
    const unsigned char* data = nullptr;
    size_t size = 0;
    size_t offset = 0;
    std::string message = "invalid PNG data";
};

void png_read_callback(png_structp png_ptr, png_bytep out_bytes, png_size_t byte_count) {
    auto* ctx = static_cast<PngReadContext*>(png_get_io_ptr(png_ptr));
    if (byte_count > ctx->size - ctx->offset) {
        png_error(png_ptr, "truncated PNG");
    }
    std::memcpy(out_bytes, ctx->data + ctx->offset, byte_count);
    ctx->offset += byte_count;
}

void png_write_callback(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::string*>(png_get_io_ptr(png_ptr));
    out->append(reinterpret_cast<const char*>(data), length);
}

void png_flush_callback(png_structp) {}

void png_error_callback(png_structp png_ptr, png_const_charp msg) {
    auto* message = static_cast<std::string*>(png_get_error_ptr(png_ptr));
    if (message && msg) *message = msg;
    png_longjmp(png_ptr, 1);
}

void png_warning_callback(png_structp, png_const_charp) {}

// -------------------- libjpeg glue --------------------
struct JpegErrorMgr {
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmp_buffer, 1);
}

void jpeg_silent_output(j_common_ptr) {}

} // namespace

ImageFormat ImageCodec::sniff(const std::string& bytes, const std::string& subject) {
    if (is_png_data(bytes)) return ImageFormat::Png;
    if (is_jpeg_data(bytes)) return ImageFormat::Jpeg;
    if (is_webp_data(bytes)) return ImageFormat::Webp;
    throw DecodeError(subject, "unsupported image format");
}

Image ImageCodec::decode(const std::string& bytes, const std::string& subject) {
    switch (sniff(bytes, subject)) {
        case ImageFormat::Png: return decode_png(bytes, subject);
        case ImageFormat::Jpeg: return decode_jpeg(bytes, subject);
        case ImageFormat::Webp: return decode_webp(bytes, subject);
    }
    throw DecodeError(subject, "unsupported image format");
}

std::string ImageCodec::encode(const Image& image, const std::string& subject) {
    if (image.width <= 0 || image.height <= 0 ||
        image.pixels.size() != static_cast<size_t>(image.width) * image.height * image.channels) {
        throw DecodeError(subject, "inconsistent pixel buffer");
    }
    switch (image.format) {
        case ImageFormat::Png: return encode_png(image, subject);
        case ImageFormat::Jpeg: return encode_jpeg(image, subject);
        case ImageFormat::Webp: return encode_webp(image, subject);
    }
    throw DecodeError(subject, "unsupported image format");
}

Image ImageCodec::rotate_180(const Image& image) {
    Image out = image;
    const size_t px = static_cast<size_t>(image.channels);
    const size_t count = px == 0 ? 0 : image.pixels.size() / px;
    for (size_t i = 0; i < count; ++i) {
        std::memcpy(out.pixels.data() + i * px, image.pixels.data() + (count - 1 - i) * px, px);
    }
    return out;
}

// -------------------- PNG --------------------
Image ImageCodec::decode_png(const std::string& bytes, const std::string& subject) {
    Image out;
    out.format = ImageFormat::Png;

    PngReadContext ctx;
    ctx.data = reinterpret_cast<const unsigned char*>(bytes.data());
    ctx.size = bytes.size();
    std::vector<png_bytep> rows;

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, &ctx.message,
                                                 png_error_callback, png_warning_callback);
    if (!png_ptr) throw DecodeError(subject, "png_create_read_struct failed");
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        throw DecodeError(subject, "png_create_info_struct failed");
    }
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        throw DecodeError(subject, "PNG: " + ctx.message);
    }

    png_set_read_fn(png_ptr, &ctx, png_read_callback);
    png_read_info(png_ptr, info_ptr);

    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bit_depth = 0;
    int color_type = 0;
    png_get_IHDR(png_ptr, info_ptr, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(png_ptr);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png_ptr);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png_ptr);
    if (png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png_ptr);
    png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    const png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
    const int channels = png_get_channels(png_ptr, info_ptr);
    if (rowbytes != static_cast<png_size_t>(width) * channels ||
        static_cast<size_t>(rowbytes) * height > kMaxPixelBytes) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        throw DecodeError(subject, "unsupported PNG layout");
    }

    out.width = static_cast<int>(width);
    out.height = static_cast<int>(height);
    out.channels = channels;
    out.pixels.resize(rowbytes * height);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = reinterpret_cast<png_bytep>(out.pixels.data() + y * rowbytes);
    }
    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    return out;
}

std::string ImageCodec::encode_png(const Image& image, const std::string& subject) {
    int color_type = 0;
    switch (image.channels) {
        case 1: color_type = PNG_COLOR_TYPE_GRAY; break;
        case 2: color_type = PNG_COLOR_TYPE_GRAY_ALPHA; break;
        case 3: color_type = PNG_COLOR_TYPE_RGB; break;
        case 4: color_type = PNG_COLOR_TYPE_RGB_ALPHA; break;
        default: throw DecodeError(subject, "unsupported channel count for PNG");
    }

    std::string out;
    std::string message = "PNG encoding failed";
    std::vector<png_bytep> rows(static_cast<size_t>(image.height));

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, &message,
                                                  png_error_callback, png_warning_callback);
    if (!png_ptr) throw DecodeError(subject, "png_create_write_struct failed");
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        throw DecodeError(subject, "png_create_info_struct failed");
    }
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        throw DecodeError(subject, "PNG: " + message);
    }

    png_set_write_fn(png_ptr, &out, png_write_callback, png_flush_callback);
    png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height),
                 8, color_type, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);

    const size_t stride = static_cast<size_t>(image.width) * image.channels;
    for (int y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(image.pixels.data() + y * stride);
    }
    png_write_image(png_ptr, rows.data());
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return out;
}

// -------------------- JPEG --------------------
Image ImageCodec::decode_jpeg(const std::string& bytes, const std::string& subject) {
    Image out;
    out.format = ImageFormat::Jpeg;

    jpeg_decompress_struct cinfo;
    JpegErrorMgr jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_output;
    if (setjmp(jerr.setjmp_buffer)) {
        jpeg_destroy_decompress(&cinfo);
        throw DecodeError(subject, std::string("JPEG: ") + jerr.message);
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, reinterpret_cast<const unsigned char*>(bytes.data()),
                 static_cast<unsigned long>(bytes.size()));
    jpeg_read_header(&cinfo, TRUE);

    if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
        cinfo.out_color_space = JCS_CMYK;
        out.cmyk = true;
    } else if (cinfo.jpeg_color_space == JCS_GRAYSCALE) {
        cinfo.out_color_space = JCS_GRAYSCALE;
    } else {
        cinfo.out_color_space = JCS_RGB;
    }
    jpeg_start_decompress(&cinfo);

    const size_t stride = static_cast<size_t>(cinfo.output_width) * cinfo.output_components;
    if (stride * cinfo.output_height > kMaxPixelBytes) {
        jpeg_destroy_decompress(&cinfo);
        throw DecodeError(subject, "JPEG too large");
    }

    out.width = static_cast<int>(cinfo.output_width);
    out.height = static_cast<int>(cinfo.output_height);
    out.channels = cinfo.output_components;
    out.pixels.resize(stride * cinfo.output_height);
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = out.pixels.data() + static_cast<size_t>(cinfo.output_scanline) * stride;
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    return out;
}

std::string ImageCodec::encode_jpeg(const Image& image, const std::string& subject) {
    J_COLOR_SPACE color_space;
    if (image.cmyk && image.channels == 4) color_space = JCS_CMYK;
    else if (image.channels == 3) color_space = JCS_RGB;
    else if (image.channels == 1) color_space = JCS_GRAYSCALE;
    else throw DecodeError(subject, "unsupported channel count for JPEG");

    jpeg_compress_struct cinfo;
    JpegErrorMgr jerr;
    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_silent_output;
    if (setjmp(jerr.setjmp_buffer)) {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
        throw DecodeError(subject, std::string("JPEG: ") + jerr.message);
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &buffer, &size);
    cinfo.image_width = static_cast<JDIMENSION>(image.width);
    cinfo.image_height = static_cast<JDIMENSION>(image.height);
    cinfo.input_components = image.channels;
    cinfo.in_color_space = color_space;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, kJpegQuality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    const size_t stride = static_cast<size_t>(image.width) * image.channels;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(image.pixels.data() + static_cast<size_t>(cinfo.next_scanline) * stride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);

    std::string out(reinterpret_cast<const char*>(buffer), size);
    jpeg_destroy_compress(&cinfo);
    std::free(buffer);
    return out;
}

// -------------------- WebP --------------------
Image ImageCodec::decode_webp(const std::string& bytes, const std::string& subject) {
    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data, bytes.size(), &features) != VP8_STATUS_OK) {
        throw DecodeError(subject, "WebP: invalid bitstream");
    }
    if (features.has_animation) throw DecodeError(subject, "WebP: animated images are not supported");

    Image out;
    out.format = ImageFormat::Webp;
    out.channels = features.has_alpha ? 4 : 3;
    // 2 = lossless in WebPBitstreamFeatures::format
    out.lossless = features.format == 2;
    if (static_cast<size_t>(features.width) * features.height * out.channels > kMaxPixelBytes) {
        throw DecodeError(subject, "WebP: image too large");
    }

    int width = 0;
    int height = 0;
    uint8_t* rgb = features.has_alpha ? WebPDecodeRGBA(data, bytes.size(), &width, &height)
                                      : WebPDecodeRGB(data, bytes.size(), &width, &height);
    if (!rgb) throw DecodeError(subject, "WebP: decode failed");

    out.width = width;
    out.height = height;
    out.pixels.assign(rgb, rgb + static_cast<size_t>(width) * height * out.channels);
    WebPFree(rgb);
    return out;
}

std::string ImageCodec::encode_webp(const Image& image, const std::string& subject) {
    if (image.channels != 3 && image.channels != 4) {
        throw DecodeError(subject, "WebP: unsupported channel count " + std::to_string(image.channels));
    }
    const int stride = image.width * image.channels;
    const uint8_t* px = image.pixels.data();
    uint8_t* encoded = nullptr;
    size_t size = 0;
    if (image.lossless) {
        size = image.channels == 4
                   ? WebPEncodeLosslessRGBA(px, image.width, image.height, stride, &encoded)
                   : WebPEncodeLosslessRGB(px, image.width, image.height, stride, &encoded);
    } else {
        size = image.channels == 4
                   ? WebPEncodeRGBA(px, image.width, image.height, stride, kWebpQuality, &encoded)
                   : WebPEncodeRGB(px, image.width, image.height, stride, kWebpQuality, &encoded);
    }
    if (size == 0 || !encoded) {
        WebPFree(encoded);
        throw DecodeError(subject, "WebP: encode failed");
    }
    std::string out(reinterpret_cast<const char*>(encoded), size);
    WebPFree(encoded);
    return out;
}
