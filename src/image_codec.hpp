#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class ImageFormat {
    Jpeg,
    Png,
    Webp
};

// 8-bit interleaved pixels, rows top to bottom.
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;
    ImageFormat format = ImageFormat::Png;
    bool cmyk = false;
    // WebP only: re-encode without loss.
    bool lossless = false;
    std::vector<uint8_t> pixels;
};

class ImageCodec {
public:
    // Format from magic bytes; DecodeError for anything but JPEG, PNG or WebP.
    static ImageFormat sniff(const std::string& bytes, const std::string& subject);

    // subject names the source (path or URL) in error messages.
    static Image decode(const std::string& bytes, const std::string& subject);
    static std::string encode(const Image& image, const std::string& subject);

    static Image rotate_180(const Image& image);

    static constexpr int kJpegQuality = 95;
    static constexpr float kWebpQuality = 95.0f;

private:
    static Image decode_png(const std::string& bytes, const std::string& subject);
    static Image decode_jpeg(const std::string& bytes, const std::string& subject);
    static std::string encode_png(const Image& image, const std::string& subject);
    static std::string encode_jpeg(const Image& image, const std::string& subject);
    static Image decode_webp(const std::string& bytes, const std::string& subject);
    static std::string encode_webp(const Image& image, const std::string& subject);
};
