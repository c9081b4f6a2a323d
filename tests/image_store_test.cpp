#include "batch_downloader.hpp"
#include "image_codec.hpp"
#include "image_store.hpp"
#include "test_support.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

std::string TwoPixelPng() {
    Image img;
    img.width = 2;
    img.height = 1;
    img.channels = 3;
    img.format = ImageFormat::Png;
    img.pixels = {255, 0, 0, 0, 0, 255};
    return ImageCodec::encode(img, "two-pixel");
}

StorageRoots MakeRoots(const fs::path& base) {
    return StorageRoots{(base / "originals").string(), (base / "output").string()};
}

void TestExtensionGuessing() {
    assert(ImageStore::guess_extension("image/jpeg; charset=binary") == std::optional<std::string>(".jpg"));
    assert(ImageStore::guess_extension("IMAGE/PNG") == std::optional<std::string>(".png"));
    assert(!ImageStore::guess_extension("text/html").has_value());
    assert(!ImageStore::guess_extension("").has_value());

    assert(ImageStore::repair_filename("a.JPEG", "image/jpeg") == "a.JPEG");
    assert(ImageStore::repair_filename("a.jpg", "image/jpeg") == "a.jpg");
    assert(ImageStore::repair_filename("a", "image/jpeg") == "a.jpg");
    assert(ImageStore::repair_filename("a.png", "image/webp") == "a.png.webp");
    assert(ImageStore::repair_filename("a", "application/octet-stream") == "a");
}

void TestPngDownloadedAndRotated() {
    auto base = MakeTempDir("png_rotated");
    FakeHttpClient client;
    const std::string body = TwoPixelPng();
    client.add("http://img.org/pic?id=1", 200, body, "image/png");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    Img img = BatchDownloader::make_img(Candidate{"http://page.org/", "http://img.org/pic?id=1"});
    ImgResult r = store.download_and_rotate(img);

    assert(r.ok());
    assert(r.img.status == ImgStatus::Processed);
    assert(r.img.directory == "img.org");
    assert(r.img.filename == "pic--id%3D1.png");
    assert(ReadFile(base / "originals" / "img.org" / "pic--id%3D1.png") == body);

    Image rotated = ImageCodec::decode(ReadFile(base / "output" / "img.org" / "pic--id%3D1.png"), "out");
    assert(rotated.width == 2 && rotated.height == 1 && rotated.channels == 3);
    assert((rotated.pixels == std::vector<uint8_t>{0, 0, 255, 255, 0, 0}));

    // the input record is left untouched
    assert(img.status == ImgStatus::NotProcessed);
    assert(img.filename == "pic--id%3D1");
}

void TestJpegRoundTripKeepsGeometry() {
    auto base = MakeTempDir("jpeg_rotated");
    Image src;
    src.width = 16;
    src.height = 8;
    src.channels = 3;
    src.format = ImageFormat::Jpeg;
    src.pixels.assign(16 * 8 * 3, 128);
    FakeHttpClient client;
    client.add("http://img.org/photo.jpg", 200, ImageCodec::encode(src, "jpeg"), "image/jpeg");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult r = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/photo.jpg"}));
    assert(r.ok());
    assert(r.img.filename == "photo.jpg");
    Image out = ImageCodec::decode(ReadFile(base / "output" / "img.org" / "photo.jpg"), "out");
    assert(out.format == ImageFormat::Jpeg);
    assert(out.width == 16 && out.height == 8);
}

void TestUndecodableStopsAtDownloaded() {
    auto base = MakeTempDir("undecodable");
    FakeHttpClient client;
    client.add("http://img.org/anim.gif", 200, "GIF89a not really", "image/gif");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult r = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/anim.gif"}));
    assert(!r.ok());
    assert(r.error_kind == ErrorKind::Decode);
    assert(r.img.status == ImgStatus::Downloaded);
    assert(fs::exists(base / "originals" / "img.org" / "anim.gif"));
    assert(!fs::exists(base / "output" / "img.org" / "anim.gif"));
}

void TestFetchFailureStopsAtNotProcessed() {
    auto base = MakeTempDir("fetch_failure");
    FakeHttpClient client;
    client.add("http://img.org/gone.png", 404, "not found", "text/html");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult gone = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/gone.png"}));
    assert(gone.error_kind == ErrorKind::Fetch);
    assert(gone.img.status == ImgStatus::NotProcessed);

    ImgResult refused = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://nowhere.org/x.png"}));
    assert(refused.error_kind == ErrorKind::Fetch);
    assert(!fs::exists(base / "originals" / "img.org" / "gone.png"));
}

void TestUnwritableRootIsIoError() {
    auto base = MakeTempDir("unwritable");
    // a regular file where a directory is needed
    std::ofstream(base / "originals") << "x";
    FakeHttpClient client;
    client.add("http://img.org/a.png", 200, TwoPixelPng(), "image/png");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult r = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/a.png"}));
    assert(r.error_kind == ErrorKind::Io);
    assert(r.img.status == ImgStatus::NotProcessed);
}

void TestWebpDownloadedAndRotated() {
    auto base = MakeTempDir("webp_rotated");
    Image src;
    src.width = 2;
    src.height = 1;
    src.channels = 3;
    src.format = ImageFormat::Webp;
    src.lossless = true;
    src.pixels = {255, 0, 0, 0, 0, 255};
    const std::string body = ImageCodec::encode(src, "webp");
    assert(ImageCodec::sniff(body, "webp") == ImageFormat::Webp);

    FakeHttpClient client;
    client.add("http://img.org/pic", 200, body, "image/webp");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult r = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/pic"}));
    assert(r.ok());
    assert(r.img.filename == "pic.webp");
    Image out = ImageCodec::decode(ReadFile(base / "output" / "img.org" / "pic.webp"), "out");
    assert(out.format == ImageFormat::Webp);
    assert(out.lossless);
    assert(out.width == 2 && out.height == 1 && out.channels == 3);
    assert((out.pixels == std::vector<uint8_t>{0, 0, 255, 255, 0, 0}));
}

void TestTruncatedWebpIsDecodeError() {
    auto base = MakeTempDir("webp_truncated");
    FakeHttpClient client;
    client.add("http://img.org/cut.webp", 200, std::string("RIFF\x10\0\0\0WEBPVP8 ", 16), "image/webp");
    ImageStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult r = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/cut.webp"}));
    assert(r.error_kind == ErrorKind::Decode);
    assert(r.img.status == ImgStatus::Downloaded);
}

// Rotation that fails outside the pipeline error hierarchy.
class OverflowingStore : public ImageStore {
public:
    using ImageStore::ImageStore;
    Img rotate(const Img&) const override { throw std::length_error("pixel buffer overflow"); }
};

void TestForeignExceptionKeepsReachedStatus() {
    auto base = MakeTempDir("foreign_exception");
    FakeHttpClient client;
    client.add("http://img.org/a.png", 200, TwoPixelPng(), "image/png");
    OverflowingStore store(client, MakeRoots(base), MakeTestLogger());

    ImgResult r = store.download_and_rotate(BatchDownloader::make_img(Candidate{"p", "http://img.org/a.png"}));
    assert(!r.ok());
    assert(r.error_kind == ErrorKind::Unknown);
    assert(r.error == "pixel buffer overflow");
    assert(r.img.status == ImgStatus::Downloaded);
    assert(r.img.filename == "a.png");
    assert(fs::exists(base / "originals" / "img.org" / "a.png"));
}

} // namespace

int main() {
    TestExtensionGuessing();
    TestPngDownloadedAndRotated();
    TestJpegRoundTripKeepsGeometry();
    TestUndecodableStopsAtDownloaded();
    TestFetchFailureStopsAtNotProcessed();
    TestUnwritableRootIsIoError();
    TestWebpDownloadedAndRotated();
    TestTruncatedWebpIsDecodeError();
    TestForeignExceptionKeepsReachedStatus();
    std::cout << "image_store_test passed" << std::endl;
    return 0;
}
