// image_decoder.cpp
#include "image_decoder.hpp"
#include "log.hpp"

#include <libheif/heif.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>

namespace {

struct HeifContextDeleter {
    void operator()(heif_context* ctx) const { heif_context_free(ctx); }
};
struct HeifHandleDeleter {
    void operator()(heif_image_handle* handle) const { heif_image_handle_release(handle); }
};
struct HeifImageDeleter {
    void operator()(heif_image* image) const { heif_image_release(image); }
};

// Loads the codec plugins once; libheif before 1.13 initializes itself.
bool initHeif() {
#if LIBHEIF_NUMERIC_VERSION >= 0x010d0000
    const heif_error err = heif_init(nullptr);
    if (err.code != heif_error_Ok) {
        PF_LOG_ERROR("decode", "libheif init failed: " << (err.message ? err.message : "?"));
        return false;
    }
#endif
    return true;
}

bool heifFailed(const heif_error& err, const std::string& path, const char* step) {
    if (err.code == heif_error_Ok) return false;
    PF_LOG_DEBUG("decode", step << " failed for " << path << ": " << (err.message ? err.message : "?"));
    return true;
}

}

bool OpenCvImageDecoder::decode(const std::string& path, cv::Mat& bgr) const {
    cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
    if (img.empty()) return false;
    if (img.depth() != CV_8U) img.convertTo(img, CV_8U, 1.0 / 256.0);
    bgr = img;
    return true;
}

bool HeifImageDecoder::decode(const std::string& path, cv::Mat& bgr) const {
    static const bool ready = initHeif();
    if (!ready) return false;

    std::unique_ptr<heif_context, HeifContextDeleter> ctx(heif_context_alloc());
    if (!ctx) return false;
    if (heifFailed(heif_context_read_from_file(ctx.get(), path.c_str(), nullptr), path, "read")) return false;

    heif_image_handle* rawHandle = nullptr;
    if (heifFailed(heif_context_get_primary_image_handle(ctx.get(), &rawHandle), path, "primary image"))
        return false;
    std::unique_ptr<heif_image_handle, HeifHandleDeleter> handle(rawHandle);

    heif_image* rawImage = nullptr;
    if (heifFailed(heif_decode_image(handle.get(), &rawImage, heif_colorspace_RGB,
                                     heif_chroma_interleaved_RGB, nullptr), path, "decode"))
        return false;
    std::unique_ptr<heif_image, HeifImageDeleter> image(rawImage);

    const int width = heif_image_get_width(image.get(), heif_channel_interleaved);
    const int height = heif_image_get_height(image.get(), heif_channel_interleaved);
    int stride = 0;
    const uint8_t* data = heif_image_get_plane_readonly(image.get(), heif_channel_interleaved, &stride);
    if (!data || width <= 0 || height <= 0) return false;

    // wraps libheif's plane; cvtColor copies it out before the image is released
    const cv::Mat rgb(height, width, CV_8UC3, const_cast<uint8_t*>(data), static_cast<size_t>(stride));
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    return true;
}

bool PhotoDecoder::isHeif(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".heic" || ext == ".heif";
}

bool PhotoDecoder::decode(const std::string& path, cv::Mat& bgr) const {
    return isHeif(path) ? heif_.decode(path, bgr) : opencv_.decode(path, bgr);
}
