// image_decoder.hpp
#pragma once
#include <opencv2/core.hpp>

#include <string>

// Turns a photo file into 8-bit BGR pixels.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    virtual bool decode(const std::string& path, cv::Mat& bgr) const = 0;
};

// JPEG and PNG through imgcodecs.
class OpenCvImageDecoder : public ImageDecoder {
public:
    bool decode(const std::string& path, cv::Mat& bgr) const override;
};

// HEIC/HEIF through libheif, primary image only.
class HeifImageDecoder : public ImageDecoder {
public:
    bool decode(const std::string& path, cv::Mat& bgr) const override;
};

// Picks the decoder by file extension: .heic/.heif go to libheif, the rest to OpenCV.
class PhotoDecoder : public ImageDecoder {
public:
    bool decode(const std::string& path, cv::Mat& bgr) const override;

    static bool isHeif(const std::string& path);

private:
    OpenCvImageDecoder opencv_;
    HeifImageDecoder heif_;
};
