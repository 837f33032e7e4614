// sprite_builder.hpp
#pragma once
#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <string>

// One extracted drawing, immutable once built.
struct FishSprite {
    cv::Mat rgba;              // CV_8UC4, trimmed to the silhouette
    cv::Size canonicalSize;    // frame the sprite was cut from
    cv::Rect trim;             // rgba's placement inside the canonical frame
    std::string sourcePath;
    int64_t sourceMtime = 0;

    int width() const { return rgba.cols; }
    int height() const { return rgba.rows; }
    float aspect() const { return rgba.rows > 0 ? static_cast<float>(rgba.cols) / rgba.rows : 1.f; }
};

using FishSpritePtr = std::shared_ptr<const FishSprite>;

class SpriteBuilder {
public:
    explicit SpriteBuilder(int trimMarginPx = 2) : trimMarginPx_(trimMarginPx) {}

    // nullptr when the alpha mask is empty. Inputs are not modified.
    FishSpritePtr build(const cv::Mat& canonicalBGR, const cv::Mat& alpha,
                        const std::string& sourcePath, int64_t sourceMtime) const;

private:
    int trimMarginPx_;
};
