// fish_extractor.hpp
#pragma once
#include "aquarium_config.hpp"
#include "marker_detector.hpp"
#include "segmenter.hpp"
#include "sprite_builder.hpp"

#include <string>

struct ExtractionResult {
    ScanStatus status = ScanStatus::PipelineError;
    MarkerSet markers;
    FishSpritePtr sprite;
    std::string detail;

    bool ok() const { return status == ScanStatus::Ok && sprite != nullptr; }
};

// Photo -> markers -> canonical warp -> alpha mask -> sprite.
class FishExtractor {
public:
    explicit FishExtractor(const AquariumConfig& config);

    ExtractionResult extract(const cv::Mat& photoBGR, const std::string& sourcePath = std::string(),
                             int64_t sourceMtime = 0) const;

    // Perspective-corrected copy of the photo in the canonical frame.
    cv::Mat warpToCanonical(const cv::Mat& photoBGR, const MarkerSet& markers) const;

    const MarkerDetector& detector() const { return detector_; }
    const Segmenter& segmenter() const { return segmenter_; }

private:
    CanonicalFrame frame_;
    MarkerDetector detector_;
    Segmenter segmenter_;
    SpriteBuilder builder_;
};
