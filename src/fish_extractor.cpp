// fish_extractor.cpp
#include "fish_extractor.hpp"

#include <opencv2/imgproc.hpp>

#include <exception>

FishExtractor::FishExtractor(const AquariumConfig& config)
: frame_(config.canonical),
  detector_(config.markers, config.canonical),
  segmenter_(config.segment, config.canonical) {}

cv::Mat FishExtractor::warpToCanonical(const cv::Mat& photoBGR, const MarkerSet& markers) const {
    cv::Mat canonical;
    cv::warpPerspective(photoBGR, canonical, detector_.homography(markers), frame_.size(),
                        cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(255, 255, 255));
    return canonical;
}

ExtractionResult FishExtractor::extract(const cv::Mat& photoBGR, const std::string& sourcePath,
                                        int64_t sourceMtime) const {
    ExtractionResult result;
    if (photoBGR.empty()) {
        result.status = ScanStatus::DecodeFailed;
        return result;
    }
    try {
        cv::Mat bgr = photoBGR;
        if (bgr.channels() == 4) cv::cvtColor(photoBGR, bgr, cv::COLOR_BGRA2BGR);
        else if (bgr.channels() == 1) cv::cvtColor(photoBGR, bgr, cv::COLOR_GRAY2BGR);

        result.status = detector_.detect(bgr, result.markers);
        if (result.status != ScanStatus::Ok) return result;

        const cv::Mat canonical = warpToCanonical(bgr, result.markers);
        const cv::Mat alpha = segmenter_.alphaMask(canonical);
        result.sprite = builder_.build(canonical, alpha, sourcePath, sourceMtime);
        result.status = result.sprite ? ScanStatus::Ok : ScanStatus::EmptySilhouette;
    } catch (const cv::Exception& e) {
        result.status = ScanStatus::PipelineError;
        result.sprite.reset();
        result.detail = e.what();
    } catch (const std::exception& e) {
        result.status = ScanStatus::PipelineError;
        result.sprite.reset();
        result.detail = e.what();
    }
    return result;
}
