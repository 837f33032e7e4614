// segmenter.hpp
#pragma once
#include "aquarium_config.hpp"

#include <opencv2/core.hpp>

struct SegmentStages {
    cv::Mat gray;        // CV_8U, red-weighted
    cv::Mat edges;       // CV_8U 0/255, gradient magnitude
    cv::Mat strokes;     // CV_8U 0/255, morphological gradient
    cv::Mat foreground;  // CV_8U 0/255, after border flood fill
    cv::Mat keep;        // CV_32F, marker suppression weights
};

// Builds the alpha mask of a drawing from the canonical-frame image.
class Segmenter {
public:
    Segmenter(const SegmentSettings& settings, const CanonicalFrame& frame);

    // canonicalBGR must have the canonical frame size. Returns CV_32F in [0,1].
    cv::Mat alphaMask(const cv::Mat& canonicalBGR, SegmentStages* stages = nullptr) const;

    // Grayscale with red at redWeight and the rest split between green and
    // blue in their luminance proportion.
    static cv::Mat inkGray(const cv::Mat& bgr, double redWeight);

    // 0 inside each marker zone, 1 away from markers, Gaussian falloff between.
    cv::Mat markerKeepMask() const;

private:
    SegmentSettings settings_;
    CanonicalFrame frame_;
    cv::Mat keep_;
};
