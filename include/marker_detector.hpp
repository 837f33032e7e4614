// marker_detector.hpp
#pragma once
#include "aquarium_config.hpp"
#include "scan_types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

// Finds the four corner markers of the drawing template and maps them to the
// canonical frame.
class MarkerDetector {
public:
    MarkerDetector(const MarkerSettings& settings, const CanonicalFrame& frame);

    ScanStatus detect(const cv::Mat& frameBGR, MarkerSet& markers) const;

    // Homography from the detected marker quadrilateral to the canonical rectangle.
    cv::Matx33d homography(const MarkerSet& markers) const;

    // Where each marker center lands in the canonical frame.
    static MarkerSet canonicalCenters(const CanonicalFrame& frame);

    // Distinct, convex and not self-intersecting, in TL, TR, BR, BL order.
    static bool isValidQuad(const MarkerSet& markers, double minSeparation);

private:
    MarkerSettings settings_;
    CanonicalFrame frame_;
    cv::aruco::ArucoDetector detector_;
};
