// scan_types.hpp
#pragma once
#include <opencv2/core.hpp>

#include <array>

enum class ScanStatus {
    Ok,
    DecodeFailed,
    MissingMarkers,
    DegenerateGeometry,
    QuadTooSmall,
    EmptySilhouette,
    PipelineError
};

const char* toString(ScanStatus status);

// True when the status means all four corner markers were found, so
// ExtractionResult::markers holds real centers.
bool markersLocated(ScanStatus status);

enum Corner { TopLeft = 0, TopRight = 1, BottomRight = 2, BottomLeft = 3 };

// Marker centers in image pixels, indexed by Corner.
struct MarkerSet {
    std::array<cv::Point2f, 4> centers;

    const cv::Point2f& operator[](Corner c) const { return centers[c]; }
    cv::Point2f& operator[](Corner c) { return centers[c]; }
};
