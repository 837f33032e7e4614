// marker_detector.cpp
#include "marker_detector.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <vector>

bool markersLocated(ScanStatus status) {
    switch (status) {
        case ScanStatus::Ok:
        case ScanStatus::DegenerateGeometry:
        case ScanStatus::QuadTooSmall:
        case ScanStatus::EmptySilhouette:
            return true;
        default:
            return false;
    }
}

const char* toString(ScanStatus status) {
    switch (status) {
        case ScanStatus::Ok:                 return "ok";
        case ScanStatus::DecodeFailed:       return "image could not be decoded";
        case ScanStatus::MissingMarkers:     return "fewer than four corner markers found";
        case ScanStatus::DegenerateGeometry: return "marker quadrilateral is degenerate";
        case ScanStatus::QuadTooSmall:       return "marker quadrilateral is too small";
        case ScanStatus::EmptySilhouette:    return "no drawing found inside the template";
        case ScanStatus::PipelineError:      return "image processing error";
    }
    return "?";
}

namespace {

cv::aruco::DetectorParameters makeParams() {
    cv::aruco::DetectorParameters p;
    p.cornerRefinementMethod = cv::aruco::CORNER_REFINE_SUBPIX;
    return p;
}

// Center of a marker as the intersection of its diagonals.
cv::Point2f markerCenter(const std::vector<cv::Point2f>& c) {
    const cv::Point2f d1 = c[2] - c[0];
    const cv::Point2f d2 = c[3] - c[1];
    const float denom = d1.x * d2.y - d1.y * d2.x;
    if (std::fabs(denom) < 1e-6f) return (c[0] + c[1] + c[2] + c[3]) * 0.25f;
    const cv::Point2f w = c[1] - c[0];
    const float t = (w.x * d2.y - w.y * d2.x) / denom;
    return c[0] + d1 * t;
}

}

MarkerDetector::MarkerDetector(const MarkerSettings& settings, const CanonicalFrame& frame)
: settings_(settings), frame_(frame),
  detector_(cv::aruco::getPredefinedDictionary(cv::aruco::DICT_4X4_50), makeParams()) {}

ScanStatus MarkerDetector::detect(const cv::Mat& frameBGR, MarkerSet& markers) const {
    if (frameBGR.empty()) return ScanStatus::DecodeFailed;

    cv::Mat gray;
    if (frameBGR.channels() == 1) gray = frameBGR;
    else cv::cvtColor(frameBGR, gray, frameBGR.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);

    std::vector<std::vector<cv::Point2f>> corners, rejected;
    std::vector<int> ids;
    detector_.detectMarkers(gray, corners, ids, rejected);

    const int wanted[4] = {settings_.idTopLeft, settings_.idTopRight,
                           settings_.idBottomRight, settings_.idBottomLeft};
    bool found[4] = {false, false, false, false};
    for (size_t i = 0; i < ids.size(); ++i) {
        for (int c = 0; c < 4; ++c) {
            // first hit wins if a marker id is printed twice
            if (ids[i] == wanted[c] && !found[c]) {
                markers.centers[c] = markerCenter(corners[i]);
                found[c] = true;
            }
        }
    }
    for (bool f : found)
        if (!f) return ScanStatus::MissingMarkers;

    if (!isValidQuad(markers, settings_.minMarkerSeparationPx)) return ScanStatus::DegenerateGeometry;

    std::vector<cv::Point2f> quad(markers.centers.begin(), markers.centers.end());
    const double area = cv::contourArea(quad);
    const double imageArea = static_cast<double>(frameBGR.cols) * frameBGR.rows;
    if (area < settings_.minQuadAreaFraction * imageArea) return ScanStatus::QuadTooSmall;

    return ScanStatus::Ok;
}

bool MarkerDetector::isValidQuad(const MarkerSet& m, double minSeparation) {
    for (int i = 0; i < 4; ++i)
        for (int j = i + 1; j < 4; ++j)
            if (cv::norm(m.centers[i] - m.centers[j]) < minSeparation) return false;

    const std::vector<cv::Point2f> quad(m.centers.begin(), m.centers.end());
    if (!cv::isContourConvex(quad)) return false;
    // Image y points down, so TL -> TR -> BR -> BL has positive oriented area.
    return cv::contourArea(quad, true) > 1.0;
}

MarkerSet MarkerDetector::canonicalCenters(const CanonicalFrame& frame) {
    const float m = frame.markerInsetPx;
    const float w = static_cast<float>(frame.width);
    const float h = static_cast<float>(frame.height);
    MarkerSet c;
    c[TopLeft]     = cv::Point2f(m, m);
    c[TopRight]    = cv::Point2f(w - m, m);
    c[BottomRight] = cv::Point2f(w - m, h - m);
    c[BottomLeft]  = cv::Point2f(m, h - m);
    return c;
}

cv::Matx33d MarkerDetector::homography(const MarkerSet& markers) const {
    const MarkerSet dst = canonicalCenters(frame_);
    cv::Mat H = cv::getPerspectiveTransform(markers.centers.data(), dst.centers.data());
    return cv::Matx33d(H);
}
