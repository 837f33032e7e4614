// segmenter.cpp
#include "segmenter.hpp"
#include "marker_detector.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace {

void removeSmallBlobs(cv::Mat& mask, int minArea) {
    if (minArea <= 1) return;
    cv::Mat labels, stats, centroids;
    const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);
    std::vector<uchar> keep(static_cast<size_t>(n), 0);
    for (int i = 1; i < n; ++i) keep[i] = stats.at<int>(i, cv::CC_STAT_AREA) >= minArea ? 255 : 0;
    for (int y = 0; y < mask.rows; ++y) {
        const int* l = labels.ptr<int>(y);
        uchar* m = mask.ptr<uchar>(y);
        for (int x = 0; x < mask.cols; ++x) m[x] = keep[l[x]];
    }
}

cv::Rect zoneRect(const cv::Point2f& c, int half) {
    return cv::Rect(cvRound(c.x) - half, cvRound(c.y) - half, 2 * half, 2 * half);
}

}

Segmenter::Segmenter(const SegmentSettings& settings, const CanonicalFrame& frame)
: settings_(settings), frame_(frame) {
    keep_ = markerKeepMask();
}

cv::Mat Segmenter::inkGray(const cv::Mat& bgr, double redWeight) {
    const double rest = 1.0 - redWeight;
    const double g = rest * 0.587 / (0.587 + 0.299);
    const double b = rest * 0.299 / (0.587 + 0.299);
    cv::Mat gray;
    cv::transform(bgr, gray, cv::Matx13f(static_cast<float>(b), static_cast<float>(g),
                                         static_cast<float>(redWeight)));
    return gray;
}

cv::Mat Segmenter::markerKeepMask() const {
    const cv::Size size = frame_.size();
    const cv::Rect bounds(cv::Point(0, 0), size);
    const int half = settings_.markerZonePx / 2 + settings_.markerPaddingPx;
    const int feather = settings_.markerFeatherPx;
    const MarkerSet centers = MarkerDetector::canonicalCenters(frame_);

    cv::Mat keep(size, CV_32F, cv::Scalar(1.f));
    for (const cv::Point2f& c : centers.centers)
        keep(zoneRect(c, half + feather) & bounds).setTo(0.f);

    if (feather > 0) {
        const int k = 2 * feather + 1;
        cv::GaussianBlur(keep, keep, cv::Size(k, k), feather / 2.0);
    }
    // the blur leaks a little into the zone; the zone itself stays fully transparent
    for (const cv::Point2f& c : centers.centers)
        keep(zoneRect(c, half) & bounds).setTo(0.f);
    return keep;
}

cv::Mat Segmenter::alphaMask(const cv::Mat& canonicalBGR, SegmentStages* stages) const {
    CV_Assert(canonicalBGR.type() == CV_8UC3 && canonicalBGR.size() == frame_.size());

    cv::Mat gray = inkGray(canonicalBGR, settings_.redWeight);
    cv::Mat smooth;
    cv::GaussianBlur(gray, smooth, cv::Size(5, 5), 0);

    // 1. gradient magnitude edges
    cv::Mat dx, dy, mag, edges;
    cv::Sobel(smooth, dx, CV_32F, 1, 0, 3);
    cv::Sobel(smooth, dy, CV_32F, 0, 1, 3);
    cv::magnitude(dx, dy, mag);
    cv::threshold(mag, edges, settings_.edgeThreshold, 255, cv::THRESH_BINARY);
    edges.convertTo(edges, CV_8U);

    // 2. thin strokes: morphological gradient plus local darkness
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
    cv::Mat grad, strokes, ink;
    cv::morphologyEx(smooth, grad, cv::MORPH_GRADIENT, kernel);
    cv::threshold(grad, strokes, settings_.morphThreshold, 255, cv::THRESH_BINARY);
    cv::adaptiveThreshold(smooth, ink, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV,
                          settings_.adaptiveBlockSize, settings_.adaptiveC);

    cv::Mat outline = edges | strokes | ink;
    cv::morphologyEx(outline, outline, cv::MORPH_CLOSE, kernel);
    // paper edges and warp seams along the frame border are not ink
    const int m = settings_.borderMarginPx;
    if (m > 0) {
        outline.rowRange(0, m).setTo(0);
        outline.rowRange(outline.rows - m, outline.rows).setTo(0);
        outline.colRange(0, m).setTo(0);
        outline.colRange(outline.cols - m, outline.cols).setTo(0);
    }
    removeSmallBlobs(outline, settings_.minBlobAreaPx);

    // 3. everything the border can reach without crossing an outline is paper
    cv::Mat padded;
    cv::copyMakeBorder(outline, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    cv::floodFill(padded, cv::Point(0, 0), cv::Scalar(128), nullptr, cv::Scalar(0), cv::Scalar(0), 8);
    cv::Mat foreground = padded(cv::Rect(1, 1, outline.cols, outline.rows)) != 128;

    cv::Mat alpha;
    foreground.convertTo(alpha, CV_32F, 1.0 / 255.0);
    if (settings_.alphaBlurSigma > 0.0) cv::GaussianBlur(alpha, alpha, cv::Size(0, 0), settings_.alphaBlurSigma);

    // 4. marker suppression
    alpha = alpha.mul(keep_);
    cv::min(alpha, 1.0, alpha);
    cv::max(alpha, 0.0, alpha);

    if (stages) {
        stages->gray = gray;
        stages->edges = edges;
        stages->strokes = strokes;
        stages->foreground = foreground;
        stages->keep = keep_;
    }
    return alpha;
}
