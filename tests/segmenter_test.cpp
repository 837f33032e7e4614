#include "segmenter.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace testing_support;

namespace {

class SegmenterTest : public ::testing::Test {
protected:
    AquariumConfig cfg;
    Segmenter segmenter{cfg.segment, cfg.canonical};

    cv::Mat paper() const { return cv::Mat(cfg.canonical.size(), CV_8UC3, cv::Scalar(255, 255, 255)); }
};

}

TEST_F(SegmenterTest, InkGrayWeightsRed) {
    cv::Mat px(1, 3, CV_8UC3);
    px.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 255);
    px.at<cv::Vec3b>(0, 1) = cv::Vec3b(255, 255, 255);
    px.at<cv::Vec3b>(0, 2) = cv::Vec3b(255, 0, 0);
    const cv::Mat g = Segmenter::inkGray(px, 0.6);
    ASSERT_EQ(g.type(), CV_8UC1);
    EXPECT_NEAR(g.at<uchar>(0, 0), 153, 1);
    EXPECT_NEAR(g.at<uchar>(0, 1), 255, 1);
    EXPECT_NEAR(g.at<uchar>(0, 2), 34, 1);
}

TEST_F(SegmenterTest, BlankPaperIsTransparent) {
    SegmentStages stages;
    const cv::Mat alpha = segmenter.alphaMask(paper(), &stages);
    ASSERT_EQ(alpha.type(), CV_32F);
    ASSERT_EQ(alpha.size(), cfg.canonical.size());
    double maxVal = 0.0;
    cv::minMaxLoc(alpha, nullptr, &maxVal);
    EXPECT_LT(maxVal, 1e-3);
    EXPECT_EQ(cv::countNonZero(stages.foreground), 0);
}

TEST_F(SegmenterTest, OutlineIsFilled) {
    cv::Mat img = paper();
    const cv::Point center = inkCenter(cfg.canonical);
    cv::circle(img, center, 100, kRedInk, 4, cv::LINE_AA);

    SegmentStages stages;
    const cv::Mat alpha = segmenter.alphaMask(img, &stages);
    EXPECT_GT(alpha.at<float>(center), 0.99f);
    EXPECT_GT(alpha.at<float>(center + cv::Point(60, 0)), 0.99f);
    EXPECT_GT(alpha.at<float>(center + cv::Point(100, 0)), 0.5f);
    EXPECT_LT(alpha.at<float>(center + cv::Point(140, 0)), 1e-3f);
    EXPECT_LT(alpha.at<float>(cv::Point(400, 20)), 1e-3f);
    EXPECT_EQ(stages.foreground.at<uchar>(center), 255);
    EXPECT_GT(stages.gray.at<uchar>(center), 250);
}

TEST_F(SegmenterTest, MarkerZonesAreSuppressed) {
    const cv::Mat keep = segmenter.markerKeepMask();
    const MarkerSet centers = MarkerDetector::canonicalCenters(cfg.canonical);
    const int half = cfg.segment.markerZonePx / 2 + cfg.segment.markerPaddingPx;
    for (const cv::Point2f& c : centers.centers) {
        const int inward = c.x < cfg.canonical.width / 2 ? half - 1 : -(half - 1);
        EXPECT_FLOAT_EQ(keep.at<float>(cv::Point(c)), 0.f);
        EXPECT_FLOAT_EQ(keep.at<float>(cv::Point(c) + cv::Point(inward, 0)), 0.f);
    }
    EXPECT_NEAR(keep.at<float>(inkCenter(cfg.canonical)), 1.f, 1e-4);

    // graded between the zone and the open paper
    const cv::Point tl(centers[TopLeft]);
    const float edge = keep.at<float>(tl + cv::Point(half + cfg.segment.markerFeatherPx + 1, 0));
    const float far = keep.at<float>(tl + cv::Point(half + 4 * cfg.segment.markerFeatherPx, 0));
    EXPECT_GT(edge, 0.f);
    EXPECT_LE(edge, far);
    EXPECT_NEAR(far, 1.f, 1e-4);
}

TEST_F(SegmenterTest, InkOverMarkerZoneStaysTransparent) {
    cv::Mat img = paper();
    const MarkerSet centers = MarkerDetector::canonicalCenters(cfg.canonical);
    cv::circle(img, cv::Point(centers[TopLeft]), 30, kRedInk, cv::FILLED);
    const cv::Mat alpha = segmenter.alphaMask(img);
    EXPECT_FLOAT_EQ(alpha.at<float>(cv::Point(centers[TopLeft])), 0.f);
}
