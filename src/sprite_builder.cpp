// sprite_builder.cpp
#include "sprite_builder.hpp"

#include <opencv2/imgproc.hpp>

#include <vector>

FishSpritePtr SpriteBuilder::build(const cv::Mat& canonicalBGR, const cv::Mat& alpha,
                                   const std::string& sourcePath, int64_t sourceMtime) const {
    CV_Assert(canonicalBGR.type() == CV_8UC3 && alpha.type() == CV_32F);
    CV_Assert(canonicalBGR.size() == alpha.size());

    cv::Mat alpha8;
    alpha.convertTo(alpha8, CV_8U, 255.0);
    if (cv::countNonZero(alpha8) == 0) return nullptr;

    std::vector<cv::Point> nz;
    cv::findNonZero(alpha8, nz);
    cv::Rect box = cv::boundingRect(nz);
    box.x -= trimMarginPx_;
    box.y -= trimMarginPx_;
    box.width += 2 * trimMarginPx_;
    box.height += 2 * trimMarginPx_;
    box &= cv::Rect(cv::Point(0, 0), alpha8.size());

    cv::Mat rgb;
    cv::cvtColor(canonicalBGR(box), rgb, cv::COLOR_BGR2RGB);
    std::vector<cv::Mat> planes;
    cv::split(rgb, planes);
    cv::Mat a = alpha8(box).clone();
    // fully transparent texels carry no color so filtering does not bleed paper in
    const cv::Mat clear = a == 0;
    for (cv::Mat& p : planes) p.setTo(0, clear);
    planes.push_back(a);

    auto sprite = std::make_shared<FishSprite>();
    cv::merge(planes, sprite->rgba);
    sprite->canonicalSize = alpha8.size();
    sprite->trim = box;
    sprite->sourcePath = sourcePath;
    sprite->sourceMtime = sourceMtime;
    return sprite;
}
