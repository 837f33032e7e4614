#include "aquarium_config.hpp"
#include "fish_extractor.hpp"
#include "image_decoder.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <chrono>
#include <iostream>
#include <vector>

static const char* cornerName(int c) {
    static const char* names[4] = {"top-left", "top-right", "bottom-right", "bottom-left"};
    return names[c];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: paperfish_scan <photo> [out.png] [config.yml]\n";
        return 2;
    }
    const std::string photoPath = argv[1];
    const std::string outPath = argc > 2 ? argv[2] : "sprite.png";
    const std::string configPath = argc > 3 ? argv[3] : "aquarium.yml";

    AquariumConfig config;
    std::string error;
    if (!AquariumConfig::load(configPath, config, error) || !config.validate(error)) {
        std::cerr << "scan: " << error << "\n";
        return 2;
    }

    cv::Mat photo;
    PhotoDecoder decoder;
    if (!decoder.decode(photoPath, photo)) {
        std::cerr << "scan: " << toString(ScanStatus::DecodeFailed) << ": " << photoPath << "\n";
        return 1;
    }

    FishExtractor extractor(config);
    const auto t0 = std::chrono::steady_clock::now();
    const ExtractionResult result = extractor.extract(photo, photoPath);
    const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    if (markersLocated(result.status)) {
        for (int c = 0; c < 4; ++c)
            std::cout << cornerName(c) << " marker at " << result.markers.centers[c] << "\n";
    }
    if (!result.ok()) {
        std::cerr << "scan: rejected: " << toString(result.status)
                  << (result.detail.empty() ? "" : " (" + result.detail + ")") << "\n";
        return 1;
    }

    cv::Mat bgra;
    cv::cvtColor(result.sprite->rgba, bgra, cv::COLOR_RGBA2BGRA);
    if (!cv::imwrite(outPath, bgra)) {
        std::cerr << "scan: cannot write " << outPath << "\n";
        return 1;
    }
    std::cout << "sprite " << result.sprite->width() << "x" << result.sprite->height()
              << " at " << result.sprite->trim << " written to " << outPath
              << " (" << ms << " ms)\n";
    return 0;
}
