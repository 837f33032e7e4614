// aquarium_config.hpp
#pragma once
#include <opencv2/core.hpp>
#include <glm/glm.hpp>

#include <string>
#include <vector>

struct WatcherSettings {
    std::string photosDir = "photos";
    int pollIntervalMs = 200;
    int debounceMs = 500;
    size_t eventQueueCapacity = 32;
    size_t spriteQueueCapacity = 16;
};

// Marker ids follow the printed template: each id sits in a fixed corner.
struct MarkerSettings {
    int idTopLeft = 3;
    int idTopRight = 1;
    int idBottomRight = 2;
    int idBottomLeft = 4;
    double minQuadAreaFraction = 0.05;
    double minMarkerSeparationPx = 20.0;
};

// Canonical frame: the four marker centers land on a rectangle inset by
// markerInsetPx from each edge of a canonicalWidth x canonicalHeight image.
struct CanonicalFrame {
    int width = 800;
    int height = 600;
    float markerInsetPx = 55.f;

    cv::Size size() const { return cv::Size(width, height); }
};

struct SegmentSettings {
    double redWeight = 0.6;
    double edgeThreshold = 48.0;
    double morphThreshold = 40.0;
    int adaptiveBlockSize = 25;
    double adaptiveC = 3.0;
    int minBlobAreaPx = 64;
    int borderMarginPx = 6;
    double alphaBlurSigma = 1.5;
    int markerZonePx = 110;
    int markerPaddingPx = 15;
    int markerFeatherPx = 5;
};

struct SwimSettings {
    // min x, min y, max x, max y in world units
    glm::vec4 bounds = glm::vec4(-1.2f, -0.75f, 1.2f, 0.75f);
    float minSpeed = 0.12f;
    float maxSpeed = 0.24f;
    float turnIntervalS = 2.5f;
    float maxTurnRad = 0.6f;
    float minEntryS = 1.0f;
    float maxEntryS = 3.0f;
    float waterResistance = 0.96f;
    float bubbleRateHz = 0.4f;
    float fishWidth = 0.45f;
};

struct SceneSpec {
    std::string name;
    std::string background;  // image path, empty = flat color
    glm::vec3 color = glm::vec3(0.1f, 0.1f, 0.2f);
};

struct RenderSettings {
    int windowWidth = 800;
    int windowHeight = 600;
    std::string windowTitle = "paperfish";
    bool vsync = true;
    int maxIngestPerFrame = 2;
};

struct AquariumConfig {
    WatcherSettings watcher;
    MarkerSettings markers;
    CanonicalFrame canonical;
    SegmentSettings segment;
    SwimSettings swim;
    RenderSettings render;
    std::vector<SceneSpec> scenes = defaultScenes();
    bool simulateAllScenes = false;
    unsigned int randomSeed = 0;
    std::string logLevel = "info";

    static std::vector<SceneSpec> defaultScenes();

    // Missing file: defaults, returns true. Unreadable or malformed: false.
    static bool load(const std::string& path, AquariumConfig& out, std::string& error);

    bool validate(std::string& error) const;
};
