// aquarium_config.cpp
#include "aquarium_config.hpp"
#include "log.hpp"

#include <algorithm>
#include <filesystem>

namespace {

void readInt(const cv::FileNode& root, const char* key, int& v) {
    const cv::FileNode n = root[key];
    if (!n.empty() && n.isInt()) v = static_cast<int>(n);
}
void readSize(const cv::FileNode& root, const char* key, size_t& v) {
    int tmp = static_cast<int>(v);
    readInt(root, key, tmp);
    v = tmp < 0 ? 0 : static_cast<size_t>(tmp);
}
void readDouble(const cv::FileNode& root, const char* key, double& v) {
    const cv::FileNode n = root[key];
    if (!n.empty() && (n.isReal() || n.isInt())) v = static_cast<double>(n);
}
void readFloat(const cv::FileNode& root, const char* key, float& v) {
    double tmp = v;
    readDouble(root, key, tmp);
    v = static_cast<float>(tmp);
}
void readBool(const cv::FileNode& root, const char* key, bool& v) {
    int tmp = v ? 1 : 0;
    readInt(root, key, tmp);
    v = tmp != 0;
}
void readString(const cv::FileNode& root, const char* key, std::string& v) {
    const cv::FileNode n = root[key];
    if (!n.empty() && n.isString()) v = static_cast<std::string>(n);
}
bool readFloats(const cv::FileNode& n, float* out, size_t count) {
    if (n.empty() || !n.isSeq() || n.size() != count) return false;
    for (size_t i = 0; i < count; ++i) out[i] = static_cast<float>(static_cast<double>(n[static_cast<int>(i)]));
    return true;
}

}

std::vector<SceneSpec> AquariumConfig::defaultScenes() {
    SceneSpec reef;  reef.name = "reef";  reef.color = glm::vec3(0.10f, 0.25f, 0.45f);
    SceneSpec kelp;  kelp.name = "kelp";  kelp.color = glm::vec3(0.08f, 0.30f, 0.25f);
    SceneSpec deep;  deep.name = "deep";  deep.color = glm::vec3(0.03f, 0.05f, 0.15f);
    return {reef, kelp, deep};
}

bool AquariumConfig::load(const std::string& path, AquariumConfig& out, std::string& error) {
    out = AquariumConfig();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        PF_LOG_INFO("config", "no " << path << ", using built-in defaults");
        return true;
    }

    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) {
            error = "cannot open config file " + path;
            return false;
        }
    } catch (const cv::Exception& e) {
        error = "malformed config file " + path + ": " + e.what();
        return false;
    }
    const cv::FileNode r = fs.root();

    readString(r, "photos_dir", out.watcher.photosDir);
    readInt(r, "poll_interval_ms", out.watcher.pollIntervalMs);
    readInt(r, "debounce_ms", out.watcher.debounceMs);
    readSize(r, "event_queue_capacity", out.watcher.eventQueueCapacity);
    readSize(r, "sprite_queue_capacity", out.watcher.spriteQueueCapacity);

    readInt(r, "canonical_width", out.canonical.width);
    readInt(r, "canonical_height", out.canonical.height);
    readFloat(r, "marker_inset_px", out.canonical.markerInsetPx);

    readInt(r, "marker_id_top_left", out.markers.idTopLeft);
    readInt(r, "marker_id_top_right", out.markers.idTopRight);
    readInt(r, "marker_id_bottom_right", out.markers.idBottomRight);
    readInt(r, "marker_id_bottom_left", out.markers.idBottomLeft);
    readDouble(r, "min_quad_area_fraction", out.markers.minQuadAreaFraction);
    readDouble(r, "min_marker_separation_px", out.markers.minMarkerSeparationPx);

    readDouble(r, "red_weight", out.segment.redWeight);
    readDouble(r, "edge_threshold", out.segment.edgeThreshold);
    readDouble(r, "morph_threshold", out.segment.morphThreshold);
    readInt(r, "adaptive_block_size", out.segment.adaptiveBlockSize);
    readDouble(r, "adaptive_c", out.segment.adaptiveC);
    readInt(r, "min_blob_area_px", out.segment.minBlobAreaPx);
    readInt(r, "border_margin_px", out.segment.borderMarginPx);
    readDouble(r, "alpha_blur_sigma", out.segment.alphaBlurSigma);
    readInt(r, "marker_zone_px", out.segment.markerZonePx);
    readInt(r, "marker_padding_px", out.segment.markerPaddingPx);
    readInt(r, "marker_feather_px", out.segment.markerFeatherPx);

    readInt(r, "window_width", out.render.windowWidth);
    readInt(r, "window_height", out.render.windowHeight);
    readString(r, "window_title", out.render.windowTitle);
    readBool(r, "vsync", out.render.vsync);
    readInt(r, "max_ingest_per_frame", out.render.maxIngestPerFrame);

    float b[4];
    if (readFloats(r["swim_bounds"], b, 4)) out.swim.bounds = glm::vec4(b[0], b[1], b[2], b[3]);
    readFloat(r, "min_speed", out.swim.minSpeed);
    readFloat(r, "max_speed", out.swim.maxSpeed);
    readFloat(r, "turn_interval_s", out.swim.turnIntervalS);
    readFloat(r, "max_turn_rad", out.swim.maxTurnRad);
    readFloat(r, "min_entry_s", out.swim.minEntryS);
    readFloat(r, "max_entry_s", out.swim.maxEntryS);
    readFloat(r, "water_resistance", out.swim.waterResistance);
    readFloat(r, "bubble_rate_hz", out.swim.bubbleRateHz);
    readFloat(r, "fish_width", out.swim.fishWidth);

    readBool(r, "simulate_all_scenes", out.simulateAllScenes);
    int seed = static_cast<int>(out.randomSeed);
    readInt(r, "random_seed", seed);
    out.randomSeed = static_cast<unsigned int>(seed);
    readString(r, "log_level", out.logLevel);

    const cv::FileNode scenes = r["scenes"];
    if (!scenes.empty()) {
        if (!scenes.isSeq()) {
            error = "'scenes' must be a sequence";
            return false;
        }
        out.scenes.clear();
        for (cv::FileNodeIterator it = scenes.begin(); it != scenes.end(); ++it) {
            const cv::FileNode s = *it;
            SceneSpec spec;
            readString(s, "name", spec.name);
            readString(s, "background", spec.background);
            float c[3];
            if (readFloats(s["color"], c, 3)) spec.color = glm::vec3(c[0], c[1], c[2]);
            if (spec.name.empty()) spec.name = "scene" + std::to_string(out.scenes.size());
            out.scenes.push_back(spec);
        }
    }
    return true;
}

bool AquariumConfig::validate(std::string& error) const {
    if (watcher.photosDir.empty()) { error = "photos_dir is empty"; return false; }
    if (watcher.pollIntervalMs <= 0 || watcher.debounceMs < 0) {
        error = "poll_interval_ms must be > 0 and debounce_ms >= 0"; return false;
    }
    if (watcher.eventQueueCapacity == 0 || watcher.spriteQueueCapacity == 0) {
        error = "queue capacities must be > 0"; return false;
    }
    if (canonical.width <= 0 || canonical.height <= 0) {
        error = "canonical size must be positive"; return false;
    }
    if (canonical.markerInsetPx < 0.f ||
        2.f * canonical.markerInsetPx >= static_cast<float>(std::min(canonical.width, canonical.height))) {
        error = "marker_inset_px must be below half the canonical frame"; return false;
    }
    const int ids[4] = {markers.idTopLeft, markers.idTopRight, markers.idBottomRight, markers.idBottomLeft};
    for (int i = 0; i < 4; ++i) {
        if (ids[i] < 0 || ids[i] >= 50) { error = "marker ids must be in [0, 50)"; return false; }
        for (int j = i + 1; j < 4; ++j)
            if (ids[i] == ids[j]) { error = "marker ids must be distinct"; return false; }
    }
    if (markers.minQuadAreaFraction < 0.0 || markers.minQuadAreaFraction >= 1.0) {
        error = "min_quad_area_fraction must be in [0, 1)"; return false;
    }
    if (segment.redWeight < 0.0 || segment.redWeight > 1.0) {
        error = "red_weight must be in [0, 1]"; return false;
    }
    if (segment.adaptiveBlockSize < 3 || segment.adaptiveBlockSize % 2 == 0) {
        error = "adaptive_block_size must be odd and >= 3"; return false;
    }
    if (segment.borderMarginPx < 0 || 2 * segment.borderMarginPx >= std::min(canonical.width, canonical.height)) {
        error = "border_margin_px out of range"; return false;
    }
    if (segment.markerZonePx <= 0 || segment.markerPaddingPx < 0 || segment.markerFeatherPx < 0) {
        error = "marker zone sizes must be non-negative"; return false;
    }
    if (render.windowWidth <= 0 || render.windowHeight <= 0) {
        error = "window size must be positive"; return false;
    }
    if (render.maxIngestPerFrame <= 0) { error = "max_ingest_per_frame must be > 0"; return false; }
    if (swim.bounds.x >= swim.bounds.z || swim.bounds.y >= swim.bounds.w) {
        error = "swim_bounds must be [min_x, min_y, max_x, max_y]"; return false;
    }
    if (swim.minSpeed <= 0.f || swim.minSpeed > swim.maxSpeed) {
        error = "speeds must satisfy 0 < min_speed <= max_speed"; return false;
    }
    if (swim.minEntryS < 0.f || swim.minEntryS > swim.maxEntryS) {
        error = "entry durations must satisfy 0 <= min_entry_s <= max_entry_s"; return false;
    }
    if (swim.turnIntervalS <= 0.f || swim.fishWidth <= 0.f) {
        error = "turn_interval_s and fish_width must be > 0"; return false;
    }
    if (scenes.empty()) { error = "at least one scene is required"; return false; }
    LogLevel lvl;
    if (!parseLogLevel(logLevel, lvl)) { error = "unknown log_level " + logLevel; return false; }
    return true;
}
