// aquarium_loop.cpp
#include "aquarium_loop.hpp"
#include "log.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

namespace {
const float kMaxFrameDt = 0.1f;
const float kMaxTilt = 0.5f;

bool loadRGBA(const std::string& path, cv::Mat& rgba) {
    cv::Mat img = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (img.empty()) return false;
    if (img.depth() != CV_8U) img.convertTo(img, CV_8U, 1.0 / 256.0);
    switch (img.channels()) {
        case 1: cv::cvtColor(img, rgba, cv::COLOR_GRAY2RGBA); break;
        case 3: cv::cvtColor(img, rgba, cv::COLOR_BGR2RGBA); break;
        case 4: cv::cvtColor(img, rgba, cv::COLOR_BGRA2RGBA); break;
        default: return false;
    }
    return true;
}
}

const char* toString(LoopState state) {
    switch (state) {
        case LoopState::Initializing: return "initializing";
        case LoopState::Running:      return "running";
        case LoopState::ShuttingDown: return "shutting-down";
        case LoopState::Terminated:   return "terminated";
    }
    return "?";
}

AquariumLoop::AquariumLoop(const AquariumConfig& config, GraphicsContext& context, IngestService& ingest)
: config_(config), ctx_(context), ingest_(ingest),
  store_(config.scenes, config.swim,
         config.simulateAllScenes ? SimulationPolicy::AllScenes : SimulationPolicy::ActiveSceneOnly,
         config.randomSeed) {}

AquariumLoop::~AquariumLoop() {
    shutdown();
}

void AquariumLoop::fail(int code, const std::string& why) {
    PF_LOG_ERROR("loop", why);
    app_.exitCode = code;
    app_.running = false;
    app_.state = LoopState::ShuttingDown;
}

bool AquariumLoop::initialize() {
    if (app_.state != LoopState::Initializing) return app_.state == LoopState::Running;

    std::string error;
    const RenderSettings& rs = config_.render;
    if (!ctx_.create(rs.windowWidth, rs.windowHeight, rs.windowTitle, rs.vsync, error)) {
        fail(ExitInitFailed, "graphics context: " + error);
        shutdown();
        return false;
    }

    for (size_t i = 0; i < store_.sceneCount(); ++i) {
        Scene& scene = store_.scene(i);
        if (scene.backgroundPath.empty()) continue;
        cv::Mat rgba;
        if (!loadRGBA(scene.backgroundPath, rgba)) {
            fail(ExitInitFailed, "cannot read background " + scene.backgroundPath + " of scene " + scene.name);
            shutdown();
            return false;
        }
        scene.backgroundTexture = ctx_.uploadTexture(rgba);
        if (!scene.backgroundTexture) {
            fail(ExitInitFailed, "cannot upload background of scene " + scene.name);
            shutdown();
            return false;
        }
    }

    if (!ingest_.start(error)) {
        fail(ExitInitFailed, error);
        shutdown();
        return false;
    }

    app_.state = LoopState::Running;
    app_.running = true;
    PF_LOG_INFO("loop", "running with " << store_.sceneCount() << " scenes, active '"
                << store_.activeScene().name << "'");
    return true;
}

size_t AquariumLoop::ingestCompleted() {
    incoming_.clear();
    ingest_.drainCompleted(static_cast<size_t>(config_.render.maxIngestPerFrame), incoming_);
    size_t added = 0;
    for (FishSpritePtr& sprite : incoming_) {
        // texture first: a fish only exists once it can be drawn
        const TextureId tex = ctx_.uploadTexture(sprite->rgba);
        if (!tex) {
            PF_LOG_WARN("loop", "texture upload failed for " << sprite->sourcePath);
            continue;
        }
        const EntityId id = store_.addSprite(std::move(sprite), tex);
        ++added;
        PF_LOG_INFO("loop", "fish #" << id << " joined '" << store_.activeScene().name << "' ("
                    << store_.activeScene().fish.size() << " there)");
    }
    ingested_ += added;
    return added;
}

void AquariumLoop::handleKeys() {
    keys_.clear();
    ctx_.pollKeys(keys_);
    for (KeyEvent key : keys_) {
        switch (key) {
            case KeyEvent::Left:
                store_.switchScene(-1);
                PF_LOG_INFO("loop", "scene '" << store_.activeScene().name << "'");
                break;
            case KeyEvent::Right:
                store_.switchScene(+1);
                PF_LOG_INFO("loop", "scene '" << store_.activeScene().name << "'");
                break;
            case KeyEvent::Escape:
            case KeyEvent::Close:
                app_.running = false;
                app_.state = LoopState::ShuttingDown;
                app_.exitCode = ExitOk;
                return;
        }
    }
}

void AquariumLoop::draw() {
    const Scene& scene = store_.activeScene();
    ctx_.beginFrame(scene.color);
    ctx_.drawBackground(scene.backgroundTexture);

    for (const FishEntity& fish : scene.fish) {
        SpriteDraw d;
        d.texture = fish.texture;
        d.center = fish.position;
        d.size = fish.size;
        d.facing = fish.facing;
        d.swimPhase = fish.swimPhase;
        float tilt = std::atan2(fish.velocity.y, std::fabs(fish.velocity.x));
        tilt = std::clamp(tilt, -kMaxTilt, kMaxTilt);
        d.tilt = fish.facing < 0.f ? -tilt : tilt;
        ctx_.drawSprite(d);
    }

    const TextureId bubble = ctx_.bubbleTexture();
    for (const Bubble& b : scene.bubbles) {
        SpriteDraw d;
        d.texture = bubble;
        d.center = b.position;
        d.size = glm::vec2(b.size);
        ctx_.drawSprite(d);
    }
}

bool AquariumLoop::frame(float dt) {
    if (app_.state != LoopState::Running) return false;
    try {
        ingestCompleted();
        store_.tick(dt);
        handleKeys();
        if (app_.state != LoopState::Running) return false;
        draw();
        if (!ctx_.present()) {
            fail(ExitRuntimeFailed, "graphics context lost");
            return false;
        }
    } catch (const std::exception& e) {
        fail(ExitRuntimeFailed, std::string("frame failed: ") + e.what());
        return false;
    }
    ++app_.frame;
    app_.elapsed += dt;
    return true;
}

void AquariumLoop::shutdown() {
    if (app_.state == LoopState::Terminated) return;
    app_.state = LoopState::ShuttingDown;
    app_.running = false;

    ingest_.stop();
    for (size_t i = 0; i < store_.sceneCount(); ++i) {
        Scene& scene = store_.scene(i);
        if (scene.backgroundTexture) ctx_.releaseTexture(scene.backgroundTexture);
        scene.backgroundTexture = 0;
        for (FishEntity& fish : scene.fish) {
            if (fish.texture) ctx_.releaseTexture(fish.texture);
            fish.texture = 0;
        }
    }
    ctx_.destroy();
    app_.state = LoopState::Terminated;
    PF_LOG_INFO("loop", "terminated after " << app_.frame << " frames, " << store_.totalFish()
                << " fish, exit code " << app_.exitCode);
}

int AquariumLoop::run() {
    if (!initialize()) return app_.exitCode;

    auto last = std::chrono::steady_clock::now();
    while (app_.state == LoopState::Running) {
        const auto now = std::chrono::steady_clock::now();
        float dt = std::chrono::duration<float>(now - last).count();
        last = now;
        frame(std::min(dt, kMaxFrameDt));
    }
    shutdown();
    return app_.exitCode;
}
