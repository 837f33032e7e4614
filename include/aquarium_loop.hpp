// aquarium_loop.hpp
#pragma once
#include "aquarium_config.hpp"
#include "graphics_context.hpp"
#include "ingest_service.hpp"
#include "scene_store.hpp"

#include <cstdint>
#include <string>

enum class LoopState { Initializing, Running, ShuttingDown, Terminated };

const char* toString(LoopState state);

enum ExitCode { ExitOk = 0, ExitInitFailed = 1, ExitRuntimeFailed = 2 };

// Process-wide state of the aquarium, owned by the loop and changed only by it.
struct ApplicationState {
    LoopState state = LoopState::Initializing;
    bool running = false;
    int exitCode = ExitOk;
    uint64_t frame = 0;
    double elapsed = 0.0;
};

// Render thread side: owns the frame clock, the scene store and every GPU
// texture. Finished sprites come in from the ingest service at most
// maxIngestPerFrame at a time.
class AquariumLoop {
public:
    AquariumLoop(const AquariumConfig& config, GraphicsContext& context, IngestService& ingest);
    ~AquariumLoop();

    AquariumLoop(const AquariumLoop&) = delete;
    AquariumLoop& operator=(const AquariumLoop&) = delete;

    // Initializing -> Running, or Terminated with ExitInitFailed.
    bool initialize();
    // One Running frame. False once the loop has left Running.
    bool frame(float dt);
    // ShuttingDown -> Terminated. Safe to call more than once.
    void shutdown();
    // Whole lifecycle on the wall clock; returns the process exit code.
    int run();

    const ApplicationState& appState() const { return app_; }
    LoopState state() const { return app_.state; }
    int exitCode() const { return app_.exitCode; }
    const SceneStore& store() const { return store_; }
    size_t ingestedTotal() const { return ingested_; }

private:
    size_t ingestCompleted();
    void handleKeys();
    void draw();
    void fail(int code, const std::string& why);

    AquariumConfig config_;
    GraphicsContext& ctx_;
    IngestService& ingest_;
    SceneStore store_;
    ApplicationState app_;
    size_t ingested_ = 0;
    std::vector<FishSpritePtr> incoming_;
    std::vector<KeyEvent> keys_;
};
