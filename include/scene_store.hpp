// scene_store.hpp
#pragma once
#include "aquarium_config.hpp"
#include "graphics_context.hpp"
#include "sprite_builder.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

using EntityId = uint64_t;

enum class SwimStage { Entering, Swimming };

struct FishEntity {
    EntityId id = 0;
    FishSpritePtr sprite;
    TextureId texture = 0;
    glm::vec2 size{0.f};
    glm::vec2 position{0.f};
    glm::vec2 velocity{0.f};
    float heading = 0.f;     // radians, 0 = swimming right
    float speed = 0.f;
    float facing = 1.f;      // eases toward the sign of velocity.x
    SwimStage stage = SwimStage::Entering;
    float stageLeft = 0.f;   // seconds left in the entry glide
    float nextTurnIn = 0.f;
    float swimPhase = 0.f;
    double spawnTime = 0.0;
};

struct Bubble {
    glm::vec2 position{0.f};
    float riseSpeed = 0.f;
    float wobble = 0.f;
    float size = 0.f;
};

struct Scene {
    std::string name;
    std::string backgroundPath;
    glm::vec3 color{0.f};
    TextureId backgroundTexture = 0;
    std::vector<FishEntity> fish;
    std::vector<Bubble> bubbles;
    double clock = 0.0;
};

enum class SimulationPolicy { ActiveSceneOnly, AllScenes };

// All fish of all scenes. Fish are only ever added; switching scenes never
// touches the fish of the scene being left.
class SceneStore {
public:
    SceneStore(const std::vector<SceneSpec>& scenes, const SwimSettings& swim,
               SimulationPolicy policy, unsigned int seed = 0);

    // Places a new fish in the active scene at a random spot inside the swim bounds.
    EntityId addSprite(FishSpritePtr sprite, TextureId texture = 0);

    void tick(float dt);

    // direction > 0 next, < 0 previous, wrapping around. Returns the new index.
    size_t switchScene(int direction);

    size_t activeIndex() const { return active_; }
    size_t sceneCount() const { return scenes_.size(); }
    const Scene& activeScene() const { return scenes_[active_]; }
    const Scene& scene(size_t index) const { return scenes_.at(index); }
    Scene& scene(size_t index) { return scenes_.at(index); }
    size_t totalFish() const;

    SimulationPolicy policy() const { return policy_; }
    void setPolicy(SimulationPolicy policy) { policy_ = policy; }
    const SwimSettings& swim() const { return swim_; }

private:
    void tickScene(Scene& scene, float dt);
    void swimFish(FishEntity& fish, float dt);
    void reflect(FishEntity& fish);
    void emitBubbles(Scene& scene, const FishEntity& fish, float dt);
    float uniform(float lo, float hi);

    std::vector<Scene> scenes_;
    SwimSettings swim_;
    SimulationPolicy policy_;
    size_t active_ = 0;
    EntityId nextId_ = 1;
    std::mt19937 rng_;
};
