// scene_store.cpp
#include "scene_store.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
const float kPi = 3.14159265358979f;
const float kMaxPitch = 0.7f;      // steepest swim angle off the horizontal
const float kFlipRate = 4.f;       // facing units per second
const float kEdgeNudge = 0.01f;
const float kStepsPerSecond = 60.f;

float wrapAngle(float a) {
    while (a > kPi) a -= 2.f * kPi;
    while (a < -kPi) a += 2.f * kPi;
    return a;
}

// Keeps the heading within kMaxPitch of the horizontal it is closest to.
float limitPitch(float heading) {
    heading = wrapAngle(heading);
    if (std::fabs(heading) <= kPi * 0.5f)
        return std::clamp(heading, -kMaxPitch, kMaxPitch);
    const float base = heading > 0.f ? kPi : -kPi;
    const float off = std::clamp(heading - base, -kMaxPitch, kMaxPitch);
    return wrapAngle(base + off);
}
}

SceneStore::SceneStore(const std::vector<SceneSpec>& scenes, const SwimSettings& swim,
                       SimulationPolicy policy, unsigned int seed)
: swim_(swim), policy_(policy), rng_(seed ? seed : std::random_device{}()) {
    if (scenes.empty()) throw std::invalid_argument("SceneStore needs at least one scene");
    for (const SceneSpec& spec : scenes) {
        Scene s;
        s.name = spec.name;
        s.backgroundPath = spec.background;
        s.color = spec.color;
        scenes_.push_back(s);
    }
}

float SceneStore::uniform(float lo, float hi) {
    if (hi <= lo) return lo;
    std::uniform_real_distribution<float> dist(lo, hi);
    return dist(rng_);
}

EntityId SceneStore::addSprite(FishSpritePtr sprite, TextureId texture) {
    if (!sprite) throw std::invalid_argument("addSprite: null sprite");
    Scene& scene = scenes_[active_];
    const glm::vec4& b = swim_.bounds;

    FishEntity fish;
    fish.id = nextId_++;
    fish.sprite = std::move(sprite);
    fish.texture = texture;
    fish.size = glm::vec2(swim_.fishWidth, swim_.fishWidth / fish.sprite->aspect());
    fish.position = glm::vec2(uniform(b.x, b.z), uniform(b.y, b.w));
    fish.speed = uniform(swim_.minSpeed, swim_.maxSpeed);

    const bool left = uniform(0.f, 1.f) < 0.5f;
    fish.heading = limitPitch((left ? kPi : 0.f) + uniform(-kMaxPitch, kMaxPitch));
    fish.velocity = fish.speed * glm::vec2(std::cos(fish.heading), std::sin(fish.heading));
    fish.facing = left ? -1.f : 1.f;
    fish.stage = SwimStage::Entering;
    fish.stageLeft = uniform(swim_.minEntryS, swim_.maxEntryS);
    fish.nextTurnIn = swim_.turnIntervalS * uniform(0.5f, 1.5f);
    fish.swimPhase = uniform(0.f, 2.f * kPi);
    fish.spawnTime = scene.clock;

    scene.fish.push_back(fish);
    return fish.id;
}

size_t SceneStore::switchScene(int direction) {
    const size_t n = scenes_.size();
    if (direction > 0) active_ = (active_ + 1) % n;
    else if (direction < 0) active_ = (active_ + n - 1) % n;
    return active_;
}

size_t SceneStore::totalFish() const {
    size_t n = 0;
    for (const Scene& s : scenes_) n += s.fish.size();
    return n;
}

void SceneStore::tick(float dt) {
    if (dt <= 0.f) return;
    if (policy_ == SimulationPolicy::AllScenes) {
        for (Scene& s : scenes_) tickScene(s, dt);
    } else {
        tickScene(scenes_[active_], dt);
    }
}

void SceneStore::tickScene(Scene& scene, float dt) {
    scene.clock += dt;
    for (FishEntity& fish : scene.fish) {
        swimFish(fish, dt);
        emitBubbles(scene, fish, dt);
    }

    const float top = swim_.bounds.w + 0.5f;
    for (Bubble& bubble : scene.bubbles) {
        bubble.wobble += dt * 3.f;
        bubble.position.y += bubble.riseSpeed * dt;
        bubble.position.x += std::sin(bubble.wobble) * 0.03f * dt;
    }
    scene.bubbles.erase(std::remove_if(scene.bubbles.begin(), scene.bubbles.end(),
                                       [top](const Bubble& b) { return b.position.y > top; }),
                        scene.bubbles.end());
}

void SceneStore::swimFish(FishEntity& fish, float dt) {
    if (fish.stage == SwimStage::Entering) {
        // glide in while the vertical drift dies down
        fish.velocity.y *= std::pow(swim_.waterResistance, dt * kStepsPerSecond);
        fish.stageLeft -= dt;
        if (fish.stageLeft <= 0.f) {
            fish.stage = SwimStage::Swimming;
            fish.heading = limitPitch(std::atan2(fish.velocity.y, fish.velocity.x));
            fish.velocity = fish.speed * glm::vec2(std::cos(fish.heading), std::sin(fish.heading));
        }
    } else {
        fish.nextTurnIn -= dt;
        if (fish.nextTurnIn <= 0.f) {
            fish.heading = limitPitch(fish.heading + uniform(-swim_.maxTurnRad, swim_.maxTurnRad));
            fish.velocity = fish.speed * glm::vec2(std::cos(fish.heading), std::sin(fish.heading));
            fish.nextTurnIn = swim_.turnIntervalS * uniform(0.5f, 1.5f);
        }
    }

    fish.position += fish.velocity * dt;
    reflect(fish);

    const float target = fish.velocity.x >= 0.f ? 1.f : -1.f;
    const float step = kFlipRate * dt;
    if (fish.facing < target) fish.facing = std::min(target, fish.facing + step);
    else fish.facing = std::max(target, fish.facing - step);

    fish.swimPhase += dt * (2.f + 10.f * fish.speed);
}

void SceneStore::reflect(FishEntity& fish) {
    const glm::vec4& b = swim_.bounds;
    bool bounced = false;
    if (fish.position.x > b.z) {
        fish.position.x = b.z - kEdgeNudge;
        fish.velocity.x = -std::fabs(fish.velocity.x);
        bounced = true;
    } else if (fish.position.x < b.x) {
        fish.position.x = b.x + kEdgeNudge;
        fish.velocity.x = std::fabs(fish.velocity.x);
        bounced = true;
    }
    if (fish.position.y > b.w) {
        fish.position.y = b.w - kEdgeNudge;
        fish.velocity.y = -std::fabs(fish.velocity.y);
        bounced = true;
    } else if (fish.position.y < b.y) {
        fish.position.y = b.y + kEdgeNudge;
        fish.velocity.y = std::fabs(fish.velocity.y);
        bounced = true;
    }
    if (bounced) fish.heading = std::atan2(fish.velocity.y, fish.velocity.x);
}

void SceneStore::emitBubbles(Scene& scene, const FishEntity& fish, float dt) {
    if (swim_.bubbleRateHz <= 0.f || uniform(0.f, 1.f) >= swim_.bubbleRateHz * dt) return;
    Bubble bubble;
    bubble.position = fish.position + glm::vec2(fish.facing * fish.size.x * 0.45f, fish.size.y * 0.1f);
    bubble.riseSpeed = uniform(0.12f, 0.25f);
    bubble.wobble = uniform(0.f, 2.f * kPi);
    bubble.size = uniform(0.02f, 0.045f);
    scene.bubbles.push_back(bubble);
}
