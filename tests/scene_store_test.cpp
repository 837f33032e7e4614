#include "scene_store.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>

namespace {

FishSpritePtr makeSprite(int w = 40, int h = 20) {
    auto s = std::make_shared<FishSprite>();
    s->rgba = cv::Mat(h, w, CV_8UC4, cv::Scalar(200, 50, 50, 255));
    s->canonicalSize = cv::Size(800, 600);
    s->trim = cv::Rect(0, 0, w, h);
    return s;
}

std::vector<SceneSpec> threeScenes() {
    return AquariumConfig::defaultScenes();
}

bool inside(const glm::vec2& p, const glm::vec4& b) {
    return p.x >= b.x && p.x <= b.z && p.y >= b.y && p.y <= b.w;
}

}

TEST(SceneStore, RequiresScenes) {
    EXPECT_THROW(SceneStore({}, SwimSettings(), SimulationPolicy::ActiveSceneOnly, 1), std::invalid_argument);
}

TEST(SceneStore, SwitchingWrapsBothWays) {
    SceneStore store(threeScenes(), SwimSettings(), SimulationPolicy::ActiveSceneOnly, 1);
    ASSERT_EQ(store.sceneCount(), 3u);
    EXPECT_EQ(store.activeIndex(), 0u);
    EXPECT_EQ(store.switchScene(-1), 2u);
    EXPECT_EQ(store.activeScene().name, "deep");
    EXPECT_EQ(store.switchScene(+1), 0u);
    EXPECT_EQ(store.switchScene(+1), 1u);
    EXPECT_EQ(store.switchScene(+1), 2u);
    EXPECT_EQ(store.switchScene(+1), 0u);
    EXPECT_EQ(store.switchScene(0), 0u);
}

TEST(SceneStore, SingleSceneSwitchIsNoOp) {
    SceneStore store({SceneSpec()}, SwimSettings(), SimulationPolicy::ActiveSceneOnly, 1);
    EXPECT_EQ(store.switchScene(+1), 0u);
    EXPECT_EQ(store.switchScene(-1), 0u);
}

TEST(SceneStore, FishOnlyAccumulate) {
    SceneStore store(threeScenes(), SwimSettings(), SimulationPolicy::ActiveSceneOnly, 7);
    const EntityId a = store.addSprite(makeSprite(), 11);
    const EntityId b = store.addSprite(makeSprite(), 12);
    EXPECT_NE(a, b);
    store.switchScene(+1);
    store.addSprite(makeSprite(), 13);

    EXPECT_EQ(store.scene(0).fish.size(), 2u);
    EXPECT_EQ(store.scene(1).fish.size(), 1u);
    EXPECT_EQ(store.totalFish(), 3u);

    for (int i = 0; i < 600; ++i) store.tick(1.f / 60.f);
    store.switchScene(-1);
    store.switchScene(-1);
    EXPECT_EQ(store.totalFish(), 3u);
    EXPECT_EQ(store.scene(0).fish[1].texture, 12u);
    EXPECT_THROW(store.addSprite(nullptr), std::invalid_argument);
    EXPECT_EQ(store.totalFish(), 3u);
}

TEST(SceneStore, NewFishStartInsideBoundsAndEntering) {
    SwimSettings swim;
    SceneStore store(threeScenes(), swim, SimulationPolicy::ActiveSceneOnly, 3);
    for (int i = 0; i < 50; ++i) store.addSprite(makeSprite(60, 30));
    for (const FishEntity& f : store.activeScene().fish) {
        EXPECT_TRUE(inside(f.position, swim.bounds));
        EXPECT_EQ(f.stage, SwimStage::Entering);
        EXPECT_GE(f.stageLeft, swim.minEntryS);
        EXPECT_LE(f.stageLeft, swim.maxEntryS);
        EXPECT_GE(f.speed, swim.minSpeed);
        EXPECT_LE(f.speed, swim.maxSpeed);
        EXPECT_FLOAT_EQ(f.size.x, swim.fishWidth);
        EXPECT_FLOAT_EQ(f.size.y, swim.fishWidth / 2.f);
        EXPECT_NE(f.sprite, nullptr);
    }
}

TEST(SceneStore, FishStayInBoundsAndStartSwimming) {
    SwimSettings swim;
    swim.bubbleRateHz = 2.f;
    SceneStore store(threeScenes(), swim, SimulationPolicy::ActiveSceneOnly, 5);
    for (int i = 0; i < 20; ++i) store.addSprite(makeSprite());

    const float dt = 1.f / 60.f;
    for (int frame = 0; frame < 60 * 20; ++frame) {
        store.tick(dt);
        for (const FishEntity& f : store.activeScene().fish) {
            ASSERT_TRUE(inside(f.position, swim.bounds)) << "frame " << frame;
            ASSERT_LE(std::fabs(f.facing), 1.f);
        }
    }
    for (const FishEntity& f : store.activeScene().fish) {
        EXPECT_EQ(f.stage, SwimStage::Swimming);
        EXPECT_NEAR(glm::length(f.velocity), f.speed, 1e-3f);
    }
    EXPECT_GT(store.activeScene().clock, 19.0);
    EXPECT_FALSE(store.activeScene().bubbles.empty());
    for (const Bubble& b : store.activeScene().bubbles) EXPECT_LE(b.position.y, swim.bounds.w + 0.5f);
}

TEST(SceneStore, ReflectsAtTheWall) {
    SwimSettings swim;
    swim.bubbleRateHz = 0.f;
    SceneStore store(threeScenes(), swim, SimulationPolicy::ActiveSceneOnly, 9);
    store.addSprite(makeSprite());
    FishEntity& fish = store.scene(0).fish[0];
    fish.stage = SwimStage::Swimming;
    fish.nextTurnIn = 100.f;
    fish.position = glm::vec2(swim.bounds.z + 0.3f, 0.f);
    fish.velocity = glm::vec2(0.2f, 0.f);

    store.tick(0.01f);
    EXPECT_LE(fish.position.x, swim.bounds.z);
    EXPECT_LT(fish.velocity.x, 0.f);
    EXPECT_NEAR(std::fabs(fish.heading), 3.14159f, 1e-3f);

    fish.position = glm::vec2(0.f, swim.bounds.y - 0.2f);
    fish.velocity = glm::vec2(0.1f, -0.1f);
    store.tick(0.01f);
    EXPECT_GE(fish.position.y, swim.bounds.y);
    EXPECT_GT(fish.velocity.y, 0.f);
}

TEST(SceneStore, FacingEasesTowardTravelDirection) {
    SwimSettings swim;
    swim.bubbleRateHz = 0.f;
    SceneStore store(threeScenes(), swim, SimulationPolicy::ActiveSceneOnly, 2);
    store.addSprite(makeSprite());
    FishEntity& fish = store.scene(0).fish[0];
    fish.stage = SwimStage::Swimming;
    fish.nextTurnIn = 100.f;
    fish.position = glm::vec2(0.f);
    fish.velocity = glm::vec2(-0.15f, 0.f);
    fish.facing = 1.f;

    store.tick(0.1f);
    EXPECT_GT(fish.facing, -1.f);
    EXPECT_LT(fish.facing, 1.f);
    for (int i = 0; i < 10; ++i) store.tick(0.1f);
    EXPECT_FLOAT_EQ(fish.facing, -1.f);
}

TEST(SceneStore, ActivePolicyFreezesHiddenScenes) {
    SceneStore store(threeScenes(), SwimSettings(), SimulationPolicy::ActiveSceneOnly, 4);
    store.addSprite(makeSprite());
    const glm::vec2 before = store.scene(0).fish[0].position;
    store.switchScene(+1);
    for (int i = 0; i < 30; ++i) store.tick(1.f / 30.f);
    EXPECT_EQ(store.scene(0).fish[0].position, before);
    EXPECT_DOUBLE_EQ(store.scene(0).clock, 0.0);
    EXPECT_GT(store.scene(1).clock, 0.9);

    store.setPolicy(SimulationPolicy::AllScenes);
    for (int i = 0; i < 30; ++i) store.tick(1.f / 30.f);
    EXPECT_NE(store.scene(0).fish[0].position, before);
    EXPECT_GT(store.scene(2).clock, 0.9);
}

TEST(SceneStore, NonPositiveStepDoesNothing) {
    SceneStore store(threeScenes(), SwimSettings(), SimulationPolicy::AllScenes, 6);
    store.addSprite(makeSprite());
    const glm::vec2 before = store.activeScene().fish[0].position;
    store.tick(0.f);
    store.tick(-1.f);
    EXPECT_EQ(store.activeScene().fish[0].position, before);
}
