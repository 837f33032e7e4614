// graphics_context.hpp
#pragma once
#include <opencv2/core.hpp>
#include <glm/glm.hpp>

#include <string>
#include <vector>

using TextureId = unsigned int;

enum class KeyEvent { Left, Right, Escape, Close };

// One textured quad in world space. Size is the unflipped width/height; the
// sign of facing mirrors it horizontally.
struct SpriteDraw {
    TextureId texture = 0;
    glm::vec2 center{0.f};
    glm::vec2 size{1.f};
    float tilt = 0.f;        // radians, counter-clockwise
    float facing = 1.f;      // -1..1
    float swimPhase = 0.f;   // drives the tail wave, 0 disables it
    glm::vec4 tint{1.f};
};

// What the aquarium needs from a window system and GPU. The render loop only
// talks to this interface, so it can run headless in tests.
class GraphicsContext {
public:
    virtual ~GraphicsContext() = default;

    virtual bool create(int width, int height, const std::string& title, bool vsync, std::string& error) = 0;
    virtual void destroy() = 0;

    // RGBA8 pixels, top row first. Returns 0 on failure.
    virtual TextureId uploadTexture(const cv::Mat& rgba) = 0;
    virtual void releaseTexture(TextureId texture) = 0;
    // Built-in bubble sprite, valid after create().
    virtual TextureId bubbleTexture() const = 0;

    virtual void beginFrame(const glm::vec3& clearColor) = 0;
    virtual void drawBackground(TextureId texture) = 0;
    virtual void drawSprite(const SpriteDraw& sprite) = 0;
    // False when the context is gone and rendering cannot continue.
    virtual bool present() = 0;

    virtual void pollKeys(std::vector<KeyEvent>& out) = 0;
};
