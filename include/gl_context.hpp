// gl_context.hpp
#pragma once
#include "graphics_context.hpp"

#include <vector>

struct GLFWwindow;

// GLFW window with an OpenGL 3.3 core context.
class GlfwGraphicsContext : public GraphicsContext {
public:
    GlfwGraphicsContext() = default;
    ~GlfwGraphicsContext() override;

    bool create(int width, int height, const std::string& title, bool vsync, std::string& error) override;
    void destroy() override;

    TextureId uploadTexture(const cv::Mat& rgba) override;
    void releaseTexture(TextureId texture) override;
    TextureId bubbleTexture() const override { return bubbleTex_; }

    void beginFrame(const glm::vec3& clearColor) override;
    void drawBackground(TextureId texture) override;
    void drawSprite(const SpriteDraw& sprite) override;
    bool present() override;

    void pollKeys(std::vector<KeyEvent>& out) override;

private:
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void framebufferSizeCallback(GLFWwindow* window, int width, int height);
    void buildGeometry();

    GLFWwindow* window_ = nullptr;
    bool glfwReady_ = false;
    int fbWidth_ = 0;
    int fbHeight_ = 0;

    unsigned int progBG_ = 0;
    unsigned int progSprite_ = 0;
    unsigned int vaoBG_ = 0, vboBG_ = 0;
    unsigned int vaoGrid_ = 0, vboGrid_ = 0, eboGrid_ = 0;
    int gridIndexCount_ = 0;
    TextureId bubbleTex_ = 0;

    int uTexBG_ = -1;
    int uTex_ = -1, uP_ = -1, uCenter_ = -1, uSize_ = -1, uTilt_ = -1;
    int uFacing_ = -1, uPhase_ = -1, uTint_ = -1;

    std::vector<TextureId> textures_;
    std::vector<KeyEvent> pendingKeys_;
};
