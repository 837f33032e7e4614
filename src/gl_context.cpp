// gl_context.cpp
#define GL_GLEXT_PROTOTYPES
#include <GL/glcorearb.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "gl_context.hpp"
#include "log.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace {

const int kGridCells = 5;

GLuint makeShader(GLenum type, const char* src) {
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, nullptr);
    glCompileShader(s);
    GLint ok = 0; glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) { char log[1024]; glGetShaderInfoLog(s, 1024, nullptr, log); PF_LOG_ERROR("gl", "shader: " << log); }
    return s;
}

GLuint makeProgram(const char* vs, const char* fs, std::string& error) {
    GLuint v = makeShader(GL_VERTEX_SHADER, vs);
    GLuint f = makeShader(GL_FRAGMENT_SHADER, fs);
    GLuint p = glCreateProgram();
    glBindAttribLocation(p, 0, "aPos");
    glBindAttribLocation(p, 1, "aUV");
    glAttachShader(p, v); glAttachShader(p, f);
    glLinkProgram(p);
    glDeleteShader(v); glDeleteShader(f);
    GLint ok = 0; glGetProgramiv(p, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[1024]; glGetProgramInfoLog(p, 1024, nullptr, log);
        error = std::string("shader link failed: ") + log;
        glDeleteProgram(p);
        return 0;
    }
    return p;
}

const char* VS_BG = R"(
#version 330 core
in vec2 aPos;
in vec2 aUV;
out vec2 vUV;
void main(){ vUV=aUV; gl_Position=vec4(aPos,0.0,1.0); }
)";
const char* FS_BG = R"(
#version 330 core
in vec2 vUV;
out vec4 fragColor;
uniform sampler2D uTex;
void main(){ fragColor = texture(uTex, vUV); }
)";

// Grid vertices span [-0.5,0.5]; the head is at +x. The tail half waves more
// than the head, scaled by how far the vertex is from the head.
const char* VS_SPRITE = R"(
#version 330 core
in vec2 aPos;
in vec2 aUV;
uniform mat4 uP;
uniform vec2 uCenter;
uniform vec2 uSize;
uniform float uTilt;
uniform float uFacing;
uniform float uPhase;
out vec2 vUV;
void main(){
    vec2 v = aPos;
    if (uPhase != 0.0) {
        float strength = 0.5 - v.x;
        float wave = sin(v.x * 20.0 + uPhase) * 0.055 * strength;
        v.y += wave;
        v.x += wave * 0.25;
    }
    v *= uSize;
    v.x *= uFacing;
    float c = cos(uTilt), s = sin(uTilt);
    v = vec2(c * v.x - s * v.y, s * v.x + c * v.y);
    vUV = aUV;
    gl_Position = uP * vec4(v + uCenter, 0.0, 1.0);
}
)";
const char* FS_SPRITE = R"(
#version 330 core
in vec2 vUV;
out vec4 fragColor;
uniform sampler2D uTex;
uniform vec4 uTint;
void main(){
    vec4 c = texture(uTex, vUV) * uTint;
    if (c.a < 0.01) discard;
    fragColor = c;
}
)";

cv::Mat makeBubbleImage(int size) {
    cv::Mat img(size, size, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    const cv::Point c(size / 2, size / 2);
    const int r = size / 2 - 2;
    cv::circle(img, c, r, cv::Scalar(200, 230, 255, 70), cv::FILLED, cv::LINE_AA);
    cv::circle(img, c, r, cv::Scalar(230, 245, 255, 220), std::max(1, size / 16), cv::LINE_AA);
    cv::circle(img, cv::Point(size / 3, size / 3), size / 10, cv::Scalar(255, 255, 255, 240), cv::FILLED, cv::LINE_AA);
    return img;
}

}

GlfwGraphicsContext::~GlfwGraphicsContext() {
    destroy();
}

bool GlfwGraphicsContext::create(int width, int height, const std::string& title, bool vsync, std::string& error) {
    if (!glfwInit()) { error = "glfwInit failed"; return false; }
    glfwReady_ = true;
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
    glfwWindowHint(GLFW_CONTEXT_ROBUSTNESS, GLFW_LOSE_CONTEXT_ON_RESET);

    window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window_) {
        error = "cannot create a " + std::to_string(width) + "x" + std::to_string(height) + " OpenGL 3.3 window";
        destroy();
        return false;
    }
    glfwMakeContextCurrent(window_);
    glfwSwapInterval(vsync ? 1 : 0);
    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_, keyCallback);
    glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);
    glfwGetFramebufferSize(window_, &fbWidth_, &fbHeight_);
    glViewport(0, 0, fbWidth_, fbHeight_);

    progBG_ = makeProgram(VS_BG, FS_BG, error);
    progSprite_ = progBG_ ? makeProgram(VS_SPRITE, FS_SPRITE, error) : 0;
    if (!progBG_ || !progSprite_) {
        destroy();
        return false;
    }
    uTexBG_  = glGetUniformLocation(progBG_, "uTex");
    uTex_    = glGetUniformLocation(progSprite_, "uTex");
    uP_      = glGetUniformLocation(progSprite_, "uP");
    uCenter_ = glGetUniformLocation(progSprite_, "uCenter");
    uSize_   = glGetUniformLocation(progSprite_, "uSize");
    uTilt_   = glGetUniformLocation(progSprite_, "uTilt");
    uFacing_ = glGetUniformLocation(progSprite_, "uFacing");
    uPhase_  = glGetUniformLocation(progSprite_, "uPhase");
    uTint_   = glGetUniformLocation(progSprite_, "uTint");

    buildGeometry();
    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    bubbleTex_ = uploadTexture(makeBubbleImage(64));
    if (!bubbleTex_) {
        error = "cannot upload bubble texture";
        destroy();
        return false;
    }
    const GLubyte* version = glGetString(GL_VERSION);
    PF_LOG_INFO("gl", "context ready: " << (version ? reinterpret_cast<const char*>(version) : "?")
                << ", framebuffer " << fbWidth_ << "x" << fbHeight_);
    return true;
}

void GlfwGraphicsContext::buildGeometry() {
    const float quad[] = { -1.f,-1.f,0.f,1.f,  1.f,-1.f,1.f,1.f,  -1.f, 1.f,0.f,0.f,  1.f, 1.f,1.f,0.f };
    glGenVertexArrays(1, &vaoBG_);
    glGenBuffers(1, &vboBG_);
    glBindVertexArray(vaoBG_);
    glBindBuffer(GL_ARRAY_BUFFER, vboBG_);
    glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);

    // subdivided quad so the tail wave bends the sprite
    std::vector<float> verts;
    std::vector<unsigned int> idx;
    const int n = kGridCells;
    for (int j = 0; j <= n; ++j) {
        for (int i = 0; i <= n; ++i) {
            const float u = float(i) / n, v = float(j) / n;
            verts.push_back(u - 0.5f);
            verts.push_back(0.5f - v);
            verts.push_back(u);
            verts.push_back(v);
        }
    }
    for (int j = 0; j < n; ++j) {
        for (int i = 0; i < n; ++i) {
            const unsigned int a = j * (n + 1) + i, b = a + 1, c = a + (n + 1), d = c + 1;
            idx.insert(idx.end(), {a, c, b, b, c, d});
        }
    }
    gridIndexCount_ = static_cast<int>(idx.size());
    glGenVertexArrays(1, &vaoGrid_);
    glGenBuffers(1, &vboGrid_);
    glGenBuffers(1, &eboGrid_);
    glBindVertexArray(vaoGrid_);
    glBindBuffer(GL_ARRAY_BUFFER, vboGrid_);
    glBufferData(GL_ARRAY_BUFFER, verts.size() * sizeof(float), verts.data(), GL_STATIC_DRAW);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, eboGrid_);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, idx.size() * sizeof(unsigned int), idx.data(), GL_STATIC_DRAW);
    glBindVertexArray(0);
}

void GlfwGraphicsContext::destroy() {
    if (window_) {
        glfwMakeContextCurrent(window_);
        if (!textures_.empty()) glDeleteTextures(static_cast<GLsizei>(textures_.size()), textures_.data());
        textures_.clear();
        bubbleTex_ = 0;
        if (vaoBG_) glDeleteVertexArrays(1, &vaoBG_);
        if (vboBG_) glDeleteBuffers(1, &vboBG_);
        if (vaoGrid_) glDeleteVertexArrays(1, &vaoGrid_);
        if (vboGrid_) glDeleteBuffers(1, &vboGrid_);
        if (eboGrid_) glDeleteBuffers(1, &eboGrid_);
        if (progBG_) glDeleteProgram(progBG_);
        if (progSprite_) glDeleteProgram(progSprite_);
        vaoBG_ = vboBG_ = vaoGrid_ = vboGrid_ = eboGrid_ = progBG_ = progSprite_ = 0;
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (glfwReady_) {
        glfwTerminate();
        glfwReady_ = false;
    }
}

TextureId GlfwGraphicsContext::uploadTexture(const cv::Mat& rgba) {
    if (!window_ || rgba.empty() || rgba.type() != CV_8UC4) return 0;
    const cv::Mat pixels = rgba.isContinuous() ? rgba : rgba.clone();
    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, pixels.cols, pixels.rows, 0, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data);
    if (glGetError() != GL_NO_ERROR) {
        glDeleteTextures(1, &tex);
        return 0;
    }
    textures_.push_back(tex);
    return tex;
}

void GlfwGraphicsContext::releaseTexture(TextureId texture) {
    auto it = std::find(textures_.begin(), textures_.end(), texture);
    if (it == textures_.end()) return;
    GLuint tex = texture;
    glDeleteTextures(1, &tex);
    textures_.erase(it);
}

void GlfwGraphicsContext::beginFrame(const glm::vec3& clearColor) {
    glViewport(0, 0, fbWidth_, fbHeight_);
    glClearColor(clearColor.r, clearColor.g, clearColor.b, 1.f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void GlfwGraphicsContext::drawBackground(TextureId texture) {
    if (!texture) return;
    glUseProgram(progBG_);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture);
    glUniform1i(uTexBG_, 0);
    glBindVertexArray(vaoBG_);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    glBindVertexArray(0);
}

void GlfwGraphicsContext::drawSprite(const SpriteDraw& sprite) {
    if (!sprite.texture) return;
    const float aspect = fbHeight_ > 0 ? float(fbWidth_) / float(fbHeight_) : 1.f;
    const glm::mat4 P = glm::ortho(-aspect, aspect, -1.f, 1.f, -1.f, 1.f);

    glUseProgram(progSprite_);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, sprite.texture);
    glUniform1i(uTex_, 0);
    glUniformMatrix4fv(uP_, 1, GL_FALSE, glm::value_ptr(P));
    glUniform2f(uCenter_, sprite.center.x, sprite.center.y);
    glUniform2f(uSize_, sprite.size.x, sprite.size.y);
    glUniform1f(uTilt_, sprite.tilt);
    glUniform1f(uFacing_, sprite.facing);
    glUniform1f(uPhase_, sprite.swimPhase);
    glUniform4f(uTint_, sprite.tint.r, sprite.tint.g, sprite.tint.b, sprite.tint.a);
    glBindVertexArray(vaoGrid_);
    glDrawElements(GL_TRIANGLES, gridIndexCount_, GL_UNSIGNED_INT, 0);
    glBindVertexArray(0);
}

bool GlfwGraphicsContext::present() {
    if (!window_) return false;
    glfwSwapBuffers(window_);
    for (GLenum err = glGetError(); err != GL_NO_ERROR; err = glGetError()) {
        if (err == GL_CONTEXT_LOST || err == GL_OUT_OF_MEMORY) {
            PF_LOG_ERROR("gl", "fatal GL error 0x" << std::hex << err);
            return false;
        }
        PF_LOG_WARN("gl", "GL error 0x" << std::hex << err);
    }
    return true;
}

void GlfwGraphicsContext::pollKeys(std::vector<KeyEvent>& out) {
    if (!window_) return;
    glfwPollEvents();
    out.insert(out.end(), pendingKeys_.begin(), pendingKeys_.end());
    pendingKeys_.clear();
    if (glfwWindowShouldClose(window_)) out.push_back(KeyEvent::Close);
}

void GlfwGraphicsContext::keyCallback(GLFWwindow* window, int key, int, int action, int) {
    auto* self = static_cast<GlfwGraphicsContext*>(glfwGetWindowUserPointer(window));
    if (!self || action != GLFW_PRESS) return;
    if (key == GLFW_KEY_LEFT) self->pendingKeys_.push_back(KeyEvent::Left);
    if (key == GLFW_KEY_RIGHT) self->pendingKeys_.push_back(KeyEvent::Right);
    if (key == GLFW_KEY_ESCAPE) self->pendingKeys_.push_back(KeyEvent::Escape);
}

void GlfwGraphicsContext::framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    auto* self = static_cast<GlfwGraphicsContext*>(glfwGetWindowUserPointer(window));
    if (!self) return;
    self->fbWidth_ = width;
    self->fbHeight_ = height;
}
