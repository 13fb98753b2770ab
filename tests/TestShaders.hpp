#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Shader sources shared by the render tests. Written for the headless
// context: one declaration per line.
namespace vu::test
{

inline const std::vector<std::string> BASIC_VERTEX = {
    "layout(location = 0) in vec3 position;",
    "uniform mat4 mvpm;",
    "void main()",
    "{",
    "    gl_Position = mvpm * vec4(position, 1.0);",
    "}",
};

inline const std::vector<std::string> BASIC_FRAGMENT = {
    "uniform float alpha;",
    "out vec4 color;",
    "void main()",
    "{",
    "    color = vec4(1.0, 1.0, 1.0, alpha);",
    "}",
};

inline const std::vector<std::string> TEXTURED_VERTEX = {
    "layout(location = 0) in vec3 position;",
    "layout(location = 1) in vec2 texcoord;",
    "uniform mat4 mvpm;",
    "out vec2 v_uv;",
    "void main()",
    "{",
    "    v_uv = texcoord;",
    "    gl_Position = mvpm * vec4(position, 1.0);",
    "}",
};

inline const std::vector<std::string> TEXTURED_FRAGMENT = {
    "in vec2 v_uv;",
    "uniform sampler2D uv;",
    "uniform vec4 tint;",
    "out vec4 color;",
    "void main()",
    "{",
    "    color = texture(uv, v_uv) * tint;",
    "}",
};

inline const std::vector<std::string> SKINNED_VERTEX = {
    "layout(location = 0) in vec3 position;",
    "layout(location = 3) in float joint;",
    "uniform mat4 mvpm;",
    "uniform mat3x4 bpos[4];",
    "void main()",
    "{",
    "    vec3 p = vec4(position, 1.0) * bpos[int(joint)];",
    "    gl_Position = mvpm * vec4(p, 1.0);",
    "}",
};

inline const std::vector<std::string> PLAIN_FRAGMENT = {
    "out vec4 color;",
    "void main()",
    "{",
    "    color = vec4(1.0);",
    "}",
};

inline std::vector<float> triangleVertices()
{
    return { 0.0f, 0.0f, 0.0f,
             1.0f, 0.0f, 0.0f,
             0.0f, 1.0f, 0.0f };
}

inline std::vector<uint8_t> solidImage(int width, int height, uint8_t value = 255)
{
    return std::vector<uint8_t>(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, value);
}

}
