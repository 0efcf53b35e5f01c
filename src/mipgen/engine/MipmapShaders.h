/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

namespace mipgen::engine::shaders {

// Two triangles covering clip space. Texture coordinates follow GL's bottom-left origin, which
// matches the row order of every level, so no flip happens between levels.
constexpr const char* kMipmapVertexShader = R"(#version 300 es
out vec2 vTexCoord;

const vec2 kPositions[6] = vec2[6](vec2(-1.0, -1.0),
                                   vec2(1.0, -1.0),
                                   vec2(-1.0, 1.0),
                                   vec2(-1.0, 1.0),
                                   vec2(1.0, -1.0),
                                   vec2(1.0, 1.0));

void main() {
  vec2 position = kPositions[gl_VertexID];
  vTexCoord = position * 0.5 + 0.5;
  gl_Position = vec4(position, 0.0, 1.0);
}
)";

// One bilinear tap in the middle of each 2x2 block of the source level averages the block.
constexpr const char* kMipmapFragmentShader = R"(#version 300 es
precision highp float;

uniform sampler2D uSourceLevel;

in vec2 vTexCoord;
out vec4 fragColor;

void main() {
  fragColor = texture(uSourceLevel, vTexCoord);
}
)";

constexpr const char* kSourceLevelSampler = "uSourceLevel";

} // namespace mipgen::engine::shaders
