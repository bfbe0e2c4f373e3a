#pragma once

#include "dr_shim.hpp"
#include "vertex_types.hpp"

namespace pentacube
{

// clang-format off
inline constexpr FlatVertex pentagon_vertices[]{
    {{-0.0868241f, 0.49240386f}, {0.9f, 0.2f, 0.3f}, 0.0f},
    {{-0.49513406f, 0.06958647f}, {0.9f, 0.7f, 0.1f}, 0.0f},
    {{-0.21918549f, -0.44939706f}, {0.2f, 0.8f, 0.3f}, 0.0f},
    {{0.35966998f, -0.3473291f}, {0.1f, 0.5f, 0.9f}, 0.0f},
    {{0.44147372f, 0.2347359f}, {0.6f, 0.2f, 0.8f}, 0.0f},
};
// clang-format on

inline constexpr u16 pentagon_indices[]{0, 1, 4, 1, 2, 4, 2, 3, 4};

/// Unit box centered at the origin. Each face has its own 4 vertices so that it can carry the full
/// [0, 1] texture range.
// clang-format off
inline constexpr MeshVertex box_vertices[]{
    // +x
    {{0.5f, -0.5f, 0.5f}, {0.0f, 1.0f}},
    {{0.5f, -0.5f, -0.5f}, {1.0f, 1.0f}},
    {{0.5f, 0.5f, -0.5f}, {1.0f, 0.0f}},
    {{0.5f, 0.5f, 0.5f}, {0.0f, 0.0f}},
    // -x
    {{-0.5f, -0.5f, -0.5f}, {0.0f, 1.0f}},
    {{-0.5f, -0.5f, 0.5f}, {1.0f, 1.0f}},
    {{-0.5f, 0.5f, 0.5f}, {1.0f, 0.0f}},
    {{-0.5f, 0.5f, -0.5f}, {0.0f, 0.0f}},
    // +y
    {{-0.5f, 0.5f, 0.5f}, {0.0f, 1.0f}},
    {{0.5f, 0.5f, 0.5f}, {1.0f, 1.0f}},
    {{0.5f, 0.5f, -0.5f}, {1.0f, 0.0f}},
    {{-0.5f, 0.5f, -0.5f}, {0.0f, 0.0f}},
    // -y
    {{-0.5f, -0.5f, -0.5f}, {0.0f, 1.0f}},
    {{0.5f, -0.5f, -0.5f}, {1.0f, 1.0f}},
    {{0.5f, -0.5f, 0.5f}, {1.0f, 0.0f}},
    {{-0.5f, -0.5f, 0.5f}, {0.0f, 0.0f}},
    // +z
    {{-0.5f, -0.5f, 0.5f}, {0.0f, 1.0f}},
    {{0.5f, -0.5f, 0.5f}, {1.0f, 1.0f}},
    {{0.5f, 0.5f, 0.5f}, {1.0f, 0.0f}},
    {{-0.5f, 0.5f, 0.5f}, {0.0f, 0.0f}},
    // -z
    {{0.5f, -0.5f, -0.5f}, {0.0f, 1.0f}},
    {{-0.5f, -0.5f, -0.5f}, {1.0f, 1.0f}},
    {{-0.5f, 0.5f, -0.5f}, {1.0f, 0.0f}},
    {{0.5f, 0.5f, -0.5f}, {0.0f, 0.0f}},
};
// clang-format on

inline constexpr u16 box_indices[]{
    0, 1, 2, 0, 2, 3,
    4, 5, 6, 4, 6, 7,
    8, 9, 10, 8, 10, 11,
    12, 13, 14, 12, 14, 15,
    16, 17, 18, 16, 18, 19,
    20, 21, 22, 20, 22, 23,
};

/// Rounds a buffer size up to the 4 byte multiple required for mapped and written buffers
constexpr usize align_buffer_size(usize const size) { return (size + 3) & ~usize{3}; }

} // namespace pentacube
