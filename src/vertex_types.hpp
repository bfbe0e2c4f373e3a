#pragma once

#include <cstddef>

#include "dr_shim.hpp"

namespace pentacube
{

/// Vertex consumed by the flat color pass
struct FlatVertex
{
    f32 position[2];
    f32 color[3];
    f32 has_texture;
};

/// Vertex consumed by the textured instanced pass
struct MeshVertex
{
    f32 position[3];
    f32 tex_coords[2];
};

/// Per-instance model matrix stored column-major. Each column is bound as a separate vec4
/// attribute.
struct InstanceRaw
{
    f32 model[16];
};

static_assert(sizeof(FlatVertex) == 24);
static_assert(offsetof(FlatVertex, color) == 8);
static_assert(offsetof(FlatVertex, has_texture) == 20);
static_assert(sizeof(MeshVertex) == 20);
static_assert(offsetof(MeshVertex, tex_coords) == 12);
static_assert(sizeof(InstanceRaw) == 64);

// Shader locations shared with assets/shaders/*.wgsl
namespace location
{

inline constexpr u32 flat_position = 0;
inline constexpr u32 flat_color = 1;
inline constexpr u32 flat_has_texture = 2;

inline constexpr u32 mesh_position = 0;
inline constexpr u32 mesh_tex_coords = 1;

inline constexpr u32 instance_model_first = 5;
inline constexpr u32 instance_model_count = 4;

} // namespace location

struct BindingSlot
{
    u32 group;
    u32 binding;
};

// Bind group layout of the textured pass
namespace binding
{

inline constexpr BindingSlot diffuse_texture{0, 0};
inline constexpr BindingSlot diffuse_sampler{0, 1};
inline constexpr BindingSlot camera{1, 0};
inline constexpr BindingSlot elapsed_time{2, 0};

inline constexpr u32 group_count = 3;

} // namespace binding

inline constexpr char const* vertex_entry_point = "vs_main";
inline constexpr char const* fragment_entry_point = "fs_main";

} // namespace pentacube
