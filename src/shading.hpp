#pragma once

#include "camera.hpp"
#include "dr_shim.hpp"
#include "vertex_types.hpp"

namespace pentacube
{

enum AddressMode : u8
{
    AddressMode_ClampToEdge = 0,
    AddressMode_Repeat,
    AddressMode_MirrorRepeat,
};

enum FilterMode : u8
{
    FilterMode_Nearest = 0,
    FilterMode_Linear,
};

/// Sampler parameters shared by the GPU sampler and the CPU reference sampler
struct SamplerState
{
    AddressMode address_u{AddressMode_ClampToEdge};
    AddressMode address_v{AddressMode_ClampToEdge};
    AddressMode address_w{AddressMode_ClampToEdge};
    FilterMode mag_filter{FilterMode_Nearest};
    FilterMode min_filter{FilterMode_Nearest};
    FilterMode mipmap_filter{FilterMode_Nearest};
};

/// Non-owning view of tightly packed 8-bit RGBA texels
struct ImageView
{
    u8 const* data;
    i32 width;
    i32 height;

    Vec4<f32> texel(i32 x, i32 y) const;
};

/// Maps an integer texel coordinate into [0, size) under the given address mode
i32 apply_address_mode(AddressMode mode, i32 coord, i32 size);

/// Samples a single mip level image at normalized coordinates. Without screen space derivatives
/// there is no minification so only the magnification filter applies.
/// Coordinates of any magnitude are valid. Non-finite coordinates sample as 0.
Vec4<f32> sample(ImageView const& image, SamplerState const& sampler, Vec2<f32> const& uv);

// CPU equivalents of the shader stages in assets/shaders

struct FlatColorVertexOut
{
    Vec4<f32> position;
    Vec3<f32> color;
};

FlatColorVertexOut flat_color_vertex(FlatVertex const& vertex);

Vec4<f32> flat_color_fragment(Vec3<f32> const& color);

struct TexturedVertexOut
{
    Vec4<f32> position;
    Vec2<f32> tex_coords;
};

TexturedVertexOut textured_vertex(
    MeshVertex const& vertex,
    InstanceRaw const& instance,
    CameraUniform const& camera);

Vec4<f32> textured_fragment(
    Vec2<f32> const& tex_coords,
    ImageView const& texture,
    SamplerState const& sampler);

} // namespace pentacube
