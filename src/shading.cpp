#include "shading.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>

namespace pentacube
{
namespace
{

i32 floor_to_int(f32 const x) { return static_cast<i32>(std::floor(x)); }

i32 euclid_mod(i32 const a, i32 const b)
{
    i32 const r = a % b;
    return (r < 0) ? r + b : r;
}

// Brings a normalized coordinate into a bounded range that the address mode maps to the same
// texels. Non-finite coordinates are sampled at 0.
f32 reduce_coord(AddressMode const mode, f32 const t)
{
    if (!std::isfinite(t))
        return 0.0f;

    switch (mode)
    {
        case AddressMode_ClampToEdge:
            return std::clamp(t, 0.0f, 1.0f);
        case AddressMode_Repeat:
            return t - std::floor(t);
        case AddressMode_MirrorRepeat:
            return t - 2.0f * std::floor(t * 0.5f);
    }

    assert(false);
    return 0.0f;
}

Vec4<f32> sample_nearest(ImageView const& image, SamplerState const& sampler, Vec2<f32> const& uv)
{
    i32 const x = apply_address_mode(
        sampler.address_u,
        floor_to_int(uv.x() * image.width),
        image.width);

    i32 const y = apply_address_mode(
        sampler.address_v,
        floor_to_int(uv.y() * image.height),
        image.height);

    return image.texel(x, y);
}

Vec4<f32> sample_linear(ImageView const& image, SamplerState const& sampler, Vec2<f32> const& uv)
{
    // Texel centers sit at half-integer coordinates
    f32 const u = uv.x() * image.width - 0.5f;
    f32 const v = uv.y() * image.height - 0.5f;

    i32 const x0 = floor_to_int(u);
    i32 const y0 = floor_to_int(v);
    f32 const tx = u - x0;
    f32 const ty = v - y0;

    i32 const xs[]{
        apply_address_mode(sampler.address_u, x0, image.width),
        apply_address_mode(sampler.address_u, x0 + 1, image.width),
    };
    i32 const ys[]{
        apply_address_mode(sampler.address_v, y0, image.height),
        apply_address_mode(sampler.address_v, y0 + 1, image.height),
    };

    Vec4<f32> const top = (1.0f - tx) * image.texel(xs[0], ys[0]) + tx * image.texel(xs[1], ys[0]);
    Vec4<f32> const bot = (1.0f - tx) * image.texel(xs[0], ys[1]) + tx * image.texel(xs[1], ys[1]);
    return (1.0f - ty) * top + ty * bot;
}

} // namespace

Vec4<f32> ImageView::texel(i32 const x, i32 const y) const
{
    assert(x >= 0 && x < width);
    assert(y >= 0 && y < height);

    constexpr i32 stride = 4;
    u8 const* const p = data + (static_cast<isize>(y) * width + x) * stride;
    return Vec4<f32>{f32(p[0]), f32(p[1]), f32(p[2]), f32(p[3])} / 255.0f;
}

i32 apply_address_mode(AddressMode const mode, i32 const coord, i32 const size)
{
    switch (mode)
    {
        case AddressMode_ClampToEdge:
            return std::clamp(coord, 0, size - 1);
        case AddressMode_Repeat:
            return euclid_mod(coord, size);
        case AddressMode_MirrorRepeat:
        {
            // Reflect every other period e.g. for size 3: 0 1 2 2 1 0 0 1 2 ...
            i32 const period = euclid_mod(coord, 2 * size);
            return (period < size) ? period : 2 * size - 1 - period;
        }
    }

    assert(false);
    return 0;
}

Vec4<f32> sample(ImageView const& image, SamplerState const& sampler, Vec2<f32> const& uv)
{
    // Texel coordinates derived from the reduced uv fit in an i32
    Vec2<f32> const reduced{
        reduce_coord(sampler.address_u, uv.x()),
        reduce_coord(sampler.address_v, uv.y()),
    };

    switch (sampler.mag_filter)
    {
        case FilterMode_Nearest:
            return sample_nearest(image, sampler, reduced);
        case FilterMode_Linear:
            return sample_linear(image, sampler, reduced);
    }

    assert(false);
    return {};
}

FlatColorVertexOut flat_color_vertex(FlatVertex const& vertex)
{
    FlatColorVertexOut result{Vec4<f32>::Zero(), Vec3<f32>::Zero()};

    // NOTE: Textured flat vertices are collapsed to the origin, matching vs_main in flat_color.wgsl
    if (vertex.has_texture == 1.0f)
        return result;

    result.position << vertex.position[0], vertex.position[1], 0.0f, 1.0f;
    result.color << vertex.color[0], vertex.color[1], vertex.color[2];
    return result;
}

Vec4<f32> flat_color_fragment(Vec3<f32> const& color) { return color.homogeneous(); }

TexturedVertexOut textured_vertex(
    MeshVertex const& vertex,
    InstanceRaw const& instance,
    CameraUniform const& camera)
{
    Eigen::Map<Mat4<f32> const> const model{instance.model};
    Eigen::Map<Mat4<f32> const> const view_proj{camera.view_proj};
    Eigen::Map<Vec3<f32> const> const position{vertex.position};

    return {
        view_proj * (model * position.homogeneous()),
        Vec2<f32>{vertex.tex_coords[0], vertex.tex_coords[1]},
    };
}

Vec4<f32> textured_fragment(
    Vec2<f32> const& tex_coords,
    ImageView const& texture,
    SamplerState const& sampler)
{
    return sample(texture, sampler, tex_coords);
}

} // namespace pentacube
