#pragma once

#include "camera.hpp"
#include "dr_shim.hpp"
#include "instances.hpp"
#include "shading.hpp"

namespace pentacube
{

struct AppConfig
{
    struct
    {
        i32 width{800};
        i32 height{600};
        char const* title{"pentacube"};
    } window;

    struct
    {
        f64 clear_color[4]{1.0, 1.0, 1.0, 1.0};
        f32 clear_depth{1.0f};
    } frame;

    Camera camera{};

    struct
    {
        i32 rows{10};
        i32 per_row{default_instances_per_row};
    } instances;

    SamplerState diffuse_sampler{
        .address_u = AddressMode_ClampToEdge,
        .address_v = AddressMode_ClampToEdge,
        .address_w = AddressMode_ClampToEdge,
        .mag_filter = FilterMode_Linear,
        .min_filter = FilterMode_Nearest,
        .mipmap_filter = FilterMode_Nearest,
    };

    struct
    {
        char const* flat_color_shader{"shaders/flat_color.wgsl"};
        char const* textured_shader{"shaders/textured_instanced.wgsl"};
        char const* diffuse_image{"images/cube-diffuse.ppm"};
    } assets;
};

} // namespace pentacube
