#pragma once

#include "assets.hpp"
#include "camera.hpp"
#include "dr_shim.hpp"
#include "render_mesh.hpp"
#include "shading.hpp"
#include "vertex_types.hpp"
#include "wgpu_utils.hpp"

namespace pentacube
{

/// Draws instanced, textured geometry through a shared camera transform
struct TexturedPass
{
    WGPUBindGroupLayout bind_group_layouts[binding::group_count];
    WGPUPipelineLayout pipeline_layout;
    WGPURenderPipeline pipeline;

    struct
    {
        WGPUTexture texture;
        WGPUTextureView view;
        WGPUSampler sampler;
    } diffuse;

    WGPUBuffer camera_buffer;
    WGPUBuffer elapsed_time_buffer;
    WGPUBuffer instance_buffer;
    u32 instance_count;

    WGPUBindGroup bind_groups[binding::group_count];
    RenderMesh mesh;

    static TexturedPass make(
        WGPUDevice device,
        WGPUQueue queue,
        WGPUStringView shader_src,
        ImageAsset const& diffuse_image,
        SamplerState const& diffuse_sampler,
        DynamicArray<InstanceRaw> const& instances,
        WGPUTextureFormat surface_format,
        WGPUTextureFormat depth_format);

    static void release(TexturedPass& pass);

    void update_camera(WGPUQueue queue, CameraUniform const& uniform) const;

    void update_elapsed_time(WGPUQueue queue, f32 seconds) const;

    void draw(WGPURenderPassEncoder encoder) const;
};

WGPUSamplerDescriptor to_sampler_desc(SamplerState const& state);

} // namespace pentacube
