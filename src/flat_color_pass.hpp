#pragma once

#include "dr_shim.hpp"
#include "render_mesh.hpp"
#include "wgpu_utils.hpp"

namespace pentacube
{

/// Draws 2D geometry with per-vertex colors directly in clip space
struct FlatColorPass
{
    WGPUPipelineLayout pipeline_layout;
    WGPURenderPipeline pipeline;
    RenderMesh mesh;

    static FlatColorPass make(
        WGPUDevice device,
        WGPUStringView shader_src,
        WGPUTextureFormat surface_format,
        WGPUTextureFormat depth_format);

    static void release(FlatColorPass& pass);

    void draw(WGPURenderPassEncoder encoder) const;
};

} // namespace pentacube
