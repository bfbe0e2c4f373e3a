#pragma once

#include "dr_shim.hpp"
#include "wgpu_utils.hpp"

namespace pentacube
{

struct DepthTarget
{
    static constexpr WGPUTextureFormat format = WGPUTextureFormat_Depth32Float;
    WGPUTexture texture;
    WGPUTextureView view;

    static DepthTarget make(WGPUDevice device, i32 width, i32 height);

    static void release(DepthTarget& target);

    void resize(WGPUDevice device, i32 width, i32 height);
};

/// Acquires the current surface texture and creates a view of it. The returned status tells the
/// caller whether the view is usable or whether the surface needs reconfiguring.
WGPUSurfaceGetCurrentTextureStatus acquire_surface_view(
    WGPUSurface surface,
    WGPUTextureView& view);

struct RenderPass
{
    WGPURenderPassEncoder encoder;

    struct ClearValues
    {
        f64 color[4];
        f32 depth;
    };

    static RenderPass begin(
        WGPUCommandEncoder cmd_encoder,
        WGPUTextureView color_view,
        WGPUTextureView depth_view,
        ClearValues const& clear);

    static void end(RenderPass& pass);
};

} // namespace pentacube
