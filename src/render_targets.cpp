#include "render_targets.hpp"

#include <cassert>

namespace pentacube
{
namespace
{

WGPUTexture make_depth_texture(
    WGPUDevice const device,
    uint32_t const width,
    uint32_t const height,
    WGPUTextureFormat const format)
{
    WGPUTextureDescriptor const desc{
        .label = {"depth target", WGPU_STRLEN},
        .usage = WGPUTextureUsage_RenderAttachment,
        .dimension = WGPUTextureDimension_2D,
        .size = {width, height, 1},
        .format = format,
        .mipLevelCount = 1,
        .sampleCount = 1,
    };
    return wgpuDeviceCreateTexture(device, &desc);
}

WGPUTextureView make_depth_view(WGPUTexture const texture)
{
    WGPUTextureViewDescriptor const desc{
        .format = wgpuTextureGetFormat(texture),
        .dimension = WGPUTextureViewDimension_2D,
        .mipLevelCount = 1,
        .arrayLayerCount = 1,
        .aspect = WGPUTextureAspect_DepthOnly,
    };
    return wgpuTextureCreateView(texture, &desc);
}

} // namespace

DepthTarget DepthTarget::make(WGPUDevice const device, i32 const width, i32 const height)
{
    assert(width > 0 && height > 0);

    DepthTarget result{};
    result.texture = make_depth_texture(device, width, height, format);
    assert(result.texture);

    result.view = make_depth_view(result.texture);
    assert(result.view);

    return result;
}

void DepthTarget::release(DepthTarget& target)
{
    wgpuTextureViewRelease(target.view);
    wgpuTextureRelease(target.texture);
    target = {};
}

void DepthTarget::resize(WGPUDevice const device, i32 const width, i32 const height)
{
    // Keep the previous target while the framebuffer is zero-sized
    if (width <= 0 || height <= 0)
        return;

    release(*this);
    *this = make(device, width, height);
}

WGPUSurfaceGetCurrentTextureStatus acquire_surface_view(
    WGPUSurface const surface,
    WGPUTextureView& view)
{
    view = nullptr;

    WGPUSurfaceTexture srf_tex{};
    wgpuSurfaceGetCurrentTexture(surface, &srf_tex);

    switch (srf_tex.status)
    {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            break;
        default:
            if (srf_tex.texture)
                wgpuTextureRelease(srf_tex.texture);
            return srf_tex.status;
    }

    WGPUTextureViewDescriptor const desc{
        .mipLevelCount = 1,
        .arrayLayerCount = 1,
    };
    view = wgpuTextureCreateView(srf_tex.texture, &desc);
    assert(view);

    // The view keeps the texture alive until it is released
    wgpuTextureRelease(srf_tex.texture);
    return srf_tex.status;
}

RenderPass RenderPass::begin(
    WGPUCommandEncoder const cmd_encoder,
    WGPUTextureView const color_view,
    WGPUTextureView const depth_view,
    ClearValues const& clear)
{
    WGPURenderPassColorAttachment const color_atts[]{
        {
            .view = color_view,
            .depthSlice = WGPU_DEPTH_SLICE_UNDEFINED,
            .loadOp = WGPULoadOp_Clear,
            .storeOp = WGPUStoreOp_Store,
            .clearValue{clear.color[0], clear.color[1], clear.color[2], clear.color[3]},
        },
    };
    WGPURenderPassDepthStencilAttachment const depth_att{
        .view = depth_view,
        .depthLoadOp = WGPULoadOp_Clear,
        .depthStoreOp = WGPUStoreOp_Store,
        .depthClearValue = clear.depth,
    };
    WGPURenderPassDescriptor const desc{
        .colorAttachmentCount = 1,
        .colorAttachments = color_atts,
        .depthStencilAttachment = &depth_att,
    };

    RenderPass result{};
    result.encoder = wgpuCommandEncoderBeginRenderPass(cmd_encoder, &desc);
    assert(result.encoder);

    return result;
}

void RenderPass::end(RenderPass& pass)
{
    wgpuRenderPassEncoderEnd(pass.encoder);
    wgpuRenderPassEncoderRelease(pass.encoder);
    pass = {};
}

} // namespace pentacube
