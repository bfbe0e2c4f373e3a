#include "flat_color_pass.hpp"

#include <cassert>

#include "geometry.hpp"
#include "vertex_types.hpp"

namespace pentacube
{
namespace
{

WGPURenderPipeline make_pipeline(
    WGPUDevice const device,
    WGPUPipelineLayout const layout,
    WGPUStringView const shader_src,
    WGPUTextureFormat const surface_format,
    WGPUTextureFormat const depth_format)
{
    WGPUShaderSourceWGSL const shader_desc_src{
        .chain = {.sType = WGPUSType_ShaderSourceWGSL},
        .code = shader_src,
    };
    WGPUShaderModuleDescriptor const shader_desc{
        .nextInChain = as<WGPUChainedStruct>(&shader_desc_src),
        .label = {"flat color shader", WGPU_STRLEN},
    };
    WGPUShaderModule const shader = wgpuDeviceCreateShaderModule(device, &shader_desc);
    assert(shader);
    auto const drop_shader = defer([=]() { wgpuShaderModuleRelease(shader); });

    WGPUVertexAttribute const vert_attrs[]{
        {
            .format = WGPUVertexFormat_Float32x2,
            .offset = offsetof(FlatVertex, position),
            .shaderLocation = location::flat_position,
        },
        {
            .format = WGPUVertexFormat_Float32x3,
            .offset = offsetof(FlatVertex, color),
            .shaderLocation = location::flat_color,
        },
        {
            .format = WGPUVertexFormat_Float32,
            .offset = offsetof(FlatVertex, has_texture),
            .shaderLocation = location::flat_has_texture,
        },
    };
    WGPUVertexBufferLayout const vert_buf_layout{
        .stepMode = WGPUVertexStepMode_Vertex,
        .arrayStride = sizeof(FlatVertex),
        .attributeCount = size(vert_attrs),
        .attributes = vert_attrs,
    };

    // Drawn in the same pass as depth tested geometry but never occludes it
    WGPUDepthStencilState const depth_state{
        .format = depth_format,
        .depthWriteEnabled = WGPUOptionalBool_False,
        .depthCompare = WGPUCompareFunction_Always,
    };

    WGPUColorTargetState const color_targ{
        .format = surface_format,
        .writeMask = WGPUColorWriteMask_All,
    };
    WGPUFragmentState const frag_state{
        .module = shader,
        .entryPoint = {fragment_entry_point, WGPU_STRLEN},
        .targetCount = 1,
        .targets = &color_targ,
    };

    WGPURenderPipelineDescriptor const pipe_desc{
        .label = {"flat color pipeline", WGPU_STRLEN},
        .layout = layout,
        .vertex{
            .module = shader,
            .entryPoint = {vertex_entry_point, WGPU_STRLEN},
            .bufferCount = 1,
            .buffers = &vert_buf_layout,
        },
        .primitive{
            .topology = WGPUPrimitiveTopology_TriangleList,
            .frontFace = WGPUFrontFace_CCW,
            .cullMode = WGPUCullMode_Back,
        },
        .depthStencil = &depth_state,
        .multisample{
            .count = 1,
            .mask = ~0u,
            .alphaToCoverageEnabled = 0u,
        },
        .fragment = &frag_state,
    };

    return wgpuDeviceCreateRenderPipeline(device, &pipe_desc);
}

} // namespace

FlatColorPass FlatColorPass::make(
    WGPUDevice const device,
    WGPUStringView const shader_src,
    WGPUTextureFormat const surface_format,
    WGPUTextureFormat const depth_format)
{
    FlatColorPass result{};

    // No bind groups are used by this pass
    WGPUPipelineLayoutDescriptor const layout_desc{
        .label = {"flat color pipeline layout", WGPU_STRLEN},
        .bindGroupLayoutCount = 0,
        .bindGroupLayouts = nullptr,
    };
    result.pipeline_layout = wgpuDeviceCreatePipelineLayout(device, &layout_desc);
    assert(result.pipeline_layout);

    result.pipeline = make_pipeline(
        device,
        result.pipeline_layout,
        shader_src,
        surface_format,
        depth_format);
    assert(result.pipeline);

    result.mesh = RenderMesh::make(
        device,
        as<u8>(as_span(pentagon_vertices)),
        as<u8>(as_span(pentagon_indices)));

    return result;
}

void FlatColorPass::release(FlatColorPass& pass)
{
    RenderMesh::release(pass.mesh);
    wgpuRenderPipelineRelease(pass.pipeline);
    wgpuPipelineLayoutRelease(pass.pipeline_layout);
    pass = {};
}

void FlatColorPass::draw(WGPURenderPassEncoder const encoder) const
{
    wgpuRenderPassEncoderSetPipeline(encoder, pipeline);
    mesh.bind_resources(encoder);
    mesh.dispatch_draw(encoder);
}

} // namespace pentacube
