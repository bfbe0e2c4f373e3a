#include "textured_pass.hpp"

#include <cassert>

#include "geometry.hpp"

namespace pentacube
{
namespace
{

// Uniform buffer bindings are sized to a 16 byte multiple
constexpr usize elapsed_time_buffer_size = 16;

WGPUAddressMode to_wgpu(AddressMode const mode)
{
    switch (mode)
    {
        case AddressMode_ClampToEdge:
            return WGPUAddressMode_ClampToEdge;
        case AddressMode_Repeat:
            return WGPUAddressMode_Repeat;
        case AddressMode_MirrorRepeat:
            return WGPUAddressMode_MirrorRepeat;
    }

    assert(false);
    return WGPUAddressMode_ClampToEdge;
}

WGPUFilterMode to_wgpu(FilterMode const mode)
{
    return (mode == FilterMode_Linear) ? WGPUFilterMode_Linear : WGPUFilterMode_Nearest;
}

WGPUMipmapFilterMode to_wgpu_mipmap(FilterMode const mode)
{
    return (mode == FilterMode_Linear) ? WGPUMipmapFilterMode_Linear
                                       : WGPUMipmapFilterMode_Nearest;
}

WGPUBindGroupLayout make_texture_bind_group_layout(WGPUDevice const device)
{
    WGPUBindGroupLayoutEntry const entries[]{
        {
            .binding = binding::diffuse_texture.binding,
            .visibility = WGPUShaderStage_Fragment,
            .texture{
                .sampleType = WGPUTextureSampleType_Float,
                .viewDimension = WGPUTextureViewDimension_2D,
                .multisampled = false,
            },
        },
        {
            .binding = binding::diffuse_sampler.binding,
            .visibility = WGPUShaderStage_Fragment,
            .sampler{
                .type = WGPUSamplerBindingType_Filtering,
            },
        },
    };
    WGPUBindGroupLayoutDescriptor const desc{
        .label = {"texture bind group layout", WGPU_STRLEN},
        .entryCount = size(entries),
        .entries = entries,
    };
    return wgpuDeviceCreateBindGroupLayout(device, &desc);
}

WGPUBindGroupLayout make_uniform_bind_group_layout(
    WGPUDevice const device,
    u32 const binding,
    usize const min_size,
    char const* const label)
{
    WGPUBindGroupLayoutEntry const entry{
        .binding = binding,
        .visibility = WGPUShaderStage_Vertex,
        .buffer{
            .type = WGPUBufferBindingType_Uniform,
            .hasDynamicOffset = false,
            .minBindingSize = min_size,
        },
    };
    WGPUBindGroupLayoutDescriptor const desc{
        .label = {label, WGPU_STRLEN},
        .entryCount = 1,
        .entries = &entry,
    };
    return wgpuDeviceCreateBindGroupLayout(device, &desc);
}

WGPUBindGroup make_uniform_bind_group(
    WGPUDevice const device,
    WGPUBindGroupLayout const layout,
    u32 const binding,
    WGPUBuffer const buffer,
    char const* const label)
{
    WGPUBindGroupEntry const entry{
        .binding = binding,
        .buffer = buffer,
        .size = wgpuBufferGetSize(buffer),
    };
    WGPUBindGroupDescriptor const desc{
        .label = {label, WGPU_STRLEN},
        .layout = layout,
        .entryCount = 1,
        .entries = &entry,
    };
    return wgpuDeviceCreateBindGroup(device, &desc);
}

WGPUBindGroup make_texture_bind_group(
    WGPUDevice const device,
    WGPUBindGroupLayout const layout,
    WGPUTextureView const color_view,
    WGPUSampler const color_sampler)
{
    WGPUBindGroupEntry const entries[]{
        {
            .binding = binding::diffuse_texture.binding,
            .textureView = color_view,
        },
        {
            .binding = binding::diffuse_sampler.binding,
            .sampler = color_sampler,
        },
    };
    WGPUBindGroupDescriptor const desc{
        .label = {"diffuse bind group", WGPU_STRLEN},
        .layout = layout,
        .entryCount = size(entries),
        .entries = entries,
    };
    return wgpuDeviceCreateBindGroup(device, &desc);
}

WGPUBuffer make_uniform_buffer(WGPUDevice const device, usize const size, char const* const label)
{
    WGPUBufferDescriptor const desc{
        .label = {label, WGPU_STRLEN},
        .usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst,
        .size = size,
    };
    return wgpuDeviceCreateBuffer(device, &desc);
}

WGPUTexture make_color_texture(
    WGPUDevice const device,
    WGPUQueue const queue,
    ImageAsset const& image,
    WGPUTextureView& view)
{
    WGPUTextureFormat const format = WGPUTextureFormat_RGBA8Unorm;
    WGPUExtent3D const size = {uint32_t(image.width), uint32_t(image.height), 1};
    uint32_t const row_size = image.width * image.stride;

    WGPUTextureDescriptor const texture_desc{
        .label = {"diffuse texture", WGPU_STRLEN},
        .usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst,
        .dimension = WGPUTextureDimension_2D,
        .size = size,
        .format = format,
        .mipLevelCount = 1,
        .sampleCount = 1,
    };
    WGPUTexture const texture = wgpuDeviceCreateTexture(device, &texture_desc);
    assert(texture);

    // Copy image data to mip level 0
    WGPUTexelCopyTextureInfo const copy_info{
        .texture = texture,
    };
    WGPUTexelCopyBufferLayout const copy_layout{
        .bytesPerRow = row_size,
        .rowsPerImage = size.height,
    };
    wgpuQueueWriteTexture(queue, &copy_info, image.data.get(), image.size(), &copy_layout, &size);

    WGPUTextureViewDescriptor const view_desc{
        .format = format,
        .dimension = WGPUTextureViewDimension_2D,
        .mipLevelCount = 1,
        .arrayLayerCount = 1,
    };
    view = wgpuTextureCreateView(texture, &view_desc);

    return texture;
}

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
        .label = {"textured instanced shader", WGPU_STRLEN},
    };
    WGPUShaderModule const shader = wgpuDeviceCreateShaderModule(device, &shader_desc);
    assert(shader);
    auto const drop_shader = defer([=]() { wgpuShaderModuleRelease(shader); });

    WGPUVertexAttribute const vert_attrs[]{
        {
            .format = WGPUVertexFormat_Float32x3,
            .offset = offsetof(MeshVertex, position),
            .shaderLocation = location::mesh_position,
        },
        {
            .format = WGPUVertexFormat_Float32x2,
            .offset = offsetof(MeshVertex, tex_coords),
            .shaderLocation = location::mesh_tex_coords,
        },
    };

    // Each column of the model matrix occupies its own location
    WGPUVertexAttribute inst_attrs[location::instance_model_count]{};
    for (u32 i = 0; i < location::instance_model_count; ++i)
    {
        inst_attrs[i].format = WGPUVertexFormat_Float32x4;
        inst_attrs[i].offset = i * sizeof(f32[4]);
        inst_attrs[i].shaderLocation = location::instance_model_first + i;
    }

    WGPUVertexBufferLayout const vert_buf_layouts[]{
        {
            .stepMode = WGPUVertexStepMode_Vertex,
            .arrayStride = sizeof(MeshVertex),
            .attributeCount = size(vert_attrs),
            .attributes = vert_attrs,
        },
        {
            .stepMode = WGPUVertexStepMode_Instance,
            .arrayStride = sizeof(InstanceRaw),
            .attributeCount = size(inst_attrs),
            .attributes = inst_attrs,
        },
    };

    WGPUDepthStencilState const depth_state{
        .format = depth_format,
        .depthWriteEnabled = WGPUOptionalBool_True,
        .depthCompare = WGPUCompareFunction_Less,
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
        .label = {"textured instanced pipeline", WGPU_STRLEN},
        .layout = layout,
        .vertex{
            .module = shader,
            .entryPoint = {vertex_entry_point, WGPU_STRLEN},
            .bufferCount = size(vert_buf_layouts),
            .buffers = vert_buf_layouts,
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

WGPUSamplerDescriptor to_sampler_desc(SamplerState const& state)
{
    return {
        .label = {"diffuse sampler", WGPU_STRLEN},
        .addressModeU = to_wgpu(state.address_u),
        .addressModeV = to_wgpu(state.address_v),
        .addressModeW = to_wgpu(state.address_w),
        .magFilter = to_wgpu(state.mag_filter),
        .minFilter = to_wgpu(state.min_filter),
        .mipmapFilter = to_wgpu_mipmap(state.mipmap_filter),
        .lodMinClamp = 0.0f,
        .lodMaxClamp = 32.0f,
        .compare = WGPUCompareFunction_Undefined,
        .maxAnisotropy = 1,
    };
}

TexturedPass TexturedPass::make(
    WGPUDevice const device,
    WGPUQueue const queue,
    WGPUStringView const shader_src,
    ImageAsset const& diffuse_image,
    SamplerState const& diffuse_sampler,
    DynamicArray<InstanceRaw> const& instances,
    WGPUTextureFormat const surface_format,
    WGPUTextureFormat const depth_format)
{
    TexturedPass result{};

    // Layouts are indexed by group
    auto& layouts = result.bind_group_layouts;
    layouts[binding::diffuse_texture.group] = make_texture_bind_group_layout(device);
    layouts[binding::camera.group] = make_uniform_bind_group_layout(
        device,
        binding::camera.binding,
        sizeof(CameraUniform),
        "camera bind group layout");
    layouts[binding::elapsed_time.group] = make_uniform_bind_group_layout(
        device,
        binding::elapsed_time.binding,
        sizeof(f32),
        "elapsed time bind group layout");

    for (WGPUBindGroupLayout const layout : layouts)
        assert(layout);

    WGPUPipelineLayoutDescriptor const layout_desc{
        .label = {"textured pipeline layout", WGPU_STRLEN},
        .bindGroupLayoutCount = size(layouts),
        .bindGroupLayouts = layouts,
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

    // Diffuse texture and sampler
    {
        auto& diffuse = result.diffuse;
        diffuse.texture = make_color_texture(device, queue, diffuse_image, diffuse.view);
        assert(diffuse.view);

        WGPUSamplerDescriptor const sampler_desc = to_sampler_desc(diffuse_sampler);
        diffuse.sampler = wgpuDeviceCreateSampler(device, &sampler_desc);
        assert(diffuse.sampler);
    }

    // Uniform buffers
    {
        result.camera_buffer = make_uniform_buffer(device, sizeof(CameraUniform), "camera buffer");
        assert(result.camera_buffer);

        result.elapsed_time_buffer = make_uniform_buffer(
            device,
            elapsed_time_buffer_size,
            "elapsed time buffer");
        assert(result.elapsed_time_buffer);

        result.update_camera(queue, CameraUniform::make());
        result.update_elapsed_time(queue, 0.0f);
    }

    // Instance buffer is written once since instances don't move
    {
        assert(!instances.empty());
        result.instance_buffer = make_init_buffer(
            device,
            instances.data(),
            instances.size() * sizeof(InstanceRaw),
            WGPUBufferUsage_Vertex,
            "instance buffer");
        result.instance_count = static_cast<u32>(instances.size());
    }

    // Bind groups are indexed by group
    {
        auto& groups = result.bind_groups;
        groups[binding::diffuse_texture.group] = make_texture_bind_group(
            device,
            layouts[binding::diffuse_texture.group],
            result.diffuse.view,
            result.diffuse.sampler);

        groups[binding::camera.group] = make_uniform_bind_group(
            device,
            layouts[binding::camera.group],
            binding::camera.binding,
            result.camera_buffer,
            "camera bind group");

        groups[binding::elapsed_time.group] = make_uniform_bind_group(
            device,
            layouts[binding::elapsed_time.group],
            binding::elapsed_time.binding,
            result.elapsed_time_buffer,
            "elapsed time bind group");

        for (WGPUBindGroup const group : groups)
            assert(group);
    }

    result.mesh = RenderMesh::make(
        device,
        as<u8>(as_span(box_vertices)),
        as<u8>(as_span(box_indices)));

    return result;
}

void TexturedPass::release(TexturedPass& pass)
{
    RenderMesh::release(pass.mesh);

    for (WGPUBindGroup const group : pass.bind_groups)
        wgpuBindGroupRelease(group);

    wgpuBufferRelease(pass.instance_buffer);
    wgpuBufferRelease(pass.elapsed_time_buffer);
    wgpuBufferRelease(pass.camera_buffer);

    wgpuSamplerRelease(pass.diffuse.sampler);
    wgpuTextureViewRelease(pass.diffuse.view);
    wgpuTextureRelease(pass.diffuse.texture);

    wgpuRenderPipelineRelease(pass.pipeline);
    wgpuPipelineLayoutRelease(pass.pipeline_layout);

    for (WGPUBindGroupLayout const layout : pass.bind_group_layouts)
        wgpuBindGroupLayoutRelease(layout);

    pass = {};
}

void TexturedPass::update_camera(WGPUQueue const queue, CameraUniform const& uniform) const
{
    wgpuQueueWriteBuffer(queue, camera_buffer, 0, &uniform, sizeof(uniform));
}

void TexturedPass::update_elapsed_time(WGPUQueue const queue, f32 const seconds) const
{
    wgpuQueueWriteBuffer(queue, elapsed_time_buffer, 0, &seconds, sizeof(seconds));
}

void TexturedPass::draw(WGPURenderPassEncoder const encoder) const
{
    wgpuRenderPassEncoderSetPipeline(encoder, pipeline);

    for (u32 i = 0; i < binding::group_count; ++i)
        wgpuRenderPassEncoderSetBindGroup(encoder, i, bind_groups[i], 0, nullptr);

    mesh.bind_resources(encoder);
    wgpuRenderPassEncoderSetVertexBuffer(
        encoder,
        1,
        instance_buffer,
        0,
        wgpuBufferGetSize(instance_buffer));

    mesh.dispatch_draw(encoder, instance_count);
}

} // namespace pentacube
