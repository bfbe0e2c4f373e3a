#include "render_mesh.hpp"

#include <cassert>
#include <cstring>

#include "geometry.hpp"

namespace pentacube
{

WGPUBuffer make_init_buffer(
    WGPUDevice const device,
    void const* const data,
    usize const size,
    WGPUBufferUsage const usage,
    char const* const label)
{
    // Buffers mapped at creation must have a size that is a multiple of 4
    WGPUBufferDescriptor const desc{
        .label = {label, WGPU_STRLEN},
        .usage = usage,
        .size = align_buffer_size(size),
        .mappedAtCreation = true,
    };
    WGPUBuffer const buffer = wgpuDeviceCreateBuffer(device, &desc);
    assert(buffer);

    void* const dst = wgpuBufferGetMappedRange(buffer, 0, desc.size);
    assert(dst);
    std::memcpy(dst, data, size);
    wgpuBufferUnmap(buffer);

    return buffer;
}

RenderMesh RenderMesh::make(
    WGPUDevice const device,
    Span<u8 const> const& vertex_data,
    Span<u8 const> const& index_data)
{
    RenderMesh result{};

    result.vertices = make_init_buffer(
        device,
        vertex_data.data(),
        vertex_data.size(),
        WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst,
        "mesh vertices");

    result.indices = make_init_buffer(
        device,
        index_data.data(),
        index_data.size(),
        WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst,
        "mesh indices");

    constexpr usize index_stride = sizeof(u16);
    result.index_count = static_cast<u32>(index_data.size() / index_stride);

    return result;
}

void RenderMesh::release(RenderMesh& mesh)
{
    wgpuBufferRelease(mesh.vertices);
    wgpuBufferRelease(mesh.indices);
    mesh = {};
}

void RenderMesh::bind_resources(WGPURenderPassEncoder const encoder) const
{
    wgpuRenderPassEncoderSetVertexBuffer(encoder, 0, vertices, 0, wgpuBufferGetSize(vertices));

    // NOTE: The index buffer may be padded so only the range covering actual indices is bound
    wgpuRenderPassEncoderSetIndexBuffer(
        encoder,
        indices,
        index_format,
        0,
        index_count * sizeof(u16));
}

void RenderMesh::dispatch_draw(WGPURenderPassEncoder const encoder, u32 const instance_count) const
{
    wgpuRenderPassEncoderDrawIndexed(encoder, index_count, instance_count, 0, 0, 0);
}

} // namespace pentacube
