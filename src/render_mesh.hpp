#pragma once

#include "dr_shim.hpp"
#include "wgpu_utils.hpp"

namespace pentacube
{

struct RenderMesh
{
    static constexpr WGPUIndexFormat index_format{WGPUIndexFormat_Uint16};
    WGPUBuffer vertices;
    WGPUBuffer indices;
    u32 index_count;

    /// Creates vertex and index buffers initialized with the given data. Index data is expected to
    /// hold u16 indices.
    static RenderMesh make(
        WGPUDevice device,
        Span<u8 const> const& vertex_data,
        Span<u8 const> const& index_data);

    static void release(RenderMesh& mesh);

    void bind_resources(WGPURenderPassEncoder encoder) const;

    void dispatch_draw(WGPURenderPassEncoder encoder, u32 instance_count = 1) const;
};

/// Creates a buffer mapped at creation, copies the given data into it and unmaps it
WGPUBuffer make_init_buffer(
    WGPUDevice device,
    void const* data,
    usize size,
    WGPUBufferUsage usage,
    char const* label);

} // namespace pentacube
