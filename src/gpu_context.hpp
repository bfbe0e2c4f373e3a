#pragma once

#include "dr_shim.hpp"
#include "wgpu_utils.hpp"

namespace pentacube
{

inline constexpr WGPUTextureFormat default_surface_format = WGPUTextureFormat_BGRA8Unorm;
inline constexpr WGPUPresentMode default_surface_present_mode = WGPUPresentMode_Fifo;

struct GpuContext
{
    WGPUInstance instance;
    WGPUSurface surface;
    WGPUAdapter adapter;
    WGPUDevice device;
    WGPUQueue queue;

    /// Creates a context that renders to the given window. Returns false if any part of the
    /// context could not be created, in which case the partially created context can still be
    /// released.
    static bool make(
        SurfaceSource const& surface_src,
        GpuContext& result,
        WGPURequestAdapterOptions const* adapter_opts = nullptr,
        WGPUDeviceDescriptor const* device_desc = nullptr);

    static void release(GpuContext& ctx);

    void config_surface(int width, int height);
    void config_surface(GLFWwindow* window);

    void report();
};

struct MainLoop
{
    /// Returns true if a frame was rendered and should be presented
    using Callback = bool(void* userdata);
    WGPUSurface surface{};
    GLFWwindow* window{};
    Callback* callback{};
    void* userdata{};

    void begin() const;
};

} // namespace pentacube
