#include "gpu_context.hpp"

namespace pentacube
{
namespace
{

WGPUDeviceDescriptor make_default_device_desc()
{
    WGPUDeviceDescriptor result{};
    result.label = {"pentacube device", WGPU_STRLEN};

    result.uncapturedErrorCallbackInfo.callback = //
        [](WGPUDevice const* /*device*/,
           WGPUErrorType type,
           WGPUStringView msg,
           void* /*userdata1*/,
           void* /*userdata2*/) {
            fmt::print(
                "WebGPU device error: {} ({})\nMessage: {}\n",
                to_string(type),
                int(type),
                to_string_view(msg));
        };

    result.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    result.deviceLostCallbackInfo.callback = //
        [](WGPUDevice const* /*device*/,
           WGPUDeviceLostReason reason,
           WGPUStringView msg,
           void* /*userdata1*/,
           void* /*userdata2*/) {
            // Releasing the device at shutdown is reported as a loss too
            if (reason == WGPUDeviceLostReason_Destroyed)
                return;

            fmt::print(
                "WebGPU device lost: {} ({})\nMessage: {}\n",
                to_string(reason),
                int(reason),
                to_string_view(msg));
        };

    return result;
}

} // namespace

bool GpuContext::make(
    SurfaceSource const& surface_src,
    GpuContext& result,
    WGPURequestAdapterOptions const* const adapter_opts,
    WGPUDeviceDescriptor const* const device_desc)
{
    result = {};

    result.instance = wgpuCreateInstance(nullptr);
    if (!result.instance)
    {
        fmt::print("Could not create WebGPU instance\n");
        return false;
    }

    result.surface = make_surface(result.instance, surface_src);
    if (!result.surface)
    {
        fmt::print("Could not create WebGPU surface\n");
        return false;
    }

    WGPURequestAdapterOptions opts = adapter_opts ? *adapter_opts : WGPURequestAdapterOptions{};
    opts.compatibleSurface = result.surface;
    result.adapter = request_adapter(result.instance, &opts);
    if (!result.adapter)
        return false;

    WGPUDeviceDescriptor const default_desc = make_default_device_desc();
    result.device = request_device(
        result.instance,
        result.adapter,
        device_desc ? device_desc : &default_desc);
    if (!result.device)
        return false;

    result.queue = wgpuDeviceGetQueue(result.device);
    result.config_surface(surface_src.window);

    return true;
}

void GpuContext::release(GpuContext& ctx)
{
    if (ctx.queue)
        wgpuQueueRelease(ctx.queue);

    if (ctx.surface)
    {
        if (ctx.device)
            wgpuSurfaceUnconfigure(ctx.surface);

        wgpuSurfaceRelease(ctx.surface);
    }

    if (ctx.device)
        wgpuDeviceRelease(ctx.device);

    if (ctx.adapter)
        wgpuAdapterRelease(ctx.adapter);

    if (ctx.instance)
        wgpuInstanceRelease(ctx.instance);

    ctx = {};
}

void GpuContext::config_surface(int const width, int const height)
{
    // A minimized window has a zero-sized framebuffer which is not a valid surface size
    if (width <= 0 || height <= 0)
        return;

    WGPUSurfaceConfiguration config{};
    {
        config.device = device;
        config.width = width;
        config.height = height;
        config.format = default_surface_format;
        config.usage = WGPUTextureUsage_RenderAttachment;
        config.presentMode = default_surface_present_mode;
        config.alphaMode = WGPUCompositeAlphaMode_Auto;
    }
    wgpuSurfaceConfigure(surface, &config);
}

void GpuContext::config_surface(GLFWwindow* const window)
{
    int width, height;
    glfwGetFramebufferSize(window, &width, &height);
    config_surface(width, height);
}

void GpuContext::report()
{
    report_adapter_features(adapter);
    report_adapter_limits(adapter);
    report_adapter_properties(adapter);
    report_device_features(device);
    report_device_limits(device);
    report_surface_capabilities(surface, adapter);
}

void MainLoop::begin() const
{
    while (!glfwWindowShouldClose(window))
    {
        if (callback(userdata) && wgpuSurfacePresent(surface) != WGPUStatus_Success)
            fmt::print("Could not present surface\n");
    }
}

} // namespace pentacube
