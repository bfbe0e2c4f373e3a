#pragma once

#include <cstdint>

#include <GLFW/glfw3.h>

#include <fmt/core.h>

#include <webgpu/webgpu.h>

namespace pentacube
{

struct SurfaceSource
{
    GLFWwindow* window;
};

WGPUSurface make_surface(WGPUInstance instance, SurfaceSource const& surface_src);

/// Processes instance events until the given condition holds
template <typename Cond>
void wait_for_condition(WGPUInstance const instance, Cond&& cond)
{
    while (!cond())
        wgpuInstanceProcessEvents(instance);
}

/// Requests an adapter and blocks until the request completes. Returns null on failure.
WGPUAdapter request_adapter(
    WGPUInstance instance,
    WGPURequestAdapterOptions const* options = nullptr);

/// Requests a device and blocks until the request completes. Returns null on failure.
WGPUDevice request_device(
    WGPUInstance instance,
    WGPUAdapter adapter,
    WGPUDeviceDescriptor const* desc = nullptr);

void report_adapter_features(WGPUAdapter adapter);

void report_adapter_limits(WGPUAdapter adapter);

void report_adapter_properties(WGPUAdapter adapter);

void report_device_features(WGPUDevice device);

void report_device_limits(WGPUDevice device);

void report_surface_capabilities(WGPUSurface surface, WGPUAdapter adapter);

fmt::string_view to_string_view(WGPUStringView value);

char const* to_string(WGPUAdapterType value);

char const* to_string(WGPUBackendType value);

char const* to_string(WGPUErrorType value);

char const* to_string(WGPUDeviceLostReason value);

char const* to_string(WGPUSurfaceGetCurrentTextureStatus value);

char const* to_string(WGPUTextureFormat value);

char const* to_string(WGPUCompositeAlphaMode value);

char const* to_string(WGPUPresentMode value);

} // namespace pentacube
