#include "wgpu_utils.hpp"

#include <cstring>

#include "wgpu_glfw.h"

namespace pentacube
{
namespace
{

void report_features(WGPUSupportedFeatures const& features)
{
    for (std::size_t i = 0; i < features.featureCount; ++i)
        fmt::print("\t{:#x}\n", static_cast<std::uint32_t>(features.features[i]));
}

void report_limits(WGPULimits const& limits)
{
    fmt::print("\tmaxTextureDimension2D: {}\n", limits.maxTextureDimension2D);
    fmt::print("\tmaxBindGroups: {}\n", limits.maxBindGroups);
    fmt::print("\tmaxBindingsPerBindGroup: {}\n", limits.maxBindingsPerBindGroup);
    fmt::print("\tmaxSampledTexturesPerShaderStage: {}\n", limits.maxSampledTexturesPerShaderStage);
    fmt::print("\tmaxSamplersPerShaderStage: {}\n", limits.maxSamplersPerShaderStage);
    fmt::print("\tmaxUniformBuffersPerShaderStage: {}\n", limits.maxUniformBuffersPerShaderStage);
    fmt::print("\tmaxUniformBufferBindingSize: {}\n", limits.maxUniformBufferBindingSize);
    fmt::print("\tminUniformBufferOffsetAlignment: {}\n", limits.minUniformBufferOffsetAlignment);
    fmt::print("\tmaxVertexBuffers: {}\n", limits.maxVertexBuffers);
    fmt::print("\tmaxBufferSize: {}\n", limits.maxBufferSize);
    fmt::print("\tmaxVertexAttributes: {}\n", limits.maxVertexAttributes);
    fmt::print("\tmaxVertexBufferArrayStride: {}\n", limits.maxVertexBufferArrayStride);
    fmt::print("\tmaxInterStageShaderVariables: {}\n", limits.maxInterStageShaderVariables);
    fmt::print("\tmaxColorAttachments: {}\n", limits.maxColorAttachments);
}

} // namespace

WGPUSurface make_surface(WGPUInstance const instance, SurfaceSource const& surface_src)
{
    return wgpu_make_surface_from_glfw(instance, surface_src.window);
}

WGPUAdapter request_adapter(
    WGPUInstance const instance,
    WGPURequestAdapterOptions const* const options)
{
    struct ReqResult
    {
        WGPUAdapter adapter;
        bool is_ready;
    } result{};

    WGPURequestAdapterCallbackInfo cb_info{};
    cb_info.userdata1 = &result;
    cb_info.mode = WGPUCallbackMode_AllowSpontaneous;
    cb_info.callback = //
        [](WGPURequestAdapterStatus status,
           WGPUAdapter adapter,
           WGPUStringView message,
           void* userdata1,
           void* /*userdata2*/) {
            auto result = static_cast<ReqResult*>(userdata1);
            if (status == WGPURequestAdapterStatus_Success)
                result->adapter = adapter;
            else
                fmt::print("Could not get WebGPU adapter. Message: {}\n", to_string_view(message));

            result->is_ready = true;
        };

    wgpuInstanceRequestAdapter(instance, options, cb_info);
    wait_for_condition(instance, [&]() { return result.is_ready; });

    return result.adapter;
}

WGPUDevice request_device(
    WGPUInstance const instance,
    WGPUAdapter const adapter,
    WGPUDeviceDescriptor const* const desc)
{
    struct ReqResult
    {
        WGPUDevice device;
        bool is_ready;
    } result{};

    WGPURequestDeviceCallbackInfo cb_info{};
    cb_info.userdata1 = &result;
    cb_info.mode = WGPUCallbackMode_AllowSpontaneous;
    cb_info.callback = //
        [](WGPURequestDeviceStatus status,
           WGPUDevice device,
           WGPUStringView message,
           void* userdata1,
           void* /*userdata2*/) {
            auto result = static_cast<ReqResult*>(userdata1);
            if (status == WGPURequestDeviceStatus_Success)
                result->device = device;
            else
                fmt::print("Could not get WebGPU device. Message: {}\n", to_string_view(message));

            result->is_ready = true;
        };

    wgpuAdapterRequestDevice(adapter, desc, cb_info);
    wait_for_condition(instance, [&]() { return result.is_ready; });

    return result.device;
}

void report_adapter_features(WGPUAdapter const adapter)
{
    WGPUSupportedFeatures features{};
    wgpuAdapterGetFeatures(adapter, &features);

    fmt::print("Adapter features:\n");
    report_features(features);
    wgpuSupportedFeaturesFreeMembers(features);
}

void report_adapter_limits(WGPUAdapter const adapter)
{
    WGPULimits limits{};
    if (wgpuAdapterGetLimits(adapter, &limits) != WGPUStatus_Success)
    {
        fmt::print("Could not get adapter limits\n");
        return;
    }

    fmt::print("Adapter limits:\n");
    report_limits(limits);
}

void report_adapter_properties(WGPUAdapter const adapter)
{
    WGPUAdapterInfo info{};
    if (wgpuAdapterGetInfo(adapter, &info) != WGPUStatus_Success)
    {
        fmt::print("Could not get adapter properties\n");
        return;
    }

    fmt::print("Adapter properties:\n");
    fmt::print("\tvendor: {} (id: {})\n", to_string_view(info.vendor), info.vendorID);
    fmt::print("\tdevice: {} (id: {})\n", to_string_view(info.device), info.deviceID);
    fmt::print("\tarchitecture: {}\n", to_string_view(info.architecture));
    fmt::print("\tdescription: {}\n", to_string_view(info.description));
    fmt::print("\tadapterType: {} ({})\n", to_string(info.adapterType), int(info.adapterType));
    fmt::print("\tbackendType: {} ({})\n", to_string(info.backendType), int(info.backendType));
    wgpuAdapterInfoFreeMembers(info);
}

void report_device_features(WGPUDevice const device)
{
    WGPUSupportedFeatures features{};
    wgpuDeviceGetFeatures(device, &features);

    fmt::print("Device features:\n");
    report_features(features);
    wgpuSupportedFeaturesFreeMembers(features);
}

void report_device_limits(WGPUDevice const device)
{
    WGPULimits limits{};
    if (wgpuDeviceGetLimits(device, &limits) != WGPUStatus_Success)
    {
        fmt::print("Could not get device limits\n");
        return;
    }

    fmt::print("Device limits:\n");
    report_limits(limits);
}

void report_surface_capabilities(WGPUSurface const surface, WGPUAdapter const adapter)
{
    WGPUSurfaceCapabilities cap{};
    if (wgpuSurfaceGetCapabilities(surface, adapter, &cap) != WGPUStatus_Success)
    {
        fmt::print("Could not get surface capabilities\n");
        return;
    }

    fmt::print("Surface capabilities:\n");
    fmt::print("\tformats:\n");
    for (std::size_t i = 0; i < cap.formatCount; ++i)
        fmt::print("\t\t{}\n", to_string(cap.formats[i]));

    fmt::print("\talphaModes:\n");
    for (std::size_t i = 0; i < cap.alphaModeCount; ++i)
        fmt::print("\t\t{}\n", to_string(cap.alphaModes[i]));

    fmt::print("\tpresentModes:\n");
    for (std::size_t i = 0; i < cap.presentModeCount; ++i)
        fmt::print("\t\t{}\n", to_string(cap.presentModes[i]));

    wgpuSurfaceCapabilitiesFreeMembers(cap);
}

fmt::string_view to_string_view(WGPUStringView const value)
{
    if (!value.data)
        return {};

    // WGPU_STRLEN marks a null-terminated string
    std::size_t const len = (value.length == WGPU_STRLEN) ? std::strlen(value.data) : value.length;
    return {value.data, len};
}

char const* to_string(WGPUAdapterType const value)
{
    switch (value)
    {
        case WGPUAdapterType_DiscreteGPU:
            return "DiscreteGPU";
        case WGPUAdapterType_IntegratedGPU:
            return "IntegratedGPU";
        case WGPUAdapterType_CPU:
            return "CPU";
        default:
            return "Unknown";
    }
}

char const* to_string(WGPUBackendType const value)
{
    switch (value)
    {
        case WGPUBackendType_Null:
            return "Null";
        case WGPUBackendType_WebGPU:
            return "WebGPU";
        case WGPUBackendType_D3D11:
            return "D3D11";
        case WGPUBackendType_D3D12:
            return "D3D12";
        case WGPUBackendType_Metal:
            return "Metal";
        case WGPUBackendType_Vulkan:
            return "Vulkan";
        case WGPUBackendType_OpenGL:
            return "OpenGL";
        case WGPUBackendType_OpenGLES:
            return "OpenGLES";
        default:
            return "Undefined";
    }
}

char const* to_string(WGPUErrorType const value)
{
    switch (value)
    {
        case WGPUErrorType_NoError:
            return "NoError";
        case WGPUErrorType_Validation:
            return "Validation";
        case WGPUErrorType_OutOfMemory:
            return "OutOfMemory";
        case WGPUErrorType_Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

char const* to_string(WGPUDeviceLostReason const value)
{
    switch (value)
    {
        case WGPUDeviceLostReason_Destroyed:
            return "Destroyed";
        case WGPUDeviceLostReason_FailedCreation:
            return "FailedCreation";
        default:
            return "Unknown";
    }
}

char const* to_string(WGPUSurfaceGetCurrentTextureStatus const value)
{
    switch (value)
    {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
            return "SuccessOptimal";
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            return "SuccessSuboptimal";
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
            return "Timeout";
        case WGPUSurfaceGetCurrentTextureStatus_Outdated:
            return "Outdated";
        case WGPUSurfaceGetCurrentTextureStatus_Lost:
            return "Lost";
        default:
            return "Error";
    }
}

char const* to_string(WGPUTextureFormat const value)
{
    switch (value)
    {
        case WGPUTextureFormat_RGBA8Unorm:
            return "RGBA8Unorm";
        case WGPUTextureFormat_RGBA8UnormSrgb:
            return "RGBA8UnormSrgb";
        case WGPUTextureFormat_BGRA8Unorm:
            return "BGRA8Unorm";
        case WGPUTextureFormat_BGRA8UnormSrgb:
            return "BGRA8UnormSrgb";
        case WGPUTextureFormat_RGB10A2Unorm:
            return "RGB10A2Unorm";
        case WGPUTextureFormat_RGBA16Float:
            return "RGBA16Float";
        case WGPUTextureFormat_Depth24Plus:
            return "Depth24Plus";
        case WGPUTextureFormat_Depth32Float:
            return "Depth32Float";
        default:
            return "Other";
    }
}

char const* to_string(WGPUCompositeAlphaMode const value)
{
    switch (value)
    {
        case WGPUCompositeAlphaMode_Auto:
            return "Auto";
        case WGPUCompositeAlphaMode_Opaque:
            return "Opaque";
        case WGPUCompositeAlphaMode_Premultiplied:
            return "Premultiplied";
        case WGPUCompositeAlphaMode_Unpremultiplied:
            return "Unpremultiplied";
        case WGPUCompositeAlphaMode_Inherit:
            return "Inherit";
        default:
            return "Unknown";
    }
}

char const* to_string(WGPUPresentMode const value)
{
    switch (value)
    {
        case WGPUPresentMode_Fifo:
            return "Fifo";
        case WGPUPresentMode_FifoRelaxed:
            return "FifoRelaxed";
        case WGPUPresentMode_Immediate:
            return "Immediate";
        case WGPUPresentMode_Mailbox:
            return "Mailbox";
        default:
            return "Undefined";
    }
}

} // namespace pentacube
