#include "wgpu_glfw.h"

#include <fmt/core.h>

#if defined(_WIN32)
#define GLFW_EXPOSE_NATIVE_WIN32
#elif defined(__linux__)
#define GLFW_EXPOSE_NATIVE_X11
#define GLFW_EXPOSE_NATIVE_WAYLAND
#endif

#include <GLFW/glfw3native.h>

namespace
{

WGPUSurface make_surface(WGPUInstance const instance, WGPUChainedStruct const* const source)
{
    WGPUSurfaceDescriptor desc{};
    desc.nextInChain = source;
    return wgpuInstanceCreateSurface(instance, &desc);
}

} // namespace

extern "C" WGPUSurface wgpu_make_surface_from_glfw(
    WGPUInstance const instance,
    GLFWwindow* const window)
{
#if defined(_WIN32)
    WGPUSurfaceSourceWindowsHWND src{};
    src.chain.sType = WGPUSType_SurfaceSourceWindowsHWND;
    src.hinstance = GetModuleHandle(nullptr);
    src.hwnd = glfwGetWin32Window(window);
    return make_surface(instance, &src.chain);
#elif defined(__linux__)
    switch (glfwGetPlatform())
    {
        case GLFW_PLATFORM_X11:
        {
            WGPUSurfaceSourceXlibWindow src{};
            src.chain.sType = WGPUSType_SurfaceSourceXlibWindow;
            src.display = glfwGetX11Display();
            src.window = glfwGetX11Window(window);
            return make_surface(instance, &src.chain);
        }
        case GLFW_PLATFORM_WAYLAND:
        {
            WGPUSurfaceSourceWaylandSurface src{};
            src.chain.sType = WGPUSType_SurfaceSourceWaylandSurface;
            src.display = glfwGetWaylandDisplay();
            src.surface = glfwGetWaylandWindow(window);
            return make_surface(instance, &src.chain);
        }
        default:
            fmt::print("Unsupported GLFW platform: {}\n", glfwGetPlatform());
            return nullptr;
    }
#else
    (void)instance;
    (void)window;
    fmt::print("Surface creation from GLFW is not supported on this platform\n");
    return nullptr;
#endif
}
