#ifndef PENTACUBE_WGPU_GLFW_H
#define PENTACUBE_WGPU_GLFW_H

#include <GLFW/glfw3.h>

#include <webgpu/webgpu.h>

#ifdef __cplusplus
extern "C"
{
#endif

/// Creates a surface from the native window handle behind a GLFW window. Returns null if the
/// window system is not supported.
WGPUSurface wgpu_make_surface_from_glfw(WGPUInstance instance, GLFWwindow* window);

#ifdef __cplusplus
}
#endif

#endif // PENTACUBE_WGPU_GLFW_H
