#include <cassert>

#include <fmt/core.h>

#include <GLFW/glfw3.h>
#include <webgpu/webgpu.h>

#include <assets.hpp>
#include <camera.hpp>
#include <config.hpp>
#include <dr_shim.hpp>
#include <flat_color_pass.hpp>
#include <gpu_context.hpp>
#include <instances.hpp>
#include <render_targets.hpp>
#include <textured_pass.hpp>
#include <wgpu_utils.hpp>

namespace pentacube
{
namespace
{

struct AppState
{
    AppConfig config;
    GLFWwindow* window;
    GpuContext gpu;
    DepthTarget depth;
    FlatColorPass flat_pass;
    TexturedPass textured_pass;
    Camera camera;
    CameraUniform camera_uniform;
    f64 start_time;
};

AppState state{};

bool load_shader(char const* const relative_path, ShaderAsset& result)
{
    String const path = asset_path(relative_path);
    if (!load_shader_asset(path.c_str(), result))
    {
        fmt::print("Failed to load shader \"{}\"\n", path);
        return false;
    }
    return true;
}

bool init_passes()
{
    AppConfig const& config = state.config;
    WGPUDevice const device = state.gpu.device;

    ShaderAsset flat_shader{};
    if (!load_shader(config.assets.flat_color_shader, flat_shader))
        return false;

    ShaderAsset textured_shader{};
    if (!load_shader(config.assets.textured_shader, textured_shader))
        return false;

    ImageAsset diffuse_image{};
    {
        String const path = asset_path(config.assets.diffuse_image);
        if (!load_image_asset(path.c_str(), diffuse_image))
        {
            fmt::print("Failed to load image \"{}\"\n", path);
            return false;
        }
    }

    DynamicArray<InstanceRaw> const instances = to_raw(
        make_instance_grid(config.instances.rows, config.instances.per_row));

    if (instances.empty())
    {
        fmt::print(
            "Instance grid is empty (rows: {}, per row: {})\n",
            config.instances.rows,
            config.instances.per_row);
        return false;
    }

    state.flat_pass = FlatColorPass::make(
        device,
        {flat_shader.src.c_str(), WGPU_STRLEN},
        default_surface_format,
        DepthTarget::format);

    state.textured_pass = TexturedPass::make(
        device,
        state.gpu.queue,
        {textured_shader.src.c_str(), WGPU_STRLEN},
        diffuse_image,
        config.diffuse_sampler,
        instances,
        default_surface_format,
        DepthTarget::format);

    return true;
}

bool init_app()
{
    glfwSetErrorCallback([](int code, char const* msg) {
        fmt::print("GLFW error ({}): {}\n", code, msg);
    });

    if (!glfwInit())
    {
        fmt::print("Failed to initialize GLFW\n");
        return false;
    }

    // Create GLFW window
    auto const& win = state.config.window;
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    state.window = glfwCreateWindow(win.width, win.height, win.title, nullptr, nullptr);
    if (!state.window)
    {
        fmt::print("Failed to create window\n");
        return false;
    }

    // Create WebGPU context and report details
    if (!GpuContext::make({state.window}, state.gpu))
    {
        fmt::print("Failed to create WebGPU context\n");
        return false;
    }
    state.gpu.report();

    // Create additional render targets
    int fb_size[2];
    glfwGetFramebufferSize(state.window, fb_size, fb_size + 1);
    state.depth = DepthTarget::make(state.gpu.device, fb_size[0], fb_size[1]);
    state.camera = state.config.camera;
    state.camera.set_aspect(fb_size[0], fb_size[1]);

    // Handle framebuffer resize
    glfwSetFramebufferSizeCallback(state.window, [](GLFWwindow* /*window*/, int width, int height) {
        state.gpu.config_surface(width, height);
        state.depth.resize(state.gpu.device, width, height);
        state.camera.set_aspect(width, height);
    });

    glfwSetKeyCallback(
        state.window,
        [](GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
            if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
                glfwSetWindowShouldClose(window, GLFW_TRUE);
        });

    if (!init_passes())
        return false;

    state.camera_uniform = CameraUniform::make();
    state.start_time = glfwGetTime();

    return true;
}

void deinit_app()
{
    if (state.textured_pass.pipeline)
        TexturedPass::release(state.textured_pass);

    if (state.flat_pass.pipeline)
        FlatColorPass::release(state.flat_pass);

    if (state.depth.texture)
        DepthTarget::release(state.depth);

    GpuContext::release(state.gpu);

    if (state.window)
        glfwDestroyWindow(state.window);

    glfwTerminate();
    state = {};
}

void update_uniforms(WGPUQueue const queue)
{
    auto const elapsed = static_cast<f32>(glfwGetTime() - state.start_time);
    state.textured_pass.update_elapsed_time(queue, elapsed);

    state.camera_uniform.update(state.camera);
    state.textured_pass.update_camera(queue, state.camera_uniform);
}

bool render_frame()
{
    glfwPollEvents();

    WGPUTextureView surface_view{};
    auto const status = acquire_surface_view(state.gpu.surface, surface_view);

    switch (status)
    {
        case WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal:
        case WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal:
            break;
        case WGPUSurfaceGetCurrentTextureStatus_Timeout:
            return false;
        case WGPUSurfaceGetCurrentTextureStatus_Outdated:
        case WGPUSurfaceGetCurrentTextureStatus_Lost:
        {
            // Skip this frame and render to a fresh surface texture on the next
            state.gpu.config_surface(state.window);
            return false;
        }
        default:
        {
            fmt::print("Failed to acquire surface texture ({})\n", to_string(status));
            glfwSetWindowShouldClose(state.window, GLFW_TRUE);
            return false;
        }
    }

    auto const drop_view = defer([=]() { wgpuTextureViewRelease(surface_view); });

    WGPUCommandEncoder const cmd_encoder = wgpuDeviceCreateCommandEncoder(
        state.gpu.device,
        nullptr);
    assert(cmd_encoder);
    auto const drop_cmd_encoder = defer([=]() { wgpuCommandEncoderRelease(cmd_encoder); });

    WGPUQueue const queue = state.gpu.queue;
    update_uniforms(queue);

    // Render pass
    {
        auto const& frame = state.config.frame;
        RenderPass::ClearValues const clear{
            .color = {
                frame.clear_color[0],
                frame.clear_color[1],
                frame.clear_color[2],
                frame.clear_color[3],
            },
            .depth = frame.clear_depth,
        };

        RenderPass pass = RenderPass::begin(cmd_encoder, surface_view, state.depth.view, clear);
        auto const end_pass = defer([&]() { RenderPass::end(pass); });

        state.flat_pass.draw(pass.encoder);
        state.textured_pass.draw(pass.encoder);
    }

    // Create encoded commands
    WGPUCommandBuffer const cmds = wgpuCommandEncoderFinish(cmd_encoder, nullptr);
    assert(cmds);
    auto const drop_cmds = defer([=]() { wgpuCommandBufferRelease(cmds); });

    // Submit encoded commands
    wgpuQueueSubmit(queue, 1, &cmds);

    return true;
}

} // namespace
} // namespace pentacube

int main(int /*argc*/, char** /*argv*/)
{
    using namespace pentacube;

    auto const _ = defer([]() { deinit_app(); });

    if (!init_app())
        return 1;

    constexpr auto loop_cb = [](void* /*userdata*/) -> bool { return render_frame(); };
    MainLoop{state.gpu.surface, state.window, loop_cb}.begin();

    return 0;
}
