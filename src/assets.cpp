#include "assets.hpp"

#include <fmt/core.h>

#include <stb_image.h>

#include "file_utils.hpp"

#ifndef PENTACUBE_ASSET_DIR
#define PENTACUBE_ASSET_DIR "assets"
#endif

namespace pentacube
{

bool load_image_asset(char const* const path, ImageAsset& result)
{
    constexpr i32 stride = 4;
    i32 width, height, src_stride;
    u8* const data = stbi_load(path, &width, &height, &src_stride, stride);
    if (!data)
    {
        fmt::print("Failed to load image \"{}\": {}\n", path, stbi_failure_reason());
        return false;
    }

    constexpr auto free_data = [](u8* data) { stbi_image_free(data); };
    result = {{data, free_data}, width, height, stride};
    return true;
}

bool load_shader_asset(char const* const path, ShaderAsset& result)
{
    if (!read_text_file(path, result.src))
    {
        fmt::print("Failed to read shader \"{}\"\n", path);
        return false;
    }

    return true;
}

String asset_path(char const* const relative_path)
{
    String result{PENTACUBE_ASSET_DIR};
    if (!result.empty() && result.back() != '/')
        result.push_back('/');

    result.append(relative_path);
    return result;
}

} // namespace pentacube
