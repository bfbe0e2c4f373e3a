#pragma once

#include <memory>

#include "dr_shim.hpp"

namespace pentacube
{

struct ImageAsset
{
    using Delete = void(u8*);
    std::unique_ptr<u8, Delete*> data{nullptr, nullptr};
    i32 width{};
    i32 height{};
    i32 stride{};
    i32 size() const { return width * height * stride; }
};

struct ShaderAsset
{
    String src{};
};

/// Loads an image from disk as 8-bit RGBA regardless of the channel count stored in the file
bool load_image_asset(char const* path, ImageAsset& result);

bool load_shader_asset(char const* path, ShaderAsset& result);

/// Joins a path relative to the asset root configured at build time
String asset_path(char const* relative_path);

} // namespace pentacube
