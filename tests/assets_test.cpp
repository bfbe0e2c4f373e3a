#include <gtest/gtest.h>

#include <assets.hpp>
#include <config.hpp>

namespace pentacube
{

TEST(Assets, PathIsJoinedToAssetRoot)
{
    String const path = asset_path("shaders/flat_color.wgsl");
    EXPECT_GT(path.size(), String{"/shaders/flat_color.wgsl"}.size());
    EXPECT_EQ(path.substr(path.size() - 24), "/shaders/flat_color.wgsl");
}

TEST(Assets, MissingFilesFailToLoad)
{
    String const path = asset_path("does/not/exist.bin");

    ShaderAsset shader{};
    EXPECT_FALSE(load_shader_asset(path.c_str(), shader));

    ImageAsset image{};
    EXPECT_FALSE(load_image_asset(path.c_str(), image));
    EXPECT_EQ(image.data.get(), nullptr);
}

TEST(Assets, DiffuseImageLoadsAsRgba)
{
    AppConfig const config{};
    String const path = asset_path(config.assets.diffuse_image);

    ImageAsset image{};
    ASSERT_TRUE(load_image_asset(path.c_str(), image));
    EXPECT_EQ(image.width, 64);
    EXPECT_EQ(image.height, 64);
    EXPECT_EQ(image.stride, 4);
    EXPECT_EQ(image.size(), 64 * 64 * 4);

    // Source has no alpha channel so every texel is opaque
    u8 const* const data = image.data.get();
    for (i32 i = 0; i < image.width * image.height; ++i)
        ASSERT_EQ(data[i * 4 + 3], 255) << "texel " << i;
}

TEST(Assets, ShadersLoad)
{
    AppConfig const config{};

    for (char const* const name : {config.assets.flat_color_shader, config.assets.textured_shader})
    {
        String const path = asset_path(name);
        ShaderAsset shader{};
        ASSERT_TRUE(load_shader_asset(path.c_str(), shader)) << path;
        EXPECT_FALSE(shader.src.empty());
    }
}

} // namespace pentacube
