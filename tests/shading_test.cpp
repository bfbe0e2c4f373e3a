#include <initializer_list>
#include <limits>

#include <gtest/gtest.h>

#include <Eigen/Geometry>

#include <shading.hpp>

#include "test_utils.hpp"

namespace pentacube
{
namespace
{

// 2x2 RGBA image
// clang-format off
constexpr u8 checker_texels[]{
    0, 0, 0, 255,     255, 0, 0, 255,
    0, 255, 0, 255,   0, 0, 255, 255,
};
// clang-format on

ImageView checker_image() { return {checker_texels, 2, 2}; }

SamplerState make_sampler(AddressMode const address, FilterMode const filter)
{
    return {
        .address_u = address,
        .address_v = address,
        .address_w = address,
        .mag_filter = filter,
        .min_filter = filter,
        .mipmap_filter = FilterMode_Nearest,
    };
}

InstanceRaw identity_instance()
{
    InstanceRaw result{};
    Eigen::Map<Mat4<f32>>{result.model}.setIdentity();
    return result;
}

} // namespace

TEST(FlatColorVertex, PassesThroughPositionAndColor)
{
    FlatVertex const v{{0.25f, -0.5f}, {0.1f, 0.2f, 0.3f}, 0.0f};
    FlatColorVertexOut const out = flat_color_vertex(v);

    EXPECT_TRUE(all_near(out.position, Vec4<f32>{0.25f, -0.5f, 0.0f, 1.0f}));
    EXPECT_TRUE(all_near(out.color, Vec3<f32>{0.1f, 0.2f, 0.3f}));
}

TEST(FlatColorVertex, TexturedFlagYieldsZeroOutput)
{
    FlatVertex const v{{0.25f, -0.5f}, {0.1f, 0.2f, 0.3f}, 1.0f};
    FlatColorVertexOut const out = flat_color_vertex(v);

    EXPECT_TRUE(out.position.isZero());
    EXPECT_TRUE(out.color.isZero());
}

TEST(FlatColorVertex, OnlyExactFlagValueCollapses)
{
    FlatVertex const v{{0.5f, 0.5f}, {1.0f, 0.0f, 0.0f}, 0.5f};
    FlatColorVertexOut const out = flat_color_vertex(v);

    EXPECT_TRUE(all_near(out.position, Vec4<f32>{0.5f, 0.5f, 0.0f, 1.0f}));
    EXPECT_TRUE(all_near(out.color, Vec3<f32>{1.0f, 0.0f, 0.0f}));
}

TEST(FlatColorFragment, AppendsOpaqueAlpha)
{
    Vec4<f32> const c = flat_color_fragment({0.2f, 0.4f, 0.6f});
    EXPECT_TRUE(all_near(c, Vec4<f32>{0.2f, 0.4f, 0.6f, 1.0f}));
}

TEST(TexturedVertex, IdentityTransformsKeepPosition)
{
    MeshVertex const v{{0.5f, -0.5f, 0.25f}, {0.75f, 0.125f}};
    TexturedVertexOut const out = textured_vertex(v, identity_instance(), CameraUniform::make());

    EXPECT_TRUE(all_near(out.position, Vec4<f32>{0.5f, -0.5f, 0.25f, 1.0f}));
    EXPECT_EQ(out.tex_coords.x(), 0.75f);
    EXPECT_EQ(out.tex_coords.y(), 0.125f);
}

TEST(TexturedVertex, AppliesModelBeforeCamera)
{
    MeshVertex const v{{1.0f, 0.0f, 0.0f}, {0.0f, 0.0f}};

    // Model translates by (0, 2, 0), camera scales by 2
    InstanceRaw instance = identity_instance();
    instance.model[13] = 2.0f;

    CameraUniform camera = CameraUniform::make();
    camera.view_proj[0] = 2.0f;
    camera.view_proj[5] = 2.0f;
    camera.view_proj[10] = 2.0f;

    TexturedVertexOut const out = textured_vertex(v, instance, camera);
    EXPECT_TRUE(all_near(out.position, Vec4<f32>{2.0f, 4.0f, 0.0f, 1.0f}));
}

TEST(TexturedVertex, MatchesMatrixProduct)
{
    MeshVertex const v{{0.3f, -0.2f, 0.7f}, {0.0f, 1.0f}};

    Mat4<f32> model = Mat4<f32>::Identity();
    model.topLeftCorner<3, 3>() = Eigen::AngleAxis<f32>(0.3f, Vec3<f32>::UnitY()).toRotationMatrix();
    model.col(3).head<3>() = Vec3<f32>{1.0f, -2.0f, 3.0f};

    Mat4<f32> view_proj = Mat4<f32>::Identity();
    view_proj(3, 2) = -1.0f;
    view_proj(3, 3) = 0.0f;

    InstanceRaw instance{};
    Eigen::Map<Mat4<f32>>{instance.model} = model;

    CameraUniform camera{};
    Eigen::Map<Mat4<f32>>{camera.view_proj} = view_proj;

    Vec4<f32> const expect = view_proj * model * Vec4<f32>{0.3f, -0.2f, 0.7f, 1.0f};
    EXPECT_TRUE(all_near(textured_vertex(v, instance, camera).position, expect));
}

TEST(AddressMode, ClampToEdge)
{
    EXPECT_EQ(apply_address_mode(AddressMode_ClampToEdge, -3, 4), 0);
    EXPECT_EQ(apply_address_mode(AddressMode_ClampToEdge, 2, 4), 2);
    EXPECT_EQ(apply_address_mode(AddressMode_ClampToEdge, 9, 4), 3);
}

TEST(AddressMode, Repeat)
{
    EXPECT_EQ(apply_address_mode(AddressMode_Repeat, -1, 4), 3);
    EXPECT_EQ(apply_address_mode(AddressMode_Repeat, 4, 4), 0);
    EXPECT_EQ(apply_address_mode(AddressMode_Repeat, 9, 4), 1);
}

TEST(AddressMode, MirrorRepeat)
{
    EXPECT_EQ(apply_address_mode(AddressMode_MirrorRepeat, 3, 4), 3);
    EXPECT_EQ(apply_address_mode(AddressMode_MirrorRepeat, 4, 4), 3);
    EXPECT_EQ(apply_address_mode(AddressMode_MirrorRepeat, 5, 4), 2);
    EXPECT_EQ(apply_address_mode(AddressMode_MirrorRepeat, 8, 4), 0);
    EXPECT_EQ(apply_address_mode(AddressMode_MirrorRepeat, -1, 4), 0);
    EXPECT_EQ(apply_address_mode(AddressMode_MirrorRepeat, -2, 4), 1);
}

TEST(ImageView, TexelsAreNormalized)
{
    ImageView const image = checker_image();
    EXPECT_TRUE(all_near(image.texel(1, 0), Vec4<f32>{1.0f, 0.0f, 0.0f, 1.0f}));
    EXPECT_TRUE(all_near(image.texel(0, 1), Vec4<f32>{0.0f, 1.0f, 0.0f, 1.0f}));
}

TEST(Sample, NearestPicksContainingTexel)
{
    ImageView const image = checker_image();
    SamplerState const sampler = make_sampler(AddressMode_ClampToEdge, FilterMode_Nearest);

    EXPECT_TRUE(all_near(sample(image, sampler, {0.25f, 0.25f}), image.texel(0, 0)));
    EXPECT_TRUE(all_near(sample(image, sampler, {0.75f, 0.25f}), image.texel(1, 0)));
    EXPECT_TRUE(all_near(sample(image, sampler, {0.25f, 0.75f}), image.texel(0, 1)));
    EXPECT_TRUE(all_near(sample(image, sampler, {0.99f, 0.99f}), image.texel(1, 1)));
}

TEST(Sample, NearestOutOfRangeFollowsAddressMode)
{
    ImageView const image = checker_image();

    SamplerState const clamp = make_sampler(AddressMode_ClampToEdge, FilterMode_Nearest);
    EXPECT_TRUE(all_near(sample(image, clamp, {1.75f, 0.25f}), image.texel(1, 0)));

    SamplerState const repeat = make_sampler(AddressMode_Repeat, FilterMode_Nearest);
    EXPECT_TRUE(all_near(sample(image, repeat, {1.25f, 0.25f}), image.texel(0, 0)));

    SamplerState const mirror = make_sampler(AddressMode_MirrorRepeat, FilterMode_Nearest);
    EXPECT_TRUE(all_near(sample(image, mirror, {1.25f, 0.25f}), image.texel(1, 0)));
}

TEST(Sample, LinearAtTexelCenterReturnsTexel)
{
    ImageView const image = checker_image();
    SamplerState const sampler = make_sampler(AddressMode_ClampToEdge, FilterMode_Linear);

    EXPECT_TRUE(all_near(sample(image, sampler, {0.25f, 0.25f}), image.texel(0, 0)));
    EXPECT_TRUE(all_near(sample(image, sampler, {0.75f, 0.75f}), image.texel(1, 1)));
}

TEST(Sample, LinearBlendsNeighbors)
{
    ImageView const image = checker_image();
    SamplerState const sampler = make_sampler(AddressMode_ClampToEdge, FilterMode_Linear);

    // Halfway between texels (0, 0) and (1, 0)
    EXPECT_TRUE(all_near(
        sample(image, sampler, {0.5f, 0.25f}),
        Vec4<f32>{0.5f, 0.0f, 0.0f, 1.0f}));

    // Center of the image
    EXPECT_TRUE(all_near(
        sample(image, sampler, {0.5f, 0.5f}),
        Vec4<f32>{0.25f, 0.25f, 0.25f, 1.0f}));
}

TEST(Sample, LinearAtCornerDependsOnAddressMode)
{
    ImageView const image = checker_image();

    SamplerState const clamp = make_sampler(AddressMode_ClampToEdge, FilterMode_Linear);
    EXPECT_TRUE(all_near(sample(image, clamp, {0.0f, 0.0f}), image.texel(0, 0)));

    // Wraps to an equal blend of all four texels
    SamplerState const repeat = make_sampler(AddressMode_Repeat, FilterMode_Linear);
    EXPECT_TRUE(all_near(
        sample(image, repeat, {0.0f, 0.0f}),
        Vec4<f32>{0.25f, 0.25f, 0.25f, 1.0f}));
}

TEST(Sample, HugeCoordinatesFollowAddressMode)
{
    ImageView const image = checker_image();
    f32 const huge = 3.0e9f;

    for (FilterMode const filter : {FilterMode_Nearest, FilterMode_Linear})
    {
        // Large even integers are whole periods of both repeating modes
        for (AddressMode const address : {AddressMode_Repeat, AddressMode_MirrorRepeat})
        {
            SamplerState const sampler = make_sampler(address, filter);
            Vec4<f32> const expect = sample(image, sampler, {0.0f, 0.25f});
            EXPECT_TRUE(all_near(sample(image, sampler, {huge, 0.25f}), expect));
            EXPECT_TRUE(all_near(sample(image, sampler, {-huge, 0.25f}), expect));
        }

        SamplerState const clamp = make_sampler(AddressMode_ClampToEdge, filter);
        EXPECT_TRUE(all_near(
            sample(image, clamp, {huge, 0.25f}),
            sample(image, clamp, {1.0f, 0.25f})));
        EXPECT_TRUE(all_near(
            sample(image, clamp, {-huge, 0.25f}),
            sample(image, clamp, {0.0f, 0.25f})));
    }

    SamplerState const repeat = make_sampler(AddressMode_Repeat, FilterMode_Nearest);
    EXPECT_TRUE(all_near(sample(image, repeat, {huge, -huge}), image.texel(0, 0)));

    SamplerState const clamp = make_sampler(AddressMode_ClampToEdge, FilterMode_Nearest);
    EXPECT_TRUE(all_near(sample(image, clamp, {huge, huge}), image.texel(1, 1)));
    EXPECT_TRUE(all_near(sample(image, clamp, {huge, -huge}), image.texel(1, 0)));
}

TEST(Sample, NonFiniteCoordinatesSampleOrigin)
{
    ImageView const image = checker_image();
    f32 const nan = std::numeric_limits<f32>::quiet_NaN();
    f32 const inf = std::numeric_limits<f32>::infinity();

    for (AddressMode const address :
         {AddressMode_ClampToEdge, AddressMode_Repeat, AddressMode_MirrorRepeat})
    {
        SamplerState const sampler = make_sampler(address, FilterMode_Nearest);
        Vec4<f32> const expect = sample(image, sampler, {0.0f, 0.0f});
        EXPECT_TRUE(all_near(sample(image, sampler, {nan, 0.0f}), expect));
        EXPECT_TRUE(all_near(sample(image, sampler, {0.0f, inf}), expect));
        EXPECT_TRUE(all_near(sample(image, sampler, {-inf, nan}), expect));
    }
}

TEST(TexturedFragment, MatchesSampler)
{
    ImageView const image = checker_image();
    SamplerState const sampler = make_sampler(AddressMode_ClampToEdge, FilterMode_Linear);
    Vec2<f32> const uv{0.6f, 0.3f};

    EXPECT_TRUE(all_near(textured_fragment(uv, image, sampler), sample(image, sampler, uv)));
}

} // namespace pentacube
