#include <gtest/gtest.h>

#include <camera.hpp>
#include <gfx_utils.hpp>

#include "test_utils.hpp"

namespace pentacube
{
namespace
{

Vec3<f32> project(Mat4<f32> const& view_proj, Vec3<f32> const& p)
{
    Vec4<f32> const clip = view_proj * p.homogeneous();
    return clip.head<3>() / clip.w();
}

} // namespace

TEST(Camera, Defaults)
{
    Camera const camera{};
    EXPECT_TRUE(all_near(camera.eye, Vec3<f32>{0.0f, 1.3f, 6.0f}));
    EXPECT_TRUE(camera.target.isZero());
    EXPECT_TRUE(all_near(camera.up, Vec3<f32>::UnitY()));
    EXPECT_FLOAT_EQ(camera.fov_y_deg, 45.0f);
    EXPECT_FLOAT_EQ(camera.z_near, 0.1f);
    EXPECT_FLOAT_EQ(camera.z_far, 100.0f);
}

TEST(Camera, RemappedProjectionMatchesZeroToOneDepth)
{
    f32 const fov_y = deg_to_rad(45.0f);
    Mat4<f32> const remapped = make_opengl_to_wgpu()
        * make_perspective<NdcType_OpenGl>(fov_y, 1.5f, 0.1f, 100.0f);
    Mat4<f32> const direct = make_perspective<NdcType_Default>(fov_y, 1.5f, 0.1f, 100.0f);

    EXPECT_TRUE(all_near(remapped, direct, 1.0e-4f));
}

TEST(Camera, TargetProjectsToCenter)
{
    Camera const camera{};
    Vec3<f32> const ndc = project(camera.view_proj(), camera.target);

    EXPECT_NEAR(ndc.x(), 0.0f, 1.0e-5f);
    EXPECT_NEAR(ndc.y(), 0.0f, 1.0e-5f);
    EXPECT_GT(ndc.z(), 0.0f);
    EXPECT_LT(ndc.z(), 1.0f);
}

TEST(Camera, ClipPlanesMapToUnitDepthRange)
{
    Camera const camera{};
    Vec3<f32> const dir = (camera.target - camera.eye).normalized();
    Mat4<f32> const view_proj = camera.view_proj();

    EXPECT_NEAR(project(view_proj, camera.eye + dir * camera.z_near).z(), 0.0f, 1.0e-4f);
    EXPECT_NEAR(project(view_proj, camera.eye + dir * camera.z_far).z(), 1.0f, 1.0e-4f);
}

TEST(Camera, SetAspect)
{
    Camera camera{};
    camera.set_aspect(1920, 1080);
    EXPECT_FLOAT_EQ(camera.aspect, 1920.0f / 1080.0f);
}

TEST(Camera, SetAspectIgnoresEmptyFramebuffer)
{
    Camera camera{};
    f32 const prev = camera.aspect;

    camera.set_aspect(0, 600);
    EXPECT_EQ(camera.aspect, prev);

    camera.set_aspect(800, 0);
    EXPECT_EQ(camera.aspect, prev);
}

TEST(Camera, SetEye)
{
    Camera camera{};
    camera.set_eye({1.0f, 2.0f, 3.0f});
    EXPECT_TRUE(all_near(camera.eye, Vec3<f32>{1.0f, 2.0f, 3.0f}));
}

TEST(CameraUniform, StartsAsIdentity)
{
    CameraUniform const uniform = CameraUniform::make();
    Eigen::Map<Mat4<f32> const> const m{uniform.view_proj};
    EXPECT_TRUE(m.isIdentity());
}

TEST(CameraUniform, StoresViewProjColumnMajor)
{
    Camera camera{};
    camera.set_aspect(800, 600);

    CameraUniform uniform = CameraUniform::make();
    uniform.update(camera);

    Mat4<f32> const expect = camera.view_proj();
    for (int col = 0; col < 4; ++col)
    {
        for (int row = 0; row < 4; ++row)
            EXPECT_FLOAT_EQ(uniform.view_proj[col * 4 + row], expect(row, col));
    }
}

} // namespace pentacube
