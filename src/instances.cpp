#include "instances.hpp"

#include <dr/linalg_reshape.hpp>

#include "gfx_utils.hpp"

namespace pentacube
{

InstanceRaw Instance::to_raw() const
{
    InstanceRaw result{};
    as_mat<4, 4>(result.model) = //
        make_translate(position) * make_affine(rotation);
    return result;
}

DynamicArray<Instance> make_instance_grid(i32 const rows, i32 const per_row)
{
    DynamicArray<Instance> result{};
    if (rows <= 0 || per_row <= 0)
        return result;

    result.reserve(rows * per_row);

    f32 const half_extent = per_row * 0.5f;
    Vec3<f32> const displacement{half_extent, 0.0f, half_extent};
    f32 const tilt = deg_to_rad(45.0f);

    for (i32 z = 0; z < rows; ++z)
    {
        for (i32 x = 0; x < per_row; ++x)
        {
            Vec3<f32> const p =
                Vec3<f32>{x * instance_spacing, instance_height, z * instance_spacing}
                - displacement;

            // Normalizing a zero vector is undefined so an instance at the origin keeps an identity
            // rotation
            Mat3<f32> r = Mat3<f32>::Identity();
            if (p != Vec3<f32>::Zero())
                r = make_rotate(tilt, p.normalized());

            result.push_back({p, r});
        }
    }

    return result;
}

DynamicArray<InstanceRaw> to_raw(DynamicArray<Instance> const& instances)
{
    DynamicArray<InstanceRaw> result{};
    result.reserve(instances.size());

    for (Instance const& inst : instances)
        result.push_back(inst.to_raw());

    return result;
}

} // namespace pentacube
