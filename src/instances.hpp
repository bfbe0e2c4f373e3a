#pragma once

#include "dr_shim.hpp"
#include "vertex_types.hpp"

namespace pentacube
{

struct Instance
{
    Vec3<f32> position;
    Mat3<f32> rotation;

    /// Returns the instance transform, rotation applied before translation
    InstanceRaw to_raw() const;
};

inline constexpr i32 default_instances_per_row = 10;
inline constexpr f32 instance_spacing = 3.0f;
inline constexpr f32 instance_height = -2.0f;

/// Lays out a grid of rows * per_row instances on the plane y = instance_height, centered around
/// the origin. Each instance is tilted 45 degrees about the direction of its position.
DynamicArray<Instance> make_instance_grid(i32 rows, i32 per_row = default_instances_per_row);

DynamicArray<InstanceRaw> to_raw(DynamicArray<Instance> const& instances);

} // namespace pentacube
