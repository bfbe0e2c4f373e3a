#pragma once

#include <dr/basic_types.hpp>
#include <dr/container_utils.hpp>
#include <dr/defer.hpp>
#include <dr/dynamic_array.hpp>
#include <dr/math.hpp>
#include <dr/math_types.hpp>
#include <dr/memory.hpp>
#include <dr/span.hpp>
#include <dr/string.hpp>

namespace pentacube
{

using namespace dr;

} // namespace pentacube
