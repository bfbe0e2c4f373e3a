#pragma once

#include "dr_shim.hpp"

namespace pentacube
{

/// Reads a file to a given buffer
bool read_text_file(char const* path, String& buffer);

} // namespace pentacube
