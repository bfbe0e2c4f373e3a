#include "file_utils.hpp"

#include <fstream>
#include <iterator>

namespace pentacube
{

bool read_text_file(char const* const path, String& buffer)
{
    std::ifstream in{path, std::ios::in};
    if (!in)
        return false;

    using Iter = std::istreambuf_iterator<char>;
    buffer.assign(Iter{in}, {});
    return true;
}

} // namespace pentacube
