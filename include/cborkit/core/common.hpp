#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace cborkit::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;

}  // 命名空间 cborkit::core
