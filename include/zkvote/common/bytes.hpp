#pragma once

#include <cstdint>
#include <vector>

namespace zkvote {

using Bytes = std::vector<uint8_t>;

}  // namespace zkvote
