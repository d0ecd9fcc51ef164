#pragma once

#include <cstdint>

using u32 = std::uint32_t;
using i64 = std::int64_t;
