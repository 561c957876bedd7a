#pragma once

#include <amc/smallvector.hpp>  // IWYU pragma: export
#include <amc/vector.hpp>       // IWYU pragma: export
#include <cstdint>

namespace ignyx {

template <class T>
using vector = amc::vector<T>;

template <class T, uint32_t N>
using SmallVector = amc::SmallVector<T, N>;

}  // namespace ignyx
