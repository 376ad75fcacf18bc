#pragma once

#include <amc/smallvector.hpp>  // IWYU pragma: export
#include <amc/vector.hpp>       // IWYU pragma: export
#include <cstddef>

namespace trellis {

template <class T>
using vector = amc::vector<T>;

template <class T, std::size_t N>
using SmallVector = amc::SmallVector<T, N>;

}  // namespace trellis
