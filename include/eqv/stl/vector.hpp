#pragma once

#include "eqv/memory.hpp"

#include <vector>


namespace eqv::stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

} // namespace eqv::stl
