#pragma once

#include <amc/flatset.hpp>
#include <functional>
#include <memory>

namespace routepat {

template <class T, class Compare = std::less<T>, class Alloc = std::allocator<T>>
using FlatSet = amc::FlatSet<T, Compare, Alloc>;

}  // namespace routepat
