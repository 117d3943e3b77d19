#pragma once

#include <amc/flatmap.hpp>
#include <functional>
#include <memory>
#include <utility>

namespace routepat {

// Sorted vector based map. Route tables are built once and looked up with small key sets,
// for which contiguous storage beats node based maps.
template <class Key, class T, class Compare = std::less<Key>, class Alloc = std::allocator<std::pair<Key, T>>>
using FlatMap = amc::FlatMap<Key, T, Compare, Alloc>;

}  // namespace routepat
