#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for gridhash_spatial module

#include <cstdint>

namespace gridhash_spatial {

// Entities
template<typename T>
struct AabbTraits;
struct Rect;

// Cells
enum class CellRounding : std::uint8_t;
struct CellSpan;

// Configuration
struct GridHashConfig;

// Grid hash
struct GridHashStats;
template<typename T>
struct GridHashSnapshot;
template<typename T>
class GridHash;

} // namespace gridhash_spatial
