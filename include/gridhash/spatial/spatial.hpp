#pragma once

/// @file spatial.hpp
/// @brief Main include file for gridhash_spatial module

#include "fwd.hpp"
#include "aabb.hpp"
#include "cell.hpp"
#include "config.hpp"
#include "grid_hash.hpp"

/// @namespace gridhash_spatial
/// @brief Broad phase spatial hashing
///
/// - **Aabb**: capability contract for anything with x, y, w, h bounds
/// - **Cells**: world to cell mapping and the bucket hash
/// - **GridHashConfig**: validated construction options, JSON loadable
/// - **GridHash**: per-frame rebuilt candidate index
