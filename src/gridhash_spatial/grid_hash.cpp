/// @file grid_hash.cpp
/// @brief GridHash non-template helpers and common instantiations
///
/// GridHash is header-only so callers can store any value type. This file
/// holds the stats formatter and instantiates the identifier-based variants
/// used by most callers.

#include <gridhash/spatial/grid_hash.hpp>

#include <iomanip>
#include <sstream>

namespace gridhash_spatial {

std::string format_stats(const GridHashStats& stats) {
    std::ostringstream oss;
    oss << "memberships=" << stats.memberships << "/" << stats.capacity
        << " buckets=" << stats.occupied_buckets << "/" << stats.buckets
        << " largest=" << stats.largest_bucket
        << " load=" << std::fixed << std::setprecision(2) << stats.load_factor;
    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class GridHash<std::uint32_t>;
template class GridHash<std::uint64_t>;
template class GridHash<const Rect*>;

} // namespace gridhash_spatial
