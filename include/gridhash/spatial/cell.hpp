#pragma once

/// @file cell.hpp
/// @brief Grid cell coordinates, cell spans and the bucket hash

#include "fwd.hpp"
#include "aabb.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace gridhash_spatial {

// =============================================================================
// Constants
// =============================================================================

/// Smallest representable cell coordinate
constexpr std::int64_t k_min_cell_coordinate = std::numeric_limits<std::int32_t>::min();

/// Largest representable cell coordinate
constexpr std::int64_t k_max_cell_coordinate = std::numeric_limits<std::int32_t>::max();

/// Hash multiplier applied to the cell x coordinate
constexpr std::int64_t k_hash_prime_x = 9283711;

/// Hash multiplier applied to the cell y coordinate
constexpr std::int64_t k_hash_prime_y = 689287499;

// =============================================================================
// CellRounding
// =============================================================================

/// How a world coordinate is mapped to a cell coordinate
enum class CellRounding : std::uint8_t {
    Floor,     ///< Round toward negative infinity: -1 / 32 is cell -1
    Truncate,  ///< Round toward zero: -1 / 32 is cell 0 (cells -1 and 0 merge)
};

/// Get rounding mode name
[[nodiscard]] const char* cell_rounding_name(CellRounding rounding) noexcept;

/// Parse rounding mode name ("floor" or "truncate")
[[nodiscard]] std::optional<CellRounding> parse_cell_rounding(const char* name) noexcept;

// =============================================================================
// Cell Coordinates
// =============================================================================

/// Convert a world coordinate to a cell coordinate.
/// @return nullopt if the input is not finite or the cell lies outside
///         [k_min_cell_coordinate, k_max_cell_coordinate]
[[nodiscard]] std::optional<std::int64_t> cell_coordinate(double world, double spacing, CellRounding rounding) noexcept;

/// Convert a world coordinate to a cell coordinate, saturating to the
/// representable range. Infinities saturate as well.
/// @return nullopt only for NaN
[[nodiscard]] std::optional<std::int64_t> clamped_cell_coordinate(double world, double spacing, CellRounding rounding) noexcept;

// =============================================================================
// CellSpan
// =============================================================================

/// Inclusive rectangle of cell coordinates covered by an AABB
struct CellSpan {
    std::int64_t x1 = 0;
    std::int64_t y1 = 0;
    std::int64_t x2 = 0;
    std::int64_t y2 = 0;

    [[nodiscard]] std::uint64_t width() const noexcept {
        return static_cast<std::uint64_t>(x2 - x1) + 1;
    }

    [[nodiscard]] std::uint64_t height() const noexcept {
        return static_cast<std::uint64_t>(y2 - y1) + 1;
    }

    /// Number of cells, saturating at the uint64 maximum
    [[nodiscard]] std::uint64_t cell_count() const noexcept;

    [[nodiscard]] bool contains(std::int64_t x, std::int64_t y) const noexcept {
        return x >= x1 && x <= x2 && y >= y1 && y <= y2;
    }

    [[nodiscard]] bool operator==(const CellSpan& other) const noexcept = default;
};

/// Span of an AABB given as raw bounds.
/// @return nullopt if any corner is not representable (see cell_coordinate)
[[nodiscard]] std::optional<CellSpan> compute_cell_span(
    double x, double y, double w, double h, double spacing, CellRounding rounding) noexcept;

/// Span of an AABB, saturating corners to the representable range.
/// @return nullopt if any bound is NaN
[[nodiscard]] std::optional<CellSpan> compute_clamped_cell_span(
    double x, double y, double w, double h, double spacing, CellRounding rounding) noexcept;

/// Span of an entity
template<Aabb T>
[[nodiscard]] std::optional<CellSpan> cell_span_of(const T& entity, double spacing, CellRounding rounding) {
    return compute_cell_span(aabb_x(entity), aabb_y(entity), aabb_w(entity), aabb_h(entity), spacing, rounding);
}

// =============================================================================
// Hashing
// =============================================================================

/// Map a cell coordinate pair to a bucket index in [0, bucket_count).
/// abs((x * 9283711) ^ (y * 689287499)) % bucket_count, evaluated in 64-bit.
/// Coordinates must lie in the representable cell range. The distribution is
/// approximate; distinct cells may share a bucket.
[[nodiscard]] std::size_t hash_cell(std::int64_t x, std::int64_t y, std::size_t bucket_count) noexcept;

} // namespace gridhash_spatial
