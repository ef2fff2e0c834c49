/// @file cell.cpp
/// @brief Cell coordinate conversion and bucket hashing

#include <gridhash/spatial/cell.hpp>

#include <cmath>
#include <cstring>

namespace gridhash_spatial {

namespace {

double round_quotient(double quotient, CellRounding rounding) noexcept {
    return rounding == CellRounding::Floor ? std::floor(quotient) : std::trunc(quotient);
}

} // anonymous namespace

// =============================================================================
// CellRounding
// =============================================================================

const char* cell_rounding_name(CellRounding rounding) noexcept {
    switch (rounding) {
        case CellRounding::Floor: return "floor";
        case CellRounding::Truncate: return "truncate";
        default: return "unknown";
    }
}

std::optional<CellRounding> parse_cell_rounding(const char* name) noexcept {
    if (name == nullptr) return std::nullopt;
    if (std::strcmp(name, "floor") == 0) return CellRounding::Floor;
    if (std::strcmp(name, "truncate") == 0 || std::strcmp(name, "trunc") == 0) return CellRounding::Truncate;
    return std::nullopt;
}

// =============================================================================
// Cell Coordinates
// =============================================================================

std::optional<std::int64_t> cell_coordinate(double world, double spacing, CellRounding rounding) noexcept {
    if (!std::isfinite(world)) {
        return std::nullopt;
    }

    double cell = round_quotient(world / spacing, rounding);
    if (!std::isfinite(cell) ||
        cell < static_cast<double>(k_min_cell_coordinate) ||
        cell > static_cast<double>(k_max_cell_coordinate)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(cell);
}

std::optional<std::int64_t> clamped_cell_coordinate(double world, double spacing, CellRounding rounding) noexcept {
    if (std::isnan(world)) {
        return std::nullopt;
    }

    double cell = round_quotient(world / spacing, rounding);
    if (std::isnan(cell)) {
        return std::nullopt;
    }
    if (cell <= static_cast<double>(k_min_cell_coordinate)) {
        return k_min_cell_coordinate;
    }
    if (cell >= static_cast<double>(k_max_cell_coordinate)) {
        return k_max_cell_coordinate;
    }
    return static_cast<std::int64_t>(cell);
}

// =============================================================================
// CellSpan
// =============================================================================

std::uint64_t CellSpan::cell_count() const noexcept {
    std::uint64_t w = width();
    std::uint64_t h = height();
    if (h != 0 && w > std::numeric_limits<std::uint64_t>::max() / h) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return w * h;
}

std::optional<CellSpan> compute_cell_span(
    double x, double y, double w, double h, double spacing, CellRounding rounding) noexcept
{
    auto x1 = cell_coordinate(x, spacing, rounding);
    auto y1 = cell_coordinate(y, spacing, rounding);
    auto x2 = cell_coordinate(x + w, spacing, rounding);
    auto y2 = cell_coordinate(y + h, spacing, rounding);
    if (!x1 || !y1 || !x2 || !y2 || *x2 < *x1 || *y2 < *y1) {
        return std::nullopt;
    }
    return CellSpan{*x1, *y1, *x2, *y2};
}

std::optional<CellSpan> compute_clamped_cell_span(
    double x, double y, double w, double h, double spacing, CellRounding rounding) noexcept
{
    auto x1 = clamped_cell_coordinate(x, spacing, rounding);
    auto y1 = clamped_cell_coordinate(y, spacing, rounding);
    auto x2 = clamped_cell_coordinate(x + w, spacing, rounding);
    auto y2 = clamped_cell_coordinate(y + h, spacing, rounding);
    if (!x1 || !y1 || !x2 || !y2 || *x2 < *x1 || *y2 < *y1) {
        return std::nullopt;
    }
    return CellSpan{*x1, *y1, *x2, *y2};
}

// =============================================================================
// Hashing
// =============================================================================

std::size_t hash_cell(std::int64_t x, std::int64_t y, std::size_t bucket_count) noexcept {
    // |x| <= 2^31 keeps both products well inside int64
    std::int64_t h = (x * k_hash_prime_x) ^ (y * k_hash_prime_y);
    std::uint64_t magnitude = h < 0 ? static_cast<std::uint64_t>(-h) : static_cast<std::uint64_t>(h);
    return static_cast<std::size_t>(magnitude % bucket_count);
}

} // namespace gridhash_spatial
