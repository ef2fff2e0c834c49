/// @file grid_hash.hpp
/// @brief Uniform-grid spatial hash for broad phase collision candidates
///
/// GridHash is rebuilt from scratch every frame from a snapshot of AABBs and
/// then answers "which stored values might overlap this box" by reading the
/// buckets of the cells the probe covers. It never performs exact overlap
/// tests; candidates may repeat and may be false positives.
///
/// Storage is two preallocated arrays sized by max_entries:
/// - cell_starts: cell_count + 1 offsets, bucket i owns
///   cell_entries[cell_starts[i], cell_starts[i + 1])
/// - cell_entries: max_entries slots grouped by bucket
///
/// Population is a counting sort (count, prefix sum, scatter) staged in a
/// second pair of buffers, so a failed population leaves the previous state
/// untouched.
///
/// @code
/// auto grid = GridHash<const Rect*>::create(32.0, 1024).unwrap();
/// std::vector<Rect> boxes = {{10, 10, 16, 16}, {20, 20, 8, 8}};
/// if (auto r = grid.populate(boxes); !r) { ... }
/// grid.query_unique(boxes[0], [&](const Rect* candidate) {
///     // exact test here
/// });
/// @endcode
///
/// Not thread-safe. Population must finish before queries are issued.

#pragma once

#include "fwd.hpp"
#include "aabb.hpp"
#include "cell.hpp"
#include "config.hpp"

#include <gridhash/core/error.hpp>
#include <gridhash/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gridhash_spatial {

// =============================================================================
// Concepts
// =============================================================================

/// Range of entities that can be iterated once per population pass
template<typename R>
concept AabbRange = std::ranges::forward_range<const R> && Aabb<std::ranges::range_value_t<const R>>;

/// Value type usable with query_unique
template<typename T>
concept HashableValue = std::equality_comparable<T> && requires(const T& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

namespace detail {

/// Reference stored by populate(): the pointer itself for pointer ranges,
/// otherwise the element's address
template<typename E>
[[nodiscard]] auto entity_ref(const E& entity) {
    if constexpr (std::is_pointer_v<E>) {
        return entity;
    } else {
        return std::addressof(entity);
    }
}

template<typename R>
using entity_ref_t = decltype(entity_ref(std::declval<const std::ranges::range_value_t<const R>&>()));

/// populate() stores addresses, so elements must outlive the iteration
template<typename R>
concept StableEntityRange = std::is_pointer_v<std::ranges::range_value_t<const R>> ||
                            std::is_lvalue_reference_v<std::ranges::range_reference_t<const R>>;

} // namespace detail

// =============================================================================
// Statistics
// =============================================================================

/// Occupancy summary of the last population
struct GridHashStats {
    std::size_t memberships = 0;       ///< Stored (entity, cell) pairs
    std::size_t capacity = 0;          ///< max_entries
    std::size_t buckets = 0;           ///< cell_count
    std::size_t occupied_buckets = 0;  ///< Buckets holding at least one entry
    std::size_t largest_bucket = 0;    ///< Entries in the fullest bucket
    float load_factor = 0.0f;          ///< memberships / capacity
};

/// Render stats for logging
[[nodiscard]] std::string format_stats(const GridHashStats& stats);

/// Copy of the internal arrays, for inspection only
template<typename T>
struct GridHashSnapshot {
    std::vector<std::size_t> cell_starts;
    std::vector<std::optional<T>> cell_entries;

    [[nodiscard]] bool operator==(const GridHashSnapshot& other) const = default;
};

// =============================================================================
// GridHash
// =============================================================================

/// Per-frame broad phase index over AABBs
/// @tparam T Stored value type (entity pointer or caller-chosen identifier)
template<typename T>
class GridHash {
public:
    using value_type = T;
    using size_type = std::size_t;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Create a grid hash, allocating all storage up front
    [[nodiscard]] static gridhash_core::Result<GridHash> create(const GridHashConfig& config) {
        auto valid = config.validate();
        if (!valid) {
            gridhash_core::debug::record_error(valid.error());
            gridhash_core::spatial_logger()->error("GridHash creation rejected: {}", valid.error().message());
            return valid.error();
        }

        try {
            GridHash grid(config);
            gridhash_core::spatial_logger()->debug(
                "Created GridHash: spacing={}, max_entries={}, buckets={}, rounding={}",
                config.spacing, config.max_entries, grid.cell_count(), cell_rounding_name(config.rounding));
            return grid;
        } catch (const std::bad_alloc&) {
            gridhash_core::Error err(gridhash_core::ErrorCode::OutOfMemory,
                "Failed to allocate GridHash storage for " + std::to_string(config.max_entries) + " entries");
            gridhash_core::debug::record_error(err);
            gridhash_core::spatial_logger()->error("{}", err.message());
            return err;
        }
    }

    /// Create with default (floor) rounding
    [[nodiscard]] static gridhash_core::Result<GridHash> create(double spacing, size_type max_entries) {
        GridHashConfig config;
        config.spacing = spacing;
        config.max_entries = max_entries;
        return create(config);
    }

    GridHash(GridHash&&) noexcept = default;
    GridHash& operator=(GridHash&&) noexcept = default;
    GridHash(const GridHash&) = default;
    GridHash& operator=(const GridHash&) = default;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const GridHashConfig& config() const noexcept { return m_config; }
    [[nodiscard]] double spacing() const noexcept { return m_config.spacing; }
    [[nodiscard]] size_type max_entries() const noexcept { return m_config.max_entries; }
    [[nodiscard]] CellRounding rounding() const noexcept { return m_config.rounding; }

    /// Number of hash buckets (2 * max_entries)
    [[nodiscard]] size_type cell_count() const noexcept { return m_cell_count; }

    /// Memberships stored by the last successful population
    [[nodiscard]] size_type membership_count() const noexcept { return m_cell_starts[m_cell_count]; }

    /// True once a population has succeeded (until clear())
    [[nodiscard]] bool is_populated() const noexcept { return m_populated; }

    // =========================================================================
    // Population
    // =========================================================================

    /// Rebuild from entities, storing a reference to each entity
    template<AabbRange R>
        requires detail::StableEntityRange<R> && std::constructible_from<T, detail::entity_ref_t<R>>
    gridhash_core::Result<void> populate(const R& entities) {
        return rebuild(entities, [](const auto& entity) {
            return T(detail::entity_ref(entity));
        });
    }

    /// Rebuild from entities, storing transform(entity).
    /// transform runs once per (entity, overlapped cell) membership.
    template<AabbRange R, typename F>
        requires std::invocable<F&, const std::ranges::range_value_t<const R>&> &&
                 std::convertible_to<std::invoke_result_t<F&, const std::ranges::range_value_t<const R>&>, T>
    gridhash_core::Result<void> populate_with(const R& entities, F&& transform) {
        return rebuild(entities, [&transform](const auto& entity) -> T {
            return std::invoke(transform, entity);
        });
    }

    /// Return to the empty state. Storage is kept.
    void clear() {
        std::fill(m_cell_starts.begin(), m_cell_starts.end(), size_type{0});
        std::fill(m_cell_entries.begin(), m_cell_entries.end(), std::nullopt);
        m_populated = false;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Visit every stored value in the buckets covered by probe.
    /// Values may repeat. If visit returns bool, false stops the query.
    template<Aabb P, typename Visitor>
        requires std::invocable<Visitor&, const T&>
    void query(const P& probe, Visitor&& visit) const {
        auto span = compute_clamped_cell_span(aabb_x(probe), aabb_y(probe), aabb_w(probe), aabb_h(probe),
                                              m_config.spacing, m_config.rounding);
        if (!span) {
            return;
        }

        auto visit_bucket = [this, &visit](size_type bucket) -> bool {
            for (size_type i = m_cell_starts[bucket]; i < m_cell_starts[bucket + 1]; ++i) {
                const auto& candidate = m_cell_entries[i];
                if (!candidate) {
                    continue;
                }
                if constexpr (std::is_same_v<std::invoke_result_t<Visitor&, const T&>, bool>) {
                    if (!std::invoke(visit, *candidate)) {
                        return false;
                    }
                } else {
                    std::invoke(visit, *candidate);
                }
            }
            return true;
        };

        // A span with as many cells as buckets is answered by one pass over
        // every bucket instead of per-cell enumeration
        if (span->cell_count() >= m_cell_count) {
            for (size_type bucket = 0; bucket < m_cell_count; ++bucket) {
                if (!visit_bucket(bucket)) {
                    return;
                }
            }
            return;
        }

        for_each_bucket(*span, visit_bucket);
    }

    /// Like query(), but each distinct value is visited once
    template<Aabb P, typename Visitor>
        requires std::invocable<Visitor&, const T&> && HashableValue<T>
    void query_unique(const P& probe, Visitor&& visit) const {
        std::unordered_set<T> considered;
        query(probe, [&considered, &visit](const T& candidate) -> bool {
            if (!considered.insert(candidate).second) {
                return true;
            }
            if constexpr (std::is_same_v<std::invoke_result_t<Visitor&, const T&>, bool>) {
                return std::invoke(visit, candidate);
            } else {
                std::invoke(visit, candidate);
                return true;
            }
        });
    }

    /// Distinct candidates for probe, in first-visit order
    template<Aabb P>
        requires HashableValue<T>
    [[nodiscard]] std::vector<T> candidates(const P& probe) const {
        std::vector<T> result;
        query_unique(probe, [&result](const T& candidate) {
            result.push_back(candidate);
        });
        return result;
    }

    // =========================================================================
    // Introspection
    // =========================================================================

    /// Occupancy statistics of the current contents
    [[nodiscard]] GridHashStats stats() const {
        GridHashStats stats;
        stats.memberships = membership_count();
        stats.capacity = m_config.max_entries;
        stats.buckets = m_cell_count;
        for (size_type bucket = 0; bucket < m_cell_count; ++bucket) {
            size_type size = m_cell_starts[bucket + 1] - m_cell_starts[bucket];
            if (size > 0) {
                ++stats.occupied_buckets;
                stats.largest_bucket = std::max(stats.largest_bucket, size);
            }
        }
        stats.load_factor = static_cast<float>(stats.memberships) / static_cast<float>(stats.capacity);
        return stats;
    }

    /// Copy of cell_starts and cell_entries
    [[nodiscard]] GridHashSnapshot<T> snapshot() const {
        return GridHashSnapshot<T>{m_cell_starts, m_cell_entries};
    }

private:
    explicit GridHash(const GridHashConfig& config)
        : m_config(config)
        , m_cell_count(config.cell_count())
        , m_cell_starts(m_cell_count + 1, 0)
        , m_cell_entries(config.max_entries)
        , m_back_starts(m_cell_count + 1, 0)
        , m_back_entries(config.max_entries)
    {}

    /// Call fn(bucket) for every cell of span, x outer, y inner.
    /// Stops when fn returns false.
    template<typename F>
    bool for_each_bucket(const CellSpan& span, F&& fn) const {
        for (std::int64_t xi = span.x1; xi <= span.x2; ++xi) {
            for (std::int64_t yi = span.y1; yi <= span.y2; ++yi) {
                size_type bucket = hash_cell(xi, yi, m_cell_count);
                if constexpr (std::is_same_v<std::invoke_result_t<F&, size_type>, bool>) {
                    if (!fn(bucket)) {
                        return false;
                    }
                } else {
                    fn(bucket);
                }
            }
        }
        return true;
    }

    /// Validate one entity and compute its span
    template<typename E>
    gridhash_core::Result<CellSpan> entity_span(const E& entity, size_type index) const {
        using gridhash_core::SpatialError;
        double x = aabb_x(entity);
        double y = aabb_y(entity);
        double w = aabb_w(entity);
        double h = aabb_h(entity);

        if (!std::isfinite(x) || !std::isfinite(y)) {
            return gridhash_core::Error(SpatialError::malformed_entity(index, "position is not finite"));
        }
        if (!std::isfinite(w) || !std::isfinite(h)) {
            return gridhash_core::Error(SpatialError::malformed_entity(index, "extent is not finite"));
        }
        if (w < 0.0 || h < 0.0) {
            return gridhash_core::Error(SpatialError::malformed_entity(index, "extent is negative"));
        }

        auto span = compute_cell_span(x, y, w, h, m_config.spacing, m_config.rounding);
        if (!span) {
            return gridhash_core::Error(SpatialError::malformed_entity(index, "bounds exceed the cell coordinate range"));
        }
        return *span;
    }

    gridhash_core::Result<void> fail(gridhash_core::Error error) const {
        gridhash_core::debug::record_error(error);
        gridhash_core::spatial_logger()->warn("GridHash population aborted: {}", error.message());
        return error;
    }

    /// Counting-sort rebuild into the back buffers, swapped in on success
    template<typename R, typename Project>
    gridhash_core::Result<void> rebuild(const R& entities, Project&& project) {
        const size_type capacity = m_config.max_entries;

        // Clear
        std::fill(m_back_starts.begin(), m_back_starts.end(), size_type{0});
        std::fill(m_back_entries.begin(), m_back_entries.end(), std::nullopt);

        // Count memberships per bucket; reject before any entry is written
        size_type total = 0;
        size_type index = 0;
        for (const auto& entity : entities) {
            auto span = entity_span(entity, index);
            if (!span) {
                return fail(span.error());
            }

            std::uint64_t cells = span->cell_count();
            if (cells > capacity - total) {
                size_type required = cells > std::numeric_limits<size_type>::max() - total
                    ? std::numeric_limits<size_type>::max()
                    : total + static_cast<size_type>(cells);
                return fail(gridhash_core::Error(gridhash_core::SpatialError::capacity_exceeded(required, capacity))
                    .with_context("entity", std::to_string(index)));
            }
            total += static_cast<size_type>(cells);

            for_each_bucket(*span, [this](size_type bucket) {
                ++m_back_starts[bucket];
            });
            ++index;
        }

        // Prefix sum: each bucket's counter becomes its end offset
        size_type start = 0;
        for (size_type i = 0; i < m_cell_count; ++i) {
            start += m_back_starts[i];
            m_back_starts[i] = start;
        }
        m_back_starts[m_cell_count] = start;

        // Scatter: decrementing from the end leaves each counter at its
        // bucket's start, entries in reverse insertion order
        for (const auto& entity : entities) {
            auto span = compute_cell_span(aabb_x(entity), aabb_y(entity), aabb_w(entity), aabb_h(entity),
                                          m_config.spacing, m_config.rounding);
            for_each_bucket(*span, [this, &project, &entity](size_type bucket) {
                size_type slot = --m_back_starts[bucket];
                m_back_entries[slot].emplace(project(entity));
            });
        }

        m_cell_starts.swap(m_back_starts);
        m_cell_entries.swap(m_back_entries);
        m_populated = true;

        gridhash_core::spatial_logger()->trace("GridHash populated: {} entities, {} memberships", index, total);
        return gridhash_core::Ok();
    }

    GridHashConfig m_config;
    size_type m_cell_count = 0;
    std::vector<size_type> m_cell_starts;
    std::vector<std::optional<T>> m_cell_entries;
    std::vector<size_type> m_back_starts;
    std::vector<std::optional<T>> m_back_entries;
    bool m_populated = false;
};

} // namespace gridhash_spatial
