#pragma once

/// @file aabb.hpp
/// @brief Entity capability contract for the grid hash
///
/// Any type can be stored in or probed against a GridHash as long as
/// AabbTraits<T> can read its position (x, y) and extent (w, h). Types with
/// numeric members named x, y, w and h work out of the box, as do pointers to
/// such types. Other layouts specialize AabbTraits:
///
/// @code
/// template<>
/// struct gridhash_spatial::AabbTraits<Sprite> {
///     static double x(const Sprite& s) { return s.pos.x; }
///     static double y(const Sprite& s) { return s.pos.y; }
///     static double w(const Sprite& s) { return s.size.x; }
///     static double h(const Sprite& s) { return s.size.y; }
/// };
/// @endcode

#include "fwd.hpp"

#include <concepts>
#include <type_traits>

namespace gridhash_spatial {

// =============================================================================
// Capability Contract
// =============================================================================

/// Type exposing numeric x, y, w, h members
template<typename T>
concept HasAabbMembers = requires(const T& e) {
    { e.x } -> std::convertible_to<double>;
    { e.y } -> std::convertible_to<double>;
    { e.w } -> std::convertible_to<double>;
    { e.h } -> std::convertible_to<double>;
};

/// Reads world-space bounds from an entity. Empty unless specialized.
template<typename T>
struct AabbTraits {};

/// Member-based bounds
template<HasAabbMembers T>
struct AabbTraits<T> {
    [[nodiscard]] static double x(const T& e) { return static_cast<double>(e.x); }
    [[nodiscard]] static double y(const T& e) { return static_cast<double>(e.y); }
    [[nodiscard]] static double w(const T& e) { return static_cast<double>(e.w); }
    [[nodiscard]] static double h(const T& e) { return static_cast<double>(e.h); }
};

/// Entity usable by GridHash population and queries
template<typename T>
concept Aabb = requires(const T& e) {
    { AabbTraits<T>::x(e) } -> std::convertible_to<double>;
    { AabbTraits<T>::y(e) } -> std::convertible_to<double>;
    { AabbTraits<T>::w(e) } -> std::convertible_to<double>;
    { AabbTraits<T>::h(e) } -> std::convertible_to<double>;
};

/// Pointer to an entity forwards to the pointee
template<typename T>
    requires Aabb<std::remove_cv_t<T>>
struct AabbTraits<T*> {
    using Pointee = std::remove_cv_t<T>;
    [[nodiscard]] static double x(const T* e) { return AabbTraits<Pointee>::x(*e); }
    [[nodiscard]] static double y(const T* e) { return AabbTraits<Pointee>::y(*e); }
    [[nodiscard]] static double w(const T* e) { return AabbTraits<Pointee>::w(*e); }
    [[nodiscard]] static double h(const T* e) { return AabbTraits<Pointee>::h(*e); }
};

// =============================================================================
// Rect
// =============================================================================

/// Plain AABB value: position is the min corner
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    [[nodiscard]] constexpr bool operator==(const Rect& other) const noexcept = default;
};

// =============================================================================
// Free Functions
// =============================================================================

template<Aabb T>
[[nodiscard]] double aabb_x(const T& e) { return AabbTraits<T>::x(e); }

template<Aabb T>
[[nodiscard]] double aabb_y(const T& e) { return AabbTraits<T>::y(e); }

template<Aabb T>
[[nodiscard]] double aabb_w(const T& e) { return AabbTraits<T>::w(e); }

template<Aabb T>
[[nodiscard]] double aabb_h(const T& e) { return AabbTraits<T>::h(e); }

/// Max x edge
template<Aabb T>
[[nodiscard]] double aabb_right(const T& e) { return aabb_x(e) + aabb_w(e); }

/// Max y edge
template<Aabb T>
[[nodiscard]] double aabb_top(const T& e) { return aabb_y(e) + aabb_h(e); }

/// Copy any entity's bounds into a Rect
template<Aabb T>
[[nodiscard]] Rect to_rect(const T& e) {
    return Rect{
        static_cast<float>(aabb_x(e)),
        static_cast<float>(aabb_y(e)),
        static_cast<float>(aabb_w(e)),
        static_cast<float>(aabb_h(e))
    };
}

/// Exact overlap test for callers filtering broad-phase candidates.
/// Touching edges count as overlapping.
template<Aabb A, Aabb B>
[[nodiscard]] bool overlaps(const A& a, const B& b) {
    return aabb_x(a) <= aabb_right(b) && aabb_x(b) <= aabb_right(a) &&
           aabb_y(a) <= aabb_top(b) && aabb_y(b) <= aabb_top(a);
}

} // namespace gridhash_spatial
