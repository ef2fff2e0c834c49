// gridhash_spatial entity capability tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <gridhash/spatial/aabb.hpp>

using namespace gridhash_spatial;
using Catch::Matchers::WithinAbs;

namespace {

struct Vec2 {
    float x;
    float y;
};

/// Entity whose bounds live in nested members
struct Sprite {
    Vec2 pos;
    Vec2 size;
};

struct IntBox {
    int x;
    int y;
    int w;
    int h;
};

} // namespace

template<>
struct gridhash_spatial::AabbTraits<Sprite> {
    static double x(const Sprite& s) { return s.pos.x; }
    static double y(const Sprite& s) { return s.pos.y; }
    static double w(const Sprite& s) { return s.size.x; }
    static double h(const Sprite& s) { return s.size.y; }
};

static_assert(Aabb<Rect>);
static_assert(Aabb<IntBox>);
static_assert(Aabb<Sprite>);
static_assert(Aabb<const Rect*>);
static_assert(Aabb<Sprite*>);
static_assert(!Aabb<Vec2>);
static_assert(!Aabb<int>);

TEST_CASE("Aabb accessors", "[spatial][aabb]") {
    SECTION("member based") {
        Rect r{1.0f, 2.0f, 3.0f, 4.0f};
        REQUIRE_THAT(aabb_x(r), WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(aabb_y(r), WithinAbs(2.0, 1e-6));
        REQUIRE_THAT(aabb_right(r), WithinAbs(4.0, 1e-6));
        REQUIRE_THAT(aabb_top(r), WithinAbs(6.0, 1e-6));
    }

    SECTION("integer members") {
        IntBox b{-5, 5, 10, 2};
        REQUIRE(aabb_x(b) == -5.0);
        REQUIRE(aabb_right(b) == 5.0);
    }

    SECTION("specialized traits") {
        Sprite s{{10.0f, 20.0f}, {4.0f, 8.0f}};
        REQUIRE(aabb_w(s) == 4.0);
        REQUIRE(aabb_h(s) == 8.0);
        REQUIRE(to_rect(s) == Rect{10.0f, 20.0f, 4.0f, 8.0f});
    }

    SECTION("pointer forwards to pointee") {
        Rect r{1.0f, 1.0f, 2.0f, 2.0f};
        const Rect* p = &r;
        REQUIRE(aabb_right(p) == 3.0);
    }
}

TEST_CASE("Aabb overlap predicate", "[spatial][aabb]") {
    Rect a{0.0f, 0.0f, 10.0f, 10.0f};

    SECTION("overlapping") {
        REQUIRE(overlaps(a, Rect{5.0f, 5.0f, 10.0f, 10.0f}));
    }

    SECTION("touching edges") {
        REQUIRE(overlaps(a, Rect{10.0f, 0.0f, 5.0f, 5.0f}));
    }

    SECTION("separated") {
        REQUIRE_FALSE(overlaps(a, Rect{11.0f, 0.0f, 5.0f, 5.0f}));
        REQUIRE_FALSE(overlaps(a, Rect{0.0f, -6.0f, 5.0f, 5.0f}));
    }

    SECTION("mixed entity types") {
        Sprite s{{2.0f, 2.0f}, {1.0f, 1.0f}};
        REQUIRE(overlaps(a, s));
        REQUIRE(overlaps(s, &a));
    }
}
