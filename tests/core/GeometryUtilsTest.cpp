#include <gtest/gtest.h>
#include <flowcanvas/core/GeometryUtils.h>

#include <limits>

using namespace flowcanvas;
using namespace flowcanvas::geometry;

// ============== Types ==============

TEST(TypesTest, PointArithmetic) {
    Point a{3, 4};
    Point b{1, 1};

    EXPECT_EQ(a + b, (Point{4, 5}));
    EXPECT_EQ(a - b, (Point{2, 3}));
    EXPECT_EQ(a * 2.0f, (Point{6, 8}));
    EXPECT_EQ(a / 2.0f, (Point{1.5f, 2.0f}));
    EXPECT_FLOAT_EQ(a.length(), 5.0f);
    EXPECT_FLOAT_EQ(a.distanceTo({0, 0}), 5.0f);
}

TEST(TypesTest, LerpIsExactAtEnds) {
    Point a{0.1f, 7.3f};
    Point b{123.456f, -98.7f};

    EXPECT_EQ(lerp(a, b, 0.0f), a);
    EXPECT_EQ(lerp(a, b, 1.0f), b);

    Point mid = lerp({0, 0}, {10, 20}, 0.5f);
    EXPECT_FLOAT_EQ(mid.x, 5.0f);
    EXPECT_FLOAT_EQ(mid.y, 10.0f);
}

TEST(TypesTest, PointIsFinite) {
    EXPECT_TRUE(Point(1, 2).isFinite());
    EXPECT_FALSE(Point(std::numeric_limits<float>::quiet_NaN(), 0).isFinite());
    EXPECT_FALSE(Point(0, std::numeric_limits<float>::infinity()).isFinite());
}

TEST(TypesTest, RectCenteredAt) {
    Rect r = Rect::centeredAt({100, 50}, {120, 80});
    EXPECT_FLOAT_EQ(r.x, 40.0f);
    EXPECT_FLOAT_EQ(r.y, 10.0f);
    EXPECT_EQ(r.center(), (Point{100, 50}));
    EXPECT_EQ(r.position(), (Point{40, 10}));
}

TEST(TypesTest, RectContains) {
    Rect r{0, 0, 100, 50};
    EXPECT_TRUE(r.contains({0, 0}));
    EXPECT_TRUE(r.contains({100, 50}));
    EXPECT_FALSE(r.contains({101, 25}));
}

TEST(TypesTest, RectExpandedAndArea) {
    Rect a{0, 0, 10, 10};
    EXPECT_EQ(a.expanded(5), (Rect{-5, -5, 20, 20}));
    EXPECT_FLOAT_EQ(a.expanded(5).area(), 400.0f);
}

TEST(TypesTest, ViewBoxDefaults) {
    ViewBox vb;
    EXPECT_FLOAT_EQ(vb.width, 1200.0f);
    EXPECT_FLOAT_EQ(vb.height, 800.0f);
    EXPECT_EQ(vb.center(), (Point{600, 400}));
    EXPECT_EQ(vb.toRect(), (Rect{0, 0, 1200, 800}));
}

// ============== segmentIntersectsRect ==============

TEST(GeometryUtilsTest, SegmentThroughRect) {
    Rect r{10, 10, 20, 20};
    EXPECT_TRUE(segmentIntersectsRect({0, 20}, {50, 20}, r));
    EXPECT_TRUE(segmentIntersectsRect({20, 0}, {20, 50}, r));
}

TEST(GeometryUtilsTest, SegmentEndpointInsideRect) {
    Rect r{10, 10, 20, 20};
    EXPECT_TRUE(segmentIntersectsRect({15, 15}, {100, 100}, r));
}

TEST(GeometryUtilsTest, SegmentMissesRect) {
    Rect r{10, 10, 20, 20};
    EXPECT_FALSE(segmentIntersectsRect({0, 0}, {50, 0}, r));
    EXPECT_FALSE(segmentIntersectsRect({0, 40}, {5, 100}, r));
}

TEST(GeometryUtilsTest, DiagonalSegmentCrossingCorner) {
    Rect r{10, 10, 20, 20};
    EXPECT_TRUE(segmentIntersectsRect({0, 0}, {40, 40}, r));
}

// ============== segmentIntersection ==============

TEST(GeometryUtilsTest, CrossingSegments) {
    auto hit = segmentIntersection({0, 0}, {10, 10}, {0, 10}, {10, 0});
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->x, 5.0f, 1e-5f);
    EXPECT_NEAR(hit->y, 5.0f, 1e-5f);
}

TEST(GeometryUtilsTest, ParallelSegmentsDoNotIntersect) {
    EXPECT_FALSE(segmentIntersection({0, 0}, {10, 0}, {0, 5}, {10, 5}).has_value());
}

TEST(GeometryUtilsTest, DisjointSegmentsDoNotIntersect) {
    EXPECT_FALSE(segmentIntersection({0, 0}, {1, 1}, {5, 0}, {6, -1}).has_value());
}

// ============== cubicBezierPoint ==============

TEST(GeometryUtilsTest, BezierEndpoints) {
    Point p0{0, 0}, p1{50, 100}, p2{150, -100}, p3{200, 0};
    EXPECT_EQ(cubicBezierPoint(p0, p1, p2, p3, 0.0f), p0);
    EXPECT_EQ(cubicBezierPoint(p0, p1, p2, p3, 1.0f), p3);
}

TEST(GeometryUtilsTest, BezierMidpointOfSymmetricCurve) {
    Point mid = cubicBezierPoint({0, 0}, {0, 100}, {100, 100}, {100, 0}, 0.5f);
    EXPECT_NEAR(mid.x, 50.0f, 1e-4f);
    EXPECT_NEAR(mid.y, 75.0f, 1e-4f);
}

// ============== constants ==============

TEST(GeometryUtilsTest, FiniteOr) {
    EXPECT_FLOAT_EQ(constants::finiteOr(3.0f, 0.0f), 3.0f);
    EXPECT_FLOAT_EQ(constants::finiteOr(std::numeric_limits<float>::quiet_NaN(), 7.0f), 7.0f);
    EXPECT_FLOAT_EQ(constants::finiteOr(-std::numeric_limits<float>::infinity(), 1.0f), 1.0f);
}
