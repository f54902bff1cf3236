#include <gtest/gtest.h>
#include "hexball/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddSubtract) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector sum = v1 + v2;
    EXPECT_DOUBLE_EQ(sum.x, 4.0);
    EXPECT_DOUBLE_EQ(sum.y, 6.0);

    Vector diff = v2 - v1;
    EXPECT_DOUBLE_EQ(diff.x, 2.0);
    EXPECT_DOUBLE_EQ(diff.y, 2.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    Vector neg = -v2;
    EXPECT_DOUBLE_EQ(neg.x, -3.0);
    EXPECT_DOUBLE_EQ(neg.y, -4.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);

    Vector mult_result = v * 2.0;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector scaled_down = v * 0.5;
    EXPECT_DOUBLE_EQ(scaled_down.x, 1.0);
    EXPECT_DOUBLE_EQ(scaled_down.y, 1.5);
}

TEST(VectorMathTest, LengthAndDotProduct) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}

TEST(VectorMathTest, Perpendicular) {
    Vector v(1.0, 0.0);
    Vector p = v.perp();
    EXPECT_DOUBLE_EQ(p.x, 0.0);
    EXPECT_DOUBLE_EQ(p.y, 1.0);
    EXPECT_DOUBLE_EQ(v.dotProduct(p), 0.0);
}

TEST(VectorMathTest, Normalize) {
    Vector v(3.0, 4.0);
    Vector n = v.normalized();
    EXPECT_DOUBLE_EQ(n.length(), 1.0);
    EXPECT_DOUBLE_EQ(n.x, 0.6);
    EXPECT_DOUBLE_EQ(n.y, 0.8);
}

TEST(VectorMathTest, NormalizeZeroVectorGivesZero) {
    Vector zero;
    Vector n = zero.normalized();
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)

    p1 += Vector(0.5, -1.0);
    EXPECT_DOUBLE_EQ(p1.x, 1.5);
    EXPECT_DOUBLE_EQ(p1.y, 1.0);
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, ClosestPointOnSegmentInterior) {
    Vector a(0.0, 0.0);
    Vector b(10.0, 0.0);
    Vector c = closestPointOnSegment(a, b, Vector(4.0, 3.0));
    EXPECT_DOUBLE_EQ(c.x, 4.0);
    EXPECT_DOUBLE_EQ(c.y, 0.0);
}

TEST(VectorMathTest, ClosestPointOnSegmentClampsToEndpoints) {
    Vector a(0.0, 0.0);
    Vector b(10.0, 0.0);

    Vector before = closestPointOnSegment(a, b, Vector(-5.0, 2.0));
    EXPECT_DOUBLE_EQ(before.x, 0.0);
    EXPECT_DOUBLE_EQ(before.y, 0.0);

    Vector after = closestPointOnSegment(a, b, Vector(15.0, -2.0));
    EXPECT_DOUBLE_EQ(after.x, 10.0);
    EXPECT_DOUBLE_EQ(after.y, 0.0);
}

TEST(VectorMathTest, ClosestPointOnDegenerateSegment) {
    Vector a(2.0, 2.0);
    Vector c = closestPointOnSegment(a, a, Vector(5.0, 5.0));
    EXPECT_DOUBLE_EQ(c.x, 2.0);
    EXPECT_DOUBLE_EQ(c.y, 2.0);
}

TEST(VectorMathTest, NearlyEqual) {
    EXPECT_TRUE(nearlyEqual(1.0, 1.0 + 1e-12));
    EXPECT_FALSE(nearlyEqual(1.0, 1.001));
    EXPECT_TRUE(nearlyEqual(1.0, 1.001, 0.01));
}
