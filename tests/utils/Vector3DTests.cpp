/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE Vector3DTests
#include <boost/test/unit_test.hpp>

#include "utils/Vector3D.hpp"

namespace {
constexpr float EPSILON = 0.001f;
}

BOOST_AUTO_TEST_SUITE(Vector3DBasicTests)

BOOST_AUTO_TEST_CASE(TestDefaultIsZero) {
    Vector3D v;
    BOOST_CHECK(v.isZero());
    BOOST_CHECK_EQUAL(v.getX(), 0.0f);
    BOOST_CHECK_EQUAL(v.getY(), 0.0f);
    BOOST_CHECK_EQUAL(v.getZ(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestLengthAndDistance) {
    Vector3D v(3.0f, 4.0f, 12.0f);
    BOOST_CHECK_CLOSE(v.length(), 13.0f, EPSILON);
    BOOST_CHECK_CLOSE(v.lengthSquared(), 169.0f, EPSILON);

    Vector3D a(1.0f, 0.0f, 1.0f);
    Vector3D b(4.0f, 0.0f, 5.0f);
    BOOST_CHECK_CLOSE(Vector3D::distance(a, b), 5.0f, EPSILON);
    BOOST_CHECK_CLOSE(Vector3D::distanceSquared(a, b), 25.0f, EPSILON);
}

BOOST_AUTO_TEST_CASE(TestNormalized) {
    Vector3D v(0.0f, 0.0f, 10.0f);
    Vector3D n = v.normalized();
    BOOST_CHECK_CLOSE(n.length(), 1.0f, EPSILON);
    BOOST_CHECK_CLOSE(n.getZ(), 1.0f, EPSILON);

    // Degenerate input stays zero rather than producing NaN
    BOOST_CHECK(Vector3D().normalized().isZero());
}

BOOST_AUTO_TEST_CASE(TestHorizontalDropsHeight) {
    Vector3D v(1.0f, 7.0f, -2.0f);
    Vector3D h = v.horizontal();
    BOOST_CHECK_EQUAL(h.getX(), 1.0f);
    BOOST_CHECK_EQUAL(h.getY(), 0.0f);
    BOOST_CHECK_EQUAL(h.getZ(), -2.0f);
}

BOOST_AUTO_TEST_CASE(TestOperators) {
    Vector3D a(1.0f, 2.0f, 3.0f);
    Vector3D b(4.0f, 5.0f, 6.0f);

    BOOST_CHECK((a + b) == Vector3D(5.0f, 7.0f, 9.0f));
    BOOST_CHECK((b - a) == Vector3D(3.0f, 3.0f, 3.0f));
    BOOST_CHECK((a * 2.0f) == Vector3D(2.0f, 4.0f, 6.0f));
    BOOST_CHECK((b / 2.0f) == Vector3D(2.0f, 2.5f, 3.0f));
    BOOST_CHECK(-a == Vector3D(-1.0f, -2.0f, -3.0f));
    BOOST_CHECK_CLOSE(a.dot(b), 32.0f, EPSILON);

    Vector3D c = a;
    c += b;
    c -= a;
    c *= 0.5f;
    BOOST_CHECK(c == Vector3D(2.0f, 2.5f, 3.0f));
}

BOOST_AUTO_TEST_CASE(TestAddScaled) {
    Vector3D position(1.0f, 0.0f, 1.0f);
    position.addScaled(Vector3D(1.0f, 0.0f, -1.0f), 0.5f);
    BOOST_CHECK_CLOSE(position.getX(), 1.5f, EPSILON);
    BOOST_CHECK_CLOSE(position.getZ(), 0.5f, EPSILON);
}

BOOST_AUTO_TEST_SUITE_END()
