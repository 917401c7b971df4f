#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include "Vec3f.h"

static void ExpectVecNear(const Vec3f& expected, const Vec3f& actual, float tol = 1e-6f)
{
    EXPECT_NEAR(expected.x, actual.x, tol);
    EXPECT_NEAR(expected.y, actual.y, tol);
    EXPECT_NEAR(expected.z, actual.z, tol);
}

TEST(Vec3f, Arithmetic)
{
    Vec3f a(1, 2, 3);
    Vec3f b(4, -5, 6);

    EXPECT_EQ(Vec3f(5, -3, 9), a + b);
    EXPECT_EQ(Vec3f(-3, 7, -3), a - b);
    EXPECT_EQ(Vec3f(-1, -2, -3), -a);
    EXPECT_EQ(Vec3f(2, 4, 6), a * 2.0f);
    EXPECT_EQ(Vec3f(2, 4, 6), 2.0f * a);
    EXPECT_EQ(Vec3f(0.5f, 1, 1.5f), a / 2.0f);
    EXPECT_EQ(Vec3f(4, -10, 18), a.elwiseMult(b));

    Vec3f c = a;
    c += b;
    c *= 2.0f;
    EXPECT_EQ(Vec3f(10, -6, 18), c);
}

TEST(Vec3f, DotCrossLength)
{
    Vec3f x(1, 0, 0), y(0, 1, 0);

    EXPECT_FLOAT_EQ(0.0f, x.dotProduct(y));
    EXPECT_EQ(Vec3f(0, 0, 1), x.crossProduct(y));
    EXPECT_EQ(Vec3f(0, 0, -1), y.crossProduct(x));

    Vec3f v(3, 4, 12);
    EXPECT_FLOAT_EQ(169.0f, v.lengthSquared());
    EXPECT_FLOAT_EQ(13.0f, v.length());
    EXPECT_FLOAT_EQ(1.0f, v.normalize().length());
    ExpectVecNear(Vec3f(3.0f / 13, 4.0f / 13, 12.0f / 13), v.normalize());
}

TEST(Vec3f, IndexAndPrint)
{
    Vec3f v(7, 8, 9);
    EXPECT_EQ(7, v[0]);
    EXPECT_EQ(8, v[1]);
    EXPECT_EQ(9, v[2]);

    std::ostringstream os;
    os << Vec3f(1, 2, 3);
    EXPECT_EQ("(1, 2, 3)", os.str());
}

TEST(Vec3f, NearZero)
{
    EXPECT_TRUE(Vec3f(0, 0, 0).nearZero());
    EXPECT_TRUE(Vec3f(1e-9f, -1e-9f, 0).nearZero());
    EXPECT_FALSE(Vec3f(1e-9f, 1e-3f, 0).nearZero());
}

TEST(Vec3f, ReflectMirrorsAboutNormal)
{
    Vec3f n(0, 1, 0);
    EXPECT_EQ(Vec3f(1, 1, 0), Reflect(Vec3f(1, -1, 0), n));
    EXPECT_EQ(Vec3f(0, 1, 0), Reflect(Vec3f(0, -1, 0), n));
    // the tangential part is untouched
    EXPECT_EQ(Vec3f(2, 0, -3), Reflect(Vec3f(2, 0, -3), n));
}

TEST(Vec3f, RefractWithUnitRatioKeepsDirection)
{
    Vec3f n(0, 1, 0);
    Vec3f uv = Vec3f(0.6f, -0.8f, 0.0f);
    ExpectVecNear(uv, Refract(uv, n, 1.0f));

    Vec3f oblique = Vec3f(1, -2, 3).normalize();
    ExpectVecNear(oblique, Refract(oblique, n, 1.0f));
}

TEST(Vec3f, RefractFollowsSnell)
{
    // 45 degrees in air into glass
    Vec3f n(0, 1, 0);
    Vec3f uv = Vec3f(1, -1, 0).normalize();
    float eta = 1.0f / 1.5f;

    Vec3f out = Refract(uv, n, eta);
    float sin_in = std::sqrt(0.5f);
    float sin_out = out.x / out.length();

    EXPECT_NEAR(1.0f, out.length(), 1e-5f);
    EXPECT_NEAR(sin_in * eta, sin_out, 1e-5f);
    EXPECT_LT(out.y, 0.0f);
}

TEST(Vec3f, RefractClampsCosineOvershoot)
{
    // a direction a hair longer than unit must not produce NaN
    Vec3f n(0, 0, 1);
    Vec3f uv(0, 0, -1.0000001f);
    Vec3f out = Refract(uv, n, 1.0f / 1.5f);
    EXPECT_FALSE(std::isnan(out.x) || std::isnan(out.y) || std::isnan(out.z));
}

TEST(Vec3f, SchlickAtNormalIncidenceIsR0)
{
    float r0 = (1.0f - 1.5f) / (1.0f + 1.5f);
    EXPECT_NEAR(r0 * r0, Schlick(1.0f, 1.5f), 1e-7f);
    EXPECT_NEAR(1.0f, Schlick(0.0f, 1.5f), 1e-6f);
    EXPECT_FLOAT_EQ(0.0f, Schlick(1.0f, 1.0f));
}
