#include <gtest/gtest.h>
#include "mesh.hh"
#include "mesher.hh"

TEST(ExtractTest, Canonicalize)
{
    std::vector<Int3> ts { { 4, 0, 1 }, { 3, 0, 4 }, { 2, 1, 0 }, { 0, 4, 1 } };
    canonicalize(ts);

    const std::vector<Int3> expected { { 0, 1, 2 }, { 0, 1, 4 }, { 0, 1, 4 }, { 0, 3, 4 } };
    EXPECT_EQ(ts, expected);

    auto again = ts;
    canonicalize(again);
    EXPECT_EQ(again, ts);
}

TEST(ExtractTest, SkipsGhostFaces)
{
    Triangulation tri;
    ASSERT_EQ(tri.init({ 0, 0 }, 7, { 0, 1 }, 3, { 1, 0 }, 5), MESHER_ERR::NONE);

    // one finite face, three ghost faces
    EXPECT_EQ(tri.mesh().n_faces(), 4u);

    const auto ts = extract_triangles(tri.mesh());
    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0], Int3(3, 5, 7));

    ASSERT_EQ(tri.insert({ 2, 2 }, 0), MESHER_ERR::NONE);
    const std::vector<Int3> expected { { 0, 3, 5 }, { 3, 5, 7 } };
    EXPECT_EQ(extract_triangles(tri.mesh()), expected);
    EXPECT_TRUE(is_infinite(tri.mesh(), tri.infinite_vertex()));
}
