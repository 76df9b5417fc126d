#include <algorithm>
#include <gtest/gtest.h>
#include "pred2D.hh"
#include "mesh.hh"
#include "search.hh"
#include "mesher.hh"

// 3x3 grid, index y * 3 + x
class SearchTest : public ::testing::Test
{
protected:

    void SetUp() override
    {
        ASSERT_EQ(tri.init(grid(3), 3, grid(1), 1, grid(5), 5), MESHER_ERR::NONE);
        for (int i = 0; i < 9; ++i) if (i != 1 && i != 3 && i != 5)
            ASSERT_EQ(tri.insert(grid(i), i), MESHER_ERR::NONE);
    }

    static Vec2 grid(const int i) { return { (double)(i % 3), (double)(i / 3) }; }

    static Int3 sorted(Int3 t)
    {
        std::vector<Int3> ts { t };
        canonicalize(ts);
        return ts[0];
    }

    Triangulation tri;
};

TEST_F(SearchTest, Inside)
{
    const auto &mesh = tri.mesh();

    Fh fh = search_triangle(mesh, { .3, .1 });
    ASSERT_TRUE(fh.is_valid());
    ASSERT_FALSE(is_ghost(mesh, fh));
    EXPECT_EQ(sorted(dump_handle(mesh, fh)), Int3(0, 1, 4));

    Hh hh {};
    EXPECT_EQ(locate(mesh, fh, { .3, .1 }, hh), TRI_LOC::IN);
}

TEST_F(SearchTest, OnEdge)
{
    const auto &mesh = tri.mesh();

    Fh fh = search_triangle(mesh, { .5, 0 });
    ASSERT_TRUE(fh.is_valid());
    ASSERT_FALSE(is_ghost(mesh, fh));

    Hh hh {};
    const auto loc = locate(mesh, fh, { .5, 0 }, hh);
    ASSERT_TRUE(is_on_edge(loc));
    const int i0 = get_index(mesh, mesh.from_vertex_handle(hh));
    const int i1 = get_index(mesh, mesh.to_vertex_handle  (hh));
    EXPECT_EQ(std::min(i0, i1), 0);
    EXPECT_EQ(std::max(i0, i1), 1);
}

TEST_F(SearchTest, OnVertex)
{
    const auto &mesh = tri.mesh();

    for (int i = 0; i < 9; ++i)
    {
        Fh fh = search_triangle(mesh, grid(i));
        ASSERT_TRUE(fh.is_valid());
        ASSERT_FALSE(is_ghost(mesh, fh));

        Hh hh {};
        ASSERT_TRUE(is_on_vertex(locate(mesh, fh, grid(i), hh)));
        EXPECT_EQ(get_index(mesh, mesh.to_vertex_handle(hh)), i);
    }
}

TEST_F(SearchTest, OutsideHull)
{
    const auto &mesh = tri.mesh();
    const Vec2 u { 5, 5 };

    Fh fh = search_triangle(mesh, u);
    ASSERT_TRUE(fh.is_valid());
    ASSERT_TRUE(is_ghost(mesh, fh));

    Hh hh {};
    EXPECT_EQ(locate(mesh, fh, u, hh), TRI_LOC::OUT);
    EXPECT_GT(orientation(get_xy(mesh, mesh.from_vertex_handle(hh)), get_xy(mesh, hh), u), 0);

    // on the line of the bottom hull edges, beyond the last one
    Fh fi = search_triangle(mesh, { 3, 0 });
    ASSERT_TRUE(fi.is_valid());
    EXPECT_TRUE(is_ghost(mesh, fi));
}

TEST_F(SearchTest, WalkAgreesWithBruteForce)
{
    const auto &mesh = tri.mesh();
    const Vec2 us[] { { .3, .1 }, { 1.7, .2 }, { .2, 1.6 }, { 1.6, 1.9 }, { 1.2, 1.1 } };

    for (const auto &u : us)
    {
        Fh fh = search_triangle_brute_force(mesh, u);
        ASSERT_TRUE(fh.is_valid());

        // from every finite face
        for (Fh fi : mesh.faces()) if (!is_ghost(mesh, fi))
            EXPECT_EQ(search_triangle_local_way(mesh, u, fi), fh);

        EXPECT_EQ(search_triangle(mesh, u, Fh {}), fh);
    }
}

TEST_F(SearchTest, GhostHintFallsBackToFiniteStart)
{
    const auto &mesh = tri.mesh();

    Fh fg {};
    for (Fh fh : mesh.faces()) if (is_ghost(mesh, fh)) { fg = fh; break; }
    ASSERT_TRUE(fg.is_valid());

    Fh fh = search_triangle(mesh, { 1.6, 1.9 }, fg);
    ASSERT_TRUE(fh.is_valid());
    EXPECT_EQ(sorted(dump_handle(mesh, fh)), Int3(4, 7, 8));
}
