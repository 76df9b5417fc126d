#ifndef GEOMETRY_PREDICATE2D_HH
#define GEOMETRY_PREDICATE2D_HH

#include <predicates.h>
#include "math_def.hh"
#include "vector_n.hh"

/// Set up the error bounds of the adaptive predicates. Safe to call repeatedly.
void predicates_init();

inline double determinant(const Vec2 &a, const Vec2 &b, const Vec2 &c)
{
    return orient2d(a.data(), b.data(), c.data());
}

inline int orientation(const Vec2 &a, const Vec2 &b, const Vec2 &c)
{
    return sign(orient2d(a.data(), b.data(), c.data())); // +1:CCW, -1:CW, 0:LINEAR
}

inline int incircle(const Vec2 &a, const Vec2 &b, const Vec2 &c, const Vec2 &d)
{
    return sign(incircle(a.data(), b.data(), c.data(), d.data())); // +1:IN, -1:OUT, 0:ON
}

/// In-circle test with ties broken by symbolic perturbation.
///
/// The lift z = x^2 + y^2 of every point is lowered by eps^rank, where the
/// rank follows the lexicographic order of the coordinates (smallest point
/// moves most). For four distinct co-circular points the answer is never 0,
/// and it only depends on the coordinates, not on the order of insertion.
/// (a, b, c) must be counter-clockwise.
inline int incircle_sos(const Vec2 &a, const Vec2 &b, const Vec2 &c, const Vec2 &d)
{
    const int s = incircle(a, b, c, d);
    if (s != 0) return s;

    const Vec2 *ps[4] { &a, &b, &c, &d };

    int rank[4] { 0, 1, 2, 3 };
    for (int i = 1; i < 4; ++i)
    for (int j = i; j > 0 && lex_less(*ps[rank[j]], *ps[rank[j-1]]); --j)
    { const int t = rank[j]; rank[j] = rank[j-1]; rank[j-1] = t; }

    for (int r = 0; r < 4; ++r)
    {
        // partial derivative of the lifted determinant w.r.t. the lift of point k
        int dz {};
        switch (rank[r])
        {
        case 0:  dz =  orientation(b, c, d); break;
        case 1:  dz = -orientation(a, c, d); break;
        case 2:  dz =  orientation(a, b, d); break;
        default: dz = -orientation(a, b, c); break;
        }
        if (dz != 0) return -dz; // lowering the lift pushes the determinant by -dz
    }

    return 0; // all four collinear
}

#endif
