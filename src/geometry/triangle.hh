#ifndef EUCLIDEAN_TRIANGULAR_HH
#define EUCLIDEAN_TRIANGULAR_HH

#include "math_def.hh"
#include "vector_n.hh"
#include "pred2D.hh"

////////////////////////////////////////////////////////////////
/// Area
////////////////////////////////////////////////////////////////

inline double signed_area(const Vec2 &a, const Vec2 &b, const Vec2 &c)
{
    return determinant(a, b, c) * .5;
}

////////////////////////////////////////////////////////////////
/// Locations
////////////////////////////////////////////////////////////////

//
//     V2
//    /  \
//  E1    E0
//  /      \
// V0--E2--V1
//
enum class TRI_LOC : int
{
    OUT = 0x00,
    IN  = 0x01,
    E0  = 0x02,
    E1  = 0x04,
    E2  = 0x08,
    V0  = 0x10,
    V1  = 0x20,
    V2  = 0x40,
    ES  = E0 | E1 | E2,
    VS  = V0 | V1 | V2,
};

inline bool is_on_edge(TRI_LOC loc) { return (int)loc & (int)TRI_LOC::ES; }

inline bool is_on_vertex(TRI_LOC loc) { return (int)loc & (int)TRI_LOC::VS; }

/// Classify u against the counter-clockwise triangle (u0, u1, u2).
inline TRI_LOC exact_locate(const Vec2 &u0, const Vec2 &u1, const Vec2 &u2, const Vec2 &u)
{
    const int r0 = orientation(u1, u2, u);
    const int r1 = orientation(u2, u0, u);
    const int r2 = orientation(u0, u1, u);

    if (r0 < 0 || r1 < 0 || r2 < 0) return TRI_LOC::OUT;

    return
        r0 > 0  && r1 > 0  && r2 > 0 ? TRI_LOC::IN : // in triangle
        r0 == 0 && r1 > 0  && r2 > 0 ? TRI_LOC::E0 : // on edge (u1, u2)
        r1 == 0 && r2 > 0  && r0 > 0 ? TRI_LOC::E1 : // on edge (u2, u0)
        r2 == 0 && r0 > 0  && r1 > 0 ? TRI_LOC::E2 : // on edge (u0, u1)
        r0 == 0 && r1 == 0 ? TRI_LOC::V2 : // on vert u2
        r1 == 0 && r2 == 0 ? TRI_LOC::V0 : // on vert u0
        TRI_LOC::V1 ; // on vert u1
}

#endif
