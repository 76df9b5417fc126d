#ifndef EUCLIDEAN_DELAUNAY_HH
#define EUCLIDEAN_DELAUNAY_HH

#include "math_def.hh"
#include "vector_n.hh"
#include "pred2D.hh"

//   1  
//  / \ 
// 2---0
//  \ / 
//   3  
inline bool exact_delaunay(const Vec2 &u0, const Vec2 &u1, const Vec2 &u2, const Vec2 &u3)
{
    return incircle(u0, u1, u2, u3) <= 0; // equivalent to incircle(u2, u3, u0, u1)
}

//   1  
//  / \ 
// 2---0
//  \ / 
//   3  
inline bool perturbed_delaunay(const Vec2 &u0, const Vec2 &u1, const Vec2 &u2, const Vec2 &u3)
{
    return incircle_sos(u0, u1, u2, u3) < 0;
}

//
//   1   
//  / \  
// 2---0 
//  \ /  
//   3   
//
inline bool exact_convex(const Vec2 &u0, const Vec2 &u1, const Vec2 &u2, const Vec2 &u3)
{
    const int r0 = orientation(u3, u0, u1);
    const int r1 = orientation(u0, u1, u2);
    const int r2 = orientation(u1, u2, u3);
    const int r3 = orientation(u2, u3, u0);
    return r0 > 0 && r1 > 0 && r2 > 0 && r3 > 0 ||
           r0 < 0 && r1 < 0 && r2 < 0 && r3 < 0 ;
}

#endif
