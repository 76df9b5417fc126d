#ifndef SEARCH2D_HH
#define SEARCH2D_HH

#include "mesh.hh"
#include "triangle.hh"

////////////////////////////////////////////////////////////////
/// Point location
////////////////////////////////////////////////////////////////

/// Scan every face. Finite faces win over ghost faces; a ghost face is
/// returned only if the point lies strictly outside its hull edge.
Fh search_triangle_brute_force(const TriMesh&, const Vec2&);

/// Visibility walk from a finite face. Returns the finite face containing the
/// point (interior or boundary), the ghost face beyond the hull edge it
/// crossed, or a null handle if the walk revisits a face.
Fh search_triangle_local_way(const TriMesh&, const Vec2&, const Fh&);

/// Walk from the hint (any finite face if the hint is null or a ghost face)
/// and fall back to the brute-force scan if the walk fails.
Fh search_triangle(const TriMesh&, const Vec2&, const Fh &hint = Fh {});

/// Where u lies in the face. For edges hh is the halfedge of the face along
/// that edge, for vertices hh points to that vertex. A ghost face yields OUT
/// with hh set to its finite halfedge.
TRI_LOC locate(const TriMesh&, const Fh&, const Vec2 &u, Hh &hh);

#endif
