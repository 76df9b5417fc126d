#include <unordered_set>
#include "pred2D.hh"
#include "triangle.hh"
#include "mesh.hh"
#include "search.hh"

using namespace OpenMesh;

////////////////////////////////////////////////////////////////
/// Exact search
////////////////////////////////////////////////////////////////

static inline bool is_inside(const TriMesh &mesh, const Fh &fh, const Vec2 &u)
{
    if (is_ghost(mesh, fh))
    {
        const auto hh = finite_halfedge(mesh, fh);
        const auto u0 = get_xy(mesh, mesh.from_vertex_handle(hh));
        const auto u1 = get_xy(mesh, mesh.to_vertex_handle  (hh));
        return orientation(u0, u1, u) > 0;
    }

    const auto hh = mesh.halfedge_handle(fh);
    const auto u0 = get_xy(mesh, mesh.from_vertex_handle(hh));
    const auto u1 = get_xy(mesh, mesh.to_vertex_handle  (hh));
    const auto u2 = get_xy(mesh, mesh.to_vertex_handle  (mesh.next_halfedge_handle(hh)));
    return exact_locate(u0, u1, u2, u) != TRI_LOC::OUT;
}

Fh search_triangle_brute_force(const TriMesh &mesh, const Vec2 &u)
{
    for (auto face : mesh.faces()) if (!is_ghost(mesh, face)) if (is_inside(mesh, face, u)) return face;
    for (auto face : mesh.faces()) if ( is_ghost(mesh, face)) if (is_inside(mesh, face, u)) return face;
    return Fh {};
}

Fh search_triangle_local_way(const TriMesh &mesh, const Vec2 &u, const Fh &fho)
{
    const int nf = (int)mesh.n_faces();
    Fh fh = fho; Hh hh {};

    std::unordered_set<Fh> visited { fh };

    for (int iter = 0; iter < nf; ++iter)
    {
        Fh fi = fh; // next face handle

        for (Hh hdge : mesh.fh_range(fh)) if (hdge != hh)
        {
            const auto u0 = get_xy(mesh, mesh.from_vertex_handle(hdge));
            const auto u1 = get_xy(mesh, mesh.to_vertex_handle  (hdge));
            if (orientation(u0, u1, u) < 0) // u is strictly behind this edge
            { hh = mesh.opposite_halfedge_handle(hdge); fi = mesh.face_handle(hh); break; }
        }

        if (fi == fh) return fh; // inside triangle or on its boundary
        if (is_ghost(mesh, fi)) return fi; // crossed the hull
        if (visited.count(fi)) break; // walking in circles
        visited.insert(fi);
        fh = fi; // go to the next triangle
    }

    return Fh {};
}

Fh search_triangle(const TriMesh &mesh, const Vec2 &u, const Fh &hint)
{
    Fh fh = hint;

    if (!fh.is_valid() || is_ghost(mesh, fh))
    {
        fh = Fh {};
        for (Fh fi : mesh.faces()) if (!is_ghost(mesh, fi)) { fh = fi; break; }
    }

    if (!fh.is_valid()) return Fh {};

    Fh fi = search_triangle_local_way(mesh, u, fh);
    if (fi.is_valid()) return fi;

    return search_triangle_brute_force(mesh, u);
}

TRI_LOC locate(const TriMesh &mesh, const Fh &fh, const Vec2 &u, Hh &hh)
{
    if (is_ghost(mesh, fh))
    {
        hh = finite_halfedge(mesh, fh);
        return TRI_LOC::OUT;
    }

    Hh hh0 = mesh.halfedge_handle(fh);
    Hh hh1 = mesh.next_halfedge_handle(hh0);
    Hh hh2 = mesh.next_halfedge_handle(hh1);
    const auto u0 = get_xy(mesh, mesh.to_vertex_handle(hh1));
    const auto u1 = get_xy(mesh, mesh.to_vertex_handle(hh2));
    const auto u2 = get_xy(mesh, mesh.to_vertex_handle(hh0));
    const auto loc = exact_locate(u0, u1, u2, u);
    if (loc == TRI_LOC::E0) { hh = hh0; }
    if (loc == TRI_LOC::E1) { hh = hh1; }
    if (loc == TRI_LOC::E2) { hh = hh2; }
    if (loc == TRI_LOC::V0) { hh = hh1; }
    if (loc == TRI_LOC::V1) { hh = hh2; }
    if (loc == TRI_LOC::V2) { hh = hh0; }
    return loc;
}
