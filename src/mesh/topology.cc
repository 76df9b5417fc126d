#include "delaunay.hh"
#include "mesh.hh"
#include "topology.hh"

using namespace OpenMesh;

////////////////////////////////////////////////////////////////
/// Construction
////////////////////////////////////////////////////////////////

Vh make_bootstrap(TriMesh &mesh, const Vh &vh0, const Vh &vh1, const Vh &vh2)
{
    Vh vh_inf = mesh.new_vertex({ 0, 0, 0 });
    set_index(mesh, vh_inf, -1);

    const Fh fhs[4] {
        mesh.add_face(vh0, vh1, vh2),
        mesh.add_face(vh1, vh0, vh_inf),
        mesh.add_face(vh2, vh1, vh_inf),
        mesh.add_face(vh0, vh2, vh_inf)
    };

    for (const Fh &fh : fhs) if (!fh.is_valid()) return Vh {};

    return vh_inf;
}

void split_face(TriMesh &mesh, const Fh &fh, const Vh &vh)
{
    mesh.split_copy(fh, vh);
}

void split_edge(TriMesh &mesh, const Hh &hh, const Vh &vh)
{
    mesh.split_edge_copy(mesh.edge_handle(hh), vh);
}

////////////////////////////////////////////////////////////////
/// Flip
////////////////////////////////////////////////////////////////

bool is_flippable(const TriMesh &mesh, const Hh &hh)
{
    Hh hi = mesh.opposite_halfedge_handle(hh);
    Vh vh0 = mesh.to_vertex_handle(hh);
    Vh vh1 = mesh.to_vertex_handle(mesh.next_halfedge_handle(hh));
    Vh vh2 = mesh.to_vertex_handle(hi);
    Vh vh3 = mesh.to_vertex_handle(mesh.next_halfedge_handle(hi));

    // flipping a hull edge would carve a finite triangle out of the hull
    if (is_infinite(mesh, vh1) || is_infinite(mesh, vh3)) return false;

    const auto u1 = get_xy(mesh, vh1);
    const auto u3 = get_xy(mesh, vh3);

    // new faces (1,2,3) and (3,0,1); only the finite one has an orientation
    if (is_infinite(mesh, vh0)) return orientation(u1, get_xy(mesh, vh2), u3) > 0;
    if (is_infinite(mesh, vh2)) return orientation(u3, get_xy(mesh, vh0), u1) > 0;

    const auto u0 = get_xy(mesh, vh0);
    const auto u2 = get_xy(mesh, vh2);
    return exact_convex(u0, u1, u2, u3) && orientation(u0, u1, u2) > 0;
}

bool flip_edge(TriMesh &mesh, const Eh &eh)
{
    if (!is_flippable(mesh, mesh.halfedge_handle(eh, 0))) return false;
    if (!mesh.is_flip_ok(eh)) return false;

    mesh.flip(eh);

    return true;
}

////////////////////////////////////////////////////////////////
/// Utilities
////////////////////////////////////////////////////////////////

int count_ghost_faces(const TriMesh &mesh)
{
    int nf {};
    for (Fh fh : mesh.faces()) if (is_ghost(mesh, fh)) ++nf;
    return nf;
}
