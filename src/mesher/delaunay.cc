#include "delaunay.hh"
#include "mesh.hh"
#include "topology.hh"
#include "mesher.hh"

using namespace OpenMesh;

//   1  
//  / \ 
// 2---0
//  \ / 
//   3  
bool is_delaunay(const TriMesh &mesh, const Eh &eh)
{
    Hh hh0 = mesh.halfedge_handle(eh, 0);
    Hh hh1 = mesh.halfedge_handle(eh, 1);
    Vh vh0 = mesh.to_vertex_handle(hh0);
    Vh vh1 = mesh.to_vertex_handle(mesh.next_halfedge_handle(hh0));
    Vh vh2 = mesh.to_vertex_handle(hh1);
    Vh vh3 = mesh.to_vertex_handle(mesh.next_halfedge_handle(hh1));

    // hull edge
    if (is_infinite(mesh, vh1) || is_infinite(mesh, vh3)) return true;

    const auto u1 = get_xy(mesh, vh1);
    const auto u3 = get_xy(mesh, vh3);

    // edges to infinity are illegal only if 1-2-3 (or 3-0-1) is a left turn,
    // i.e. the hull would not be convex at the finite end point
    if (is_infinite(mesh, vh0)) return orientation(u1, get_xy(mesh, vh2), u3) <= 0;
    if (is_infinite(mesh, vh2)) return orientation(u3, get_xy(mesh, vh0), u1) <= 0;

    return perturbed_delaunay(get_xy(mesh, vh0), u1, get_xy(mesh, vh2), u3);
}

struct EuclideanDelaunay
{
    inline bool operator()(const TriMesh &mesh, const Eh &eh) const
    { return is_delaunay(mesh, eh); } // If true, do not flip
};

int legalize(TriMesh &mesh, const std::vector<Eh> &ehs, const Vh &apex, const int max_n_flip)
{
    auto legalizer = make_legalizer(mesh, EuclideanDelaunay {});

    legalizer.clear(); legalizer.set_apex(apex);
    legalizer.enqueue(ehs.data(), (int)ehs.size());

    return legalizer.flip_all(max_n_flip);
}

////////////////////////////////////////////////////////////////
/// Validation
////////////////////////////////////////////////////////////////

int check_delaunay(const TriMesh &mesh, const int verbose)
{
    int n_err {};

    for (Fh fh : mesh.faces())
    {
        int n_inf {};
        for (Vh vh : mesh.fv_range(fh)) if (is_infinite(mesh, vh)) ++n_inf;

        if (n_inf > 1)
        {
            if (verbose) { fprintf(stderr, "Face "); print_handle(mesh, fh, " has more than one vertex at infinity\n"); }
            ++n_err; continue;
        }

        if (n_inf == 1) continue;

        const auto t = dump_handle(mesh, fh);
        Hh hh = mesh.halfedge_handle(fh);
        const auto u0 = get_xy(mesh, mesh.from_vertex_handle(hh));
        const auto u1 = get_xy(mesh, mesh.to_vertex_handle(hh));
        const auto u2 = get_xy(mesh, mesh.to_vertex_handle(mesh.next_halfedge_handle(hh)));

        if (orientation(u0, u1, u2) <= 0)
        {
            if (verbose) fprintf(stderr, "Face (%d, %d, %d) is not counter-clockwise\n", t[0], t[1], t[2]);
            ++n_err;
        }
    }

    for (Eh eh : mesh.edges())
    {
        if (mesh.is_boundary(eh))
        {
            if (verbose) { fprintf(stderr, "Edge "); print_handle(mesh, mesh.halfedge_handle(eh, 0), " is on a boundary\n"); }
            ++n_err; continue;
        }

        if (is_infinite(mesh, eh))
        {
            if (!is_delaunay(mesh, eh))
            {
                if (verbose) { fprintf(stderr, "Edge "); print_handle(mesh, mesh.halfedge_handle(eh, 0), " breaks hull convexity\n"); }
                ++n_err;
            }
            continue;
        }

        Hh hh0 = mesh.halfedge_handle(eh, 0);
        Hh hh1 = mesh.halfedge_handle(eh, 1);
        Vh vh1 = mesh.to_vertex_handle(mesh.next_halfedge_handle(hh0));
        Vh vh3 = mesh.to_vertex_handle(mesh.next_halfedge_handle(hh1));
        if (is_infinite(mesh, vh1) || is_infinite(mesh, vh3)) continue;

        const auto u0 = get_xy(mesh, hh0);
        const auto u1 = get_xy(mesh, vh1);
        const auto u2 = get_xy(mesh, hh1);
        const auto u3 = get_xy(mesh, vh3);

        if (!exact_delaunay(u0, u1, u2, u3))
        {
            if (verbose) { fprintf(stderr, "Edge "); print_handle(mesh, hh0, " is not Delaunay\n"); }
            ++n_err;
        }
    }

    for (Vh vh : mesh.vertices()) if (mesh.is_isolated(vh))
    {
        if (verbose) { fprintf(stderr, "Vertex "); print_handle(mesh, vh, " is isolated\n"); }
        ++n_err;
    }

    const int nv = (int)mesh.n_vertices(), ne = (int)mesh.n_edges(), nf = (int)mesh.n_faces();
    if (nv - ne + nf != 2)
    {
        if (verbose) fprintf(stderr, "Euler characteristic is %d (V %d, E %d, F %d)\n", nv - ne + nf, nv, ne, nf);
        ++n_err;
    }

    return n_err;
}
