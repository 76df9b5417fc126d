#include <algorithm>
#include <unordered_set>
#include "math_def.hh"
#include "delaunay.hh"
#include "triangle.hh"
#include "mesh.hh"
#include "topology.hh"
#include "search.hh"
#include "mesher.hh"

using namespace OpenMesh;

////////////////////////////////////////////////////////////////
/// Errors
////////////////////////////////////////////////////////////////

static const char *__mesher_err_msg[] = {
    "No error",
    "Duplicate point",
    "Degenerate input",
    "Numerical inconsistency",
    "Invalid coordinate",
};

const char *mesher_error_message(const MESHER_ERR err)
{
    const int i = (int)err;
    if (i < 0 || i > (int)MESHER_ERR::INVALID_COORDINATE) return "Unknown error";
    return __mesher_err_msg[i];
}

////////////////////////////////////////////////////////////////
/// Utilities
////////////////////////////////////////////////////////////////

static inline bool is_valid_point(const Vec2 &u)
{
    return is_valid_coordinate(u[0]) && is_valid_coordinate(u[1]);
}

static inline bool is_coincident(const Vec2 &u, const Vec2 &v, const double tol)
{
    if (tol > 0) return (u - v).sqrnorm() <= tol * tol;
    return u[0] == v[0] && u[1] == v[1];
}

static inline const char *location_name(const TRI_LOC loc)
{
    if (loc == TRI_LOC::IN)  return "in triangle";
    if (loc == TRI_LOC::OUT) return "out of hull";
    if (is_on_edge(loc))     return "on edge";
    return "on vertex";
}

// A face whose circumcircle contains u. For a ghost face the circle
// degenerates to the open half-plane beyond its hull edge.
static inline bool is_in_conflict(const TriMesh &mesh, const Fh &fh, const Vec2 &u)
{
    if (is_ghost(mesh, fh))
    {
        const auto hh = finite_halfedge(mesh, fh);
        return orientation(get_xy(mesh, mesh.from_vertex_handle(hh)), get_xy(mesh, hh), u) >= 0;
    }

    Hh hh0 = mesh.halfedge_handle(fh);
    Hh hh1 = mesh.next_halfedge_handle(hh0);
    Hh hh2 = mesh.next_halfedge_handle(hh1);
    return incircle(get_xy(mesh, hh0), get_xy(mesh, hh1), get_xy(mesh, hh2), u) >= 0;
}

////////////////////////////////////////////////////////////////
/// Incremental triangulation
////////////////////////////////////////////////////////////////

Triangulation::Triangulation(const MesherOptions &options)
: opts_(options)
{
    predicates_init();
}

MESHER_ERR Triangulation::init(
    const Vec2 &u0, const int i0,
    const Vec2 &u1, const int i1,
    const Vec2 &u2, const int i2)
{
    m_.clear(); vh_inf_ = Vh {}; fh_hint_ = Fh {}; n_flip_ = 0;

    if (!is_valid_point(u0) || !is_valid_point(u1) || !is_valid_point(u2))
        return MESHER_ERR::INVALID_COORDINATE;

    const int ort = orientation(u0, u1, u2);
    if (ort == 0) return MESHER_ERR::DEGENERATE_INPUT;

    Vh vh0 = m_.new_vertex({ u0[0], u0[1], 0 }); set_index(m_, vh0, i0);
    Vh vh1 = m_.new_vertex({ u1[0], u1[1], 0 }); set_index(m_, vh1, i1);
    Vh vh2 = m_.new_vertex({ u2[0], u2[1], 0 }); set_index(m_, vh2, i2);

    // the finite triangle must be counter-clockwise
    vh_inf_ = (ort > 0) ?
        make_bootstrap(m_, vh0, vh1, vh2) :
        make_bootstrap(m_, vh0, vh2, vh1) ;

    if (!vh_inf_.is_valid()) { m_.clear(); return MESHER_ERR::NUMERICAL_INCONSISTENCY; }

    fh_hint_ = finite_face(m_, vh0);

    if (opts_.verbose > 1)
        fprintf(stderr, "Seed triangle (%d, %d, %d)\n", i0, i1, i2);

    return MESHER_ERR::NONE;
}

Vh Triangulation::find_near_vertex(const Fh &fh, const Vec2 &u) const
{
    const double tol = opts_.duplicate_tolerance;

    // The nearest vertex to u is connected to u once u is inserted, so it
    // is a corner of some face of the conflict region around fh.
    std::vector<Fh> faces { fh };
    std::unordered_set<Fh> visited { fh };

    Vh vh_near {}; double d_near = tol * tol;

    for (size_t i = 0; i < faces.size(); ++i)
    {
        for (Vh vh : m_.fv_range(faces[i])) if (!is_infinite(m_, vh))
        {
            const double d = (get_xy(m_, vh) - u).sqrnorm();
            if (d <= d_near) { d_near = d; vh_near = vh; }
        }

        for (Hh hh : m_.fh_range(faces[i]))
        {
            Fh fi = m_.opposite_face_handle(hh);
            if (visited.count(fi)) continue;
            visited.insert(fi);
            if (is_in_conflict(m_, fi, u)) faces.push_back(fi);
        }
    }

    return vh_near;
}

MESHER_ERR Triangulation::insert(const Vec2 &u, const int index, int *other)
{
    if (!is_initialized()) return MESHER_ERR::DEGENERATE_INPUT;

    if (!is_valid_point(u)) return MESHER_ERR::INVALID_COORDINATE;

    // find the triangle where the point locates
    Fh fh = search_triangle(m_, u, fh_hint_);
    if (!fh.is_valid()) return MESHER_ERR::NUMERICAL_INCONSISTENCY;

    // at which part of the triangle the point locates
    Hh hh {}; const auto loc = locate(m_, fh, u, hh);

    if (is_on_vertex(loc))
    {
        if (other) *other = get_index(m_, m_.to_vertex_handle(hh));
        return MESHER_ERR::DUPLICATE_POINT;
    }

    if (loc == TRI_LOC::OUT && !is_ghost(m_, fh)) return MESHER_ERR::NUMERICAL_INCONSISTENCY;

    if (opts_.duplicate_tolerance > 0)
    {
        Vh vh_near = find_near_vertex(fh, u);
        if (vh_near.is_valid())
        {
            if (other) *other = get_index(m_, vh_near);
            return MESHER_ERR::DUPLICATE_POINT;
        }
    }

    Vh vh = m_.new_vertex({ u[0], u[1], 0 });
    set_index(m_, vh, index);

    // insert the point into the triangle or onto the edge
    if (is_on_edge(loc)) split_edge(m_, hh, vh);
    else                 split_face(m_, fh, vh);

    // edges to flip
    std::vector<Eh> ehs {};
    for (auto hdge : m_.voh_range(vh))
        ehs.push_back(hdge.next().edge());

    const int n_flip = legalize(m_, ehs, vh, (int)m_.n_edges());
    if (n_flip < 0) return MESHER_ERR::NUMERICAL_INCONSISTENCY;

    n_flip_ += n_flip;
    fh_hint_ = finite_face(m_, vh);

    if (opts_.verbose > 1)
        fprintf(stderr, "Point %d inserted %s, %d flips\n", index, location_name(loc), n_flip);

    return MESHER_ERR::NONE;
}

////////////////////////////////////////////////////////////////
/// Batch
////////////////////////////////////////////////////////////////

// First three points, in input order, that span a triangle.
static bool find_seed(const std::vector<Vec2> &vs, const double tol, int &i0, int &i1, int &i2)
{
    const int nv = (int)vs.size();

    i0 = 0; i1 = -1; i2 = -1;

    for (int i = 1; i < nv && i1 < 0; ++i)
        if (!is_coincident(vs[i0], vs[i], tol)) i1 = i;

    if (i1 < 0) return false;

    for (int i = i1 + 1; i < nv && i2 < 0; ++i)
        if (orientation(vs[i0], vs[i1], vs[i]) != 0)
        if (!is_coincident(vs[i0], vs[i], tol))
        if (!is_coincident(vs[i1], vs[i], tol))
        { i2 = i; }

    return i2 >= 0;
}

static inline TriangulationResult make_error(const MESHER_ERR err, const int vertex, const int other, const int verbose)
{
    TriangulationResult res {};
    res.err = err; res.vertex = vertex; res.other = other;

    if (verbose)
    {
        fprintf(stderr, "triangulate error %d: %s", (int)err, mesher_error_message(err));
        if (vertex >= 0) fprintf(stderr, " at point %d", vertex);
        if (other  >= 0) fprintf(stderr, " (coincides with point %d)", other);
        fprintf(stderr, "\n");
    }

    return res;
}

TriangulationResult insert_all(const std::vector<Vec2> &vs, const MesherOptions &opts)
{
    predicates_init();

    const int nv = (int)vs.size();

    for (int i = 0; i < nv; ++i) if (!is_valid_point(vs[i]))
        return make_error(MESHER_ERR::INVALID_COORDINATE, i, -1, opts.verbose);

    if (nv < 3) return make_error(MESHER_ERR::DEGENERATE_INPUT, -1, -1, opts.verbose);

    int i0 {}, i1 {}, i2 {};
    if (!find_seed(vs, opts.duplicate_tolerance, i0, i1, i2))
        return make_error(MESHER_ERR::DEGENERATE_INPUT, -1, -1, opts.verbose);

    Triangulation tri(opts);

    MESHER_ERR err = tri.init(vs[i0], i0, vs[i1], i1, vs[i2], i2);
    if (err != MESHER_ERR::NONE) return make_error(err, -1, -1, opts.verbose);

    for (int i = 0; i < nv; ++i) if (i != i0 && i != i1 && i != i2)
    {
        int other { -1 };
        err = tri.insert(vs[i], i, &other);
        if (err != MESHER_ERR::NONE) return make_error(err, i, other, opts.verbose);
    }

    if (opts.validate && check_delaunay(tri.mesh(), opts.verbose) != 0)
        return make_error(MESHER_ERR::NUMERICAL_INCONSISTENCY, -1, -1, opts.verbose);

    TriangulationResult res {};
    res.triangles = extract_triangles(tri.mesh());

    if (opts.verbose)
        fprintf(stderr, "Triangulated %d points: %d triangles, %d hull edges, %d flips\n",
            nv, (int)res.triangles.size(), count_ghost_faces(tri.mesh()), tri.n_flips());

    return res;
}
