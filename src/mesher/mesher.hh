#ifndef DELAUNAY_MESHER_HH
#define DELAUNAY_MESHER_HH

#include <vector>
#include "mesh.hh"

////////////////////////////////////////////////////////////////
/// Errors
////////////////////////////////////////////////////////////////

enum class MESHER_ERR : int
{
    NONE = 0,
    DUPLICATE_POINT,         // a point coincides with an already inserted one
    DEGENERATE_INPUT,        // fewer than 3 points, or all points collinear
    NUMERICAL_INCONSISTENCY, // location or legalization failed
    INVALID_COORDINATE,      // NaN, infinite, or out of the supported range
};

const char *mesher_error_message(const MESHER_ERR);

////////////////////////////////////////////////////////////////
/// Options and results
////////////////////////////////////////////////////////////////

struct MesherOptions
{
    // Points closer than this to an inserted vertex are duplicates.
    // Zero means only bit-identical coordinates collide.
    double duplicate_tolerance { 0 };

    // Run check_delaunay() before extracting triangles.
    bool validate { true };

    // 0: silent, 1: summary, 2: every insertion
    int verbose { 0 };
};

struct TriangulationResult
{
    MESHER_ERR err { MESHER_ERR::NONE };

    int vertex { -1 }; // input index of the offending point
    int other  { -1 }; // input index it collides with (DUPLICATE_POINT only)

    std::vector<Int3> triangles {}; // canonical, empty on failure

    bool ok() const { return err == MESHER_ERR::NONE; }
};

////////////////////////////////////////////////////////////////
/// Incremental Delaunay triangulation
////////////////////////////////////////////////////////////////

class Triangulation
{
public:

    explicit Triangulation(const MesherOptions &options = MesherOptions {});

    /// Start over from three non-collinear points (either orientation).
    MESHER_ERR init(
        const Vec2 &u0, const int i0,
        const Vec2 &u1, const int i1,
        const Vec2 &u2, const int i2);

    /// Insert a point and restore the Delaunay property. If the point is a
    /// duplicate the mesh is not touched and *other receives the index of
    /// the vertex it collides with.
    MESHER_ERR insert(const Vec2 &u, const int index, int *other = nullptr);

    bool is_initialized() const { return vh_inf_.is_valid(); }

    const TriMesh &mesh() const { return m_; }

    Vh infinite_vertex() const { return vh_inf_; }

    /// Number of inserted points.
    int n_vertices() const { return is_initialized() ? (int)m_.n_vertices() - 1 : 0; }

    /// Number of flips performed so far.
    int n_flips() const { return n_flip_; }

protected:

    Vh find_near_vertex(const Fh &fh, const Vec2 &u) const;

protected:

    TriMesh m_;

    Vh vh_inf_;

    Fh fh_hint_; // a face of the last inserted vertex

    MesherOptions opts_;

    int n_flip_ {};
};

/// Triangulate the points in input order. On success the result holds the
/// finite triangles as ascending index triples in ascending order.
TriangulationResult insert_all(const std::vector<Vec2>&, const MesherOptions& = MesherOptions {});

////////////////////////////////////////////////////////////////
/// Delaunay property
////////////////////////////////////////////////////////////////

/// Local legality of an edge, including edges of ghost faces.
bool is_delaunay(const TriMesh&, const Eh&);

/// Flip stacked edges until all are legal; edges at the apex are not
/// stacked again. Returns the number of flips or -1.
int legalize(TriMesh&, const std::vector<Eh>&, const Vh &apex, const int max_n_flip);

/// Check orientation, local Delaunay property, and topology of the whole
/// mesh. Returns the number of violations found.
int check_delaunay(const TriMesh&, const int verbose = 0);

////////////////////////////////////////////////////////////////
/// Extraction
////////////////////////////////////////////////////////////////

/// Input indices of all finite triangles in canonical form.
std::vector<Int3> extract_triangles(const TriMesh&);

/// Sort the corners of every triangle, then the triangles.
void canonicalize(std::vector<Int3>&);

#endif
