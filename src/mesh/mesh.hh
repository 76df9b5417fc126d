#ifndef MESH_DEFINITION_HH
#define MESH_DEFINITION_HH

#include <cstdio>
#include <vector>
#include <OpenMesh/Core/Mesh/TriMesh_ArrayKernelT.hh>
#include "vector_n.hh"

using Hh = OpenMesh::HalfedgeHandle;
using Vh = OpenMesh::VertexHandle;
using Fh = OpenMesh::FaceHandle;
using Eh = OpenMesh::EdgeHandle;

////////////////////////////////////////////////////////////////
/// Definition
////////////////////////////////////////////////////////////////

struct MeshTraits : public OpenMesh::DefaultTraitsDouble
{
    // Default attributes
    VertexAttributes   (OpenMesh::Attributes::Status);
    FaceAttributes     (OpenMesh::Attributes::Status);
    EdgeAttributes     (OpenMesh::Attributes::Status);
    HalfedgeAttributes (OpenMesh::Attributes::Status);

    // Customized attributes
    VertexTraits
    {
    private:
        int index_ { -1 }; // position in the input sequence, -1 for the vertex at infinity

    public:
        int  index() const { return index_; }
        void set_index(const int i) { index_ = i; }
    };
    FaceTraits     {};
    EdgeTraits     {};
    HalfedgeTraits {};
};

using TriMesh = OpenMesh::TriMesh_ArrayKernelT<MeshTraits>;

////////////////////////////////////////////////////////////////
/// Vertex at infinity
////////////////////////////////////////////////////////////////

// Every hull edge (a, b) of the finite triangulation is closed by a ghost
// face (a, b, inf), so the mesh is a triangulated sphere without boundary.

inline int get_index(const TriMesh &mesh, const Vh &vh)
{ return mesh.data(vh).index(); }

inline void set_index(TriMesh &mesh, const Vh &vh, const int i)
{ mesh.data(vh).set_index(i); }

inline bool is_infinite(const TriMesh &mesh, const Vh &vh)
{ return mesh.data(vh).index() < 0; }

inline bool is_infinite(const TriMesh &mesh, const Eh &eh)
{
    return
        is_infinite(mesh, mesh.to_vertex_handle(mesh.halfedge_handle(eh, 0))) ||
        is_infinite(mesh, mesh.to_vertex_handle(mesh.halfedge_handle(eh, 1)));
}

inline bool is_ghost(const TriMesh &mesh, const Fh &fh)
{
    for (Vh vh : mesh.fv_range(fh)) if (is_infinite(mesh, vh)) return true;
    return false;
}

/// The halfedge of a ghost face that does not touch the vertex at infinity.
inline Hh finite_halfedge(const TriMesh &mesh, const Fh &fh)
{
    Hh hh = mesh.halfedge_handle(fh);
    for (int i = 0; i < 3; ++i, hh = mesh.next_halfedge_handle(hh))
    if (!is_infinite(mesh, mesh.from_vertex_handle(hh)))
    if (!is_infinite(mesh, mesh.to_vertex_handle  (hh)))
    { return hh; }
    return Hh {};
}

/// Any finite face incident to the vertex, or a null handle if it has none.
inline Fh finite_face(const TriMesh &mesh, const Vh &vh)
{
    for (Fh fh : mesh.vf_range(vh)) if (!is_ghost(mesh, fh)) return fh;
    return Fh {};
}

////////////////////////////////////////////////////////////////
/// Flags
////////////////////////////////////////////////////////////////

template <class MeshT>
inline bool is_enqueued(const MeshT &mesh, const Eh &eh) { return mesh.status(eh).tagged2(); }
template <class MeshT>
inline void set_enqueued(MeshT &mesh, const Eh &eh, const bool val) { mesh.status(eh).set_tagged2(val); }

////////////////////////////////////////////////////////////////
/// Geometry
////////////////////////////////////////////////////////////////

template <class MeshT>
inline Vec2 get_xy(const MeshT &mesh, const Vh &vh)
{ const auto p = mesh.point(vh); return { p[0], p[1] }; }

template <class MeshT>
inline Vec2 get_xy(const MeshT &mesh, const Hh &hh)
{ return get_xy(mesh, mesh.to_vertex_handle(hh)); }

////////////////////////////////////////////////////////////////
/// Info
////////////////////////////////////////////////////////////////

inline void print_handle(const TriMesh &mesh, const Vh &vh, const char *end = "")
{
    fprintf(stderr, "(%d)%s", get_index(mesh, vh), end);
}

inline void print_handle(const TriMesh &mesh, const Hh &hh, const char *end = "")
{
    fprintf(stderr, "(%d, %d)%s",
        get_index(mesh, mesh.from_vertex_handle(hh)),
        get_index(mesh, mesh.to_vertex_handle  (hh)), end);
}

inline void print_handle(const TriMesh &mesh, const Fh &fh, const char *end = "")
{
    fprintf(stderr, "(%d, %d, %d)%s",
        get_index(mesh, mesh.from_vertex_handle(mesh.halfedge_handle(fh))),
        get_index(mesh, mesh.to_vertex_handle  (mesh.halfedge_handle(fh))),
        get_index(mesh, mesh.to_vertex_handle  (mesh.next_halfedge_handle(mesh.halfedge_handle(fh)))), end);
}

////////////////////////////////////////////////////////////////
/// Dump
////////////////////////////////////////////////////////////////

/// Input indices of the face corners, in the face's stored (CCW) order.
Int3 dump_handle(const TriMesh &mesh, const Fh &fh);

#endif
