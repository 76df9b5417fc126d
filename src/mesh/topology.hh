#ifndef MESH_TOPOLOGY_HH
#define MESH_TOPOLOGY_HH

#include <vector>

#include "mesh.hh"

////////////////////////////////////////////////////////////////
/// Construction
////////////////////////////////////////////////////////////////

/// Close the counter-clockwise triangle (vh0, vh1, vh2) with a vertex at
/// infinity and three ghost faces. Returns the vertex at infinity, or a null
/// handle if OpenMesh rejects one of the faces.
Vh make_bootstrap(TriMesh&, const Vh &vh0, const Vh &vh1, const Vh &vh2);

/// Replace one triangle with three sharing vh (vh must be isolated).
void split_face(TriMesh&, const Fh&, const Vh&);

/// Replace the two triangles sharing the edge of hh with four sharing vh.
void split_edge(TriMesh&, const Hh&, const Vh&);

////////////////////////////////////////////////////////////////
/// Flip
////////////////////////////////////////////////////////////////

//
//   1   
//  / \  
// 2---0 
//  \ /  
//   3   
//
// hh runs from 2 to 0. Both triangles the flip would create must be
// properly oriented; a finite hull edge (1 or 3 at infinity) is never
// flippable.
bool is_flippable(const TriMesh&, const Hh&);

/// Flip the edge unless it is refused by is_flippable() or by OpenMesh's
/// own connectivity check. The mesh is untouched when false is returned.
bool flip_edge(TriMesh&, const Eh&);

////////////////////////////////////////////////////////////////
/// Legalization
////////////////////////////////////////////////////////////////

template <class DelaunayT>
class Legalizer
{
public:

    Legalizer(TriMesh &mesh, const DelaunayT &is_delaunay)
    : mesh(mesh), is_delaunay(is_delaunay) {}

    /// Clear all stacked edges
    void clear();

    /// Push specific edges
    void enqueue(const Eh[], const int);

    /// Edges incident to the apex are not pushed again after a flip.
    void set_apex(const Vh &vh) { apex = vh; }

    // Keep popping edges and flipping the non-Delaunay ones until the
    // stack runs dry. Returns the number of flips, or -1 if an illegal
    // edge could not be flipped or max_n_flip was exceeded.
    int flip_all(const int max_n_flip);

protected:

    void enqueue(const Eh&);

    void enqueue_adjacent(const Eh&);

protected:

    TriMesh &mesh;

    const DelaunayT is_delaunay;

    Vh apex;

    std::vector<Eh> stack;
};

template <class DelaunayT>
inline void Legalizer<DelaunayT>::clear()
{
    for (Eh eh : stack) { set_enqueued(mesh, eh, false); }
    stack.clear();
}

template <class DelaunayT>
inline void Legalizer<DelaunayT>::enqueue(const Eh &eh)
{
    if (is_enqueued(mesh, eh)) return;
    stack.push_back(eh);
    set_enqueued(mesh, eh, true);
}

template <class DelaunayT>
inline void Legalizer<DelaunayT>::enqueue(const Eh ehs[], const int ne)
{
    for (int i = 0; i < ne; ++i) enqueue(ehs[i]);
}

template <class DelaunayT>
inline void Legalizer<DelaunayT>::enqueue_adjacent(const Eh &eh_base)
{
    const Eh ehs[4] {
        mesh.edge_handle(mesh.next_halfedge_handle(mesh.halfedge_handle(eh_base, 0))),
        mesh.edge_handle(mesh.prev_halfedge_handle(mesh.halfedge_handle(eh_base, 0))),
        mesh.edge_handle(mesh.next_halfedge_handle(mesh.halfedge_handle(eh_base, 1))),
        mesh.edge_handle(mesh.prev_halfedge_handle(mesh.halfedge_handle(eh_base, 1)))
    };

    for (const Eh &eh : ehs)
    {
        if (apex.is_valid())
        {
            const Hh hh = mesh.halfedge_handle(eh, 0);
            if (mesh.from_vertex_handle(hh) == apex) continue;
            if (mesh.to_vertex_handle  (hh) == apex) continue;
        }
        enqueue(eh);
    }
}

template <class DelaunayT>
inline int Legalizer<DelaunayT>::flip_all(const int max_n_flip)
{
    int n_flip {};

    while (!stack.empty())
    {
        Eh eh = stack.back();
        set_enqueued(mesh, eh, false);
        stack.pop_back();

        if (is_delaunay(mesh, eh)) continue;

        if (n_flip >= max_n_flip || !flip_edge(mesh, eh))
        { clear(); return -1; }

        enqueue_adjacent(eh);
        ++n_flip;
    }

    return n_flip;
}

template <class DelaunayT>
inline Legalizer<DelaunayT> make_legalizer(TriMesh &mesh, const DelaunayT &is_delaunay)
{ return Legalizer<DelaunayT>(mesh, is_delaunay); }

////////////////////////////////////////////////////////////////
/// Utilities
////////////////////////////////////////////////////////////////

/// Number of hull edges, i.e. of ghost faces.
int count_ghost_faces(const TriMesh&);

#endif
