#include "mesh.hh"

using namespace OpenMesh;

////////////////////////////////////////////////////////////////
/// Dump handle
////////////////////////////////////////////////////////////////

Int3 dump_handle(const TriMesh &mesh, const Fh &fh)
{
    Vh vh0 = mesh.from_vertex_handle(mesh.halfedge_handle(fh));
    Vh vh1 = mesh.to_vertex_handle  (mesh.halfedge_handle(fh));
    Vh vh2 = mesh.to_vertex_handle  (mesh.next_halfedge_handle(mesh.halfedge_handle(fh)));
    return { get_index(mesh, vh0), get_index(mesh, vh1), get_index(mesh, vh2) };
}
