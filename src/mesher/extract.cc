#include <algorithm>
#include "mesh.hh"
#include "mesher.hh"

std::vector<Int3> extract_triangles(const TriMesh &mesh)
{
    std::vector<Int3> ts {};
    ts.reserve(mesh.n_faces());

    for (Fh fh : mesh.faces())
        if (!mesh.status(fh).deleted() && !is_ghost(mesh, fh))
            ts.push_back(dump_handle(mesh, fh));

    canonicalize(ts);

    return ts;
}

void canonicalize(std::vector<Int3> &ts)
{
    for (auto &t : ts) std::sort(t.data(), t.data() + 3);

    std::sort(ts.begin(), ts.end(), [](const Int3 &a, const Int3 &b) { return lex_less(a, b); });
}
