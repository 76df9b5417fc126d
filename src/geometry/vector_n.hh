#ifndef VECTOR_N_HH
#define VECTOR_N_HH

#include <OpenMesh/Core/Geometry/VectorT.hh>

template <typename T, size_t N>
using VecN = OpenMesh::VectorT<T, N>;

using Vec2 = VecN<double, 2>;

using Int3 = VecN<int, 3>;

// lexicographic order, x first
inline bool lex_less(const Vec2 &a, const Vec2 &b)
{ return a[0] < b[0] || (a[0] == b[0] && a[1] < b[1]); }

inline bool lex_less(const Int3 &a, const Int3 &b)
{
    if (a[0] != b[0]) return a[0] < b[0];
    if (a[1] != b[1]) return a[1] < b[1];
    return a[2] < b[2];
}

#endif
