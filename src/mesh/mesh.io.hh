#ifndef MESH_IO_HH
#define MESH_IO_HH

#include <cstdio>
#include <ios>
#include <vector>
#include "vector_n.hh"

enum IO_ERR_TYPE
{
    NO_ERROR,
    INTERNAL,
    CANNOT_OPEN,
    UNSUPPORTED_FORMAT,
    MALFORMED,
};

const char *io_error_message(const int err);

int read_node(
    std::vector<Vec2> &vs,
    const char *filename);

int save_node(
    const std::vector<Vec2> &vs,
    const char* filename,
    const std::streamsize prec = 17);

int save_obj(
    const double *vs, const int nv,
    const int    *fs, const int nf,
    const char *filename,
    const int offset = 1,
    const std::streamsize prec = 17);

/// Index triples in any corner order; faces are written counter-clockwise.
int save_obj(
    const std::vector<Vec2> &vs,
    const std::vector<Int3> &ts,
    const char *filename);

/// One triangle per line as "[i, j, k]".
void print_triangles(const std::vector<Int3> &triangles, FILE *out);

#endif
