#include <cstdlib>
#include "mesh.hh"
#include "mesher.hh"
#include "mesh.io.hh"
#include "main.hh"

// largest N whose N * N indices fit comfortably in an int
static constexpr int max_grid = 4096;

// N x N integer grid, index y * N + x
static std::vector<Vec2> make_grid(const int n)
{
    std::vector<Vec2> vs {};
    for (int y = 0; y < n; ++y)
    for (int x = 0; x < n; ++x)
        vs.push_back({ (double)x, (double)y });
    return vs;
}

int main(const int argc, const char **argv)
{
    const char **begin = argv + 1, **end = argv + argc;

    MesherOptions opts {};
    int n_grid = 3;
    std::string node_file, obj_file;

    const char *arg {};
    if ((arg = get_value(begin, end, "--grid")))      { n_grid = atoi(arg); }
    if ((arg = get_value(begin, end, "--node")))      { node_file = arg; }
    if ((arg = get_value(begin, end, "--tolerance"))) { opts.duplicate_tolerance = atof(arg); }
    if ((arg = get_value(begin, end, "--verbose")))   { opts.verbose = atoi(arg); }
    if ((arg = get_value(begin, end, "--obj")))       { obj_file = arg; }
    if (has_key(begin, end, "--no-validate"))         { opts.validate = false; }

    std::vector<Vec2> vs {};
    if (!node_file.empty())
    {
        if (read_node(vs, node_file.c_str()) != 0)
        { fprintf(stderr, "Cannot load node file.\n"); return 1; }
    }
    else
    {
        if (n_grid < 1 || n_grid > max_grid)
        { fprintf(stderr, "Grid size must be between 1 and %d.\n", max_grid); return 1; }
        vs = make_grid(n_grid);
    }

    const auto res = insert_all(vs, opts);
    if (!res.ok())
    {
        fprintf(stderr, "Triangulation failed: %s", mesher_error_message(res.err));
        if (res.vertex >= 0) fprintf(stderr, " (point %d", res.vertex);
        if (res.other  >= 0) fprintf(stderr, ", coincides with point %d", res.other);
        if (res.vertex >= 0) fprintf(stderr, ")");
        fprintf(stderr, "\n");
        return (int)res.err;
    }

    if (node_file.empty())
        printf("%dx%d grid triangles (indices into 0..%d in row-major order):\n", n_grid, n_grid, n_grid * n_grid - 1);
    print_triangles(res.triangles, stdout);

    if (!obj_file.empty() && save_obj(vs, res.triangles, obj_file.c_str()) != 0)
    { fprintf(stderr, "Cannot save obj file.\n"); return 1; }

    return 0;
}
