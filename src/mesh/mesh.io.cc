#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include "pred2D.hh"
#include "mesh.io.hh"

static const char *__io_err_msg[] = {
    "",
    "internal error",
    "cannot open file",
    "unsupported format",
    "malformed file"
};

const char *io_error_message(const int err)
{
    if (err < 0 || err > IO_ERR_TYPE::MALFORMED) return __io_err_msg[IO_ERR_TYPE::INTERNAL];
    return __io_err_msg[err];
}

////////////////////////////////////////////////////////////////
/// Utils
////////////////////////////////////////////////////////////////

inline std::string get_file_extension(const char *filename)
{
    std::string s { filename };
    auto found = s.find_last_of(".");
    if (found == std::string::npos) return std::string {};
    return s.substr(found + 1);
}

// Skip blank lines and '#' comments of the Triangle formats.
static bool next_record(std::ifstream &in, std::istringstream &line)
{
    std::string s {};

    while (std::getline(in, s))
    {
        const auto hash = s.find('#');
        if (hash != std::string::npos) s.erase(hash);
        if (s.find_first_not_of(" \t\r") == std::string::npos) continue;
        line.clear();
        line.str(s);
        return true;
    }

    return false;
}

////////////////////////////////////////////////////////////////
/// Raw data
////////////////////////////////////////////////////////////////

int save_obj(
    const double *vs, const int nv,
    const int    *fs, const int nf,
    const char *filename,
    const int offset,
    const std::streamsize prec)
{
    std::ofstream out(filename, std::ios::out);
    if (!out) return IO_ERR_TYPE::CANNOT_OPEN;

    out << std::defaultfloat << std::setprecision(prec);

    for (int i = 0; i < nv; ++i)
        out << "v "
            << vs[i*2 + 0] << " "
            << vs[i*2 + 1] << " "
            << 0 << "\n";

    for (int i = 0; i < nf; ++i)
        out << "f "
            << fs[i*3 + 0] + offset << " "
            << fs[i*3 + 1] + offset << " "
            << fs[i*3 + 2] + offset << "\n";

    return IO_ERR_TYPE::NO_ERROR;
}

int read_node(std::vector<Vec2> &vs, const char *filename)
{
    if (get_file_extension(filename).compare("node") != 0)
    {
        fprintf(stderr, "read_node error %d: %s\n", IO_ERR_TYPE::UNSUPPORTED_FORMAT, io_error_message(IO_ERR_TYPE::UNSUPPORTED_FORMAT));
        return IO_ERR_TYPE::UNSUPPORTED_FORMAT;
    }

    std::ifstream in(filename, std::ios::in);
    if (!in)
    {
        fprintf(stderr, "read_node error %d: %s\n", IO_ERR_TYPE::CANNOT_OPEN, io_error_message(IO_ERR_TYPE::CANNOT_OPEN));
        return IO_ERR_TYPE::CANNOT_OPEN;
    }

    std::istringstream line {};

    int nv {}, dim {};

    if (!next_record(in, line) || !(line >> nv >> dim) || nv < 0 || dim != 2)
    {
        fprintf(stderr, "read_node error %d: %s (header)\n", IO_ERR_TYPE::MALFORMED, io_error_message(IO_ERR_TYPE::MALFORMED));
        return IO_ERR_TYPE::MALFORMED;
    }

    vs.clear();

    for (int i = 0; i < nv; ++i)
    {
        int vid {}; Vec2 p {};

        // optional: attributes and boundary marker follow the coordinates
        if (!next_record(in, line) || !(line >> vid >> p[0] >> p[1]))
        {
            fprintf(stderr, "read_node error %d: %s (vertex %d)\n", IO_ERR_TYPE::MALFORMED, io_error_message(IO_ERR_TYPE::MALFORMED), i);
            return IO_ERR_TYPE::MALFORMED;
        }

        vs.push_back(p);
    }

    return IO_ERR_TYPE::NO_ERROR;
}

int save_node(const std::vector<Vec2> &vs, const char* filename, const std::streamsize prec)
{
    std::ofstream out(filename, std::ios::out);
    if (!out) return IO_ERR_TYPE::CANNOT_OPEN;

    out << std::defaultfloat << std::setprecision(prec);

    out << vs.size() << " 2 0 0\n";

    for (size_t i = 0; i < vs.size(); ++i)
        out << i + 1 << " "
            << vs[i][0] << " "
            << vs[i][1] << "\n";

    return IO_ERR_TYPE::NO_ERROR;
}

////////////////////////////////////////////////////////////////
/// Triangles
////////////////////////////////////////////////////////////////

int save_obj(const std::vector<Vec2> &vs, const std::vector<Int3> &ts, const char *filename)
{
    predicates_init();

    std::vector<int> fs {};
    fs.reserve(ts.size() * 3);

    for (const auto &t : ts)
    {
        for (int i = 0; i < 3; ++i)
            if (t[i] < 0 || t[i] >= (int)vs.size()) return IO_ERR_TYPE::INTERNAL;

        // canonical triples lose their orientation
        const bool ccw = orientation(vs[t[0]], vs[t[1]], vs[t[2]]) > 0;
        fs.push_back(t[0]); fs.push_back(ccw ? t[1] : t[2]); fs.push_back(ccw ? t[2] : t[1]);
    }

    return save_obj((const double *)vs.data(), (int)vs.size(), fs.data(), (int)ts.size(), filename);
}

void print_triangles(const std::vector<Int3> &triangles, FILE *out)
{
    for (const auto &t : triangles)
        fprintf(out, "[%d, %d, %d]\n", t[0], t[1], t[2]);
}
