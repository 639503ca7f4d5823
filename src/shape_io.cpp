#include "fluxed/shape_io.hpp"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fluxed {

static constexpr uint32_t SHAPE_MAGIC = 0x53584C46u; // 'FLXS'
static constexpr uint32_t SHAPE_VER   = 1;
static constexpr uint32_t MAX_DIMS    = 32;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================
// Text
// ============================================================
bool read_shape_text(std::istream& is, std::unique_ptr<NdShape>& out, std::string& error) {
    Extents extents;
    std::vector<int> values;
    bool have_dims = false;
    std::string line;
    int line_no = 0;

    while (std::getline(is, line)) {
        line_no++;
        auto hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);

        std::istringstream ls(line);
        std::string first;
        if (!(ls >> first)) continue;

        if (first == "dims") {
            if (have_dims) {
                error = "line " + std::to_string(line_no) + ": duplicate dims line";
                return false;
            }
            long long e = 0;
            while (ls >> e) {
                if (e <= 0) {
                    error = "line " + std::to_string(line_no) + ": extents must be positive";
                    return false;
                }
                extents.push_back((std::size_t)e);
            }
            if (!ls.eof() || extents.empty()) {
                error = "line " + std::to_string(line_no) + ": malformed dims line";
                return false;
            }
            try {
                NdShape::cell_count(extents);
            } catch (const std::invalid_argument& e) {
                error = "line " + std::to_string(line_no) + ": " + e.what();
                return false;
            }
            have_dims = true;
            continue;
        }

        if (!have_dims) {
            error = "line " + std::to_string(line_no) + ": cells before dims line";
            return false;
        }

        for (char c : line) {
            if (c == '0' || c == '1') values.push_back(c - '0');
            else if (c == ' ' || c == '\t' || c == '\r' || c == ',') continue;
            else {
                error = "line " + std::to_string(line_no) + ": invalid character '" + c + "'";
                return false;
            }
        }
    }

    if (!have_dims) {
        error = "missing dims line";
        return false;
    }

    try {
        out.reset(new NdShape(extents, values));
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    return true;
}

void write_shape_text(std::ostream& os, const NdShape& shape) {
    os << "dims";
    for (std::size_t e : shape.extents()) os << " " << e;
    os << "\n";

    const std::size_t row = shape.extents().back();
    for (std::size_t i = 0; i < shape.size(); i++) {
        os << char('0' + shape.at(i));
        if ((i + 1) % row == 0) os << "\n";
    }
}

// ============================================================
// Binary
// ============================================================
template <typename T>
static void write_pod(std::ostream& os, const T& v) {
    os.write((const char*)&v, sizeof(T));
}

template <typename T>
static bool read_pod(std::istream& is, T& v) {
    return (bool)is.read((char*)&v, sizeof(T));
}

bool read_shape_binary(std::istream& is, std::unique_ptr<NdShape>& out, std::string& error) {
    uint32_t magic = 0, ver = 0, ndim = 0;
    if (!read_pod(is, magic) || !read_pod(is, ver) || !read_pod(is, ndim)) {
        error = "truncated header";
        return false;
    }
    if (magic != SHAPE_MAGIC || ver != SHAPE_VER) {
        error = "not a fluxed shape file (bad magic or version)";
        return false;
    }
    if (ndim == 0 || ndim > MAX_DIMS) {
        error = "bad dimension count " + std::to_string(ndim);
        return false;
    }

    Extents extents(ndim);
    for (uint32_t k = 0; k < ndim; k++) {
        uint64_t e = 0;
        if (!read_pod(is, e) || e == 0 || e > NdShape::MAX_CELLS) {
            error = "bad extent on axis " + std::to_string(k);
            return false;
        }
        extents[k] = (std::size_t)e;
    }

    std::size_t n = 0;
    try {
        n = NdShape::cell_count(extents);
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }

    std::vector<uint8_t> raw(n);
    if (n && !is.read((char*)raw.data(), (std::streamsize)n)) {
        error = "truncated cell data";
        return false;
    }

    try {
        out.reset(new NdShape(extents, std::vector<int>(raw.begin(), raw.end())));
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    return true;
}

bool write_shape_binary(std::ostream& os, const NdShape& shape) {
    write_pod(os, SHAPE_MAGIC);
    write_pod(os, SHAPE_VER);
    write_pod(os, (uint32_t)shape.dimensions());
    for (std::size_t e : shape.extents()) write_pod(os, (uint64_t)e);
    os.write((const char*)shape.cells().data(), (std::streamsize)shape.size());
    return (bool)os;
}

// ============================================================
// Files
// ============================================================
bool load_shape(const std::string& path, std::unique_ptr<NdShape>& out) {
    bool binary = ends_with(path, ".bin");
    std::ifstream f(path, binary ? std::ios::binary : std::ios::in);
    if (!f) {
        std::cerr << "Could not open shape file: " << path << "\n";
        return false;
    }

    std::string error;
    bool ok = binary ? read_shape_binary(f, out, error) : read_shape_text(f, out, error);
    if (!ok) std::cerr << "Failed to read shape " << path << ": " << error << "\n";
    return ok;
}

bool save_shape(const std::string& path, const NdShape& shape) {
    bool binary = ends_with(path, ".bin");
    std::ofstream f(path, binary ? std::ios::binary : std::ios::out);
    if (!f) {
        std::cerr << "Could not write shape file: " << path << "\n";
        return false;
    }
    if (binary) return write_shape_binary(f, shape);
    write_shape_text(f, shape);
    return (bool)f;
}

bool parse_shape_spec(const std::string& spec, std::unique_ptr<NdShape>& out) {
    static const std::string prefix = "box:";
    if (spec.compare(0, prefix.size(), prefix) != 0)
        return load_shape(spec, out);

    Extents extents;
    std::istringstream ss(spec.substr(prefix.size()));
    std::string tok;
    while (std::getline(ss, tok, 'x')) {
        try {
            std::size_t used = 0;
            long long e = std::stoll(tok, &used);
            if (used != tok.size() || e <= 0) throw std::invalid_argument(tok);
            extents.push_back((std::size_t)e);
        } catch (const std::exception&) {
            std::cerr << "Bad box extent '" << tok << "' in " << spec << "\n";
            return false;
        }
    }
    if (extents.empty()) {
        std::cerr << "Box spec has no extents: " << spec << "\n";
        return false;
    }
    try {
        out.reset(new NdShape(NdShape::hollow_box(extents)));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Bad box spec " << spec << ": " << e.what() << "\n";
        return false;
    }
    return true;
}

bool dump_intensity(const std::string& path, const NdShape& shape) {
    if (!shape.has_intensity()) {
        std::cerr << "No intensity field to dump\n";
        return false;
    }

    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        std::perror("dump fopen failed");
        return false;
    }

    int32_t nd = (int32_t)shape.dimensions();
    std::fwrite(&nd, sizeof(int32_t), 1, f);
    for (std::size_t e : shape.extents()) {
        int64_t e64 = (int64_t)e;
        std::fwrite(&e64, sizeof(int64_t), 1, f);
    }
    std::size_t written = std::fwrite(shape.intensity().data(), sizeof(double), shape.size(), f);

    bool ok = (written == shape.size());
    if (std::fclose(f) != 0) ok = false;
    return ok;
}

} // namespace fluxed
