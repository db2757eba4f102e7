/*─────────────────────────────────────────────────────────────
  File: src/plot3d_io.cpp

  Plot3D grid and function file I/O (Fortran unformatted, multi-block).

  Supported format assumptions:
    - Grid file:
        * Record 1: number of blocks (int32)
        * Record 2: (ni,nj,nk) int32 triplets, one per block
        * Record 3+: one record per block, [x(1..N), y(1..N), z(1..N)]
          in double precision
    - Function file:
        * Record 1: number of blocks (int32)
        * Record 2: (ni,nj,nk,nvars) int32 quadruplets
        * Record 3+: one record per block, nvars planes of N doubles
    - 3-D, double precision, no iblank
    - Endianness matches the host (no byte swapping performed)

  This is intentionally strict: unexpected record sizes throw.
─────────────────────────────────────────────────────────────*/
#include "meshstep/plot3d_io.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>

namespace meshstep {

namespace {

/*=====================================================================
  FortranRecordReader

  Helper class for reading Fortran unformatted sequential records.

  A Fortran unformatted record has the structure:
      [uint32 record_size]
      [record_size bytes of payload]
      [uint32 record_size]
=====================================================================*/
class FortranRecordReader {
public:
    explicit FortranRecordReader(const std::string& path)
        : input_(path, std::ios::binary), path_(path) {
        if (!input_) {
            throw std::runtime_error("Failed to open input file: " + path);
        }
    }

    /*---------------------------------------------------------
      Read a single Fortran record and return its payload.
    ---------------------------------------------------------*/
    std::vector<char> readRecord() {
        std::uint32_t leading = 0;
        if (!input_.read(reinterpret_cast<char*>(&leading), sizeof(leading))) {
            throw std::runtime_error("Unable to read record marker from " + path_);
        }

        std::vector<char> buffer(leading);
        if (!buffer.empty() && !input_.read(buffer.data(), leading)) {
            throw std::runtime_error("Unable to read record payload from " + path_);
        }

        std::uint32_t trailing = 0;
        if (!input_.read(reinterpret_cast<char*>(&trailing), sizeof(trailing))) {
            throw std::runtime_error("Unable to read trailing record marker from " + path_);
        }

        if (leading != trailing) {
            throw std::runtime_error("Mismatched Fortran record markers in " + path_);
        }

        return buffer;
    }

    /*---------------------------------------------------------
      Read a scalar value stored as a Fortran record.

      The record payload size must exactly match sizeof(T).
    ---------------------------------------------------------*/
    template <typename T>
    T readScalar() {
        auto buffer = readRecord();
        if (buffer.size() != sizeof(T)) {
            throw std::runtime_error("Unexpected record length while reading scalar from " + path_);
        }
        T value{};
        std::memcpy(&value, buffer.data(), sizeof(T));
        return value;
    }

    const std::string& path() const { return path_; }

private:
    std::ifstream input_;
    std::string   path_;
};

/*=====================================================================
  FortranRecordWriter

  Inverse of FortranRecordReader.
=====================================================================*/
class FortranRecordWriter {
public:
    explicit FortranRecordWriter(const std::string& path)
        : output_(path, std::ios::binary | std::ios::trunc), path_(path) {
        if (!output_) {
            throw std::runtime_error("Failed to open output file: " + path);
        }
    }

    void writeRecord(const void* data, std::size_t nbytes) {
        const auto marker = static_cast<std::uint32_t>(nbytes);
        output_.write(reinterpret_cast<const char*>(&marker), sizeof(marker));
        output_.write(static_cast<const char*>(data), static_cast<std::streamsize>(nbytes));
        output_.write(reinterpret_cast<const char*>(&marker), sizeof(marker));
        if (!output_) {
            throw std::runtime_error("Write failed on " + path_);
        }
    }

    template <typename T>
    void writeVector(const std::vector<T>& v) {
        writeRecord(v.data(), v.size() * sizeof(T));
    }

private:
    std::ofstream output_;
    std::string   path_;
};

/*---------------------------------------------------------
  Records 1 and 2: block count and per-block int32 dims.
  `per_block` is 3 for grids, 4 for function files.
---------------------------------------------------------*/
std::vector<std::vector<std::int32_t>> read_dimensions(FortranRecordReader& reader, int per_block)
{
    const std::int32_t count = reader.readScalar<std::int32_t>();
    if (count < 0) {
        throw std::runtime_error("Negative block count in " + reader.path());
    }
    const auto block_count = static_cast<std::size_t>(count);

    auto dimension_bytes = reader.readRecord();
    const std::size_t expected_bytes = block_count * per_block * sizeof(std::int32_t);
    if (dimension_bytes.size() != expected_bytes) {
        throw std::runtime_error("Unexpected dimension record size in " + reader.path());
    }

    std::vector<std::int32_t> flat(block_count * per_block);
    if (!flat.empty())
        std::memcpy(flat.data(), dimension_bytes.data(), expected_bytes);

    std::vector<std::vector<std::int32_t>> dims(block_count);
    for (std::size_t block = 0; block < block_count; ++block) {
        dims[block].assign(flat.begin() + block * per_block, flat.begin() + (block + 1) * per_block);
        for (int d = 0; d < 3; ++d)
            if (dims[block][d] < 1)
                throw std::runtime_error("Block " + std::to_string(block + 1) +
                                         " has a non-positive dimension in " + reader.path());
    }
    return dims;
}

std::vector<double> read_doubles(FortranRecordReader& reader, std::size_t value_count,
                                 const char* what)
{
    const std::size_t expected = value_count * sizeof(double);
    auto buffer = reader.readRecord();
    if (buffer.size() != expected) {
        throw std::runtime_error(std::string("Unexpected ") + what + " record size in " + reader.path());
    }
    std::vector<double> raw(value_count);
    if (expected)
        std::memcpy(raw.data(), buffer.data(), expected);
    return raw;
}

} // anonymous namespace

std::vector<double> Plot3DFunction::variable(int v) const
{
    if (v < 0 || v >= nvars)
        throw std::out_of_range("Plot3D function variable " + std::to_string(v) + " out of range");
    const auto n = static_cast<std::size_t>(num_points());
    return std::vector<double>(values.begin() + v * n, values.begin() + (v + 1) * n);
}

/*=====================================================================
  read_plot3d_grid

  Returns one Plot3DBlock per block, populated with:
    - idx      : 1-based block index
    - name     : "block-N"
    - vtxSize  : (ni,nj,nk)
    - x,y,z    : coordinate arrays in Plot3D order
=====================================================================*/
std::vector<Plot3DBlock> read_plot3d_grid(const std::string& path)
{
    FortranRecordReader reader(path);
    const auto dims = read_dimensions(reader, 3);

    std::vector<Plot3DBlock> blocks;
    blocks.reserve(dims.size());

    for (std::size_t block = 0; block < dims.size(); ++block) {
        Plot3DBlock b;
        b.idx = static_cast<int>(block + 1);
        b.name = "block-" + std::to_string(block + 1);
        b.vtxSize = {static_cast<long long>(dims[block][0]),
                     static_cast<long long>(dims[block][1]),
                     static_cast<long long>(dims[block][2])};

        const auto point_count = static_cast<std::size_t>(b.num_points());
        const std::vector<double> raw = read_doubles(reader, point_count * 3, "coordinate");

        /*-----------------------------------------------------
          Unpack coordinates:
            [x1..xN, y1..yN, z1..zN]
        -----------------------------------------------------*/
        b.x.assign(raw.begin(), raw.begin() + point_count);
        b.y.assign(raw.begin() + point_count, raw.begin() + 2 * point_count);
        b.z.assign(raw.begin() + 2 * point_count, raw.end());

        blocks.push_back(std::move(b));
    }
    return blocks;
}

std::vector<Plot3DFunction> read_plot3d_function_layout(const std::string& path)
{
    FortranRecordReader reader(path);
    const auto dims = read_dimensions(reader, 4);

    std::vector<Plot3DFunction> blocks(dims.size());
    for (std::size_t block = 0; block < dims.size(); ++block) {
        blocks[block].vtxSize = {static_cast<long long>(dims[block][0]),
                                 static_cast<long long>(dims[block][1]),
                                 static_cast<long long>(dims[block][2])};
        blocks[block].nvars = dims[block][3];
        if (blocks[block].nvars < 0)
            throw std::runtime_error("Negative variable count in " + path);
    }
    return blocks;
}

std::vector<Plot3DFunction> read_plot3d_function(const std::string& path)
{
    FortranRecordReader reader(path);
    const auto dims = read_dimensions(reader, 4);

    std::vector<Plot3DFunction> blocks(dims.size());
    for (std::size_t block = 0; block < dims.size(); ++block) {
        Plot3DFunction& f = blocks[block];
        f.vtxSize = {static_cast<long long>(dims[block][0]),
                     static_cast<long long>(dims[block][1]),
                     static_cast<long long>(dims[block][2])};
        f.nvars = dims[block][3];
        if (f.nvars < 0)
            throw std::runtime_error("Negative variable count in " + path);
        f.values = read_doubles(reader, static_cast<std::size_t>(f.num_points()) * f.nvars,
                                "function");
    }
    return blocks;
}

void write_plot3d_grid(const std::string& path, const std::vector<Plot3DBlock>& blocks)
{
    FortranRecordWriter writer(path);

    const auto count = static_cast<std::int32_t>(blocks.size());
    writer.writeRecord(&count, sizeof(count));

    std::vector<std::int32_t> dims;
    for (const auto& b : blocks)
        for (int d = 0; d < 3; ++d)
            dims.push_back(static_cast<std::int32_t>(b.vtxSize[d]));
    writer.writeVector(dims);

    for (const auto& b : blocks) {
        const auto n = static_cast<std::size_t>(b.num_points());
        if (b.x.size() != n || b.y.size() != n || b.z.size() != n)
            throw std::invalid_argument("Coordinate arrays of " + b.name + " do not match its size");
        std::vector<double> raw;
        raw.reserve(3 * n);
        raw.insert(raw.end(), b.x.begin(), b.x.end());
        raw.insert(raw.end(), b.y.begin(), b.y.end());
        raw.insert(raw.end(), b.z.begin(), b.z.end());
        writer.writeVector(raw);
    }
}

void write_plot3d_function(const std::string& path, const std::vector<Plot3DFunction>& blocks)
{
    FortranRecordWriter writer(path);

    const auto count = static_cast<std::int32_t>(blocks.size());
    writer.writeRecord(&count, sizeof(count));

    std::vector<std::int32_t> dims;
    for (const auto& f : blocks) {
        for (int d = 0; d < 3; ++d)
            dims.push_back(static_cast<std::int32_t>(f.vtxSize[d]));
        dims.push_back(f.nvars);
    }
    writer.writeVector(dims);

    for (const auto& f : blocks) {
        if (f.values.size() != static_cast<std::size_t>(f.num_points()) * f.nvars)
            throw std::invalid_argument("Function values do not match block size");
        writer.writeVector(f.values);
    }
}

} // namespace meshstep
