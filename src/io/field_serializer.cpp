#include "field_serializer.hpp"
#include <stdexcept> // For runtime_error

namespace Cradial {
namespace io {

// Magic number and version for basic file format validation
const std::uint32_t MAGIC_NUMBER_FIELD = 0x43524746; // CRGF
const std::uint16_t FILE_FORMAT_VERSION = 1;

void BinaryFieldSerializer::save_field(const GeoField& field, const std::string& path) const {
    if (field.get_total_nodes() == 0) {
        throw std::runtime_error("Cannot save an unconfigured field to: " + path);
    }
    std::ofstream outfile(path, std::ios::binary | std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    // 1. Magic number & Version
    write_binary(outfile, MAGIC_NUMBER_FIELD);
    write_binary(outfile, FILE_FORMAT_VERSION);

    // 2. Shape
    std::vector<uint_t> shape = field.get_shape();
    write_binary(outfile, static_cast<std::uint32_t>(shape.size()));
    for (uint_t n : shape) {
        write_binary(outfile, static_cast<std::uint32_t>(n));
    }

    // 3. Axes and values
    write_binary_vector(outfile, field.get_lons());
    write_binary_vector(outfile, field.get_lats());
    write_binary_vector(outfile, field.get_values_raw());

    if (!outfile.good()) {
         throw std::runtime_error("Error occurred during writing to file: " + path);
    }
    outfile.close();
}

std::unique_ptr<GeoField> BinaryFieldSerializer::load_field(const std::string& path) const {
    std::ifstream infile(path, std::ios::binary);
    if (!infile.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + path);
    }

    std::uint32_t magic;
    std::uint16_t version;
    read_binary(infile, magic, path);
    read_binary(infile, version, path);

    if (magic != MAGIC_NUMBER_FIELD) {
        throw std::runtime_error("Invalid file format (magic number mismatch) for field: " + path);
    }
    if (version != FILE_FORMAT_VERSION) {
        throw std::runtime_error("Unsupported file format version for field: " + path);
    }

    std::uint32_t rank;
    read_binary(infile, rank, path);
    if (rank < 2 || rank > 3) {
        throw std::runtime_error("Invalid field rank " + std::to_string(rank) + " in: " + path);
    }
    std::vector<uint_t> shape(rank);
    std::uint64_t total = 1;
    for (auto& n : shape) {
        std::uint32_t dim;
        read_binary(infile, dim, path);
        n = dim;
        total *= dim;
    }

    std::vector<real_t> lons, lats, values;
    read_binary_vector(infile, lons, shape[0], path);
    read_binary_vector(infile, lats, shape[1], path);

    auto field = std::make_unique<GeoField>();
    try {
        field->set_axes(lons, lats);
        field->set_shape(shape);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid grid in " + path + ": " + e.what());
    }

    read_binary_vector(infile, values, total, path);
    field->set_all_values(values);

    infile.close();
    return field;
}

} // namespace io
} // namespace Cradial
