#ifndef Cradial_FIELD_SERIALIZER_HPP
#define Cradial_FIELD_SERIALIZER_HPP

#include "../fields/geo_field.hpp"
#include <string>
#include <fstream> // For file streams
#include <memory>
#include <cstdint>
#include <stdexcept>

namespace Cradial {
namespace io {

// --- Simple Binary Field Serializer ---
// Layout: magic, version, rank, shape entries, lon axis, lat axis, values.
// Each vector is prefixed with its uint64 length.
class BinaryFieldSerializer {
public:
    void save_field(const GeoField& field, const std::string& path) const;
    std::unique_ptr<GeoField> load_field(const std::string& path) const;

private:
    template<typename T>
    void write_binary(std::ofstream& out, const T& value) const {
        out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    }

    template<typename T>
    void read_binary(std::ifstream& in, T& value, const std::string& path) const {
        in.read(reinterpret_cast<char*>(&value), sizeof(T));
        if (!in) {
            throw std::runtime_error("Unexpected end of file while reading field: " + path);
        }
    }

    void write_binary_vector(std::ofstream& out, const std::vector<real_t>& vec) const {
        std::uint64_t size = vec.size();
        write_binary(out, size);
        out.write(reinterpret_cast<const char*>(vec.data()), static_cast<std::streamsize>(vec.size() * sizeof(real_t)));
    }

    void read_binary_vector(std::ifstream& in, std::vector<real_t>& vec,
                            std::uint64_t expected_size, const std::string& path) const {
        std::uint64_t size;
        read_binary(in, size, path);
        if (size != expected_size) {
            throw std::runtime_error("Data size mismatch when loading field from: " + path);
        }
        vec.resize(static_cast<size_t>(size));
        in.read(reinterpret_cast<char*>(vec.data()), static_cast<std::streamsize>(size * sizeof(real_t)));
        if (!in) {
            throw std::runtime_error("Unexpected end of file while reading field: " + path);
        }
    }
};

} // namespace io
} // namespace Cradial

#endif // Cradial_FIELD_SERIALIZER_HPP
