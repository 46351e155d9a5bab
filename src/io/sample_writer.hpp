#ifndef Cradial_SAMPLE_WRITER_HPP
#define Cradial_SAMPLE_WRITER_HPP

#include "../sampler/radial_sampler.hpp"
#include <ostream>
#include <string>

namespace Cradial {
namespace io {

// CSV output of sampling results. NaN is written as "nan", infinities as "inf" / "-inf".
class CsvSampleWriter {
public:
    explicit CsvSampleWriter(int precision = 6);

    // point,ring_km,bearing_deg[,lat,lon],v0[,v1...]
    void write(std::ostream& out, const RadialSample& sample) const;
    // center_lat,center_lon,point,ring_km,bearing_deg,value
    void write(std::ostream& out, const MultiCenterSample& sample) const;

    void save(const RadialSample& sample, const std::string& path) const;
    void save(const MultiCenterSample& sample, const std::string& path) const;

private:
    int m_precision;

    void write_number(std::ostream& out, real_t value) const;
};

} // namespace io
} // namespace Cradial

#endif // Cradial_SAMPLE_WRITER_HPP
