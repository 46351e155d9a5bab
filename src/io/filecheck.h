#include <string>

#ifndef FILECHECK_H
#define FILECHECK_H

namespace Cradial {
namespace io {

// check whether file exist
bool file_exists(const std::string& path);

// check the file suffix, case-insensitive (ext given with the dot, e.g. ".crg")
bool has_extension(const std::string& path, const std::string& ext);

} // namespace io
} // namespace Cradial

#endif
