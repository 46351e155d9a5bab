#ifndef CRADIAL_RUN_APP_HPP
#define CRADIAL_RUN_APP_HPP

#include <string>

namespace cradial {
namespace app {

// Parses the INI file, loads the field, samples it and writes the CSV.
// Returns the process exit code: 0 on success, 1 on any error (reported on stderr).
int run(const std::string& config_file_path);

} // namespace app
} // namespace cradial

#endif // CRADIAL_RUN_APP_HPP
