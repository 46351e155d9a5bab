#include "filecheck.h"
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace Cradial {
namespace io {

bool file_exists(const std::string& path) {
	if (path.empty()) {
		return false;
	}
	std::error_code ec;
	return std::filesystem::is_regular_file(path, ec);
}

bool has_extension(const std::string& path, const std::string& ext) {
	std::string actual = std::filesystem::path(path).extension().string();
	if (actual.size() != ext.size()) {
		return false;
	}
	return std::equal(actual.begin(), actual.end(), ext.begin(), [](char a, char b) {
		return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
	});
}

} // namespace io
} // namespace Cradial
