#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <boost/filesystem.hpp>
#include "Common.hpp"

namespace flood_roc {

namespace common {

bool file_exists(const std::string& filename) {
    if (filename.empty() ||
        (!boost::filesystem::exists(filename) &&
         !boost::filesystem::exists(boost::filesystem::path(boost::filesystem::current_path()).string() + "/" + filename))) {
        return false;
    }
    return true;
}

std::string resolve_path(const std::string& filename, const std::string& base_filename) {
    if (filename.empty()) return filename;

    boost::filesystem::path p(filename);
    if (p.is_absolute() || base_filename.empty()) return filename;

    boost::filesystem::path base_directory = boost::filesystem::path(base_filename).parent_path();
    return (base_directory / p).string();
}

std::string file_extension(const std::string& filename) {
    return to_lower(boost::filesystem::path(filename).extension().string());
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    for (size_t i = 0; i < result.size(); i++) {
        result[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[i])));
    }
    return result;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;

    char delimiter = 0;
    if (line.find(',') != std::string::npos) delimiter = ',';
    else if (line.find(';') != std::string::npos) delimiter = ';';
    else if (line.find('\t') != std::string::npos) delimiter = '\t';

    std::istringstream ss(line);
    std::string token;

    if (delimiter) {
        while (std::getline(ss, token, delimiter)) fields.push_back(trim(token));
    }
    else {
        while (ss >> token) fields.push_back(token);
    }

    return fields;
}

bool parse_double(const std::string& token, double& value) {
    std::string str = trim(token);
    if (str.empty()) return false;

    const char* begin = str.c_str();
    char* end = NULL;
    errno = 0;
    double result = std::strtod(begin, &end);

    if (end == begin || *end != '\0' || errno == ERANGE) return false;

    value = result;
    return true;
}

} /* namespace common */

} /* namespace flood_roc */
