#ifndef flood_roc_Common_hpp
#define flood_roc_Common_hpp

#include <algorithm>
#include <string>
#include <vector>

namespace flood_roc {

namespace common {

template <typename T>
struct IndexComparator {
    IndexComparator(const std::vector<T>& values)
        : values_(values)
    {
    }

    bool operator()(size_t a, size_t b) const {
        return values_[a] < values_[b];
    }

    const std::vector<T>& values_;
};

// indices of values sorted from the highest to the lowest value
template <typename T>
std::vector<size_t> descending_indices(const std::vector<T>& values) {
    std::vector<size_t> indices(values.size());
    for (size_t i = 0; i < indices.size(); i++) indices[i]=i;
    std::sort(indices.begin(), indices.end(), IndexComparator<T>(values));
    std::reverse(indices.begin(), indices.end());
    return indices;
}

bool file_exists(const std::string& filename);

// path of filename relative to the directory of base_filename, unless absolute
std::string resolve_path(const std::string& filename, const std::string& base_filename);

std::string file_extension(const std::string& filename);

std::string trim(const std::string& str);

std::string to_lower(const std::string& str);

// splits on comma, semicolon, tab or blanks
std::vector<std::string> split_fields(const std::string& line);

bool parse_double(const std::string& token, double& value);

} /* namespace common */

} /* namespace flood_roc */

#endif /* flood_roc_Common_hpp */
