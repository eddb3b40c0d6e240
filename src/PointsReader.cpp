#include <fstream>
#include <sstream>
#include "flood_roc/Errors.hpp"
#include "flood_roc/PointsReader.hpp"
#include "Common.hpp"

namespace flood_roc {

namespace {

const char* kXColumnAliases[] = { "x", "lon", "long", "longitude", "easting", "east" };
const char* kYColumnAliases[] = { "y", "lat", "latitude", "northing", "north" };

bool find_column(const std::vector<std::string>& header, const std::string& name, size_t& index) {
    std::string lower_name = common::to_lower(name);
    for (size_t i = 0; i < header.size(); i++) {
        if (common::to_lower(header[i]) == lower_name) {
            index = i;
            return true;
        }
    }
    return false;
}

bool find_alias_column(const std::vector<std::string>& header, const char* aliases[], size_t alias_count, size_t& index) {
    for (size_t i = 0; i < alias_count; i++) {
        if (find_column(header, aliases[i], index)) return true;
    }
    return false;
}

bool is_header(const std::vector<std::string>& fields) {
    double value;
    for (size_t i = 0; i < fields.size() && i < 2; i++) {
        if (!common::parse_double(fields[i], value)) return true;
    }
    return false;
}

} /* namespace */

PointsReader::PointsReader()
    : x_column_("x")
    , y_column_("y")
{
}

PointsReader::~PointsReader()
{
}

void PointsReader::FindColumns(
    const std::vector<std::string>& header,
    const std::string& filename,
    size_t& x_index,
    size_t& y_index) const
{
    bool x_found = find_column(header, x_column_, x_index) ||
        find_alias_column(header, kXColumnAliases, sizeof(kXColumnAliases) / sizeof(kXColumnAliases[0]), x_index);

    bool y_found = find_column(header, y_column_, y_index) ||
        find_alias_column(header, kYColumnAliases, sizeof(kYColumnAliases) / sizeof(kYColumnAliases[0]), y_index);

    if (!x_found || !y_found) {
        std::stringstream ss;
        ss << "the points file " << filename << " has no '" << (x_found ? y_column_ : x_column_) << "' column";
        throw PointFormatError(ss.str());
    }
}

PointSet PointsReader::Read(const std::string& filename) const {
    if (filename.empty()) {
        throw MissingInputError("no points file was given");
    }

    std::ifstream in(filename.c_str());
    if (!in.is_open()) {
        throw MissingInputError("the points file " + filename + " could not be opened");
    }

    PointSet point_set;
    point_set.crs = crs_;

    size_t x_index = 0;
    size_t y_index = 1;
    bool first_record = true;

    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        line_number++;

        std::string trimmed = common::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        std::vector<std::string> fields = common::split_fields(trimmed);

        if (first_record) {
            first_record = false;
            if (is_header(fields)) {
                FindColumns(fields, filename, x_index, y_index);
                continue;
            }
        }

        Point point;
        if (x_index >= fields.size() || y_index >= fields.size() ||
            !common::parse_double(fields[x_index], point.x) ||
            !common::parse_double(fields[y_index], point.y)) {
            std::stringstream ss;
            ss << "invalid point at " << filename << ":" << line_number << " '" << trimmed << "'";
            throw PointFormatError(ss.str());
        }

        point_set.points.push_back(point);
    }

    return point_set;
}

} /* namespace flood_roc */
