#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <boost/filesystem.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>
#include "flood_roc/Errors.hpp"
#include "flood_roc/RasterReader.hpp"
#include "Common.hpp"

namespace flood_roc {

namespace {

typedef std::map<std::string, double> AsciiGridHeader;

bool header_value(const AsciiGridHeader& header, const std::string& key, double& value) {
    AsciiGridHeader::const_iterator it = header.find(key);
    if (it == header.end()) return false;
    value = it->second;
    return true;
}

double required_header_value(const AsciiGridHeader& header, const std::string& key, const std::string& filename) {
    double value = 0;
    if (!header_value(header, key, value)) {
        throw RasterFormatError("the ASCII grid " + filename + " has no " + key + " entry");
    }
    return value;
}

// ncols / nrows must be whole numbers that fit an int
int required_grid_size(const AsciiGridHeader& header, const std::string& key, const std::string& filename) {
    double value = required_header_value(header, key, filename);
    if (!(value >= 1 && value <= std::numeric_limits<int>::max()) || std::floor(value) != value) {
        std::stringstream ss;
        ss << "the ASCII grid " << filename << " has an invalid " << key << " " << value;
        throw RasterFormatError(ss.str());
    }
    return static_cast<int>(value);
}

} /* namespace */

RasterReader::RasterReader()
    : nodata_(0)
    , has_nodata_(false)
    , has_geotransform_(false)
{
}

RasterReader::~RasterReader()
{
}

Raster RasterReader::Read(const std::string& filename) const {
    if (filename.empty()) {
        throw MissingInputError("no susceptibility raster was given");
    }

    if (!common::file_exists(filename)) {
        throw MissingInputError("the susceptibility raster " + filename + " does not exist");
    }

    if (common::file_extension(filename) == ".asc") {
        return ReadAsciiGrid(filename);
    }

    return ReadImage(filename);
}

Raster RasterReader::ReadAsciiGrid(const std::string& filename) const {
    std::ifstream in(filename.c_str());
    if (!in.is_open()) {
        throw MissingInputError("the ASCII grid " + filename + " could not be opened");
    }

    AsciiGridHeader header;
    std::string line;
    std::string first_data_line;

    while (std::getline(in, line)) {
        std::vector<std::string> tokens = common::split_fields(line);
        if (tokens.empty()) continue;

        double value;
        if (common::parse_double(tokens[0], value)) {
            first_data_line = line;
            break;
        }

        if (tokens.size() != 2 || !common::parse_double(tokens[1], value)) {
            throw RasterFormatError("malformed ASCII grid header line '" + common::trim(line) + "' in " + filename);
        }

        header[common::to_lower(tokens[0])] = value;
    }

    int ncols = required_grid_size(header, "ncols", filename);
    int nrows = required_grid_size(header, "nrows", filename);

    double cell_width = 0;
    double cell_height = 0;
    double cellsize = 0;
    if (header_value(header, "cellsize", cellsize)) {
        cell_width = cell_height = cellsize;
    }
    else {
        cell_width = required_header_value(header, "dx", filename);
        cell_height = required_header_value(header, "dy", filename);
    }

    double x_lower_left = 0;
    if (!header_value(header, "xllcorner", x_lower_left)) {
        x_lower_left = required_header_value(header, "xllcenter", filename) - 0.5 * cell_width;
    }

    double y_lower_left = 0;
    if (!header_value(header, "yllcorner", y_lower_left)) {
        y_lower_left = required_header_value(header, "yllcenter", filename) - 0.5 * cell_height;
    }

    std::vector<double> values;

    std::string data_line = first_data_line;
    bool has_line = !first_data_line.empty();
    while (has_line) {
        std::vector<std::string> tokens = common::split_fields(data_line);
        for (size_t i = 0; i < tokens.size(); i++) {
            double value;
            if (!common::parse_double(tokens[i], value)) {
                throw RasterFormatError("invalid cell value '" + tokens[i] + "' in " + filename);
            }
            values.push_back(value);
        }
        has_line = static_cast<bool>(std::getline(in, data_line));
    }

    if (values.size() != static_cast<size_t>(ncols) * nrows) {
        std::stringstream ss;
        ss << "the ASCII grid " << filename << " has " << values.size() << " cells, expected " << static_cast<size_t>(ncols) * nrows;
        throw RasterFormatError(ss.str());
    }

    cv::Mat grid(nrows, ncols, CV_64F);
    for (int r = 0; r < nrows; r++) {
        for (int c = 0; c < ncols; c++) {
            grid.at<double>(r, c) = values[static_cast<size_t>(r) * ncols + c];
        }
    }

    GeoTransform transform = GeoTransform::north_up(
        x_lower_left,
        y_lower_left + nrows * cell_height,
        cell_width,
        cell_height);

    Raster raster(grid, transform, crs_);

    double nodata;
    if (has_nodata_) {
        raster.set_nodata(nodata_);
    }
    else if (header_value(header, "nodata_value", nodata)) {
        raster.set_nodata(nodata);
    }

    return raster;
}

Raster RasterReader::ReadImage(const std::string& filename) const {
    cv::Mat image = cv::imread(filename, cv::IMREAD_UNCHANGED);

    if (image.empty()) {
        throw MissingInputError("the susceptibility raster " + filename + " could not be decoded");
    }

    Raster raster(image, ImageGeoTransform(filename), crs_);
    if (has_nodata_) raster.set_nodata(nodata_);
    return raster;
}

GeoTransform RasterReader::ImageGeoTransform(const std::string& image_filename) const {
    if (has_geotransform_) return geotransform_;

    if (!world_filename_.empty()) {
        if (!common::file_exists(world_filename_)) {
            throw MissingInputError("the world file " + world_filename_ + " does not exist");
        }
        return ReadWorldFile(world_filename_);
    }

    std::vector<std::string> candidates = WorldFileCandidates(image_filename);
    for (size_t i = 0; i < candidates.size(); i++) {
        if (common::file_exists(candidates[i])) return ReadWorldFile(candidates[i]);
    }

    throw RasterFormatError("the raster " + image_filename + " has no georeferencing, "
                            "give a world file or a geotransform");
}

GeoTransform RasterReader::ReadWorldFile(const std::string& filename) {
    std::ifstream in(filename.c_str());
    if (!in.is_open()) {
        throw MissingInputError("the world file " + filename + " could not be opened");
    }

    std::vector<double> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (common::trim(line).empty()) continue;

        double value;
        if (!common::parse_double(line, value)) {
            throw RasterFormatError("invalid world file line '" + common::trim(line) + "' in " + filename);
        }
        lines.push_back(value);
    }

    return GeoTransform::from_world_file(lines);
}

std::vector<std::string> RasterReader::WorldFileCandidates(const std::string& image_filename) {
    boost::filesystem::path path(image_filename);
    std::string extension = path.extension().string();

    std::vector<std::string> suffixes;
    if (extension.size() >= 3) {
        // .tif -> .tfw, .png -> .pgw
        suffixes.push_back(std::string(".") + extension[1] + extension[extension.size()-1] + "w");
    }
    if (!extension.empty()) {
        suffixes.push_back(extension + "w");
    }
    suffixes.push_back(".wld");

    std::vector<std::string> candidates;
    for (size_t i = 0; i < suffixes.size(); i++) {
        boost::filesystem::path candidate = path;
        candidate.replace_extension(suffixes[i]);
        candidates.push_back(candidate.string());
    }
    return candidates;
}

} /* namespace flood_roc */
