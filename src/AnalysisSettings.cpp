#include <sstream>
#include "flood_roc/AnalysisSettings.hpp"
#include "flood_roc/Errors.hpp"
#include "Common.hpp"

namespace flood_roc {

AnalysisSettings::AnalysisSettings()
{
    roc_options_.drop_intermediate = true;
}

AnalysisSettings::AnalysisSettings(const std::string& filename)
{
    roc_options_.drop_intermediate = true;
    Load(filename);
}

AnalysisSettings::~AnalysisSettings()
{
}

void AnalysisSettings::Load(const std::string& filename)
{
    if (!common::file_exists(filename)) {
        throw MissingInputError("the analysis settings file " + filename + " does not exist");
    }

    filename_ = filename;

    try {
        YAML::Node node = YAML::LoadFile(filename);

        if (node.Type() != YAML::NodeType::Map) {
            throw SettingsError("the analysis settings file " + filename + " is not a YAML map");
        }

        // input data
        LoadRasterSettings(node["raster"]);
        LoadPointsSettings(node["points-positive"], "points-positive", positive_points_settings_);
        LoadPointsSettings(node["points-negative"], "points-negative", negative_points_settings_);

        LoadRocOptions(node["roc-settings"]);
        LoadOutputSettings(node["output"]);
    }
    catch (const YAML::Exception& e) {
        throw SettingsError("invalid analysis settings file " + filename + ": " + e.what());
    }
}

void AnalysisSettings::LoadRasterSettings(const YAML::Node& node)
{
    if (!node) {
        throw MissingInputError("the analysis settings have no raster entry");
    }

    if (node.Type() != YAML::NodeType::Map) {
        throw SettingsError("the raster settings must be a map");
    }

    if (!node["filename"]) {
        throw MissingInputError("the analysis settings have no raster filename");
    }

    raster_settings_.filename = common::resolve_path(node["filename"].as<std::string>(), filename_);

    if (node["crs"]) {
        raster_settings_.crs = node["crs"].as<std::string>();
    }

    if (node["nodata"]) {
        raster_settings_.nodata = node["nodata"].as<double>();
        raster_settings_.has_nodata = true;
    }

    if (node["world-filename"]) {
        raster_settings_.world_filename = common::resolve_path(node["world-filename"].as<std::string>(), filename_);
    }

    if (node["geotransform"]) {
        if (node["geotransform"].Type() != YAML::NodeType::Sequence || node["geotransform"].size() != 6) {
            throw SettingsError("the raster geotransform must be a list of 6 numbers [x0, dx, rx, y0, ry, dy]");
        }

        const YAML::Node& gt = node["geotransform"];
        raster_settings_.geotransform = GeoTransform(
            gt[0].as<double>(), gt[1].as<double>(), gt[2].as<double>(),
            gt[3].as<double>(), gt[4].as<double>(), gt[5].as<double>());
        raster_settings_.has_geotransform = true;
    }
}

void AnalysisSettings::LoadPointsSettings(const YAML::Node& node, const std::string& key, PointsSettings& settings)
{
    if (!node) {
        throw MissingInputError("the analysis settings have no " + key + " entry");
    }

    if (node.Type() != YAML::NodeType::Map) {
        throw SettingsError("the " + key + " settings must be a map");
    }

    if (!node["filename"]) {
        throw MissingInputError("the analysis settings have no " + key + " filename");
    }

    settings.filename = common::resolve_path(node["filename"].as<std::string>(), filename_);

    if (node["crs"]) {
        settings.crs = node["crs"].as<std::string>();
    }
    else {
        // points without a declared CRS are taken to be in the raster CRS
        settings.crs = raster_settings_.crs;
    }

    if (node["x-column"]) {
        settings.x_column = node["x-column"].as<std::string>();
    }

    if (node["y-column"]) {
        settings.y_column = node["y-column"].as<std::string>();
    }
}

void AnalysisSettings::LoadRocOptions(const YAML::Node& node)
{
    if (!node) return;

    if (node["drop-intermediate"]) {
        roc_options_.drop_intermediate = node["drop-intermediate"].as<bool>();
    }
}

void AnalysisSettings::LoadOutputSettings(const YAML::Node& node)
{
    if (!node) return;

    if (node["directory"]) {
        output_settings_.directory = node["directory"].as<std::string>();
    }

    if (node["roc-filename"]) {
        output_settings_.roc_filename = node["roc-filename"].as<std::string>();
    }

    if (node["summary-filename"]) {
        output_settings_.summary_filename = node["summary-filename"].as<std::string>();
    }

    if (node["plot-filename"]) {
        output_settings_.plot_filename = node["plot-filename"].as<std::string>();
    }

    if (node["plot-size"]) {
        output_settings_.plot_size = node["plot-size"].as<int>();
        if (output_settings_.plot_size < 64) {
            throw SettingsError("the plot size must be at least 64 pixels");
        }
    }
}

std::string AnalysisSettings::to_string() const
{
    std::stringstream ss;
    ss << "raster:\n" << raster_settings_.to_string();
    ss << "points-positive:\n" << positive_points_settings_.to_string();
    ss << "points-negative:\n" << negative_points_settings_.to_string();
    ss << "roc-settings:\n" << roc_options_.to_string();
    ss << "output:\n" << output_settings_.to_string();
    return ss.str();
}

} /* namespace flood_roc */
