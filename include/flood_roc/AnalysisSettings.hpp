#ifndef flood_roc_AnalysisSettings_hpp
#define flood_roc_AnalysisSettings_hpp

#include <sstream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "flood_roc/Raster.hpp"
#include "flood_roc/ROC.hpp"

namespace flood_roc {

struct RasterSettings {

    RasterSettings()
        : filename("")
        , crs("")
        , world_filename("")
        , nodata(0)
        , has_nodata(false)
        , has_geotransform(false)
    {
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "filename: " << filename << "\n";
        ss << "crs: " << ((crs.empty()) ? "empty" : crs) << "\n";
        ss << "world_filename: " << ((world_filename.empty()) ? "empty" : world_filename) << "\n";
        ss << "nodata: ";
        if (has_nodata) ss << nodata; else ss << "empty";
        ss << "\n";
        ss << "geotransform: " << ((has_geotransform) ? geotransform.to_string() : "empty") << "\n";
        return ss.str();
    }

    std::string filename;
    std::string crs;
    std::string world_filename;
    double nodata;
    bool has_nodata;
    GeoTransform geotransform;
    bool has_geotransform;
};

struct PointsSettings {

    PointsSettings()
        : filename("")
        , crs("")
        , x_column("x")
        , y_column("y")
    {
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "filename: " << filename << "\n";
        ss << "crs: " << ((crs.empty()) ? "empty" : crs) << "\n";
        ss << "x_column: " << x_column << "\n";
        ss << "y_column: " << y_column << "\n";
        return ss.str();
    }

    std::string filename;
    std::string crs;
    std::string x_column;
    std::string y_column;
};

struct OutputSettings {

    OutputSettings()
        : directory("roc_output")
        , roc_filename("roc.csv")
        , summary_filename("summary.yml")
        , plot_filename("roc.png")
        , plot_size(480)
    {
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "directory: " << directory << "\n";
        ss << "roc_filename: " << roc_filename << "\n";
        ss << "summary_filename: " << summary_filename << "\n";
        ss << "plot_filename: " << ((plot_filename.empty()) ? "empty" : plot_filename) << "\n";
        ss << "plot_size: " << plot_size << "\n";
        return ss.str();
    }

    std::string roc_path() const {
        return join(roc_filename);
    }

    std::string summary_path() const {
        return join(summary_filename);
    }

    std::string plot_path() const {
        return (plot_filename.empty()) ? "" : join(plot_filename);
    }

    std::string directory;
    std::string roc_filename;
    std::string summary_filename;
    std::string plot_filename;
    int plot_size;

private:

    std::string join(const std::string& filename) const {
        if (directory.empty() || (!filename.empty() && filename[0] == '/')) return filename;
        return directory + "/" + filename;
    }
};

class AnalysisSettings
{
public:
    AnalysisSettings();

    AnalysisSettings(const std::string& filename);

    ~AnalysisSettings();

    // load the analysis settings YML file
    void Load(const std::string& filename);

    const std::string& filename() const {
        return filename_;
    }

    const RasterSettings& raster_settings() const {
        return raster_settings_;
    }

    const PointsSettings& positive_points_settings() const {
        return positive_points_settings_;
    }

    const PointsSettings& negative_points_settings() const {
        return negative_points_settings_;
    }

    const RocOptions& roc_options() const {
        return roc_options_;
    }

    const OutputSettings& output_settings() const {
        return output_settings_;
    }

    void set_output_directory(const std::string& directory) {
        output_settings_.directory = directory;
    }

    std::string to_string() const;

private:

    void LoadRasterSettings(const YAML::Node& node);

    void LoadPointsSettings(const YAML::Node& node, const std::string& key, PointsSettings& settings);

    void LoadRocOptions(const YAML::Node& node);

    void LoadOutputSettings(const YAML::Node& node);

    std::string filename_;
    RasterSettings raster_settings_;
    PointsSettings positive_points_settings_;
    PointsSettings negative_points_settings_;
    RocOptions roc_options_;
    OutputSettings output_settings_;
};

} /* namespace flood_roc */

#endif /* flood_roc_AnalysisSettings_hpp */
