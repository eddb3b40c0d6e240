#include <cstdio>
#include <boost/filesystem.hpp>
#include <opencv2/highgui/highgui.hpp>
#include "flood_roc/Application.hpp"
#include "flood_roc/Errors.hpp"
#include "flood_roc/PointsReader.hpp"
#include "flood_roc/RasterReader.hpp"
#include "flood_roc/RocReport.hpp"

namespace flood_roc {

Application *Application::instance_ = NULL;

Application*  Application::instance() {
    if (!instance_){
        instance_ = new Application();
    }
    return instance_;
}

void Application::init(const std::string& settings_filename, const std::string& output_directory, bool show_roc_plot) {
    settings_filename_ = settings_filename;
    output_directory_ = output_directory;
    show_roc_plot_ = show_roc_plot;
    settings_ = AnalysisSettings();
}

int Application::process() {
    try {
        settings_.Load(settings_filename_);
        if (!output_directory_.empty()) settings_.set_output_directory(output_directory_);

        std::cout << "Analysis settings:\n" << settings_.to_string() << std::endl;

        RocAnalysisResult result = run_analysis();

        char auc_text[64];
        snprintf(auc_text, 64, "%.3f", result.auc());
        std::cout << "AUC: " << auc_text << std::endl;
        std::cout << "Mann-Whitney AUC: " << result.mann_whitney_auc << std::endl;
        std::cout << result.dataset.to_string() << std::endl;

        write_report(result);
    }
    catch (const Error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    catch (const boost::filesystem::filesystem_error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    catch (const cv::Exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

RocAnalysisResult Application::run_analysis() {
    const RasterSettings& raster_settings = settings_.raster_settings();

    RasterReader raster_reader;
    raster_reader.set_crs(raster_settings.crs);
    raster_reader.set_world_filename(raster_settings.world_filename);
    if (raster_settings.has_nodata) raster_reader.set_nodata(raster_settings.nodata);
    if (raster_settings.has_geotransform) raster_reader.set_geotransform(raster_settings.geotransform);

    std::cout << "Loading raster: " << raster_settings.filename << std::endl;
    Raster raster = raster_reader.Read(raster_settings.filename);
    std::cout << raster.to_string() << std::endl;

    const PointsSettings& positive_settings = settings_.positive_points_settings();
    PointsReader positive_reader;
    positive_reader.set_crs(positive_settings.crs);
    positive_reader.set_x_column(positive_settings.x_column);
    positive_reader.set_y_column(positive_settings.y_column);
    PointSet positive_points = positive_reader.Read(positive_settings.filename);
    std::cout << "Flood points: " << positive_settings.filename << "\n" << positive_points.to_string() << std::endl;

    const PointsSettings& negative_settings = settings_.negative_points_settings();
    PointsReader negative_reader;
    negative_reader.set_crs(negative_settings.crs);
    negative_reader.set_x_column(negative_settings.x_column);
    negative_reader.set_y_column(negative_settings.y_column);
    PointSet negative_points = negative_reader.Read(negative_settings.filename);
    std::cout << "Non-flood points: " << negative_settings.filename << "\n" << negative_points.to_string() << std::endl;

    return compute_roc_auc(&raster, &positive_points, &negative_points, settings_.roc_options());
}

void Application::write_report(const RocAnalysisResult& result) {
    const OutputSettings& output_settings = settings_.output_settings();

    if (!output_settings.directory.empty()) {
        boost::filesystem::create_directories(output_settings.directory);
    }

    RocReport report(result);
    report.add_input("settings", settings_.filename());
    report.add_input("raster", settings_.raster_settings().filename);
    report.add_input("points-positive", settings_.positive_points_settings().filename);
    report.add_input("points-negative", settings_.negative_points_settings().filename);

    report.csv_write(output_settings.roc_path());
    std::cout << "ROC table: " << output_settings.roc_path() << std::endl;

    report.SaveSummary(output_settings.summary_path());
    std::cout << "Summary: " << output_settings.summary_path() << std::endl;

    if (!output_settings.plot_path().empty()) {
        report.SavePlot(output_settings.plot_path(), output_settings.plot_size);
        std::cout << "ROC plot: " << output_settings.plot_path() << std::endl;
    }

    if (show_roc_plot_) {
        cv::imshow("ROC", report.Plot(output_settings.plot_size));
        cv::waitKey();
    }
}

} /* namespace flood_roc */
