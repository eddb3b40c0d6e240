#ifndef flood_roc_Application_hpp
#define flood_roc_Application_hpp

#include <iostream>
#include <string>

#include "flood_roc/AnalysisSettings.hpp"
#include "flood_roc/RocAnalysis.hpp"

namespace flood_roc {

class Application {
public:

    void init(const std::string& settings_filename, const std::string& output_directory = "", bool show_roc_plot = false);

    // runs the analysis described by the settings file, returns the exit status
    int process();

    const AnalysisSettings& settings() const {
        return settings_;
    }

    static Application* instance();

private:
    Application()
        : show_roc_plot_(false)
    {
    }

    ~Application() {}

    RocAnalysisResult run_analysis();

    void write_report(const RocAnalysisResult& result);

    static Application *instance_;

    std::string settings_filename_;
    std::string output_directory_;
    bool show_roc_plot_;
    AnalysisSettings settings_;
};

} /* namespace flood_roc */



#endif /* flood_roc_Application_hpp */
