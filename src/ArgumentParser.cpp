#include <iostream>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include "flood_roc/ArgumentParser.hpp"
#include "Common.hpp"

using namespace boost;

namespace flood_roc {

ArgumentParser::ArgumentParser()
    : app_name_("")
    , settings_filename_("")
    , output_directory_("")
    , show_roc_plot_(false)
{
}

ArgumentParser::~ArgumentParser() {
}

bool ArgumentParser::run(int argc, char const *argv[]) {
    app_name_ = filesystem::path(argv[0]).stem().string();

    program_options::options_description desc(app_name_);

    desc.add_options()
        ("settings-filename,i", program_options::value<std::string>()->required(), "The YML file with the analysis settings.")
        ("output-directory,o", program_options::value<std::string>(), "Directory of the ROC table, summary and plot.")
        ("show-roc-plot,s", program_options::value<bool>(), "Show the ROC plot.")
        ("help,h", "show the command line description");

    program_options::positional_options_description pd;

    pd.add("settings-filename", 1);

    program_options::variables_map vm;

    try {
        program_options::store(program_options::command_line_parser(argc, argv).options(desc).positional(pd).run(), vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return false;
        }

        if (vm.count("settings-filename")) {
            settings_filename_ = vm["settings-filename"].as<std::string>();

            if (!common::file_exists(settings_filename_)) {
                std::cerr << "ERROR: The analysis settings file not found" << std::endl;
                return false;
            }
        }

        if (vm.count("output-directory")) {
            output_directory_ = vm["output-directory"].as<std::string>();
        }

        if (vm.count("show-roc-plot")) {
            show_roc_plot_ = vm["show-roc-plot"].as<bool>();
        }

        program_options::notify(vm);
    } catch (boost::program_options::error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return false;
    }

    return true;
}

} /* namespace flood_roc */
