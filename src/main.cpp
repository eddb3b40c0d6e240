#include <iostream>
#include "flood_roc/ArgumentParser.hpp"
#include "flood_roc/Application.hpp"

using namespace flood_roc;

int main(int argc, char const *argv[]) {

    ArgumentParser argument_parser;
    if (!argument_parser.run(argc, argv)) {
        return 1;
    }

    std::cout << "Flood susceptibility ROC-AUC analysis" << std::endl;
    std::cout << "settings-filename: " << argument_parser.settings_filename() << "\n" << std::endl;

    Application::instance()->init(
        argument_parser.settings_filename(),
        argument_parser.output_directory(),
        argument_parser.show_roc_plot());

    return Application::instance()->process();
}
