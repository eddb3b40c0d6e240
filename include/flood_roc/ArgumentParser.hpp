#ifndef flood_roc_ArgumentParser_hpp
#define flood_roc_ArgumentParser_hpp

#include <string>

namespace flood_roc {

class ArgumentParser {
public:

    ArgumentParser();
    virtual ~ArgumentParser();

    std::string app_name() const {
        return app_name_;
    }

    std::string settings_filename() const {
        return settings_filename_;
    }

    std::string output_directory() const {
        return output_directory_;
    }

    bool show_roc_plot() const {
        return show_roc_plot_;
    }

    bool run(int argc, char const *argv[]);

private:

    std::string app_name_;
    std::string settings_filename_;
    std::string output_directory_;
    bool show_roc_plot_;

};

} /* namespace flood_roc */

#endif /* flood_roc_ArgumentParser_hpp */
