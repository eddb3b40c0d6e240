#define BOOST_TEST_MODULE test_ArgumentParser
#include <boost/test/unit_test.hpp>
#include <cstdio>

#include "flood_roc/ArgumentParser.hpp"

using namespace flood_roc;

BOOST_AUTO_TEST_CASE(settings_file_is_nonexistent)
{
    int argc = 2;
    char const *argv[2] = {
        "flood-roc-evaluation",
        "--settings-filename=nonexistent.yml"
    };

    ArgumentParser argument_parser;
    BOOST_CHECK_MESSAGE(argument_parser.run(argc, argv) == false, "Return false if the settings file is nonexistent");
}

BOOST_AUTO_TEST_CASE(settings_file_is_existent)
{
    char settings_file_arg[256];
    int n = snprintf(settings_file_arg, 256, "--settings-filename=%s/analysis.yml", DATA_PATH);

    BOOST_REQUIRE(n >= 0 && n < 256);

    int argc = 2;
    char const *argv[2] = {
        "flood-roc-evaluation",
        settings_file_arg
    };

    ArgumentParser argument_parser;
    BOOST_CHECK_MESSAGE(argument_parser.run(argc, argv) == true, "Return true if the settings file is existent");
    BOOST_CHECK_EQUAL(argument_parser.settings_filename(), std::string(DATA_PATH) + "/analysis.yml");
    BOOST_CHECK_EQUAL(argument_parser.app_name(), "flood-roc-evaluation");
    BOOST_CHECK(argument_parser.output_directory().empty());
    BOOST_CHECK(!argument_parser.show_roc_plot());
}

BOOST_AUTO_TEST_CASE(settings_file_is_positional)
{
    char settings_file_arg[256];
    int n = snprintf(settings_file_arg, 256, "%s/analysis.yml", DATA_PATH);

    BOOST_REQUIRE(n >= 0 && n < 256);

    int argc = 5;
    char const *argv[5] = {
        "/usr/local/bin/flood-roc-evaluation",
        settings_file_arg,
        "-o",
        "/tmp/roc",
        "--show-roc-plot=true"
    };

    ArgumentParser argument_parser;
    BOOST_REQUIRE(argument_parser.run(argc, argv));
    BOOST_CHECK_EQUAL(argument_parser.settings_filename(), settings_file_arg);
    BOOST_CHECK_EQUAL(argument_parser.output_directory(), "/tmp/roc");
    BOOST_CHECK(argument_parser.show_roc_plot());
}

BOOST_AUTO_TEST_CASE(settings_file_is_required)
{
    int argc = 1;
    char const *argv[1] = {
        "flood-roc-evaluation"
    };

    ArgumentParser argument_parser;
    BOOST_CHECK_MESSAGE(argument_parser.run(argc, argv) == false, "Return false without a settings file");
}

BOOST_AUTO_TEST_CASE(help_stops_the_run)
{
    int argc = 2;
    char const *argv[2] = {
        "flood-roc-evaluation",
        "--help"
    };

    ArgumentParser argument_parser;
    BOOST_CHECK(argument_parser.run(argc, argv) == false);
}
