#define BOOST_TEST_MODULE test_Application
#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>
#include <yaml-cpp/yaml.h>

#include "flood_roc/Application.hpp"

using namespace flood_roc;

BOOST_AUTO_TEST_CASE(missing_points_entry_fails)
{
    Application::instance()->init(DATA_PATH "/analysis_missing_points.yml");
    BOOST_CHECK_EQUAL(Application::instance()->process(), 1);
}

BOOST_AUTO_TEST_CASE(nonexistent_settings_file_fails)
{
    Application::instance()->init(DATA_PATH "/nonexistent.yml");
    BOOST_CHECK_EQUAL(Application::instance()->process(), 1);
}

BOOST_AUTO_TEST_CASE(report_is_written_to_output_directory)
{
    boost::filesystem::path directory = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path("flood-roc-app-%%%%-%%%%");

    Application::instance()->init(DATA_PATH "/analysis.yml", directory.string());
    BOOST_REQUIRE_EQUAL(Application::instance()->process(), 0);

    BOOST_CHECK(boost::filesystem::exists(directory / "roc.csv"));
    BOOST_CHECK(boost::filesystem::exists(directory / "summary.yml"));

    // plot-filename is empty in the settings
    BOOST_CHECK(!boost::filesystem::exists(directory / "roc.png"));

    YAML::Node summary = YAML::LoadFile((directory / "summary.yml").string());
    BOOST_CHECK_CLOSE(summary["auc"].as<double>(), 8.0 / 9.0, 1e-6);
    BOOST_CHECK_EQUAL(summary["dropped-positive-count"].as<int>(), 2);

    boost::system::error_code ec;
    boost::filesystem::remove_all(directory, ec);
}
