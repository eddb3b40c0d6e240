#include <cassert>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <opencv2/imgcodecs/imgcodecs.hpp>
#include <opencv2/imgproc/imgproc.hpp>
#include <yaml-cpp/yaml.h>
#include "flood_roc/Errors.hpp"
#include "flood_roc/RocReport.hpp"

namespace flood_roc {

RocReport::RocReport(const RocAnalysisResult& result)
    : result_(result)
{
}

RocReport::~RocReport()
{
}

std::string RocReport::column_name(Columns column) {
    assert(column < COLUMNS_END);
    switch (column) {
        case THRESHOLD:
            return "THRESHOLD";
        case FALSE_POSITIVE_RATE:
            return "FALSE_POSITIVE_RATE";
        case TRUE_POSITIVE_RATE:
            return "TRUE_POSITIVE_RATE";
        case TRUE_POSITIVE:
            return "TRUE_POSITIVE";
        case FALSE_POSITIVE:
            return "FALSE_POSITIVE";
        case TRUE_NEGATIVE:
            return "TRUE_NEGATIVE";
        case FALSE_NEGATIVE:
            return "FALSE_NEGATIVE";
        default:
            return "";
    }
}

void RocReport::stream_write(std::stringstream& ss, size_t point_index) const {
    const RocPoint& point = result_.roc.points()[point_index];
    size_t positive_count = result_.roc.positive_count();
    size_t negative_count = result_.roc.negative_count();

    char buffer[256];
    snprintf(buffer, 256, "%.6g,%.5f,%.5f,%lu,%lu,%lu,%lu",
        point.threshold,
        point.false_positive_rate,
        point.true_positive_rate,
        static_cast<unsigned long>(point.true_positive),
        static_cast<unsigned long>(point.false_positive),
        static_cast<unsigned long>(negative_count - point.false_positive),
        static_cast<unsigned long>(positive_count - point.true_positive));
    ss << std::string(buffer) << "\n";
}

std::string RocReport::csv_string() const {
    std::stringstream ss;

    for (size_t c = 0; c < COLUMNS_END; c++) {
        ss << column_name(static_cast<Columns>(c));
        if (c < COLUMNS_END-1) ss << ","; else ss << "\n";
    }

    for (size_t i = 0; i < result_.roc.size(); i++) stream_write(ss, i);

    return ss.str();
}

void RocReport::csv_write(const std::string& filename) const {
    std::ofstream out(filename.c_str());
    if (!out.is_open()) {
        throw Error("the ROC table " + filename + " could not be written");
    }
    out << csv_string();
    out.close();
}

std::string RocReport::summary_string() const {
    const LabeledDataset& dataset = result_.dataset;

    YAML::Emitter out;
    out.SetDoublePrecision(10);
    out << YAML::BeginMap;
    out << YAML::Key << "auc" << YAML::Value << result_.auc();
    out << YAML::Key << "mann-whitney-auc" << YAML::Value << result_.mann_whitney_auc;
    out << YAML::Key << "positive-count" << YAML::Value << dataset.positive_count();
    out << YAML::Key << "negative-count" << YAML::Value << dataset.negative_count();
    out << YAML::Key << "dropped-positive-count" << YAML::Value << dataset.dropped_positive_count();
    out << YAML::Key << "dropped-negative-count" << YAML::Value << dataset.dropped_negative_count();
    out << YAML::Key << "curve-points" << YAML::Value << result_.roc.size();

    if (!inputs_.empty()) {
        out << YAML::Key << "inputs" << YAML::Value << YAML::BeginMap;
        for (size_t i = 0; i < inputs_.size(); i++) {
            out << YAML::Key << inputs_[i].first << YAML::Value << inputs_[i].second;
        }
        out << YAML::EndMap;
    }

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void RocReport::SaveSummary(const std::string& filename) const {
    std::ofstream fout(filename.c_str());
    if (!fout.is_open()) {
        throw Error("the ROC summary " + filename + " could not be written");
    }
    fout << summary_string();
    fout.close();
}

cv::Mat RocReport::Plot(int size) const {
    cv::Mat plot(size, size, CV_8UC3, cv::Scalar(255, 255, 255));

    int margin = size / 8;
    int side = size - 2 * margin;
    cv::Point origin(margin, size - margin);

    // curve coordinates to image pixels, y grows downwards
    std::vector<cv::Point> polyline;
    const std::vector<RocPoint>& points = result_.roc.points();
    for (size_t i = 0; i < points.size(); i++) {
        polyline.push_back(cv::Point(
            origin.x + cvRound(points[i].false_positive_rate * side),
            origin.y - cvRound(points[i].true_positive_rate * side)));
    }

    cv::rectangle(plot, cv::Point(margin, margin), cv::Point(size - margin, size - margin), cv::Scalar(0, 0, 0), 1);
    cv::line(plot, origin, cv::Point(size - margin, margin), cv::Scalar(160, 160, 160), 1, cv::LINE_AA);
    cv::polylines(plot, polyline, false, cv::Scalar(128, 0, 0), 2, cv::LINE_AA);

    double font_scale = size / 960.0;
    cv::putText(plot, "False Positive Rate", cv::Point(margin, size - margin / 3),
                cv::FONT_HERSHEY_SIMPLEX, font_scale, cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
    cv::putText(plot, "True Positive Rate", cv::Point(margin / 4, margin * 2 / 3),
                cv::FONT_HERSHEY_SIMPLEX, font_scale, cv::Scalar(0, 0, 0), 1, cv::LINE_AA);

    char label[64];
    snprintf(label, 64, "AUC = %.3f", result_.auc());
    cv::putText(plot, label, cv::Point(size / 2, size - margin - margin / 3),
                cv::FONT_HERSHEY_SIMPLEX, font_scale * 1.5, cv::Scalar(128, 0, 0), 1, cv::LINE_AA);

    return plot;
}

void RocReport::SavePlot(const std::string& filename, int size) const {
    cv::Mat plot = Plot(size);

    bool written = false;
    try {
        written = cv::imwrite(filename, plot);
    }
    catch (const cv::Exception& e) {
        throw Error("the ROC plot " + filename + " could not be written: " + e.what());
    }

    if (!written) {
        throw Error("the ROC plot " + filename + " could not be written");
    }
}

} /* namespace flood_roc */
