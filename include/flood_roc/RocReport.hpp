#ifndef flood_roc_RocReport_hpp
#define flood_roc_RocReport_hpp

#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core/core.hpp>
#include "flood_roc/RocAnalysis.hpp"

namespace flood_roc {

/**
 * Writes a ROC analysis as a CSV table (one row per curve point), a YAML
 * summary and a plot image.
 */
class RocReport {
public:

    enum Columns {
        THRESHOLD = 0,
        FALSE_POSITIVE_RATE,
        TRUE_POSITIVE_RATE,
        TRUE_POSITIVE,
        FALSE_POSITIVE,
        TRUE_NEGATIVE,
        FALSE_NEGATIVE,
        COLUMNS_END
    };

    RocReport(const RocAnalysisResult& result);
    ~RocReport();

    // input description copied to the summary, e.g. ("raster", filename)
    void add_input(const std::string& name, const std::string& value) {
        inputs_.push_back(std::make_pair(name, value));
    }

    std::string csv_string() const;

    void csv_write(const std::string& filename) const;

    std::string summary_string() const;

    void SaveSummary(const std::string& filename) const;

    cv::Mat Plot(int size) const;

    void SavePlot(const std::string& filename, int size) const;

    static std::string column_name(Columns column);

private:

    void stream_write(std::stringstream& ss, size_t point_index) const;

    RocAnalysisResult result_;
    std::vector<std::pair<std::string, std::string> > inputs_;
};

} /* namespace flood_roc */

#endif /* flood_roc_RocReport_hpp */
