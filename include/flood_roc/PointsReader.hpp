#ifndef flood_roc_PointsReader_hpp
#define flood_roc_PointsReader_hpp

#include <string>
#include <vector>
#include "flood_roc/Point.hpp"

namespace flood_roc {

/**
 * Reads observation points from a delimited text file, one point per line.
 *
 * A first line whose leading fields are not numbers is taken as a header and
 * the coordinate columns are then looked up by name. Without a header the
 * first two columns are x and y. Blank lines and lines starting with '#' are
 * ignored.
 */
class PointsReader {
public:

    PointsReader();
    ~PointsReader();

    void set_crs(const std::string& crs) {
        crs_ = crs;
    }

    void set_x_column(const std::string& x_column) {
        x_column_ = x_column;
    }

    void set_y_column(const std::string& y_column) {
        y_column_ = y_column;
    }

    PointSet Read(const std::string& filename) const;

private:

    void FindColumns(const std::vector<std::string>& header, const std::string& filename, size_t& x_index, size_t& y_index) const;

    std::string crs_;
    std::string x_column_;
    std::string y_column_;
};

} /* namespace flood_roc */

#endif /* flood_roc_PointsReader_hpp */
