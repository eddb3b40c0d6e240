#ifndef flood_roc_RasterReader_hpp
#define flood_roc_RasterReader_hpp

#include <string>
#include <vector>
#include "flood_roc/Raster.hpp"

namespace flood_roc {

/**
 * Loads a single band susceptibility raster.
 *
 * ESRI ASCII grids (.asc) carry their own georeferencing and no-data value.
 * Any other file is decoded by OpenCV and georeferenced by, in this order,
 * the explicit geotransform, the configured world file or a world file next
 * to the image (name.tfw, name.tifw, name.wld, ...).
 */
class RasterReader {
public:

    RasterReader();
    ~RasterReader();

    void set_crs(const std::string& crs) {
        crs_ = crs;
    }

    void set_nodata(double nodata) {
        nodata_ = nodata;
        has_nodata_ = true;
    }

    void set_world_filename(const std::string& world_filename) {
        world_filename_ = world_filename;
    }

    void set_geotransform(const GeoTransform& geotransform) {
        geotransform_ = geotransform;
        has_geotransform_ = true;
    }

    Raster Read(const std::string& filename) const;

    static GeoTransform ReadWorldFile(const std::string& filename);

    static std::vector<std::string> WorldFileCandidates(const std::string& image_filename);

private:

    Raster ReadAsciiGrid(const std::string& filename) const;

    Raster ReadImage(const std::string& filename) const;

    GeoTransform ImageGeoTransform(const std::string& image_filename) const;

    std::string crs_;
    std::string world_filename_;
    GeoTransform geotransform_;
    double nodata_;
    bool has_nodata_;
    bool has_geotransform_;
};

} /* namespace flood_roc */

#endif /* flood_roc_RasterReader_hpp */
