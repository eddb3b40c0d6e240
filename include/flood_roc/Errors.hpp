#ifndef flood_roc_Errors_hpp
#define flood_roc_Errors_hpp

#include <stdexcept>
#include <string>

namespace flood_roc {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// raster or point set not supplied, or its file could not be read
class MissingInputError : public Error {
public:
    explicit MissingInputError(const std::string& message)
        : Error(message)
    {
    }
};

// one class has no valid sample after filtering, the ROC is undefined
class InsufficientDataError : public Error {
public:
    explicit InsufficientDataError(const std::string& message)
        : Error(message)
    {
    }
};

// the raster returned only missing values for a non-empty class
class NoDataFoundError : public InsufficientDataError {
public:
    explicit NoDataFoundError(const std::string& message)
        : InsufficientDataError(message)
    {
    }
};

class EmptyDatasetError : public Error {
public:
    explicit EmptyDatasetError(const std::string& message)
        : Error(message)
    {
    }
};

// points are not expressed in the raster coordinate reference system
class CoordinateMismatchError : public Error {
public:
    explicit CoordinateMismatchError(const std::string& message)
        : Error(message)
    {
    }
};

class RasterFormatError : public Error {
public:
    explicit RasterFormatError(const std::string& message)
        : Error(message)
    {
    }
};

class PointFormatError : public Error {
public:
    explicit PointFormatError(const std::string& message)
        : Error(message)
    {
    }
};

class SettingsError : public Error {
public:
    explicit SettingsError(const std::string& message)
        : Error(message)
    {
    }
};

} /* namespace flood_roc */

#endif /* flood_roc_Errors_hpp */
