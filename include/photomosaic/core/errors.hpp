#pragma once

#include <stdexcept>
#include <string>

namespace photomosaic {

class PhotomosaicError : public std::runtime_error {
public:
    explicit PhotomosaicError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PhotomosaicError {
public:
    explicit ConfigError(const std::string& message)
        : PhotomosaicError("Config error: " + message) {}
};

class ValidationError : public PhotomosaicError {
public:
    explicit ValidationError(const std::string& message)
        : PhotomosaicError("Validation error: " + message) {}
};

class IOError : public PhotomosaicError {
public:
    explicit IOError(const std::string& message)
        : PhotomosaicError("I/O error: " + message) {}
};

class PoolEmptyError : public PhotomosaicError {
public:
    explicit PoolEmptyError(const std::string& message = "no tile sources supplied")
        : PhotomosaicError("Tile pool error: " + message) {}
};

class SizeMismatchError : public PhotomosaicError {
public:
    explicit SizeMismatchError(const std::string& message)
        : PhotomosaicError("Size mismatch: " + message) {}
};

} // namespace photomosaic
