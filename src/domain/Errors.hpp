/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the cache, codec and search layers.
 */

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace imagescout::domain {

/**
 * @class ImageScoutError
 * @brief Base class for every error raised by ImageScout.
 */
class ImageScoutError : public std::runtime_error {
public:
    explicit ImageScoutError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Cache file could not be read or written. */
class IOFailure : public ImageScoutError {
public:
    using ImageScoutError::ImageScoutError;
};

/** @brief No cache file exists yet for a folder. */
class NotFoundError : public ImageScoutError {
public:
    using ImageScoutError::ImageScoutError;
};

/** @brief Cache file exists but has an unknown schema or inconsistent content. */
class CorruptCacheError : public ImageScoutError {
public:
    using ImageScoutError::ImageScoutError;
};

/** @brief The embedding model rejected its input or failed. */
class ModelInferenceError : public ImageScoutError {
public:
    using ImageScoutError::ImageScoutError;
};

/** @brief A vector does not have the dimensionality of its collection. */
class DimensionMismatchError : public ImageScoutError {
public:
    DimensionMismatchError(std::size_t expected, std::size_t actual)
        : ImageScoutError("Dimension mismatch: expected " + std::to_string(expected) +
                          ", got " + std::to_string(actual)),
          m_expected(expected), m_actual(actual) {}

    std::size_t expected() const { return m_expected; }
    std::size_t actual() const { return m_actual; }

private:
    std::size_t m_expected;
    std::size_t m_actual;
};

/** @brief settings.json holds a value outside its allowed range. */
class ConfigError : public ImageScoutError {
public:
    using ImageScoutError::ImageScoutError;
};

} // namespace imagescout::domain
