#pragma once

#include <stdexcept>
#include <string>

namespace monodither {

class MonoditherError : public std::runtime_error {
public:
    explicit MonoditherError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public MonoditherError {
public:
    explicit ConfigError(const std::string& message)
        : MonoditherError("Config error: " + message) {}
};

class ValidationError : public MonoditherError {
public:
    explicit ValidationError(const std::string& message)
        : MonoditherError("Validation error: " + message) {}
};

class IOError : public MonoditherError {
public:
    explicit IOError(const std::string& message)
        : MonoditherError("I/O error: " + message) {}
};

class DecodeError : public IOError {
public:
    explicit DecodeError(const std::string& message)
        : IOError("Decode error: " + message) {}
};

class EncodeError : public IOError {
public:
    explicit EncodeError(const std::string& message)
        : IOError("Encode error: " + message) {}
};

class OutputDirectoryError : public IOError {
public:
    explicit OutputDirectoryError(const std::string& message)
        : IOError("Output directory error: " + message) {}
};

} // namespace monodither
