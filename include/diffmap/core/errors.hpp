#pragma once

#include <stdexcept>
#include <string>

namespace diffmap {

class DiffmapError : public std::runtime_error {
public:
    explicit DiffmapError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public DiffmapError {
public:
    explicit ConfigError(const std::string& message)
        : DiffmapError("Config error: " + message) {}
};

class ValidationError : public DiffmapError {
public:
    explicit ValidationError(const std::string& message)
        : DiffmapError("Validation error: " + message) {}
};

class IOError : public DiffmapError {
public:
    explicit IOError(const std::string& message)
        : DiffmapError("I/O error: " + message) {}
};

// Images handed to a diff are unusable (too few, sizes disagree).
class InvalidInputError : public DiffmapError {
public:
    explicit InvalidInputError(const std::string& message)
        : DiffmapError("Invalid input: " + message) {}
};

class UnknownProgramError : public DiffmapError {
public:
    explicit UnknownProgramError(const std::string& name)
        : DiffmapError("Unknown render program: " + name) {}
};

class MissingOptionError : public DiffmapError {
public:
    explicit MissingOptionError(const std::string& key)
        : DiffmapError("Missing render option: " + key) {}
};

// A raster of the wrong kind was fed to a typed render step.
class UnsupportedOperandError : public DiffmapError {
public:
    explicit UnsupportedOperandError(const std::string& message)
        : DiffmapError("Unsupported operand: " + message) {}
};

} // namespace diffmap
