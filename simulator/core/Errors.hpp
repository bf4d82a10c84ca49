#pragma once

#include <stdexcept>
#include <string>

// Raised for any configuration that must not reach the step loop
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when a trajectory cannot be written or read back
class OutputError : public std::runtime_error {
public:
    explicit OutputError(const std::string& what) : std::runtime_error(what) {}
};

class TrajectoryNotFoundError : public OutputError {
public:
    explicit TrajectoryNotFoundError(const std::string& path)
        : OutputError("Trajectory file not found: " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};
