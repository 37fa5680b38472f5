#pragma once
#include <stdexcept>
#include <string>

namespace posecast {

// Base of every error raised by posecast modules.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed seating file, invalid endpoint or config value. Fatal at startup.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Camera, replay file or socket could not be opened. Aborts start().
class ResourceError : public Error {
public:
    explicit ResourceError(const std::string& what) : Error(what) {}
};

// A single failed read or send. Caught inside the loop; the frame is dropped.
class TransientIOError : public Error {
public:
    explicit TransientIOError(const std::string& what) : Error(what) {}
};

// Seat set rejected at construction (empty, duplicate or empty id).
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

} // namespace posecast
