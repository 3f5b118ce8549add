#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kestrel {

// Base exception for all validation engine errors
class kestrel_exception : public std::runtime_error {
public:
    explicit kestrel_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Executable missing, not executable, or working directory unusable
class process_start_error : public kestrel_exception {
public:
    explicit process_start_error(const std::string& message)
        : kestrel_exception(message) {}
};

// Liveness or response wait exceeded
class process_timeout_error : public kestrel_exception {
public:
    explicit process_timeout_error(const std::string& message)
        : kestrel_exception(message) {}
};

// Read/write on a child pipe failed or hit end of file
class process_io_error : public kestrel_exception {
public:
    explicit process_io_error(const std::string& message)
        : kestrel_exception(message) {}
};

// Malformed or unexpected response from the server under test
class protocol_error : public kestrel_exception {
public:
    explicit protocol_error(const std::string& message)
        : kestrel_exception(message) {}
};

// Process introspection (/proc) failed
class resource_sample_error : public kestrel_exception {
public:
    explicit resource_sample_error(const std::string& message)
        : kestrel_exception(message) {}
};

// A file could not be read during the security scan
class scan_io_error : public kestrel_exception {
public:
    scan_io_error(std::string path, const std::string& message)
        : kestrel_exception(message)
        , _path(std::move(path)) {}

    auto path() const -> const std::string& {
        return _path;
    }

private:
    std::string _path;
};

// Invalid configuration; raised before any process is started
class configuration_error : public kestrel_exception {
public:
    explicit configuration_error(const std::string& message)
        : kestrel_exception(message) {}
};

} // namespace kestrel
