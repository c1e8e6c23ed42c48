#ifndef WIDEPATH_COMMON_ERRORS_HPP
#define WIDEPATH_COMMON_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace widepath {

// Base for every failure the conversion pipeline reports. All of them are fatal:
// the run aborts and any partially written output must be discarded.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A required raw input file does not exist.
class InputNotFoundError : public Error {
public:
    explicit InputNotFoundError(const std::string& path)
        : Error("Missing input file: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// A line violates the expected column count or numeric format.
class ParseError : public Error {
public:
    ParseError(const std::string& source, size_t line_number,
               const std::string& line, const std::string& reason)
        : Error(source + ":" + std::to_string(line_number) + ": " + reason +
                " (line: '" + line + "')"),
          line_number_(line_number),
          line_(line) {}

    size_t line_number() const { return line_number_; }
    const std::string& line() const { return line_; }

private:
    size_t line_number_;
    std::string line_;
};

// Node ids are not contiguous, or an edge references an unknown node.
class GraphIntegrityError : public Error {
public:
    using Error::Error;
};

// Grid coordinates that cannot be turned into latitude/longitude.
class ProjectionError : public Error {
public:
    using Error::Error;
};

// Invalid option values or configuration file contents.
class ConfigError : public Error {
public:
    using Error::Error;
};

}  // namespace widepath

#endif // WIDEPATH_COMMON_ERRORS_HPP
