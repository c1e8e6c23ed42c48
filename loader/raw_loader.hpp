#ifndef WIDEPATH_LOADER_RAW_LOADER_HPP
#define WIDEPATH_LOADER_RAW_LOADER_HPP

#include <graph/graph_records.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace widepath {

// Reads one dataset's raw files from a directory into uniform node and edge
// records. New datasets are supported by adding an implementation.
class RawLoader {
public:
    virtual ~RawLoader() = default;

    // Throws InputNotFoundError before reading anything if a required file is
    // missing, ParseError on malformed content.
    virtual RawGraph load(const std::filesystem::path& input_dir) const = 0;

    virtual const char* name() const = 0;
    virtual std::vector<std::string> required_files() const = 0;

protected:
    void require_files(const std::filesystem::path& input_dir) const;
};

}  // namespace widepath

#endif // WIDEPATH_LOADER_RAW_LOADER_HPP
