#include "raw_loader.hpp"
#include <common/errors.hpp>

namespace widepath {

void RawLoader::require_files(const std::filesystem::path& input_dir) const {
    for (const auto& file : required_files()) {
        std::filesystem::path path = input_dir / file;
        if (!std::filesystem::exists(path)) {
            throw InputNotFoundError(path.string());
        }
    }
}

}  // namespace widepath
