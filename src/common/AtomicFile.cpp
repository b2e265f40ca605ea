#include "common/AtomicFile.h"

#include <fstream>
#include <system_error>

namespace exitforge {
namespace utils {

bool writeFileAtomic(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << content;
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (!ec) {
        return true;
    }

    // rename can refuse to replace on some filesystems
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        path,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace utils
} // namespace exitforge
