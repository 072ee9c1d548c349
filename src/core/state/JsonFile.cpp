#include "core/state/JsonFile.h"

#include <fstream>
#include <system_error>

namespace tradeguard {
namespace core {

bool writeJsonAtomic(const std::filesystem::path& path, const nlohmann::json& raw) {
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
        out << raw.dump(2);
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse rename over an existing file
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

std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path, std::string* error) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        if (error) {
            *error = "cannot open " + path.string();
        }
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return raw;
    } catch (const nlohmann::json::exception& e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

} // namespace core
} // namespace tradeguard
