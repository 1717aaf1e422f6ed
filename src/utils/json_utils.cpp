#include "utils/json_utils.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace modelfetch {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        return nlohmann::json::parse(body);
    } catch (const std::exception& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

std::optional<nlohmann::json> read_json_file(const fs::path& path, std::string* error) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (error) *error = "not found: " + path.string();
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        if (error) *error = "cannot open: " + path.string();
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return parse_json(buffer.str(), error);
}

bool write_json_atomic(const fs::path& path, const nlohmann::json& j, std::string* error) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            if (error) *error = "cannot open: " + tmp.string();
            return false;
        }
        ofs << j.dump(2);
        ofs.flush();
        if (!ofs.good()) {
            if (error) *error = "write failed: " + tmp.string();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        if (error) *error = "rename failed: " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

}  // namespace modelfetch
