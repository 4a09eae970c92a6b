#include "safeproc/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace safeproc {

namespace fs = std::filesystem;

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }

    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

std::string make_absolute(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) return path;
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<std::string> find_program(const std::string& program,
                                        const std::string& search_path,
                                        const std::string& base_dir) {
    if (program.empty()) return std::nullopt;

    auto is_executable = [](const std::string& candidate) {
        return is_regular_file(candidate) && access(candidate.c_str(), X_OK) == 0;
    };

    // Relative names resolve where the child will run, not where we run
    auto anchor = [&base_dir](const std::string& path) {
        fs::path p(path);
        if (p.is_relative() && !base_dir.empty()) p = fs::path(base_dir) / p;
        return make_absolute(p.string());
    };

    if (program.find('/') != std::string::npos) {
        std::string candidate = anchor(program);
        if (is_executable(candidate)) return candidate;
        return std::nullopt;
    }

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        // Empty entries would mean the current directory; never searched.
        if (dir.empty()) continue;
        std::string candidate = anchor(dir + "/" + program);
        if (is_executable(candidate)) return candidate;
    }

    return std::nullopt;
}

} // namespace safeproc
