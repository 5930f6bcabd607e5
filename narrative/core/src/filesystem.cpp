#include <narrative/core/filesystem.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace narrative::core {

bool FileSystem::exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    // Create parent directories so stores can write into fresh save folders
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream file(path);
    if (!file) return false;
    file << text;
    return file.good();
}

} // namespace narrative::core
