#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include "../core/logger/logger.hpp"

namespace Ferret {
namespace Storage {

namespace fs = std::filesystem;
using Ferret::Core::Logger;

namespace {
bool is_valid_key(const std::string& key) {
    return !key.empty() && key.find('/') == std::string::npos
           && key.find('\\') == std::string::npos && key != "." && key != "..";
}
}  // namespace

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        fs::create_directories(base_path_, ec);
        if (ec) {
            Logger::error("Failed to create storage directory: " + base_path_ + " ("
                          + ec.message() + ")");
        }
    }
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    if (!is_valid_key(key)) {
        Logger::error("Storage: invalid key '" + key + "'");
        return false;
    }

    fs::path path = fs::path(base_path_) / key;
    fs::path tmp  = path;
    tmp += "." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "."
           + std::to_string(tmp_counter_++) + TMP_SUFFIX;

    try {
        fs::create_directories(path.parent_path());
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                Logger::error("Write Error: " + tmp.string());
                return false;
            }
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (!file) {
                Logger::error("Write Error: " + tmp.string());
                file.close();
                fs::remove(tmp);
                return false;
            }
        }
        fs::rename(tmp, path);
        Logger::debug("Saved: " + path.string());
        return true;
    } catch (const fs::filesystem_error& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    }
}

std::optional<std::string> DiskStorage::load(const std::string& key) const {
    if (!is_valid_key(key))
        return std::nullopt;

    fs::path      path = fs::path(base_path_) / key;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        Logger::warn("Read Error: " + path.string());
        return std::nullopt;
    }
    return content;
}

bool DiskStorage::remove(const std::string& key) {
    if (!is_valid_key(key))
        return false;
    std::error_code ec;
    bool            removed = fs::remove(fs::path(base_path_) / key, ec);
    if (ec)
        Logger::warn("Failed to remove " + key + ": " + ec.message());
    return removed;
}

std::vector<std::string> DiskStorage::keys() const {
    std::vector<std::string> out;
    std::error_code          ec;
    for (fs::directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        std::string name = it->path().filename().string();
        if (name.size() >= 4 && name.compare(name.size() - 4, 4, TMP_SUFFIX) == 0)
            continue;
        out.push_back(std::move(name));
    }
    return out;
}

size_t DiskStorage::total_bytes() const {
    size_t total = 0;
    for (const auto& key : keys()) {
        std::error_code ec;
        auto            size = fs::file_size(fs::path(base_path_) / key, ec);
        if (!ec)
            total += static_cast<size_t>(size);
    }
    return total;
}

void DiskStorage::clear() {
    for (const auto& key : keys())
        remove(key);
}

}  // namespace Storage
}  // namespace Ferret
