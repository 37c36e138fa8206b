#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>

namespace SeoAudit {
namespace Storage {

DiskStorage::DiskStorage(const std::string& base_path, Core::Logger& logger)
    : base_path_(base_path.empty() ? "." : base_path), logger_(logger) {
}

std::string DiskStorage::path_for(const std::string& key) const {
    std::filesystem::path path(base_path_);
    path /= key;
    return path.string();
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    try {
        std::filesystem::path path(path_for(key));

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file.is_open()) {
            logger_.error("Write Error: " + path.string());
            return false;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            logger_.error("Write Error: " + path.string());
            return false;
        }

        logger_.success("Saved: " + path.string());
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        logger_.error("FS Error: " + std::string(e.what()));
        return false;
    }
}

bool DiskStorage::save_file(const std::string&                              key,
                            const std::function<void(const std::string&)>& write_file) {
    std::filesystem::path path(path_for(key));
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        write_file(path.string());
    } catch (const std::filesystem::filesystem_error& e) {
        logger_.error("FS Error: " + std::string(e.what()));
        return false;
    } catch (const std::runtime_error& e) {
        logger_.error("Write Error: " + std::string(e.what()));
        return false;
    }

    logger_.success("Saved: " + path.string());
    return true;
}

}  // namespace Storage
}  // namespace SeoAudit
