#pragma once
#include <functional>
#include <string>
#include "../core/logger/logger.hpp"
#include "storage.hpp"

namespace SeoAudit {
namespace Storage {

class DiskStorage : public Storage {
public:
    DiskStorage(const std::string& base_path, Core::Logger& logger);
    ~DiskStorage() override = default;

    bool save(const std::string& key, const std::string& content) override;

    // For files a library writes itself: creates the parent directories, then
    // calls write_file with the final path. A std::runtime_error it throws is
    // logged and reported as false.
    bool save_file(const std::string& key, const std::function<void(const std::string&)>& write_file);

    std::string path_for(const std::string& key) const;

private:
    std::string   base_path_;
    Core::Logger& logger_;
};

}  // namespace Storage
}  // namespace SeoAudit
