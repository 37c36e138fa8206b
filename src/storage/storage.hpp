#pragma once
#include <string>

namespace SeoAudit {
namespace Storage {

class Storage {
public:
    virtual ~Storage() = default;

    // Returns false when the content could not be written.
    virtual bool save(const std::string& key, const std::string& content) = 0;
};

}  // namespace Storage
}  // namespace SeoAudit
