#include "http_client.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace SeoAudit {

bool Response::is_html() const {
    return Utils::Text::to_lower(content_type).find(Core::Constants::HTML_CONTENT_TYPE)
           != std::string::npos;
}

namespace Network {
namespace Http {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Status: return "status";
        default: return "other";
    }
}

}  // namespace Http
}  // namespace Network
}  // namespace SeoAudit
