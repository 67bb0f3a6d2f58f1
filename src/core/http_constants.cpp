#include "core/http_constants.hpp"
#include "core/utils.hpp"

#include <format>

namespace autoheal::http {

std::string ParsedUrl::scheme_host() const {
    return std::format("{}{}:{}", use_ssl ? kHttpsScheme : kHttpScheme, host, port);
}

ParsedUrl parse_url(std::string url) {
    ParsedUrl parsed;

    if (url.starts_with(kHttpsScheme)) {
        url = url.substr(kHttpsScheme.size());
    } else if (url.starts_with(kHttpScheme)) {
        url = url.substr(kHttpScheme.size());
        parsed.use_ssl = false;
        parsed.port = 80;
    }

    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        parsed.path = url.substr(path_pos);
        url = url.substr(0, path_pos);
    }

    const auto port_pos = url.find(':');
    if (port_pos != std::string::npos) {
        parsed.port = utils::parse_int<int>(std::string_view(url).substr(port_pos + 1), parsed.port);
        parsed.host = url.substr(0, port_pos);
    } else {
        parsed.host = url;
    }

    return parsed;
}

} // namespace autoheal::http
