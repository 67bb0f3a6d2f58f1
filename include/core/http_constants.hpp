#pragma once

#include <string>
#include <string_view>

namespace autoheal::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";
inline constexpr std::string_view kHttpsScheme = "https://";
inline constexpr std::string_view kHttpScheme = "http://";

/**
 * @brief Split an http(s) URL into the pieces httplib::Client needs
 */
struct ParsedUrl {
    std::string host;
    std::string path = "/";
    int port = 443;
    bool use_ssl = true;

    [[nodiscard]] std::string scheme_host() const;
};

[[nodiscard]] ParsedUrl parse_url(std::string url);

} // namespace autoheal::http
