#include "infrastructure/HttplibTransport.hpp"
#include <httplib.h>
#include <exception>

namespace bundlesync::infrastructure {

namespace {

// Splits "https://host[:port]/path?query" into "https://host[:port]" and "/path?query".
bool SplitUrl(const std::string& url, std::string& origin, std::string& target) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return false;
    auto pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == std::string::npos) {
        origin = url;
        target = "/";
    } else {
        origin = url.substr(0, pathStart);
        target = url.substr(pathStart);
    }
    return !origin.empty();
}

} // namespace

HttplibTransport::HttplibTransport(int connectTimeoutSeconds, int readTimeoutSeconds)
    : m_connectTimeout(connectTimeoutSeconds), m_readTimeout(readTimeoutSeconds) {}

domain::HttpResponse HttplibTransport::get(const std::string& url, const Headers& headers, std::uintmax_t maxBodyBytes) {
    domain::HttpResponse response;

    std::string origin;
    std::string target;
    if (!SplitUrl(url, origin, target)) {
        response.transportError = "Malformed URL: " + url;
        return response;
    }

    try {
        httplib::Client cli(origin);
        cli.set_follow_location(true);
        cli.set_connection_timeout(m_connectTimeout, 0);
        cli.set_read_timeout(m_readTimeout, 0);

        httplib::Headers requestHeaders(headers.begin(), headers.end());

        auto res = cli.Get(
            target, requestHeaders,
            [&](const httplib::Response& r) {
                response.status = r.status;
                response.contentType = r.get_header_value("Content-Type");
                return true;
            },
            [&](const char* data, size_t length) {
                response.body.append(data, length);
                if (response.body.size() > maxBodyBytes) {
                    // Keep exactly maxBodyBytes + 1 so the caller can see the overflow.
                    response.body.resize(static_cast<size_t>(maxBodyBytes) + 1);
                    response.truncated = true;
                    return false;
                }
                return true;
            });

        if (response.truncated) {
            response.transportOk = true;
            return response;
        }
        if (!res) {
            response.transportError = "Connection failed: " + httplib::to_string(res.error());
            return response;
        }
        response.transportOk = true;
        response.status = res->status;
        if (response.contentType.empty()) {
            response.contentType = res->get_header_value("Content-Type");
        }
    } catch (const std::exception& e) {
        response.transportOk = false;
        response.transportError = e.what();
    }
    return response;
}

} // namespace bundlesync::infrastructure
