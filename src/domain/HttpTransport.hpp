/**
 * @file HttpTransport.hpp
 * @brief Interface for blocking HTTP GET requests against the remote host.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace bundlesync::domain {

/**
 * @struct HttpResponse
 * @brief Outcome of a GET. When @c transportOk is false, @c status and @c body are meaningless.
 */
struct HttpResponse {
    bool transportOk = false;
    int status = 0;
    std::string contentType;
    std::string body;
    std::string transportError;
    bool truncated = false; ///< Receiving stopped once the body exceeded the size cap.
};

/**
 * @class HttpTransport
 * @brief Abstract GET capability. Production code uses cpp-httplib; tests substitute a fake.
 */
class HttpTransport {
public:
    using Headers = std::multimap<std::string, std::string>;

    virtual ~HttpTransport() = default;

    /**
     * @brief Performs a GET, following redirects.
     * @param url Absolute URL (scheme, host and path/query).
     * @param headers Request headers.
     * @param maxBodyBytes Receiving stops after more than this many bytes arrived; the body then
     *        holds maxBodyBytes + 1 bytes and @c truncated is set.
     */
    virtual HttpResponse get(const std::string& url, const Headers& headers, std::uintmax_t maxBodyBytes) = 0;
};

} // namespace bundlesync::domain
