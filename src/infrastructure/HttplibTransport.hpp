/**
 * @file HttplibTransport.hpp
 * @brief HttpTransport adapter built on cpp-httplib.
 */

#pragma once

#include "domain/HttpTransport.hpp"

namespace bundlesync::infrastructure {

class HttplibTransport : public domain::HttpTransport {
public:
    /**
     * @param connectTimeoutSeconds Limit for establishing the connection.
     * @param readTimeoutSeconds Limit for a single read on an open connection.
     */
    HttplibTransport(int connectTimeoutSeconds = 30, int readTimeoutSeconds = 300);

    domain::HttpResponse get(const std::string& url, const Headers& headers, std::uintmax_t maxBodyBytes) override;

private:
    int m_connectTimeout;
    int m_readTimeout;
};

} // namespace bundlesync::infrastructure
