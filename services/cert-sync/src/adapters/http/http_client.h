/**
 * @file http_client.h
 * @brief Blocking HTTP transport for the upstream token and download calls
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

namespace certsync::adapters::http {

enum class Method { Get, Post };

struct HttpRequest {
    Method method = Method::Get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    /// Sent as application/x-www-form-urlencoded when not empty
    std::vector<std::pair<std::string, std::string>> formParams;
    /// Sent as application/json when not empty (and no form parameters)
    std::string jsonBody;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * @brief Synchronous request/response transport
 *
 * Any HTTP status is returned as is; callers apply raiseForStatus().
 * Transport faults throw TimeoutException or ConnectionException.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;

protected:
    IHttpTransport() = default;
};

/**
 * @brief Throw the exception matching a non-2xx status
 *
 *   401 -> AuthenticationException
 *   403 -> PermissionException
 *   408 -> TimeoutException
 *   429, 5xx -> ConnectionException
 *   other 4xx and unexpected codes -> ValidationException
 */
void raiseForStatus(int status, const std::string& context);

/// @brief "https://host:port", path and query of an absolute URL; empty host when invalid
struct ParsedUrl {
    std::string hostString;
    std::string path;
    std::string query;
};
ParsedUrl parseUrl(const std::string& url);

/// @brief Path plus the configured query string, as sent on the request line
std::string requestTarget(const ParsedUrl& url);

/**
 * @brief Drogon request for a transport request
 *
 * The URL's query stays on the request line for every method; form
 * parameters of a POST go to the body.
 */
drogon::HttpRequestPtr buildDrogonRequest(const HttpRequest& request, const ParsedUrl& url);

/**
 * @brief Drogon HttpClient behind IHttpTransport
 *
 * Owns an event loop thread (stopped and joined on destruction) so that
 * requests work both before and after the application's main loop is running.
 */
class DrogonHttpClient : public IHttpTransport {
public:
    explicit DrogonHttpClient(int timeoutSeconds = 60);

    DrogonHttpClient(const DrogonHttpClient&) = delete;
    DrogonHttpClient& operator=(const DrogonHttpClient&) = delete;

    HttpResponse send(const HttpRequest& request) override;

private:
    int timeoutSeconds_;
    trantor::EventLoopThread loopThread_;
};

} // namespace certsync::adapters::http
