/**
 * @file http_client.cpp
 * @brief HTTP transport implementation
 */
#include "http_client.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <regex>

namespace certsync::adapters::http {

using namespace certsync::common;

void raiseForStatus(int status, const std::string& context) {
    if (status >= 200 && status < 300) {
        return;
    }

    std::string message = context + " returned HTTP " + std::to_string(status);
    if (status == 401) {
        throw AuthenticationException(message);
    }
    if (status == 403) {
        throw PermissionException(message);
    }
    if (status == 408) {
        throw TimeoutException(message);
    }
    if (status == 429 || (status >= 500 && status < 600)) {
        throw ConnectionException(message);
    }
    throw ValidationException(message);
}

ParsedUrl parseUrl(const std::string& url) {
    // scheme://host[:port] [/path] [?query]
    static const std::regex urlRegex(R"(^(https?://[^/?#]+)([^?#]*)(?:\?([^#]*))?)",
                                     std::regex::icase);
    std::smatch match;
    ParsedUrl parsed;
    if (std::regex_search(url, match, urlRegex)) {
        parsed.hostString = match.str(1);
        parsed.path = match.str(2).empty() ? "/" : match.str(2);
        parsed.query = match.str(3);
    }
    return parsed;
}

DrogonHttpClient::DrogonHttpClient(int timeoutSeconds)
    : timeoutSeconds_(timeoutSeconds)
    , loopThread_("certsync-http")
{
    loopThread_.run();
}

std::string requestTarget(const ParsedUrl& url) {
    if (url.query.empty()) {
        return url.path;
    }
    return url.path + "?" + url.query;
}

drogon::HttpRequestPtr buildDrogonRequest(const HttpRequest& request, const ParsedUrl& url) {
    drogon::HttpRequestPtr req;
    if (!request.formParams.empty()) {
        req = drogon::HttpRequest::newHttpFormPostRequest();
        for (const auto& [key, value] : request.formParams) {
            req->setParameter(key, value);
        }
    } else {
        req = drogon::HttpRequest::newHttpRequest();
        if (!request.jsonBody.empty()) {
            req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
            req->setBody(request.jsonBody);
        }
    }

    req->setMethod(request.method == Method::Post ? drogon::Post : drogon::Get);

    // Configured query stays on the request line, already percent-encoded
    req->setPathEncode(false);
    req->setPath(requestTarget(url));

    for (const auto& [name, value] : request.headers) {
        req->addHeader(name, value);
    }
    req->addHeader("User-Agent", "cert-sync/1.0");
    return req;
}

HttpResponse DrogonHttpClient::send(const HttpRequest& request) {
    ParsedUrl url = parseUrl(request.url);
    if (url.hostString.empty()) {
        throw ValidationException("invalid URL: " + request.url);
    }

    spdlog::debug("[HttpClient] {} {}{}", request.method == Method::Post ? "POST" : "GET",
                  url.hostString, url.path);

    auto client = drogon::HttpClient::newHttpClient(url.hostString, loopThread_.getLoop());
    auto req = buildDrogonRequest(request, url);

    // Shared so that a late callback after our own timeout stays valid
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();

    client->sendRequest(req, [promise](drogon::ReqResult result, const drogon::HttpResponsePtr& response) {
        try {
            if (result == drogon::ReqResult::Ok && response) {
                HttpResponse out;
                out.status = static_cast<int>(response->getStatusCode());
                out.body = std::string(response->getBody());
                promise->set_value(std::move(out));
            } else if (result == drogon::ReqResult::Timeout) {
                throw TimeoutException("HTTP request timed out");
            } else {
                throw ConnectionException("HTTP request failed: ReqResult " +
                                          std::to_string(static_cast<int>(result)));
            }
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    }, static_cast<double>(timeoutSeconds_));

    // Drogon enforces the request timeout; the extra margin only guards a lost callback
    if (future.wait_for(std::chrono::seconds(timeoutSeconds_ + 5)) == std::future_status::timeout) {
        spdlog::error("[HttpClient] No response after {} seconds: {}", timeoutSeconds_, url.hostString);
        throw TimeoutException("no response from " + url.hostString);
    }

    HttpResponse response = future.get();
    spdlog::debug("[HttpClient] HTTP {} ({} bytes)", response.status, response.body.size());
    return response;
}

} // namespace certsync::adapters::http
