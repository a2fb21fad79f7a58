/**
 * @file token_providers.cpp
 * @brief Access token and SFC token acquisition
 */
#include "token_providers.h"
#include "exceptions.h"

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <stdexcept>

namespace certsync::adapters::http {

using common::AuthenticationException;
using common::ParsingException;
using railway::ErrorCode;
using railway::Result;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

Json::Value parseJson(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw ParsingException("token response is not JSON: " + errors);
    }
    return root;
}

void logFailure(const char* component, const railway::FailureDescription& failure) {
    spdlog::error("[{}] {}: {}", component, failure.message(), failure.causeMessage());
}

} // anonymous namespace

// =============================================================================
// AccessTokenProvider
// =============================================================================

AccessTokenProvider::AccessTokenProvider(IHttpTransport* transport, AccessTokenSettings settings,
                                         RetryPolicy retry)
    : transport_(transport)
    , settings_(std::move(settings))
    , retry_(std::move(retry))
{
    if (!transport_) {
        throw std::invalid_argument("AccessTokenProvider: transport cannot be nullptr");
    }
}

Result<std::string> AccessTokenProvider::acquireToken() {
    auto result = Result<std::string>::fromComputation(
        [this]() { return withRetry(retry_, "access token request", [this]() { return requestToken(); }); },
        ErrorCode::AUTHENTICATION_ERROR,
        "Access token acquisition failed");

    if (result.isFailure()) {
        logFailure("AccessTokenProvider", result.unwrapFailure());
    } else {
        spdlog::info("[AccessTokenProvider] Access token acquired");
    }
    return result;
}

std::string AccessTokenProvider::requestToken() {
    HttpRequest request;
    request.method = Method::Post;
    request.url = settings_.url;
    request.formParams = {
        {"grant_type", "password"},
        {"client_id", settings_.clientId},
        {"client_secret", settings_.clientSecret},
        {"username", settings_.username},
        {"password", settings_.password},
    };

    HttpResponse response = transport_->send(request);
    raiseForStatus(response.status, "access token endpoint");

    Json::Value json = parseJson(response.body);
    if (!json.isObject() || !json["access_token"].isString() ||
        json["access_token"].asString().empty()) {
        throw AuthenticationException("token response has no access_token");
    }
    return json["access_token"].asString();
}

// =============================================================================
// SfcTokenProvider
// =============================================================================

SfcTokenProvider::SfcTokenProvider(IHttpTransport* transport, SfcLoginSettings settings,
                                   RetryPolicy retry)
    : transport_(transport)
    , settings_(std::move(settings))
    , retry_(std::move(retry))
{
    if (!transport_) {
        throw std::invalid_argument("SfcTokenProvider: transport cannot be nullptr");
    }
}

Result<std::string> SfcTokenProvider::acquireToken(const std::string& accessToken) {
    auto result = Result<std::string>::fromComputation(
        [&]() {
            return withRetry(retry_, "SFC login request",
                             [&]() { return requestToken(accessToken); });
        },
        ErrorCode::AUTHENTICATION_ERROR,
        "SFC token acquisition failed");

    if (result.isFailure()) {
        logFailure("SfcTokenProvider", result.unwrapFailure());
    } else {
        spdlog::info("[SfcTokenProvider] SFC token acquired");
    }
    return result;
}

std::string SfcTokenProvider::requestToken(const std::string& accessToken) {
    Json::Value body;
    body["borderPostId"] = settings_.borderPostId;
    body["boxId"] = settings_.boxId;
    body["passengerControlType"] = settings_.passengerControlType;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    HttpRequest request;
    request.method = Method::Post;
    request.url = settings_.url;
    request.headers = {{"Authorization", "Bearer " + accessToken}};
    request.jsonBody = Json::writeString(writer, body);

    HttpResponse response = transport_->send(request);
    raiseForStatus(response.status, "SFC login endpoint");

    std::string token = trim(response.body);
    if (token.empty()) {
        throw AuthenticationException("SFC login returned an empty token");
    }
    return token;
}

} // namespace certsync::adapters::http
