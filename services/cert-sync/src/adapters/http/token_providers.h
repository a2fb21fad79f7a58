/**
 * @file token_providers.h
 * @brief Dual-token authentication against the upstream service
 *
 * 1. AccessTokenProvider: OpenID Connect password grant -> access_token
 * 2. SfcTokenProvider: login with the access token and border post data -> SFC token
 */
#pragma once

#include "../../domain/ports.h"
#include "http_client.h"
#include "retry_policy.h"

#include <string>

namespace certsync::adapters::http {

struct AccessTokenSettings {
    std::string url;
    std::string clientId;
    std::string clientSecret;
    std::string username;
    std::string password;
};

struct SfcLoginSettings {
    std::string url;
    std::string borderPostId;
    std::string boxId;
    std::string passengerControlType;
};

class AccessTokenProvider : public domain::IAccessTokenProvider {
public:
    /// @throws std::invalid_argument if transport is nullptr
    AccessTokenProvider(IHttpTransport* transport, AccessTokenSettings settings,
                        RetryPolicy retry = RetryPolicy{});

    /**
     * @brief POST the password grant and read "access_token" from the JSON response
     * @return Token, or AUTHENTICATION_ERROR "Access token acquisition failed"
     */
    railway::Result<std::string> acquireToken() override;

private:
    std::string requestToken();

    IHttpTransport* transport_;
    AccessTokenSettings settings_;
    RetryPolicy retry_;
};

class SfcTokenProvider : public domain::ISfcTokenProvider {
public:
    /// @throws std::invalid_argument if transport is nullptr
    SfcTokenProvider(IHttpTransport* transport, SfcLoginSettings settings,
                     RetryPolicy retry = RetryPolicy{});

    /**
     * @brief POST the login request; the token is the trimmed response text
     * @return Token, or AUTHENTICATION_ERROR "SFC token acquisition failed"
     */
    railway::Result<std::string> acquireToken(const std::string& accessToken) override;

private:
    std::string requestToken(const std::string& accessToken);

    IHttpTransport* transport_;
    SfcLoginSettings settings_;
    RetryPolicy retry_;
};

} // namespace certsync::adapters::http
