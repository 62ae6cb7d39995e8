#pragma once

#include <chrono>
#include <string>

#include "pxhttp/http-client.hpp"
#include "access-token.hpp"
#include "errors.hpp"

namespace authpx
{

class ITokenFetcher
{
public:
    virtual ~ITokenFetcher() = default;

    /**
     * Perform a single token exchange. Never retries.
     * Throws FetchError.
     */
    virtual AccessToken fetch() = 0;
};

/**
 * Obtains tokens through the OAuth2 client-credentials grant (RFC 6749 §4.4).
 */
class OAuth2TokenFetcher final : public ITokenFetcher
{
public:
    /**
     * How the client authenticates at the token endpoint.
     */
    enum class ClientAuth {
        Post,  // client_id/client_secret in the form body (client_secret_post)
        Basic  // HTTP Basic header (client_secret_basic, RFC 6749 §2.3.1)
    };

    struct Options
    {
        std::string tokenUrl;
        std::string clientId;
        std::string clientSecret;
        std::string scope;     // optional
        std::string audience;  // optional
        ClientAuth clientAuth = ClientAuth::Post;

        // Subtracted from the reported lifetime, so that a token is not
        // handed out while it is about to expire in flight.
        std::chrono::seconds expiryMargin{20};

        pxhttp::Config httpConfig;
    };

    OAuth2TokenFetcher(Options options,
                       pxhttp::IHttpClient& client,
                       IClock const& clock = SteadyClock::instance());

    AccessToken fetch() override;

private:
    std::string buildRequestBody() const;

    Options options_;
    pxhttp::IHttpClient& client_;
    IClock const& clock_;
};

}
