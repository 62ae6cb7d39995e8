#include "uri.hpp"

#include <cstring>
#include <cctype>
#include <cstdio>

#include "pxhttp/log.hpp"
#include "stx/format.h"

namespace pxhttp
{

/**
 * Character classes.
 *
 * https://tools.ietf.org/html/rfc3986#section-2
 */

static bool isUnreserved(int c)
{
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

static bool isSubDelim(int c)
{
    return c == '!' || c == '$' || c == '&' || c == '\'' || c == '(' ||
        c == ')' || c == '*' || c == '+' || c == ',' || c == ';' || c == '=';
}

static bool isPChar(int c)
{
    return isUnreserved(c) || c == '%' || isSubDelim(c) || c == ':' || c == '@';
}

/**
 * Parse scheme
 *
 * https://tools.ietf.org/html/rfc3986#section-3.1
 */
static bool parseScheme(const char*& str, std::string& out)
{
    if (!std::isalpha(static_cast<unsigned char>(*str)))
        return false;

    while (std::isalnum(static_cast<unsigned char>(*str)) ||
           *str == '-' || *str == '+' || *str == '.') {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*str))));
        ++str;
    }

    return *str++ == ':';
}

/**
 * Parse authority + port.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.2
 */
static bool parseAuthority(const char*& str, std::string& host, uint16_t& port)
{
    if (str[0] != '/' || str[1] != '/')
        return false;
    str += 2;

    /* User information is skipped, it never reaches the host header. */
    if (auto userEnd = std::strchr(str, '@')) {
        auto endOfAuthority = std::strpbrk(str, "/?#");
        if (!endOfAuthority || userEnd < endOfAuthority)
            str = userEnd + 1;
    }

    /* IP-Literal */
    if (*str == '[') {
        host.push_back(*str++);
        while (std::isxdigit(static_cast<unsigned char>(*str)) || *str == ':' || *str == '.')
            host.push_back(*str++);
        if (*str != ']')
            return false;
        host.push_back(*str++);
    }
    else {
        /* IPv4 & Reg-Name */
        while (isUnreserved(static_cast<unsigned char>(*str)))
            host.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*str++))));
    }

    if (host.empty())
        return false;

    /* Port */
    if (*str == ':') {
        ++str;
        uint32_t value = 0;
        auto digits = 0;
        while (std::isdigit(static_cast<unsigned char>(*str))) {
            value = value * 10u + static_cast<uint32_t>(*str - '0');
            if (value > 65535u)
                return false;
            ++digits;
            ++str;
        }
        if (digits == 0 || value == 0)
            return false;
        port = static_cast<uint16_t>(value);
    }

    return *str == '\0' || *str == '/' || *str == '?' || *str == '#';
}

/**
 * Parse path, keeping percent-encodings as they are.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.3
 */
static bool parsePath(const char*& str, std::string& path)
{
    while (isPChar(static_cast<unsigned char>(*str)) || *str == '/')
        path.push_back(*str++);

    /* Path must end with either EOF, '?' or '#' */
    return *str == '\0' || *str == '?' || *str == '#';
}

/**
 * Parse query, keeping percent-encodings as they are. Clients commonly
 * send brackets and pipes unencoded, so any visible character is taken.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.4
 */
static bool parseQuery(const char*& str, std::string& query)
{
    while (std::isgraph(static_cast<unsigned char>(*str)) && *str != '#')
        query.push_back(*str++);

    /* Query must end with either EOF or '#' (fragment indicator) */
    return *str == '\0' || *str == '#';
}

URIComponents URIComponents::fromStrRfc3986(std::string const& uri)
{
    URIComponents result;
    const auto* c = uri.c_str();
    std::string error;

    if (!parseScheme(c, result.scheme))
        error = "Error parsing scheme";
    else if (!parseAuthority(c, result.host, result.port))
        error = "Error parsing authority";
    else if (!parsePath(c, result.path))
        error = "Error parsing path";
    else if (*c == '?' && !parseQuery(++c, result.query))
        error = "Error parsing query";

    if (!error.empty()) {
        throw logRuntimeError<URIError>(stx::format("[URIComponents::fromStrRfc3986] {} of URI '{}'", error, uri));
    }

    return result;
}

URIComponents URIComponents::fromStrPath(std::string const& pathAndQueryString)
{
    URIComponents result;
    const auto* c = pathAndQueryString.c_str();

    if (*c != '/' || !parsePath(c, result.path))
        throw logRuntimeError<URIError>(
            stx::format("[URIComponents::fromStrPath] Error parsing path from '{}'", pathAndQueryString));

    if (*c == '?' && !parseQuery(++c, result.query))
        throw logRuntimeError<URIError>(
            stx::format("[URIComponents::fromStrPath] Error parsing query from '{}'", pathAndQueryString));

    return result;
}

std::uint16_t URIComponents::defaultPort() const
{
    if (scheme == "http")
        return 80u;
    if (scheme == "https")
        return 443u;
    return 0u;
}

std::string URIComponents::build() const
{
    return buildHost() + buildPath();
}

std::string URIComponents::buildHost() const
{
    if (scheme.empty())
        throw logRuntimeError<URIError>("[URIComponents::buildHost] Missing scheme");

    if (host.empty())
        throw logRuntimeError<URIError>("[URIComponents::buildHost] Missing host");

    return scheme + "://" +
           host +
           (port > 0 ? std::string(":") + std::to_string(port) : "");
}

std::string URIComponents::buildPath() const
{
    std::string uri = path.empty() ? std::string("/") : path;
    if (!query.empty())
        uri += "?" + query;
    return uri;
}

std::string URIComponents::buildHostHeader() const
{
    if (host.empty())
        throw logRuntimeError<URIError>("[URIComponents::buildHostHeader] Missing host");

    if (port > 0 && port != defaultPort())
        return host + ":" + std::to_string(port);
    return host;
}

std::string URIComponents::encode(std::string str)
{
    static const auto alpha =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "-._~"        /* unreserved */;

    for (std::string::size_type i = 0;;) {
        i = str.find_first_not_of(alpha, i);
        if (i == std::string::npos)
            break;

        const char codepoint = str[i];
        char hex[3 + 1] = {}; /* %XX + \0 */

        auto len = std::snprintf(hex, sizeof(hex), "%%%02X",
                                 static_cast<unsigned char>(codepoint));
        if (len > 0) {
            str.replace(i, 1, hex);
            i += std::strlen(hex);
        } else {
            ++i;
        }
    }

    return str;
}

}
