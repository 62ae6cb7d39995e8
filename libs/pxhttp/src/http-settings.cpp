#include "http-settings.hpp"
#include "log.hpp"

#ifdef AUTHPX_KEYCHAIN_SUPPORT
#include <keychain/keychain.h>
#endif
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <future>
#include <sstream>
#include <spdlog/spdlog.h>

using namespace pxhttp;

static const std::chrono::minutes KEYCHAIN_TIMEOUT{1};
static const char* KEYCHAIN_PACKAGE = "lib.authpx.proxy";

namespace YAML
{

template <>
struct convert<Config::Proxy>
{
    static bool decode(const Node& node, Config::Proxy& a)
    {
        if (!node.IsMap())
            return false;

        const auto& host = node["host"];
        const auto& port = node["port"];

        if (!host || !port)
            return false;

        a.host = host.as<std::string>();
        a.port = port.as<int>();

        const auto& user = node["user"];
        const auto& password = node["password"];
        const auto& keychain = node["keychain"];

        if (user) {
            a.user = user.as<std::string>();

            if (password)
                a.password = password.as<std::string>();
            else if (keychain)
                a.keychain = keychain.as<std::string>();
            else
                return false;
        }

        return true;
    }
};
}

namespace
{

bool isCredentialHeader(std::string const& name)
{
    return headerNameEquals(name, "Authorization") ||
        headerNameEquals(name, "Proxy-Authorization") ||
        headerNameEquals(name, "Cookie") ||
        headerNameEquals(name, "X-Api-Key");
}

bool parseFlag(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(value.empty() || value == "0" || value == "false" || value == "no" || value == "off");
}

}

bool CaseInsensitiveLess::operator()(std::string const& a, std::string const& b) const
{
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char l, unsigned char r) { return std::tolower(l) < std::tolower(r); });
}

bool pxhttp::headerNameEquals(std::string const& a, std::string const& b)
{
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(),
            [](unsigned char l, unsigned char r) { return std::tolower(l) == std::tolower(r); });
}

std::string pxhttp::redactHeaders(Headers const& headers)
{
    std::string result = "{";
    for (auto const& [name, value] : headers) {
        if (result.size() > 1)
            result += ", ";
        result += name + ": " + (isCredentialHeader(name) ? redact(value) : value);
    }
    return result + "}";
}

std::string secret::load(
        const std::string &service,
        const std::string &user)
{
#ifdef AUTHPX_KEYCHAIN_SUPPORT
    log().debug("Loading secret (service={}) ...", service);
    auto result = std::async(std::launch::async, [=]() {
        keychain::Error error;
        auto password = keychain::getPassword(
                KEYCHAIN_PACKAGE,
                service,
                user,
                error);

        if (error)
            throw std::runtime_error(error.message);
        return password;
    });

    if (result.wait_for(KEYCHAIN_TIMEOUT) == std::future_status::timeout) {
        log().warn("  ... Keychain timed out.");
        return {};
    }

    log().debug("  ...OK.");
    return result.get();
#else
    throw std::runtime_error("[secret::load] authpx was compiled with AUTHPX_KEYCHAIN_SUPPORT OFF.");
#endif
}

Config Config::fromNode(YAML::Node const& node)
{
    Config conf;
    if (!node || node.IsNull())
        return conf;

    if (auto headers = node["headers"]) {
        auto headersMap = headers.as<std::map<std::string, std::string>>();
        conf.headers.insert(headersMap.begin(), headersMap.end());
    }

    if (auto proxy = node["proxy"])
        conf.proxy = proxy.as<Config::Proxy>();

    if (auto timeout = node["timeout-secs"])
        conf.timeoutSecs = timeout.as<std::time_t>();

    if (auto sslStrict = node["ssl-strict"])
        conf.sslCertStrict = sslStrict.as<bool>();

    if (auto caCert = node["ca-cert"])
        conf.caCertPath = caCert.as<std::string>();

    return conf;
}

void Config::applyEnvironment()
{
    if (auto timeoutStr = std::getenv("HTTP_TIMEOUT")) {
        try {
            timeoutSecs = std::stoll(timeoutStr);
        }
        catch (std::exception& e) {
            log().warn("Could not parse value of HTTP_TIMEOUT.");
        }
    }
    if (auto sslStrictFlagStr = std::getenv("HTTP_SSL_STRICT"))
        sslCertStrict = parseFlag(sslStrictFlagStr);
}

void Config::apply(httplib::Client &cl) const
{
    cl.set_connection_timeout(timeoutSecs);
    cl.set_read_timeout(timeoutSecs);
    cl.set_write_timeout(timeoutSecs);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    cl.enable_server_certificate_verification(sslCertStrict);
    if (!caCertPath.empty())
        cl.set_ca_cert_path(caCertPath.c_str());
#endif

    // Proxy Settings
    if (proxy) {
        cl.set_proxy(proxy->host, proxy->port);

        auto password = proxy->password;
        if (!proxy->keychain.empty())
            password = secret::load(proxy->keychain, proxy->user);

        if (!proxy->user.empty())
            cl.set_proxy_basic_auth(proxy->user, password);
    }
}

std::string Config::toSafeString() const
{
    std::ostringstream out;
    out << "timeout=" << timeoutSecs << "s";
    out << ", ssl-strict=" << (sslCertStrict ? "yes" : "no");
    if (!caCertPath.empty())
        out << ", ca-cert=" << caCertPath;
    if (proxy) {
        out << ", proxy=" << proxy->host << ":" << proxy->port;
        if (!proxy->user.empty()) {
            out << " (user=" << proxy->user;
            if (!proxy->password.empty())
                out << ", password=***";
            else if (!proxy->keychain.empty())
                out << ", keychain=" << proxy->keychain;
            out << ")";
        }
    }
    if (!headers.empty())
        out << ", headers=" << redactHeaders(headers);
    return out.str();
}
