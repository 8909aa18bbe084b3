#include "bags/https_client.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace bags::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "bags/1.0";

HttpError makeError(const char* method, const std::string& host, const std::string& target,
                    const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS " << method << " https://" << host << target << " failed: " << message;
    return HttpError(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw HttpError("Redirect response missing Location header");
    }

    ParsedLocation result{};
    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw HttpError("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw HttpError("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? "/" : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw HttpError("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }
    return result;
}

std::string normalizeTarget(const std::string& target) {
    if (target.empty()) return "/";
    if (target.front() != '/') return "/" + target;
    return target;
}

bhttp::response<bhttp::string_body> performRequest(bhttp::verb verb, const std::string& host,
                                                   const std::string& target, const std::string& body,
                                                   const Headers& headers, int timeoutSec) {
    const char* method = verb == bhttp::verb::post ? "POST" : "GET";
    if (timeoutSec <= 0) {
        throw makeError(method, host, target, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::host_name_verification(host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(method, host, target, oss.str());
    }

    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(host, "443", ec);
    if (ec) {
        throw makeError(method, host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(method, host, target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(method, host, target, "TLS handshake error: " + ec.message());
    }

    bhttp::request<bhttp::string_body> req{verb, target, 11};
    req.set(bhttp::field::host, host);
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (verb == bhttp::verb::post) {
        req.body() = body;
        req.prepare_payload();
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(method, host, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(method, host, target, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    // Servers routinely drop the connection without close_notify; the response is already complete.
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated &&
        ec != beast::error::timeout) {
        throw makeError(method, host, target, "TLS shutdown error: " + ec.message());
    }

    return response;
}

Response toResponse(bhttp::response<bhttp::string_body>&& response, const std::string& host,
                    const std::string& target) {
    Response result;
    result.status = static_cast<unsigned>(response.result_int());
    result.body = std::move(response.body());
    result.final_host = host;
    result.final_target = target;
    return result;
}

} // namespace

Response get(const std::string& host, const std::string& target, const Headers& headers, int timeout_sec) {
    if (host.empty()) {
        throw HttpError("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = normalizeTarget(target);

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(bhttp::verb::get, currentHost, currentTarget, "", headers, timeout_sec);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto parsed = parseRedirectLocation(
                    std::string(response.base()[bhttp::field::location]), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const HttpError& redirectError) {
                throw makeError("GET", currentHost, currentTarget, redirectError.what());
            }
        }
        return toResponse(std::move(response), currentHost, currentTarget);
    }

    throw makeError("GET", currentHost, currentTarget, "Too many redirects");
}

Response post(const std::string& host, const std::string& target, const std::string& body,
              const Headers& headers, int timeout_sec) {
    if (host.empty()) {
        throw HttpError("HTTPS POST requires a non-empty host");
    }
    const std::string normalized = normalizeTarget(target);
    auto response = performRequest(bhttp::verb::post, host, normalized, body, headers, timeout_sec);
    return toResponse(std::move(response), host, normalized);
}

std::string urlEncode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out << static_cast<char>(c);
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

} // namespace bags::http
