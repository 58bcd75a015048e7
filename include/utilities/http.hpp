#pragma once
#ifndef QUICKSHARE_HTTP_HPP
#define QUICKSHARE_HTTP_HPP

#include <cstddef>
#include <string>
#include <unordered_map>

std::string trim(const std::string& str);

namespace HTTP {

// Status codes mapping
const std::unordered_map<int, std::string> statusCode = {
    {200, "OK"},
    {201, "Created"},
    {204, "No Content"},
    {400, "Bad Request"},
    {401, "Unauthorized"},
    {403, "Forbidden"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {409, "Conflict"},
    {410, "Gone"},
    {413, "Payload Too Large"},
    {500, "Internal Server Error"}
};

/// Largest request head (request line plus headers) a server accepts.
constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    OPTIONS,
    HEAD,
    PATCH,
    INVALID
};

HttpMethod StringToHttpMethod(const std::string& methodStr);
std::string HttpMethodToString(HttpMethod method);

struct HTTPREQUEST
{
    HttpMethod method = HttpMethod::INVALID;
    std::string uri;
    std::string path;   ///< uri without the query string, percent-decoded
    std::unordered_map<std::string, std::string> query;
    std::string protocol;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

struct HTTPRESPONSE
{
    std::string protocol = "HTTP/1.1";
    int statusCodeNumber = 0;
    std::string reasonPhrase;
    std::string contentType;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

/**
 * Parse a request head (request line and headers). Any bytes after the blank
 * line are copied into body unchanged, so binary payloads survive.
 */
HTTPREQUEST ParseHttpRequest(const std::string& requestStr);

/** Case-insensitive header lookup; empty string if absent. */
std::string FindHeader(const std::unordered_map<std::string, std::string>& headers,
                       const std::string& name);

/** Content-Length of a parsed head, 0 if absent. Throws std::invalid_argument if malformed. */
std::size_t ContentLength(const std::unordered_map<std::string, std::string>& headers);

std::string UrlDecode(const std::string& text);
std::string UrlEncode(const std::string& text);

/** Build a response with the canonical reason phrase for @p status. */
HTTPRESPONSE MakeResponse(int status, const std::string& contentType, std::string body);
std::string GenerateResponseString(const HTTPRESPONSE& response);
std::string GetMimeType(const std::string& filename);

std::string GenerateHttpRequestString(const HTTPREQUEST& request);
HTTPRESPONSE ParseHttpResponse(const std::string& responseStr);

} // namespace HTTP

#endif // QUICKSHARE_HTTP_HPP
