#include "utilities/http.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

std::string trim(const std::string& str)
{
    const std::string whitespace = " \t\n\r";
    size_t start = str.find_first_not_of(whitespace);
    size_t end = str.find_last_not_of(whitespace);

    if (start == std::string::npos) // No non-whitespace characters found
        return "";

    return str.substr(start, end - start + 1);
}

namespace HTTP {

namespace {

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Splits "Name: value" lines up to the blank line; returns the offset of the
// first body byte (or npos if the head is not terminated).
std::size_t parseHeaderBlock(const std::string& text, std::size_t pos,
                             std::unordered_map<std::string, std::string>& headers)
{
    while (pos < text.size())
    {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string::npos)
            return std::string::npos;
        std::string line = text.substr(pos, eol - pos);
        pos = eol + 1;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            return pos;

        size_t delimiterPos = line.find(':');
        if (delimiterPos != std::string::npos)
        {
            std::string headerName = trim(line.substr(0, delimiterPos));
            std::string headerValue = trim(line.substr(delimiterPos + 1));
            headers[headerName] = headerValue;
        }
    }
    return std::string::npos;
}

} // namespace

HttpMethod StringToHttpMethod(const std::string& methodStr) {
    if (methodStr == "GET") return HttpMethod::GET;
    else if (methodStr == "POST") return HttpMethod::POST;
    else if (methodStr == "PUT") return HttpMethod::PUT;
    else if (methodStr == "DELETE") return HttpMethod::DELETE;
    else if (methodStr == "OPTIONS") return HttpMethod::OPTIONS;
    else if (methodStr == "HEAD") return HttpMethod::HEAD;
    else if (methodStr == "PATCH") return HttpMethod::PATCH;
    else return HttpMethod::INVALID;
}

std::string HttpMethodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::OPTIONS: return "OPTIONS";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::PATCH: return "PATCH";
        default: return "INVALID";
    }
}

std::string UrlDecode(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size())
        {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i] == '+' ? ' ' : text[i]);
    }
    return out;
}

std::string UrlEncode(const std::string& text)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

HTTPREQUEST ParseHttpRequest(const std::string& requestStr)
{
    HTTPREQUEST request;
    std::size_t eol = requestStr.find('\n');
    std::string requestLine = requestStr.substr(0, eol);

    // Remove trailing carriage return if present
    if (!requestLine.empty() && requestLine.back() == '\r')
    {
        requestLine.pop_back();
    }

    std::istringstream requestLineStream(requestLine);

    // Read the method, URI, and protocol from the request line
    std::string methodStr;
    requestLineStream >> methodStr >> request.uri >> request.protocol;
    request.method = StringToHttpMethod(methodStr);

    std::size_t q = request.uri.find('?');
    request.path = UrlDecode(request.uri.substr(0, q));
    if (q != std::string::npos)
    {
        std::istringstream queryStream(request.uri.substr(q + 1));
        std::string pair;
        while (std::getline(queryStream, pair, '&'))
        {
            if (pair.empty())
                continue;
            std::size_t eq = pair.find('=');
            std::string key = UrlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : UrlDecode(pair.substr(eq + 1));
            request.query[key] = value;
        }
    }

    if (eol == std::string::npos)
        return request;
    std::size_t bodyStart = parseHeaderBlock(requestStr, eol + 1, request.headers);
    if (bodyStart != std::string::npos)
        request.body = requestStr.substr(bodyStart);

    return request;
}

std::string FindHeader(const std::unordered_map<std::string, std::string>& headers,
                       const std::string& name)
{
    const std::string wanted = lower(name);
    for (const auto& header : headers)
    {
        if (lower(header.first) == wanted)
            return header.second;
    }
    return "";
}

std::size_t ContentLength(const std::unordered_map<std::string, std::string>& headers)
{
    std::string value = FindHeader(headers, "Content-Length");
    if (value.empty())
        return 0;
    if (!std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw std::invalid_argument("Malformed Content-Length: " + value);
    return static_cast<std::size_t>(std::stoull(value));
}

HTTPRESPONSE MakeResponse(int status, const std::string& contentType, std::string body)
{
    HTTPRESPONSE httpResponse;
    httpResponse.statusCodeNumber = status;
    auto it = statusCode.find(status);
    httpResponse.reasonPhrase = it != statusCode.end() ? it->second : "Unknown";
    httpResponse.contentType = contentType;
    httpResponse.body = std::move(body);
    return httpResponse;
}

std::string GenerateResponseString(const HTTPRESPONSE& response)
{
    std::ostringstream responseStream;
    responseStream << response.protocol << " " << response.statusCodeNumber << " " << response.reasonPhrase << "\r\n";
    if (!response.contentType.empty())
        responseStream << "Content-Type: " << response.contentType << "\r\n";
    for (const auto& header : response.headers)
    {
        responseStream << header.first << ": " << header.second << "\r\n";
    }
    responseStream << "Content-Length: " << response.body.size() << "\r\n";
    responseStream << "Connection: close\r\n";
    responseStream << "\r\n";
    responseStream << response.body;

    return responseStream.str();
}

std::string GetMimeType(const std::string& filename)
{
    std::size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos)
        return "application/octet-stream";
    std::string fileExtension = lower(filename.substr(dot + 1));
    if (fileExtension == "html" || fileExtension == "htm")
        return "text/html";
    else if (fileExtension == "txt")
        return "text/plain";
    else if (fileExtension == "css")
        return "text/css";
    else if (fileExtension == "js")
        return "application/javascript";
    else if (fileExtension == "json")
        return "application/json";
    else if (fileExtension == "pdf")
        return "application/pdf";
    else if (fileExtension == "zip")
        return "application/zip";
    else if (fileExtension == "jpg" || fileExtension == "jpeg")
        return "image/jpeg";
    else if (fileExtension == "png")
        return "image/png";
    else if (fileExtension == "gif")
        return "image/gif";
    else
        return "application/octet-stream";
}

std::string GenerateHttpRequestString(const HTTPREQUEST& request)
{
    std::ostringstream requestStream;

    // Start with the request line
    requestStream << HttpMethodToString(request.method) << " " << request.uri << " " << request.protocol << "\r\n";

    for (const auto& header : request.headers)
    {
        requestStream << header.first << ": " << header.second << "\r\n";
    }
    if (FindHeader(request.headers, "Content-Length").empty())
        requestStream << "Content-Length: " << request.body.size() << "\r\n";

    // End headers section
    requestStream << "\r\n";

    requestStream << request.body;

    return requestStream.str();
}

HTTPRESPONSE ParseHttpResponse(const std::string& responseStr)
{
    HTTPRESPONSE response;
    std::size_t eol = responseStr.find('\n');
    std::string statusLine = responseStr.substr(0, eol);

    // Remove trailing carriage return if present
    if (!statusLine.empty() && statusLine.back() == '\r')
    {
        statusLine.pop_back();
    }

    // Parse the status line
    std::istringstream statusLineStream(statusLine);
    statusLineStream >> response.protocol >> response.statusCodeNumber;
    std::getline(statusLineStream, response.reasonPhrase);
    response.reasonPhrase = trim(response.reasonPhrase);

    if (eol == std::string::npos)
        return response;
    std::size_t bodyStart = parseHeaderBlock(responseStr, eol + 1, response.headers);
    response.contentType = FindHeader(response.headers, "Content-Type");
    if (bodyStart == std::string::npos)
        return response;

    std::string body = responseStr.substr(bodyStart);
    std::string length = FindHeader(response.headers, "Content-Length");
    if (!length.empty())
    {
        std::size_t declared = ContentLength(response.headers);
        if (declared < body.size())
            body.resize(declared);
    }
    response.body = std::move(body);

    return response;
}

} // namespace HTTP
