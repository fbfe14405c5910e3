// vidstream/include/vidstream/http/HttpEnums.h
#ifndef VIDSTREAM_HTTP_HTTPENUMS_H
#define VIDSTREAM_HTTP_HTTPENUMS_H

namespace Vidstream {
namespace Http {

// HTTP Method enum
enum class HttpMethod {
    GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS, UNKNOWN
};

// HTTP Status Codes
enum class HttpStatus {
    OK = 200,
    PARTIAL_CONTENT = 206,
    NOT_FOUND = 404,
    RANGE_NOT_SATISFIABLE = 416,
    INTERNAL_SERVER_ERROR = 500
};

// Utility function to get string representation of HttpMethod
inline const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        case HttpMethod::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Reason phrase for the status line
inline const char* http_status_to_string(HttpStatus status) {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::PARTIAL_CONTENT: return "Partial Content";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::RANGE_NOT_SATISFIABLE: return "Range Not Satisfiable";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
    }
    return "Internal Server Error"; // Default for unknown codes
}

} // namespace Http
} // namespace Vidstream

#endif // VIDSTREAM_HTTP_HTTPENUMS_H
