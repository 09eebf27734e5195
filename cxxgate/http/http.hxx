/**
 * @file http.hxx
 * @brief Core HTTP types, status codes, methods, and utility functions for the cxxgate.
 */

#ifndef CXXGATE_HTTP_HXX
#define CXXGATE_HTTP_HXX

#include "utils/utils.hxx"

namespace cxxgate::http {
    /** @brief Type alias for HTTP URI. */
    using uri_t = std::string;

    /** @brief Type alias for HTTP message body. */
    using body_t = std::string;

    /** @brief Type alias for HTTP path. */
    using path_t = std::string;

    /** @brief Type alias for JSON payloads. */
    using json_t = shared::json_traits_t;

    /** @brief Type alias for HTTP headers (case-insensitive keys). */
    using headers_t = std::map<std::string, std::string, internal::ci_less_t>;

    /** @brief Type alias for HTTP query and path parameters (case-insensitive keys). */
    using params_t = std::map<std::string, std::string, internal::ci_less_t>;

    /**
     * @brief HTTP status codes used by the gateway.
     *
     * Upstream responses may carry any code; those are kept as plain integers
     * and cast to this type only when relayed.
     */
    enum struct e_status : std::int16_t {
        // 2xx Success
        ok = 200,         ///< The request was successful.
        created = 201,    ///< The resource was successfully created.
        accepted = 202,   ///< The request has been accepted for processing.
        no_content = 204, ///< The request was successful but there is no content to return.

        // 3xx Redirection
        moved_permanently = 301, ///< The resource has been permanently moved to a new URL.
        found = 302,             ///< The resource has been temporarily moved to a new URL.
        not_modified = 304,      ///< The resource has not been modified since the last request.

        // 4xx Client Error
        bad_request = 400,          ///< The request was malformed or invalid.
        unauthorized = 401,         ///< The client must authenticate to access the resource.
        forbidden = 403,            ///< The client does not have permission to access the resource.
        not_found = 404,            ///< The resource could not be found.
        method_not_allowed = 405,   ///< The request method is not allowed.
        request_timeout = 408,      ///< The client did not send a request in the time allowed.
        payload_too_large = 413,    ///< The request payload is too large to process.
        unprocessable_entity = 422, ///< The server understands the request but cannot process it.
        too_many_requests = 429,    ///< The client has sent too many requests in a given amount of time.

        // 5xx Server Error
        internal_server_error = 500, ///< The server encountered an internal error.
        not_implemented = 501,       ///< The server does not support the requested functionality.
        bad_gateway = 502,           ///< The server received an invalid response from an upstream server.
        service_unavailable = 503,   ///< The server is temporarily unavailable.
        gateway_timeout = 504        ///< The server did not receive a timely response from an upstream server.
    };

    /**
     * @brief HTTP request methods.
     */
    enum struct e_method : std::int16_t {
        get,     ///< GET method for retrieving resources
        head,    ///< HEAD method for retrieving headers only
        post,    ///< POST method for creating resources
        put,     ///< PUT method for updating resources
        delete_, ///< DELETE method for removing resources
        connect, ///< CONNECT method for establishing tunnels
        options, ///< OPTIONS method for describing communication options
        trace,   ///< TRACE method for diagnostic purposes
        patch,   ///< PATCH method for partial updates
        unknown  ///< Unknown or unsupported method
    };

    /**
     * @brief Convert HTTP method enum to string.
     * @param method HTTP method enum value.
     * @return String representation of the HTTP method.
     */
    CXXGATE_INLINE std::string method_to_str(const e_method& method) {
        switch (method) {
            case e_method::get:
                return "GET";
            case e_method::head:
                return "HEAD";
            case e_method::post:
                return "POST";
            case e_method::put:
                return "PUT";
            case e_method::delete_:
                return "DELETE";
            case e_method::connect:
                return "CONNECT";
            case e_method::options:
                return "OPTIONS";
            case e_method::trace:
                return "TRACE";
            case e_method::patch:
                return "PATCH";
            default:
                return "UNKNOWN";
        }
    }

    /**
     * @brief Convert HTTP method string to enum value.
     *
     * Matching is exact (upper case), as required on the wire. Template
     * configuration is normalized to upper case before calling this.
     *
     * @param method_str String representation of the HTTP method.
     * @return Corresponding HTTP method enum value.
     */
    CXXGATE_INLINE constexpr e_method str_to_method(const std::string_view& method_str) {
        switch (utils::fnv1a_hash(method_str)) {
            case utils::fnv1a_hash("GET"):
                return e_method::get;

            case utils::fnv1a_hash("HEAD"):
                return e_method::head;

            case utils::fnv1a_hash("POST"):
                return e_method::post;

            case utils::fnv1a_hash("PUT"):
                return e_method::put;

            case utils::fnv1a_hash("DELETE"):
                return e_method::delete_;

            case utils::fnv1a_hash("CONNECT"):
                return e_method::connect;

            case utils::fnv1a_hash("OPTIONS"):
                return e_method::options;

            case utils::fnv1a_hash("TRACE"):
                return e_method::trace;

            case utils::fnv1a_hash("PATCH"):
                return e_method::patch;

            default:
                return e_method::unknown;
        }
    }

    /**
     * @brief Current time as an ISO-8601 UTC string with millisecond precision.
     * @param tp Time point to format.
     * @return Formatted timestamp, e.g. 2025-01-31T10:00:00.123Z.
     */
    CXXGATE_INLINE std::string iso_timestamp(const std::chrono::system_clock::time_point& tp = std::chrono::system_clock::now()) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

        return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(std::chrono::system_clock::to_time_t(tp)), ms);
    }
}

#include "request/request.hxx"

#include "response/response.hxx"

#include "http_ctx/http_ctx.hxx"

#endif // CXXGATE_HTTP_HXX
