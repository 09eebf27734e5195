/**
 * @file response.hxx
 * @brief HTTP response abstractions.
 */

#ifndef CXXGATE_HTTP_RESPONSE_HXX
#define CXXGATE_HTTP_RESPONSE_HXX

namespace cxxgate::http {
    /**
     * @brief Represents a generic HTTP response, including status, headers and body.
     */
    struct response_t {
        /**
         * @brief Default constructor.
         */
        CXXGATE_INLINE response_t() = default;

        /**
         * @brief Virtual destructor.
         */
        CXXGATE_INLINE virtual ~response_t() = default;

        /**
         * @brief Construct a plain-text response.
         * @param body The response body as a string.
         * @param status_code The HTTP status code to send (default is 200 OK).
         * @param headers Additional headers to include.
         */
        CXXGATE_INLINE response_t(std::string&& body, e_status&& status_code = e_status::ok, headers_t&& headers = {}) {
            m_body = std::move(body);

            {
                if (!headers.empty()) {
                    for (auto& header : headers)
                        m_headers[header.first] = std::move(header.second);
                }

                m_headers.emplace("Content-Type", "text/plain");
            }

            m_status = std::move(status_code);
        }

      public:
        /**
         * @brief Get the body (mutable).
         * @return Reference to the body.
         */
        CXXGATE_INLINE auto& body() { return m_body; }

        /**
         * @brief Get the headers (mutable).
         * @return Reference to the headers container.
         */
        CXXGATE_INLINE auto& headers() { return m_headers; }

        /**
         * @brief Get the status (mutable).
         * @return Reference to the status enum.
         */
        CXXGATE_INLINE auto& status() { return m_status; }

      public:
        /** @brief Body. */
        body_t m_body{};

        /** @brief Headers. */
        headers_t m_headers{};

        /** @brief Status code. Upstream codes outside the enum are stored as-is. */
        e_status m_status{e_status::ok};
    };

    /**
     * @brief A JSON response, serializing a JSON value to the body.
     *
     * Sets "Content-Type: application/json".
     */
    struct json_response_t : public response_t {
        /**
         * @brief Default constructor.
         */
        CXXGATE_INLINE json_response_t() = default;

        /**
         * @brief Construct a JSON response from a JSON value.
         * @param body The JSON value to serialize.
         * @param status_code The HTTP status code (default is 200 OK).
         * @param headers Additional headers to include.
         */
        CXXGATE_INLINE json_response_t(const json_t::json_obj_t& body, e_status&& status_code = e_status::ok, headers_t&& headers = {}) {
            m_body = json_t::serialize(body);

            {
                if (!headers.empty()) {
                    for (auto& header : headers)
                        m_headers[header.first] = std::move(header.second);
                }

                m_headers.emplace("Content-Type", "application/json");
            }

            m_status = std::move(status_code);
        }
    };

    /**
     * @brief Build the gateway's standard JSON error body.
     * @param error Short error title, e.g. "Invalid API Key".
     * @param message Human-readable description.
     * @param status_code HTTP status of the response.
     * @return JSON response carrying {error, message, timestamp}.
     */
    CXXGATE_INLINE json_response_t error_response(
        const std::string_view& error,
        const std::string_view& message,

        e_status&& status_code
    ) {
        json_t::json_obj_t body = {
            {"error", std::string(error)},
            {"message", std::string(message)},
            {"timestamp", iso_timestamp()}
        };

        return json_response_t(body, std::move(status_code));
    }

    /**
     * @enum e_response_class
     * @brief Enumerates the supported built-in response types.
     */
    enum struct e_response_class : std::uint8_t {
        plain, ///< A plain text response (e.g., text/plain).
        json   ///< A JSON-formatted response (e.g., application/json).
    };

    /**
     * @brief A factory wrapper for generating typed responses.
     * @tparam _class_t The response class type to instantiate.
     *
     * Must be either `response_t` or `json_response_t`.
     */
    template <typename _class_t = response_t>
    struct response_class_t {
        static_assert(std::is_base_of_v<response_t, _class_t>, "Class must inherit from response_t");

        static_assert(std::is_same_v<response_t, std::decay_t<_class_t>>
            || std::is_same_v<json_response_t, std::decay_t<_class_t>>, "Class must be response_t or json_response_t");

      public:
        /**
         * @brief Construct a response of the specified type.
         * @tparam _body_t The type of the response body.
         * @param body The content to be sent as the response body.
         * @param status_code HTTP status code (default is 200 OK).
         * @param headers Optional additional HTTP headers.
         * @return An instance of the specified response type.
         */
        template <typename _body_t>
        CXXGATE_INLINE static _class_t make_response(
            _body_t&& body,

            e_status&& status_code = e_status::ok,

            headers_t&& headers = {}
        ) {
            return _class_t(
                std::forward<_body_t>(body),

                std::move(status_code),

                std::move(headers)
            );
        }
    };
}

#endif // CXXGATE_HTTP_RESPONSE_HXX
