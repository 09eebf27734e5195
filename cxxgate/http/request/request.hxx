/**
 * @file request.hxx
 * @brief Defines the HTTP request abstraction used by CXXGATE.
 *
 * Encapsulates method, target, headers, body, client info and the
 * authentication info attached by the gateway middlewares.
 */

#ifndef CXXGATE_HTTP_REQUEST_HXX
#define CXXGATE_HTTP_REQUEST_HXX

namespace cxxgate::http {
    /**
     * @brief Authentication details attached to a request by the auth middleware.
     */
    struct auth_info_t {
        /** @brief API key presented by the caller. */
        std::string m_api_key{};

        /** @brief Origin of the caller (may be empty). */
        std::string m_origin{};

        /** @brief Value of the X-Client-Domain header (may be empty). */
        std::string m_client_domain{};

        /** @brief Application name the API key belongs to. */
        std::string m_app_name{};
    };

    /**
     * @brief Represents an inbound HTTP request in CXXGATE.
     *
     * Holds the method, the raw request target (path and query), headers,
     * body and client metadata. Designed to be used throughout the handling
     * pipeline: routing, middlewares and handlers.
     */
    struct request_t {
        /**
         * @brief Default constructor.
         */
        CXXGATE_INLINE request_t() = default;

      public:
        /**
         * @brief Determine whether the client requested a persistent connection.
         * @return true if the Connection header is missing or equals "keep-alive" (case-insensitive).
         */
        [[nodiscard]] CXXGATE_INLINE bool keep_alive() const {
            const auto it = m_headers.find("connection");

            if (it == m_headers.end())
                return true;

            return boost::iequals(it->second, "keep-alive");
        }

        /**
         * @brief Look up a header value.
         * @param name Header name (case-insensitive).
         * @return The value, or nullopt if the header is absent.
         */
        [[nodiscard]] CXXGATE_INLINE std::optional<std::string> header(const std::string_view& name) const {
            const auto it = m_headers.find(name);

            if (it == m_headers.end())
                return std::nullopt;

            return it->second;
        }

        /**
         * @brief Path component of the request target, without the query.
         * @return Percent-decoded path, "/" for an empty or unparsable target.
         */
        [[nodiscard]] CXXGATE_INLINE std::string path() const {
            auto parsed = boost::urls::parse_origin_form(m_uri);

            if (!parsed) {
                const auto query_pos = m_uri.find('?');

                return query_pos == uri_t::npos ? m_uri : m_uri.substr(0u, query_pos);
            }

            auto path = std::string(parsed->path());

            return path.empty() ? "/" : path;
        }

        /**
         * @brief Raw query string of the request target.
         * @return Encoded query without '?', empty when absent.
         */
        [[nodiscard]] CXXGATE_INLINE std::string raw_query() const {
            const auto query_pos = m_uri.find('?');

            return query_pos == uri_t::npos ? std::string{} : m_uri.substr(query_pos + 1u);
        }

        /**
         * @brief Decoded query parameters of the request target.
         * @return Map of parameters; the first occurrence of a repeated key wins.
         */
        [[nodiscard]] CXXGATE_INLINE std::map<std::string, std::string, internal::ci_less_t> query() const {
            std::map<std::string, std::string, internal::ci_less_t> out{};

            auto parsed = boost::urls::parse_origin_form(m_uri);

            if (!parsed)
                return out;

            for (const auto& param : parsed->params())
                out.emplace(param.key, param.has_value ? param.value : std::string{});

            return out;
        }

      public:
        /**
         * @brief Holds information about the client making the HTTP request.
         */
        struct client_info_t {
            /**
             * @brief Default constructor.
             */
            CXXGATE_INLINE client_info_t() = default;

            /**
             * @brief Constructs a client info object with a specified remote address.
             * @param remote_addr The client's remote address.
             * @param remote_port The client's remote port.
             */
            CXXGATE_INLINE client_info_t(
                const std::string_view& remote_addr,
                const std::uint16_t& remote_port
            )
                : m_remote_addr(remote_addr),
                  m_remote_port(remote_port) {
            }

          public:
            /**
             * @brief Get the remote address (mutable).
             * @return Reference to the string.
             */
            CXXGATE_INLINE auto& remote_addr() { return m_remote_addr; }

            /**
             * @brief Get the remote address (read-only).
             * @return Const reference to the string.
             */
            [[nodiscard]] CXXGATE_INLINE const auto& remote_addr() const { return m_remote_addr; }

            /**
             * @brief Get the remote port (read-only).
             * @return Const reference to the uint16.
             */
            [[nodiscard]] CXXGATE_INLINE const auto& remote_port() const { return m_remote_port; }

          private:
            /** @brief The client's remote address. */
            std::string m_remote_addr{};

            /** @brief The client's remote port. */
            std::uint16_t m_remote_port{};
        };

      public:
        /**
         * @brief Get the HTTP method (mutable).
         * @return Reference to the method enum.
         */
        CXXGATE_INLINE auto& method() { return m_method; }

        /**
         * @brief Get the HTTP method (read-only).
         * @return Const reference to the method enum.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& method() const { return m_method; }

        /**
         * @brief Get the request target (mutable).
         * @return Reference to the uri string.
         */
        CXXGATE_INLINE auto& uri() { return m_uri; }

        /**
         * @brief Get the request target (read-only).
         * @return Const reference to the uri string.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& uri() const { return m_uri; }

        /**
         * @brief Get the message body (mutable).
         * @return Reference to the body.
         */
        CXXGATE_INLINE auto& body() { return m_body; }

        /**
         * @brief Get the message body (read-only).
         * @return Const reference to the body.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& body() const { return m_body; }

        /**
         * @brief Get the header map (mutable).
         * @return Reference to the headers container.
         */
        CXXGATE_INLINE auto& headers() { return m_headers; }

        /**
         * @brief Get the header map (read-only).
         * @return Const reference to the headers container.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& headers() const { return m_headers; }

        /**
         * @brief Access the client info (mutable).
         * @return Reference to the client info struct.
         */
        CXXGATE_INLINE auto& client() { return m_client_info; }

        /**
         * @brief Access the client info (read-only).
         * @return Const reference to the client info struct.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& client() const { return m_client_info; }

        /**
         * @brief Access the authentication info (mutable).
         * @return Reference to the optional auth info.
         */
        CXXGATE_INLINE auto& auth() { return m_auth; }

        /**
         * @brief Access the authentication info (read-only).
         * @return Const reference to the optional auth info.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& auth() const { return m_auth; }

      private:
        /** @brief HTTP method. */
        e_method m_method{};

        /** @brief Request target (origin form: path and optional query). */
        uri_t m_uri{};

        /** @brief Request body. */
        body_t m_body{};

        /** @brief HTTP headers. */
        headers_t m_headers{};

        /** @brief Client information. */
        client_info_t m_client_info{};

        /** @brief Set once the request passed API-key authentication. */
        std::optional<auth_info_t> m_auth{};
    };
}

#endif // CXXGATE_HTTP_REQUEST_HXX
