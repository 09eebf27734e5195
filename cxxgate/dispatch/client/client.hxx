/**
 * @file client.hxx
 * @brief Outbound HTTP transport used by the dispatcher and the pass-through proxy.
 */

#ifndef CXXGATE_DISPATCH_CLIENT_HXX
#define CXXGATE_DISPATCH_CLIENT_HXX

namespace cxxgate::dispatch {
    /**
     * @brief A fully built outbound request.
     */
    struct outbound_request_t {
        /** @brief HTTP method. */
        http::e_method m_method{http::e_method::get};

        /** @brief Absolute URL (http or https). */
        std::string m_url{};

        /** @brief Request headers. */
        http::headers_t m_headers{};

        /** @brief Request body, empty for none. */
        http::body_t m_body{};

        /** @brief Upper bound for the whole exchange. */
        std::chrono::milliseconds m_timeout{std::chrono::seconds(30)};
    };

    /**
     * @brief A received outbound response (any status code).
     */
    struct outbound_response_t {
        /** @brief Upstream status code. */
        std::int32_t m_status{};

        /** @brief Upstream headers; repeated fields are joined with ", ". */
        http::headers_t m_headers{};

        /** @brief Upstream body. */
        http::body_t m_body{};
    };

    /**
     * @brief Transport seam for outbound HTTP.
     *
     * Implementations resolve, connect, exchange and close. Any failure before a
     * complete response is read is reported as exceptions::transport_exception_t.
     */
    class c_base_http_client {
      public:
        /**
         * @brief Perform one HTTP exchange.
         * @param request Request to send.
         * @return The upstream response.
         * @throws exceptions::transport_exception_t on network, DNS, TLS or timeout failures.
         */
        virtual boost::asio::awaitable<outbound_response_t> send(outbound_request_t request) = 0;

        /**
         * @brief Virtual destructor.
         */
        virtual ~c_base_http_client() = default;
    };

    /**
     * @brief Boost.Beast implementation of the transport (plain TCP and TLS).
     */
    class c_http_client : public c_base_http_client {
      public:
        /**
         * @brief Construct the client.
         * @param verify_peer Verify upstream TLS certificates against the default store.
         * @param max_body_size Largest accepted response body in bytes.
         */
        explicit c_http_client(bool verify_peer = true, std::size_t max_body_size = 67108864u);

      public:
        boost::asio::awaitable<outbound_response_t> send(outbound_request_t request) override;

      private:
        /**
         * @brief Write the request and read the response over a connected stream.
         * @tparam _stream_t beast::tcp_stream or beast::ssl_stream<beast::tcp_stream>.
         * @param stream Connected stream.
         * @param request Beast request.
         * @param deadline Absolute deadline of the exchange.
         * @return The upstream response.
         */
        template <typename _stream_t>
        boost::asio::awaitable<outbound_response_t> exchange(
            _stream_t& stream,

            boost::beast::http::request<boost::beast::http::string_body>& request,

            const std::chrono::steady_clock::time_point& deadline
        );

      private:
        /** @brief TLS context shared by all https exchanges. */
        boost::asio::ssl::context m_ssl_ctx{boost::asio::ssl::context::tls_client};

        /** @brief Whether upstream certificates are verified. */
        bool m_verify_peer{true};

        /** @brief Largest accepted response body. */
        std::size_t m_max_body_size{};
    };
}

#endif // CXXGATE_DISPATCH_CLIENT_HXX
