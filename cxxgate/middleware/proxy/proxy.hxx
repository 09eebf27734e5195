/**
 * @file proxy.hxx
 * @brief Transparent pass-through proxy for `/api` requests.
 */

#ifndef CXXGATE_MIDDLEWARE_PROXY_HXX
#define CXXGATE_MIDDLEWARE_PROXY_HXX

namespace cxxgate::middleware::proxy {
    /**
     * @brief Configuration options for the pass-through proxy.
     */
    struct proxy_options_t {
        /** @brief Backend base URL the path is appended to. */
        std::string m_backend_url{"http://localhost:8000"};

        /** @brief Path prefix that is proxied. */
        std::string m_prefix{"/api"};

        /** @brief Upper bound for one upstream exchange. */
        std::chrono::milliseconds m_timeout{std::chrono::seconds(30)};
    };

    /**
     * @brief Forwards every request under the prefix to the backend.
     *
     * Other requests continue down the chain. Each proxied request is recorded
     * in the request log.
     */
    class c_proxy_middleware : public c_base_middleware {
      public:
        /**
         * @brief Construct the proxy.
         * @param client Outbound transport.
         * @param log Request log.
         * @param options Backend and prefix.
         */
        c_proxy_middleware(dispatch::c_base_http_client& client, stats::c_request_log& log, proxy_options_t options = {});

      public:
        boost::asio::awaitable<http::response_t> handle(const http::request_t& request, next_t next) override;

        /**
         * @brief Headers sent to the backend for an inbound request.
         * @param request Inbound request.
         * @return Gateway headers, plus Authorization and every x-custom-* header.
         */
        static http::headers_t prepare_headers(const http::request_t& request);

        /**
         * @brief Whether an upstream response header is relayed to the caller.
         * @param name Header name.
         * @return False for content-encoding, content-length and transfer-encoding.
         */
        static bool is_forwarded_header(const std::string_view& name);

        [[nodiscard]] CXXGATE_INLINE const auto& options() const { return m_options; }

      private:
        /** @brief Outbound transport. */
        dispatch::c_base_http_client& m_client;

        /** @brief Request log. */
        stats::c_request_log& m_log;

        /** @brief Backend and prefix. */
        proxy_options_t m_options{};
    };
}

#endif // CXXGATE_MIDDLEWARE_PROXY_HXX
