/**
 * @file cors.hxx
 * @brief Dynamic CORS middleware for CXXGATE.
 *
 * Origins are checked against the domain registry on every request: configured
 * origins, runtime registered domains and wildcard domain patterns are allowed,
 * anything else is rejected with 403.
 */

#ifndef CXXGATE_MIDDLEWARE_CORS_HXX
#define CXXGATE_MIDDLEWARE_CORS_HXX

namespace cxxgate::middleware::cors {
    /**
     * @brief Configuration options for the CORS middleware.
     */
    struct cors_options_t {
        /** @brief Methods advertised to preflight requests. */
        std::vector<std::string> m_allowed_methods{"GET", "POST", "PUT", "DELETE", "OPTIONS"};

        /** @brief Headers advertised to preflight requests. */
        std::vector<std::string> m_allowed_headers{"Content-Type", "Authorization", "X-API-Key", "X-Client-Domain"};

        /** @brief List of headers exposed to the client. */
        std::vector<std::string> m_exposed_headers{};

        /** @brief Whether to allow credentials (cookies, authorization headers, etc.). */
        bool m_allow_credentials{true};

        /** @brief Maximum age (in seconds) for preflight requests, 0 to omit. */
        std::int32_t m_max_age{86400};

        /** @brief Status of a successful preflight response. */
        http::e_status m_preflight_status{http::e_status::ok};
    };

    /**
     * @brief CORS middleware backed by the domain registry.
     */
    class c_cors_middleware : public c_base_middleware {
      public:
        /**
         * @brief Constructs a CORS middleware instance.
         * @param registry Domain registry deciding which origins are allowed.
         * @param options Configuration options for the CORS middleware.
         */
        explicit c_cors_middleware(const domains::c_domain_registry& registry, cors_options_t options = cors_options_t{});

      public:
        /**
         * @brief Handles an incoming HTTP request.
         *
         * Rejects denied origins, answers preflight OPTIONS requests and adds
         * CORS headers to the responses of allowed origins.
         *
         * @param request The incoming HTTP request.
         * @param next The next middleware in the chain.
         * @return The HTTP response after processing.
         */
        boost::asio::awaitable<http::response_t> handle(const http::request_t& request, next_t next) override;

      private:
        /**
         * @brief Adds CORS headers to the response.
         * @param response The HTTP response to modify.
         * @param origin The origin of the request, empty when absent.
         */
        void add_cors_headers(http::response_t& response, const std::string& origin) const;

      private:
        /** @brief Source of the origin policy. */
        const domains::c_domain_registry& m_registry;

        /** @brief CORS configuration options. */
        cors_options_t m_options{};
    };
}

#endif // CXXGATE_MIDDLEWARE_CORS_HXX
