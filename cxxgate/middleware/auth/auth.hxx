/**
 * @file auth.hxx
 * @brief API-key authentication middleware for CXXGATE.
 */

#ifndef CXXGATE_MIDDLEWARE_AUTH_HXX
#define CXXGATE_MIDDLEWARE_AUTH_HXX

namespace cxxgate::middleware::auth {
    /**
     * @brief Authenticates requests by origin or API key.
     *
     * `/health` and `/gateway/...` are never authenticated. Configured and
     * pattern-matched origins pass without a key; every other caller must send a
     * valid `X-API-Key`. A new origin presenting a valid key is registered in the
     * domain registry, and the auth info is attached to the request passed down
     * the chain.
     */
    class c_auth_middleware : public c_base_middleware {
      public:
        /**
         * @brief Construct the middleware.
         * @param registry Domain registry holding keys and registrations.
         */
        explicit c_auth_middleware(domains::c_domain_registry& registry);

      public:
        boost::asio::awaitable<http::response_t> handle(const http::request_t& request, next_t next) override;

        /**
         * @brief Whether a path bypasses authentication.
         * @param path Request path without query.
         * @return True for `/health` and everything under `/gateway/`.
         */
        static bool is_public_path(const std::string_view& path);

      private:
        /**
         * @brief Build a 401 response.
         */
        static http::response_t unauthorized(const std::string_view& error, const std::string_view& message, const std::string& origin);

      private:
        /** @brief Keys and registrations. */
        domains::c_domain_registry& m_registry;
    };
}

#endif // CXXGATE_MIDDLEWARE_AUTH_HXX
