/**
 * @file gateway.hxx
 * @brief The gateway application: components, middlewares and management endpoints.
 */

#ifndef CXXGATE_GATEWAY_HXX
#define CXXGATE_GATEWAY_HXX

namespace cxxgate::gateway {
    /** @brief Version reported by the management endpoints. */
    inline constexpr std::string_view k_version = "1.0.0";

    /** @brief Service name reported by the health endpoint. */
    inline constexpr std::string_view k_service = "cxxgate";

    /**
     * @brief Owns every gateway component and installs them on the HTTP framework.
     *
     * Construction loads the request templates and the application manifest,
     * then registers the middlewares (CORS, authentication, rate limiting,
     * pass-through proxy) and the `/health` and `/gateway/...` routes.
     */
    class c_gateway {
      public:
        /**
         * @brief Build the gateway.
         * @param cfg Complete configuration.
         * @param client Outbound transport; a Beast client is created when null.
         * @throws exceptions::config_exception_t on an invalid domain pattern or rate limit.
         */
        explicit c_gateway(cxxgate_cfg_t cfg, std::shared_ptr<dispatch::c_base_http_client> client = nullptr);

        c_gateway(const c_gateway&) = delete;

        c_gateway& operator=(const c_gateway&) = delete;

      public:
        /**
         * @brief Start serving on the configured host and port.
         * @throws exceptions::server_exception_t if the server can't listen.
         */
        void start();

        /**
         * @brief Block until the server stops.
         */
        CXXGATE_INLINE void wait() { m_app.wait(); }

        /**
         * @brief Stop serving.
         */
        CXXGATE_INLINE void stop() { m_app.stop(); }

        /**
         * @brief Run a request through the middleware chain and routes in-process.
         * @param request Inbound request.
         * @return The response.
         */
        CXXGATE_INLINE boost::asio::awaitable<http::response_t> handle(http::request_t request) const {
            co_return co_await m_app._handle_request(std::move(request));
        }

      public:
        /**
         * @brief The 404 response listing the available endpoints.
         * @return JSON response with status 404.
         */
        static http::response_t not_found();

        /**
         * @brief HTTP status of an invocation result.
         * @param result Invocation result.
         * @return 200 on success, otherwise the status of the error kind.
         */
        static http::e_status status_of(const dispatch::invocation_result_t& result);

      public:
        [[nodiscard]] CXXGATE_INLINE const auto& cfg() const { return m_cfg; }

        CXXGATE_INLINE auto& domains() { return m_domains; }

        CXXGATE_INLINE auto& log() { return m_log; }

        [[nodiscard]] CXXGATE_INLINE const auto& store() const { return m_store; }

        [[nodiscard]] CXXGATE_INLINE const auto& permissions() const { return m_permissions; }

        [[nodiscard]] CXXGATE_INLINE const auto& validator() const { return m_validator; }

        CXXGATE_INLINE auto& dispatcher() { return m_dispatcher; }

        CXXGATE_INLINE auto& app() { return m_app; }

      private:
        /**
         * @brief Register the middlewares in chain order.
         */
        void install_middlewares();

        /**
         * @brief Register the management routes and the 404 handler.
         */
        void install_routes();

        /**
         * @brief `POST /gateway/invoke-template`.
         */
        boost::asio::awaitable<http::response_t> invoke_template(http::http_ctx_t&& ctx);

      private:
        /** @brief Configuration. */
        cxxgate_cfg_t m_cfg{};

        /** @brief Outbound transport. */
        std::shared_ptr<dispatch::c_base_http_client> m_client;

        /** @brief Origins, patterns, keys and registrations. */
        domains::c_domain_registry m_domains;

        /** @brief Request log. */
        stats::c_request_log m_log;

        /** @brief Request templates. */
        templates::c_template_store m_store{};

        /** @brief Manifest of the application. */
        templates::c_permission_registry m_permissions{};

        /** @brief Template validator. */
        templates::c_validator m_validator;

        /** @brief Template dispatcher. */
        dispatch::c_dispatcher m_dispatcher;

        /** @brief HTTP framework. */
        c_cxxgate m_app{};
    };
}

#endif // CXXGATE_GATEWAY_HXX
