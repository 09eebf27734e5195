/**
 * @file cxxgate.hxx
 * @brief Main public API and configuration structures for the cxxgate.
 */

#ifndef CXXGATE_HXX
#define CXXGATE_HXX

#include "shared/shared.hxx"

/**
 * @namespace cxxgate
 * @brief Main namespace for the CXXGATE.
 */
namespace cxxgate {
#ifdef CXXGATE_USE_LOGGING_IMPL
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Global logger instance for cxxgate. */
    inline const auto g_logging = std::make_unique<shared::c_logging>();
#endif // CXXGATE_USE_LOGGING_IMPL
}

#include "exception/exception.hxx"

#include "http/http.hxx"

#include "route/route.hxx"

#include "middleware/middleware.hxx"

#include "server/server.hxx"

#include "config/config.hxx"

namespace cxxgate {
    /**
     * @brief Configuration parameters for the cxxgate.
     */
    struct cxxgate_cfg_t {
        /** @brief Hostname or IP address to listen on. (default: localhost) */
        std::string m_host{"localhost"};

        /** @brief Port number to listen on. (default: 9000) */
        std::string m_port{"9000"};

        /**
         * @brief Server-specific configuration parameters.
         */
        struct {
            /** @brief Number of worker threads for the server. (default: 4) */
            std::int32_t m_workers{4};

            /** @brief Maximum number of pending connections. (default: 2048) */
            std::int32_t m_max_connections{2048};

            /** @brief Maximum request size in bytes. (default: 10 MB) */
            std::size_t m_max_request_size{10485760u};

            /** @brief Put the acceptor in non-blocking mode. (default: true) */
            bool m_acceptor_nonblocking{true};
        } m_server{};

        /**
         * @brief HTTP-specific configuration parameters.
         */
        struct http_t {
            /** @brief Response class to use for internal HTTP responses. (default: json) */
            http::e_response_class m_response_class{http::e_response_class::json};

            /** @brief Keep-alive timeout in seconds. (default: 30 seconds) */
            std::chrono::seconds m_keep_alive_timeout{std::chrono::seconds(30)};
        } m_http{};

        /**
         * @brief Socket-specific configuration parameters.
         */
        struct {
            /** @brief Enable or disable TCP_NODELAY option. (default: true) */
            bool m_tcp_no_delay{true};

            /** @brief Receive buffer size. (default: 512 KB) */
            std::size_t m_rcv_buf_size{524288u};

            /** @brief Send buffer size. (default: 512 KB) */
            std::size_t m_snd_buf_size{524288u};
        } m_socket{};

#ifdef CXXGATE_HAS_LOGGING_IMPL
        /**
         * @brief Configuration for the internal CXXGATE logger.
         */
        struct logger_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Whether to flush output immediately after each message. (default: false) */
            bool m_force_flush{false};

            /** @brief Enable asynchronous logging. (default: true) */
            bool m_async{true};

            /** @brief Size of the internal log buffer. (default: 16384) */
            std::size_t m_buffer_size{16384u};

            /** @brief Strategy for handling buffer overflows. (default: discard_oldest) */
            c_logging::e_overflow_strategy m_strategy{c_logging::e_overflow_strategy::discard_oldest};
        };

        /** @brief Logger configuration for CXXGATE. */
        logger_t m_logger{};
#endif // CXXGATE_HAS_LOGGING_IMPL

        /** @brief Gateway configuration. */
        config::gateway_cfg_t m_gateway{};
    };

    /**
     * @brief HTTP framework hosting the gateway.
     *
     * Owns the server, the route trie and the middleware chain.
     */
    class c_cxxgate {
      public:
        /** @brief Handler producing the response for requests no route matched. */
        using not_found_handler_t = std::function<http::response_t(const http::request_t&)>;

        /** @brief Compiled middleware chain. */
        using chain_t = std::function<boost::asio::awaitable<http::response_t>(const http::request_t&)>;

      public:
        /**
         * @brief Default constructor. Initializes configuration and running state.
         */
        CXXGATE_INLINE c_cxxgate() : m_cfg(), m_running(false) {}

      public:
        /**
         * @brief Starts the server with the given configuration.
         * @param cfg Configuration settings.
         * @throws exceptions::server_exception_t if the server can't listen.
         */
        void start(cxxgate_cfg_t cfg);

        /**
         * @brief Stops the server.
         */
        void stop();

        /**
         * @brief Waits for the server to finish.
         * @note This function blocks until the server is stopped.
         */
        void wait();

        /**
         * @brief Compile the middleware chain without starting the server.
         *
         * Called by start(); lets requests be handled in-process.
         */
        void build();

      public:
        /**
         * @brief Adds a new route handler for a specific HTTP method and path.
         * @tparam _fn_t Type of the handler function
         * @param method HTTP method to handle
         * @param path URL path pattern to match
         * @param fn Handler function to add
         * @throws base_exception_t on malformed or duplicate routes.
         */
        template <typename _fn_t>
        CXXGATE_INLINE void add_method(
            const http::e_method& method,
            const http::path_t& path,
            _fn_t&& fn
        ) {
            auto new_route = std::make_shared<route::fn_route_t<std::decay_t<_fn_t>>>(method, path, std::forward<_fn_t>(fn));

            if (!m_route_trie.insert(method, path, new_route))
                throw base_exception_t(fmt::format("Failed to insert route: {} {}", http::method_to_str(method), path));

            m_routes.push_back(std::move(new_route));
        }

        /**
         * @brief Adds a middleware to the processing chain.
         * @param middleware Middleware instance to add
         */
        CXXGATE_INLINE void add_middleware(middleware::middleware_t middleware) {
            if (m_running.load(std::memory_order_acquire))
                throw base_exception_t("Can't add middleware after server started");

            m_middlewares.push_back(std::move(middleware));
        }

        /**
         * @brief Replace the default 404 response.
         * @param handler Handler for unmatched requests.
         */
        CXXGATE_INLINE void set_not_found_handler(not_found_handler_t handler) { m_not_found_handler = std::move(handler); }

      public:
        /**
         * @brief Internal request handler for processing HTTP requests.
         * @param request HTTP request to handle
         * @return Awaitable that resolves to an HTTP response
         */
        boost::asio::awaitable<http::response_t> _handle_request(http::request_t&& request) const;

      public:
        /**
         * @brief Get a reference to the configuration.
         * @return Reference to the configuration structure.
         */
        CXXGATE_INLINE auto& cfg() { return m_cfg; }

        /**
         * @brief Get the configuration (read-only).
         * @return Const reference to the configuration structure.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& cfg() const { return m_cfg; }

        /**
         * @brief Get the running state of the API.
         * @return Const reference to the running state flag.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& running() const { return m_running; }

        /**
         * @brief Registered routes, in registration order.
         * @return Const reference to the routes.
         */
        [[nodiscard]] CXXGATE_INLINE const auto& routes() const { return m_routes; }

      private:
        /**
         * @brief Build the internal error response in the configured response class.
         */
        http::response_t internal_error() const;

      private:
        /** @brief Configuration parameters. */
        cxxgate_cfg_t m_cfg{};

        /** @brief Atomic flag indicating whether the server is running. */
        std::atomic_bool m_running{};

        /** @brief Guards the wait condition. */
        std::mutex m_wait_mutex{};

        /** @brief Signalled by stop(). */
        std::condition_variable m_wait_cv{};

        /** @brief Server instance. */
        std::shared_ptr<server::c_server> m_server;

        /** @brief Trie for routes. */
        route::internal::trie_node_t<std::shared_ptr<route::route_t>> m_route_trie;

        /** @brief Routes in registration order. */
        std::vector<std::shared_ptr<route::route_t>> m_routes;

        /** @brief Middleware instances. */
        std::vector<middleware::middleware_t> m_middlewares;

        /** @brief Compiled middleware chain. */
        chain_t m_middlewares_chain;

        /** @brief Response for unmatched requests. */
        not_found_handler_t m_not_found_handler;

        /** @brief Signal set for handling termination signals. */
        std::optional<boost::asio::signal_set> m_signals;
    };
}

#include "config/loader/loader.hxx"

#include "domains/domains.hxx"

#include "stats/stats.hxx"

#include "templates/templates.hxx"

#include "dispatch/dispatch.hxx"

#include "middleware/cors/cors.hxx"

#include "middleware/auth/auth.hxx"

#include "middleware/rate_limit/rate_limit.hxx"

#include "middleware/proxy/proxy.hxx"

#include "gateway/gateway.hxx"

#include "sdk/sdk.hxx"

#endif // CXXGATE_HXX
