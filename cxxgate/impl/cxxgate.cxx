#include <cxxgate.hxx>

namespace cxxgate {
    void c_cxxgate::start(cxxgate_cfg_t cfg) {
        m_cfg = std::move(cfg);

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->init(
            m_cfg.m_logger.m_level,
            m_cfg.m_logger.m_force_flush,
            m_cfg.m_logger.m_async,
            m_cfg.m_logger.m_buffer_size,
            m_cfg.m_logger.m_strategy
        );
#endif // CXXGATE_USE_LOGGING_IMPL

        if (m_cfg.m_host.compare("localhost") == 0u)
            m_cfg.m_host = "127.0.0.1";

        auto port = 9000u;

        if (auto [ptr, ec] = std::from_chars(m_cfg.m_port.c_str(), m_cfg.m_port.c_str() + m_cfg.m_port.size(), port); ec != std::errc())
            port = 0;

        if (port <= 0 || port > 65535u) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Core] Port number '{}' is not supported, using '9000' instead", m_cfg.m_port);
#endif // CXXGATE_USE_LOGGING_IMPL

            port = 9000;

            m_cfg.m_port = "9000";
        }

        build();

        m_running.store(true, std::memory_order_release);

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[{}:{}] Starting server...", m_cfg.m_host, m_cfg.m_port);
#endif // CXXGATE_USE_LOGGING_IMPL

        try {
            m_server = std::make_shared<server::c_server>(*this, m_cfg.m_host, static_cast<std::uint16_t>(port));
        }
        catch (const boost::system::system_error& e) {
            m_running.store(false, std::memory_order_release);

            throw exceptions::server_exception_t(
                fmt::format("Failed to listen on {}:{}: {}", m_cfg.m_host, m_cfg.m_port, e.code().message())
            );
        }

        m_signals.emplace(m_server->io_ctx(), SIGINT, SIGTERM, SIGQUIT);

        m_signals->async_wait([&](const boost::system::error_code& err_code, [[maybe_unused]] std::int32_t signo) {
            if (!err_code)
                this->stop();
        });

        m_server->start(m_cfg.m_server.m_workers);
    }

    void c_cxxgate::stop() {
        if (!m_running)
            return;

        m_running.store(false, std::memory_order_release);

        {
            std::lock_guard lock(m_wait_mutex);
        }

        m_wait_cv.notify_all();

        if (m_signals.has_value()) {
            boost::system::error_code error_code{};

            m_signals->cancel(error_code);

            if (error_code) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[{}:{}] Failed to cancel signals: {}", m_cfg.m_host, m_cfg.m_port, error_code.message());
#endif // CXXGATE_USE_LOGGING_IMPL
            }
        }

        if (m_server) {
            m_server->stop();

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::info, "[{}:{}] Server stopped...", m_cfg.m_host, m_cfg.m_port);
#endif // CXXGATE_USE_LOGGING_IMPL
        }
    }

    void c_cxxgate::wait() {
#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::info,

            "[{}:{}] CXXGATE wait state initiated, thread blocked pending shutdown signal",

            m_cfg.m_host, m_cfg.m_port
        );
#endif // CXXGATE_USE_LOGGING_IMPL

        {
            std::unique_lock lock(m_wait_mutex);

            m_wait_cv.wait(lock, [this] {
                return !m_running.load(std::memory_order_acquire);
            });
        }

        m_server.reset();

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::info,

            "[{}:{}] CXXGATE wait state terminated, shutdown procedure complete",

            m_cfg.m_host, m_cfg.m_port
        );
#endif // CXXGATE_USE_LOGGING_IMPL
    }

    boost::asio::awaitable<http::response_t> c_cxxgate::_handle_request(http::request_t&& request) const {
        if (!m_middlewares_chain)
            throw base_exception_t("Request handled before the middleware chain was built");

        try {
            co_return co_await m_middlewares_chain(request);
        }
#ifdef CXXGATE_USE_LOGGING_IMPL
        catch (const boost::system::system_error& e) {
            g_logging->log(
                e_log_level::error,

                "[Core] Boost system error in handle request: code={}, category={}, message={}",

                e.code().value(), e.code().category().name(), e.what()
            );
        }
        catch (const std::exception& e) {
            g_logging->log(e_log_level::error, "[Core] Exception in handle request outer: {}", e.what());
        }
#else
        catch (const boost::system::system_error& e) {
            std::cerr << fmt::format(
                "[Core] Boost system error in handle request: code={}, category={}, message={}",

                e.code().value(), e.code().category().name(), e.what()
            ) << "\n";
        }
        catch (const std::exception& e) {
            std::cerr << fmt::format("[Core] Exception in handle request outer: {}", e.what()) << "\n";
        }
#endif // CXXGATE_USE_LOGGING_IMPL

        co_return internal_error();
    }

    http::response_t c_cxxgate::internal_error() const {
        if (m_cfg.m_http.m_response_class == http::e_response_class::plain) {
            return http::response_class_t<http::response_t>::make_response(
                std::string("Internal server error"),

                http::e_status::internal_server_error
            );
        }

        return http::error_response(
            "Internal Server Error",

            "An unexpected error occurred",

            http::e_status::internal_server_error
        );
    }

    void c_cxxgate::build() {
        chain_t core = [this](const http::request_t& req) -> boost::asio::awaitable<http::response_t> {
            auto opt_pair = m_route_trie.find(req.method(), req.path());

            if (!opt_pair.has_value()) {
                if (m_not_found_handler)
                    co_return m_not_found_handler(req);

                if (m_cfg.m_http.m_response_class == http::e_response_class::plain) {
                    co_return http::response_class_t<http::response_t>::make_response(
                        std::string("Not found"),

                        http::e_status::not_found
                    );
                }

                co_return http::response_class_t<http::json_response_t>::make_response(
                    http::json_t::json_obj_t{
                        {"message", "Not found"}
                    },

                    http::e_status::not_found
                );
            }

            auto [route, params] = std::move(opt_pair.value());

            if (!route)
                co_return internal_error();

            http::http_ctx_t ctx(req, params);

            if (route->is_async())
                co_return co_await route->handle_async(std::move(ctx));

            co_return route->handle(std::move(ctx));
        };

        auto chain = std::move(core);

        for (auto& middleware : std::ranges::reverse_view(m_middlewares)) {
            auto next_chain = std::move(chain);

            chain = [middleware, next_chain = std::move(next_chain)](const http::request_t& req)
                -> boost::asio::awaitable<http::response_t> {
                co_return co_await middleware->handle(req, next_chain);
            };
        }

        m_middlewares_chain = std::move(chain);
    }
}
