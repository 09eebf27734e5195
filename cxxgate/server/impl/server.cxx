#include <cxxgate.hxx>

namespace cxxgate::server {
    c_server::c_server(c_cxxgate& gate, const std::string& host, const std::int32_t port)
        : m_cxxgate(gate),
          m_acceptor(m_io_ctx) {
        const auto endpoint = boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(host), static_cast<std::uint16_t>(port));

        m_acceptor.open(endpoint.protocol());

        boost::system::error_code error_code{};

        const auto& cfg = m_cxxgate.cfg();

        {
            m_acceptor.non_blocking(cfg.m_server.m_acceptor_nonblocking, error_code);

            if (error_code) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Server] Failed to set acceptor nonblocking option: {}", error_code.message());
#endif // CXXGATE_USE_LOGGING_IMPL

                error_code = {};
            }
        }

        {
            m_acceptor.set_option(boost::asio::socket_base::reuse_address(true), error_code);

            if (error_code) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Server] Failed to set REUSEADDR option: {}", error_code.message());
#endif // CXXGATE_USE_LOGGING_IMPL

                error_code = {};
            }
        }

        m_acceptor.bind(endpoint);

        {
            m_acceptor.listen(cfg.m_server.m_max_connections, error_code);

            if (error_code)
                throw exceptions::server_exception_t(fmt::format("Failed to listen: {}", error_code.message()));
        }

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::debug, "[Server] Acceptor max connections: {}", cfg.m_server.m_max_connections);
#endif // CXXGATE_USE_LOGGING_IMPL
    }

    void c_server::start(const std::int32_t workers_count) {
        m_running.store(true, std::memory_order_release);

        const auto workers = workers_count <= 0
                               ? std::max(1, static_cast<std::int32_t>(std::thread::hardware_concurrency()))
                               : workers_count;

        if (workers_count <= 0) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Server] Overriding workers count to {} based on hardware concurrency", workers);
#endif // CXXGATE_USE_LOGGING_IMPL
        }

        try {
            boost::asio::co_spawn(m_io_ctx, do_accept(), boost::asio::detached);

            m_thread_pool = std::make_unique<boost::asio::thread_pool>(workers);

            for (std::int32_t i{}; i < workers; i++) {
                boost::asio::post(*m_thread_pool, [this] {
                    try {
                        m_io_ctx.run();
                    }
#ifdef CXXGATE_USE_LOGGING_IMPL
                    catch (const boost::system::system_error& e) {
                        g_logging->log(
                            e_log_level::error,

                            "[Server] Boost system error in worker thread: code={}, category={}, message={}",

                            e.code().value(), e.code().category().name(), e.what()
                        );
                    }
                    catch (const std::exception& e) {
                        g_logging->log(e_log_level::error, "[Server] Exception in worker thread: {}", e.what());
                    }
#else
                    catch (const boost::system::system_error& e) {
                        std::cerr << fmt::format(
                            "[Server] Boost system error in worker thread: code={}, category={}, message={}",

                            e.code().value(), e.code().category().name(), e.what()
                        ) << "\n";
                    }
                    catch (const std::exception& e) {
                        std::cerr << fmt::format("[Server] Exception in worker thread: {}", e.what()) << "\n";
                    }
#endif // CXXGATE_USE_LOGGING_IMPL
                });
            }

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Server] Spawned {} worker threads", workers);
#endif // CXXGATE_USE_LOGGING_IMPL
        }
        catch (const boost::system::system_error& e) {
            throw exceptions::server_exception_t(
                fmt::format(
                    "Boost system error during server start: code={}, category={}, message={}",

                    e.code().value(), e.code().category().name(), e.what()
                )
            );
        }
    }

    void c_server::stop() {
        if (!m_running.load(std::memory_order_acquire))
            return;

        m_running.store(false, std::memory_order_release);

        if (m_acceptor.is_open()) {
            boost::system::error_code error_code{};

            m_acceptor.cancel(error_code);

            if (error_code) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[Server] Failed to cancel acceptor: {}", error_code.message());
#endif // CXXGATE_USE_LOGGING_IMPL

                error_code = {};
            }

            m_acceptor.close(error_code);

            if (error_code) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[Server] Failed to close acceptor: {}", error_code.message());
#endif // CXXGATE_USE_LOGGING_IMPL
            }
        }

        m_io_ctx.stop();

        if (m_thread_pool && !m_io_ctx.get_executor().running_in_this_thread()) {
            m_thread_pool->stop();
            m_thread_pool->join();

            m_thread_pool.reset();
        }
    }

    boost::asio::awaitable<void> c_server::do_accept() {
        const auto executor = co_await boost::asio::this_coro::executor;

        while (m_running.load(std::memory_order_relaxed)) {
            try {
                boost::system::error_code error_code{};

                boost::asio::ip::tcp::socket socket(m_io_ctx);

                co_await m_acceptor.async_accept(socket, boost::asio::redirect_error(boost::asio::use_awaitable, error_code));

                if (error_code) {
                    if (error_code == boost::asio::error::operation_aborted)
                        co_return;

                    continue;
                }

                {
                    const auto& cfg = m_cxxgate.cfg();

                    if (cfg.m_socket.m_tcp_no_delay)
                        socket.set_option(boost::asio::ip::tcp::no_delay(true), error_code);

                    if (!error_code && cfg.m_socket.m_rcv_buf_size)
                        socket.set_option(boost::asio::socket_base::receive_buffer_size(static_cast<std::int32_t>(cfg.m_socket.m_rcv_buf_size)), error_code);

                    if (!error_code && cfg.m_socket.m_snd_buf_size)
                        socket.set_option(boost::asio::socket_base::send_buffer_size(static_cast<std::int32_t>(cfg.m_socket.m_snd_buf_size)), error_code);

                    if (error_code) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                        g_logging->log(e_log_level::error, "[Server] Failed to set socket option: {}", error_code.message());
#endif // CXXGATE_USE_LOGGING_IMPL

                        boost::system::error_code close_ec{};

                        socket.close(close_ec);

                        continue;
                    }
                }

                boost::asio::co_spawn(
                    executor,

                    [self = shared_from_this(), sock = std::move(socket)]() mutable -> boost::asio::awaitable<void> {
                        co_await client_t(std::move(sock), self->m_cxxgate, *self).start();
                    },

                    boost::asio::detached
                );
            }
#ifdef CXXGATE_USE_LOGGING_IMPL
            catch (const boost::system::system_error& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server] Boost system error in acceptor: code={}, category={}, message={}",

                    e.code().value(), e.code().category().name(), e.what()
                );
            }
            catch (const std::exception& e) {
                g_logging->log(e_log_level::error, "[Server] Exception in acceptor: {}", e.what());
            }
#else
            catch (const boost::system::system_error& e) {
                std::cerr << fmt::format(
                    "[Server] Boost system error in acceptor: code={}, category={}, message={}",

                    e.code().value(), e.code().category().name(), e.what()
                ) << "\n";
            }
            catch (const std::exception& e) {
                std::cerr << fmt::format("[Server] Exception in acceptor: {}", e.what()) << "\n";
            }
#endif // CXXGATE_USE_LOGGING_IMPL
        }

        co_return;
    }
}
