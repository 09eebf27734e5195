#include <cxxgate.hxx>

namespace cxxgate::server {
    boost::asio::awaitable<void> client_t::start() {
        if (!m_server.running(std::memory_order_acquire))
            co_return;

        while (!m_close) {
            std::tuple<bool, std::size_t> catch_tuple{};

            try {
                if (!m_server.running(std::memory_order_relaxed))
                    break;

                boost::system::error_code error_code{};

                boost::beast::http::request_parser<boost::beast::http::string_body> parser{};

                parser.body_limit(m_cxxgate.cfg().m_server.m_max_request_size);

                co_await boost::beast::http::async_read(
                    m_socket,
                    m_buffer,

                    parser,

                    boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
                );

                if (error_code == boost::beast::http::error::end_of_stream
                    || error_code == boost::asio::error::eof
                    || error_code == boost::asio::error::connection_reset
                    || error_code == boost::asio::error::operation_aborted)
                    break;

                if (error_code == boost::beast::http::error::body_limit)
                    throw exceptions::client_exception_t(error_code.message(), 413u);

                if (error_code && error_code.category() == boost::beast::http::make_error_code(boost::beast::http::error::bad_target).category())
                    throw exceptions::client_exception_t(error_code.message(), 400u);

                if (error_code)
                    throw exceptions::client_exception_t(error_code.message(), 500u);

                auto parsed = parser.release();

                m_version = parsed.version();

                http::request_t req{};

                {
                    req.uri() = std::string(parsed.target());
                    req.method() = http::str_to_method(parsed.method_string());

                    for (auto& field : parsed)
                        req.headers().emplace(std::string(field.name_string()), std::string(field.value()));

                    req.body() = std::move(parsed.body());
                }

                {
                    auto remote_endpoint = m_socket.remote_endpoint();

                    req.client() = http::request_t::client_info_t(
                        remote_endpoint.address().to_string(),

                        remote_endpoint.port()
                    );
                }

                co_await handle_request(std::move(req));
            }
#ifdef CXXGATE_USE_LOGGING_IMPL
            catch (const exceptions::client_exception_t& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.message()
                );

                catch_tuple = std::make_tuple(true, e.status());
            }
            catch (const boost::system::system_error& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server-Client] Exception while handling client (id: {}): code={}, category={}, message={}",

                    m_socket.native_handle(), e.code().value(), e.code().category().name(), e.what()
                );

                break;
            }
            catch (const std::exception& e) {
                g_logging->log(
                    e_log_level::error,

                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.what()
                );

                catch_tuple = std::make_tuple(true, 500u);
            }
#else
            catch (const exceptions::client_exception_t& e) {
                std::cerr << fmt::format(
                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.message()
                ) << "\n";

                catch_tuple = std::make_tuple(true, e.status());
            }
            catch (const boost::system::system_error& e) {
                std::cerr << fmt::format(
                    "[Server-Client] Exception while handling client (id: {}): code={}, category={}, message={}",

                    m_socket.native_handle(), e.code().value(), e.code().category().name(), e.what()
                ) << "\n";

                break;
            }
            catch (const std::exception& e) {
                std::cerr << fmt::format(
                    "[Server-Client] Exception while handling client (id: {}): {}",

                    m_socket.native_handle(),

                    e.what()
                ) << "\n";

                catch_tuple = std::make_tuple(true, 500u);
            }
#endif // CXXGATE_USE_LOGGING_IMPL

            if (std::get<0u>(catch_tuple)) {
                boost::system::error_code error_code{};

                try {
                    co_await write_error(std::get<1u>(catch_tuple));
                }
                catch (const boost::system::system_error& e) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                    g_logging->log(e_log_level::debug, "[Server-Client] Failed to write error response: {}", e.code().message());
#endif // CXXGATE_USE_LOGGING_IMPL
                }

                m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, error_code);

                break;
            }
        }

        boost::system::error_code ignored_error_code{};

        m_socket.close(ignored_error_code);

        co_return;
    }

    boost::asio::awaitable<void> client_t::write_error(const std::size_t status) {
        boost::beast::http::response<boost::beast::http::string_body> response{};

        response.version(m_version);

        std::string_view message{};

        switch (status) {
            case 400u:
                {
                    response.result(boost::beast::http::status::bad_request);

                    message = "Bad request";

                    break;
                }

            case 413u:
                {
                    response.result(boost::beast::http::status::payload_too_large);

                    message = "Payload too large";

                    break;
                }

            default:
                {
                    response.result(boost::beast::http::status::internal_server_error);

                    message = "Internal server error";

                    break;
                }
        }

        if (m_cxxgate.cfg().m_http.m_response_class == http::e_response_class::plain) {
            response.set(boost::beast::http::field::content_type, "text/plain");

            response.body() = std::string(message);
        }
        else {
            response.set(boost::beast::http::field::content_type, "application/json");

            response.body() = http::json_t::serialize(
                http::json_t::json_obj_t{
                    {"success", false},
                    {"message", message}
                }
            );
        }

        response.keep_alive(false);

        response.prepare_payload();

        m_close = true;

        co_await boost::beast::http::async_write(m_socket, response, boost::asio::use_awaitable);
    }

    boost::asio::awaitable<void> client_t::handle_request(http::request_t&& req) {
        const auto keep_alive = req.keep_alive();

        auto response_data = co_await m_cxxgate._handle_request(std::move(req));

        boost::beast::http::response<boost::beast::http::string_body> response{};

        response.version(m_version);

        for (auto&& [key, value] : response_data.m_headers)
            response.insert(key, std::move(value));

        response.body() = std::move(response_data.m_body);

        response.result(static_cast<unsigned>(response_data.m_status));

        if (keep_alive) {
            response.keep_alive(true);

            response.set(boost::beast::http::field::keep_alive, fmt::format("timeout={}", m_cxxgate.cfg().m_http.m_keep_alive_timeout.count()));
        }
        else {
            response.keep_alive(false);

            m_close = true;
        }

        response.prepare_payload();

        co_await boost::beast::http::async_write(m_socket, response, boost::asio::use_awaitable);

        if (m_close) {
            boost::system::error_code ignored_error_code{};

            m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored_error_code);
        }
    }
}
