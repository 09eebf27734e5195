#include <cxxgate.hxx>

namespace cxxgate::dispatch {
    namespace {
        /**
         * @brief Copy a Beast string view into a std::string.
         */
        template <typename _view_t>
        CXXGATE_INLINE std::string to_string(const _view_t& view) {
            return std::string(view.data(), view.size());
        }

        /**
         * @brief Turn an error code from an outbound step into a transport exception.
         */
        [[noreturn]] void throw_transport(
            const std::string_view& step,

            const boost::system::error_code& error_code,

            const std::string& url,
            const std::chrono::milliseconds& timeout
        ) {
            if (error_code == boost::beast::error::timeout || error_code == boost::asio::error::operation_aborted)
                throw exceptions::transport_exception_t(fmt::format("Request to {} timed out after {}ms", url, timeout.count()));

            throw exceptions::transport_exception_t(
                fmt::format("{} failed for {}: {} (code={}, category={})", step, url, error_code.message(), error_code.value(), error_code.category().name())
            );
        }
    }

    c_http_client::c_http_client(bool verify_peer, std::size_t max_body_size)
        : m_verify_peer(verify_peer), m_max_body_size(max_body_size) {
        if (m_verify_peer) {
            m_ssl_ctx.set_default_verify_paths();

            m_ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);
        }
        else
            m_ssl_ctx.set_verify_mode(boost::asio::ssl::verify_none);
    }

    template <typename _stream_t>
    boost::asio::awaitable<outbound_response_t> c_http_client::exchange(
        _stream_t& stream,

        boost::beast::http::request<boost::beast::http::string_body>& request,

        const std::chrono::steady_clock::time_point& deadline
    ) {
        boost::system::error_code error_code{};

        boost::beast::get_lowest_layer(stream).expires_at(deadline);

        co_await boost::beast::http::async_write(
            stream,

            request,

            boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
        );

        if (error_code)
            throw boost::system::system_error(error_code, "write");

        boost::beast::flat_buffer buffer{};

        boost::beast::http::response_parser<boost::beast::http::string_body> parser{};

        parser.body_limit(m_max_body_size);

        co_await boost::beast::http::async_read(
            stream,
            buffer,

            parser,

            boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
        );

        if (error_code)
            throw boost::system::system_error(error_code, "read");

        auto response = parser.release();

        outbound_response_t out{};

        out.m_status = static_cast<std::int32_t>(response.result_int());

        for (const auto& field : response) {
            auto name = to_string(field.name_string());

            auto [it, inserted] = out.m_headers.emplace(name, to_string(field.value()));

            if (!inserted)
                it->second = fmt::format("{}, {}", it->second, to_string(field.value()));
        }

        out.m_body = std::move(response.body());

        co_return out;
    }

    boost::asio::awaitable<outbound_response_t> c_http_client::send(outbound_request_t request) {
        const auto deadline = std::chrono::steady_clock::now() + request.m_timeout;

        auto parsed = boost::urls::parse_uri(request.m_url);

        if (!parsed)
            throw exceptions::transport_exception_t(fmt::format("Invalid URL '{}': {}", request.m_url, parsed.error().message()));

        const auto scheme = to_string(parsed->scheme());

        const auto secure = boost::iequals(scheme, "https");

        if (!secure && !boost::iequals(scheme, "http"))
            throw exceptions::transport_exception_t(fmt::format("Unsupported protocol '{}' in {}", scheme, request.m_url));

        const std::string host = parsed->host();

        if (host.empty())
            throw exceptions::transport_exception_t(fmt::format("Missing host in {}", request.m_url));

        const auto port = parsed->has_port() ? to_string(parsed->port()) : std::string(secure ? "443" : "80");

        auto target = to_string(parsed->encoded_target());

        if (target.empty())
            target = "/";

        boost::beast::http::request<boost::beast::http::string_body> beast_request{};

        {
            beast_request.version(11);
            beast_request.method_string(http::method_to_str(request.m_method));
            beast_request.target(target);

            beast_request.set(boost::beast::http::field::host, parsed->has_port() ? fmt::format("{}:{}", host, port) : host);

            for (const auto& [key, value] : request.m_headers)
                beast_request.set(key, value);

            if (beast_request.find(boost::beast::http::field::user_agent) == beast_request.end())
                beast_request.set(boost::beast::http::field::user_agent, "cxxgate/1.0.0");

            beast_request.body() = std::move(request.m_body);

            beast_request.prepare_payload();
        }

        auto executor = co_await boost::asio::this_coro::executor;

        try {
            boost::system::error_code error_code{};

            boost::asio::ip::tcp::resolver resolver{executor};

            boost::asio::steady_timer resolve_timer{executor};

            resolve_timer.expires_at(deadline);

            resolve_timer.async_wait([&resolver](const boost::system::error_code& timer_error) {
                if (!timer_error)
                    resolver.cancel();
            });

            const auto endpoints = co_await resolver.async_resolve(
                host,
                port,

                boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
            );

            resolve_timer.cancel();

            if (error_code)
                throw_transport("DNS resolution", error_code, request.m_url, request.m_timeout);

            if (secure) {
                boost::beast::ssl_stream<boost::beast::tcp_stream> stream{executor, m_ssl_ctx};

                if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
                    throw exceptions::transport_exception_t(fmt::format("Failed to set SNI host name for {}", host));

                if (m_verify_peer)
                    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));

                boost::beast::get_lowest_layer(stream).expires_at(deadline);

                co_await boost::beast::get_lowest_layer(stream).async_connect(
                    endpoints,

                    boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
                );

                if (error_code)
                    throw_transport("Connect", error_code, request.m_url, request.m_timeout);

                co_await stream.async_handshake(
                    boost::asio::ssl::stream_base::client,

                    boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
                );

                if (error_code)
                    throw_transport("TLS handshake", error_code, request.m_url, request.m_timeout);

                auto response = co_await exchange(stream, beast_request, deadline);

                {
                    boost::system::error_code ignored_error_code{};

                    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));

                    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ignored_error_code));
                }

                co_return response;
            }

            boost::beast::tcp_stream stream{executor};

            stream.expires_at(deadline);

            co_await stream.async_connect(
                endpoints,

                boost::asio::redirect_error(boost::asio::use_awaitable, error_code)
            );

            if (error_code)
                throw_transport("Connect", error_code, request.m_url, request.m_timeout);

            auto response = co_await exchange(stream, beast_request, deadline);

            {
                boost::system::error_code ignored_error_code{};

                stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored_error_code);
            }

            co_return response;
        }
        catch (const boost::system::system_error& e) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(
                e_log_level::debug,

                "[Transport] Exchange with {} failed: code={}, category={}, message={}",

                request.m_url, e.code().value(), e.code().category().name(), e.what()
            );
#endif // CXXGATE_USE_LOGGING_IMPL

            throw_transport("HTTP exchange", e.code(), request.m_url, request.m_timeout);
        }
    }
}
