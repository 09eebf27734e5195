#include <cxxgate.hxx>

namespace cxxgate::middleware::proxy {
    c_proxy_middleware::c_proxy_middleware(dispatch::c_base_http_client& client, stats::c_request_log& log, proxy_options_t options)
        : m_client(client), m_log(log), m_options(std::move(options)) {
        while (!m_options.m_backend_url.empty() && m_options.m_backend_url.back() == '/')
            m_options.m_backend_url.pop_back();
    }

    http::headers_t c_proxy_middleware::prepare_headers(const http::request_t& request) {
        const auto origin = request.header("Origin");

        const auto client_domain = request.header("X-Client-Domain");

        http::headers_t headers{
            {"Content-Type", "application/json"},
            {"User-Agent", "cxxgate/1.0.0"},
            {"X-Forwarded-For", request.client().remote_addr()},
            {"X-Forwarded-Proto", "http"},
            {"X-Forwarded-Host", request.header("Host").value_or(std::string{})},
            {"X-Gateway-Origin", origin.value_or("unknown")},
            {"X-Gateway-API-Key", request.header("X-API-Key").value_or("none")},
            {"X-Gateway-Client-Domain", client_domain.has_value() ? *client_domain : origin.value_or("unknown")}
        };

        if (auto authorization = request.header("Authorization"); authorization.has_value())
            headers["Authorization"] = *authorization;

        for (const auto& [name, value] : request.headers()) {
            if (boost::istarts_with(name, "x-custom-"))
                headers[boost::to_lower_copy(name)] = value;
        }

        return headers;
    }

    bool c_proxy_middleware::is_forwarded_header(const std::string_view& name) {
        return !boost::iequals(name, "content-encoding")
            && !boost::iequals(name, "content-length")
            && !boost::iequals(name, "transfer-encoding");
    }

    boost::asio::awaitable<http::response_t> c_proxy_middleware::handle(const http::request_t& request, next_t next) {
        const auto path = request.path();

        if (!path.starts_with(m_options.m_prefix))
            co_return co_await next(request);

        const auto id = m_log.begin();

        const auto request_id = stats::c_request_log::make_request_id(id);

        const auto started = std::chrono::steady_clock::now();

        stats::log_entry_t entry{};

        entry.m_id = id;
        entry.m_request_id = request_id;
        entry.m_method = http::method_to_str(request.method());
        entry.m_path = path;
        entry.m_origin = request.header("Origin");
        entry.m_api_key = request.header("X-API-Key");

        dispatch::outbound_request_t outbound{};

        outbound.m_method = request.method();
        outbound.m_url = m_options.m_backend_url + path;
        outbound.m_headers = prepare_headers(request);
        outbound.m_timeout = m_options.m_timeout;

        if (const auto query = request.raw_query(); !query.empty())
            outbound.m_url += "?" + query;

        if (request.method() != http::e_method::get && request.method() != http::e_method::head)
            outbound.m_body = request.body();

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Proxy] [{}] Proxying {} {} to {}", request_id, entry.m_method, path, outbound.m_url);
#endif // CXXGATE_USE_LOGGING_IMPL

        std::optional<dispatch::outbound_response_t> upstream{};

        std::string error{};

        try {
            upstream = co_await m_client.send(std::move(outbound));
        }
        catch (const exceptions::transport_exception_t& e) {
            error = e.message();
        }

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        entry.m_duration = duration;
        entry.m_timestamp = stats::log_clock_t::now();

        if (!upstream.has_value()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::error, "[Proxy] [{}] Proxy error: {}", request_id, error);
#endif // CXXGATE_USE_LOGGING_IMPL

            entry.m_status = 500;
            entry.m_error = error;

            m_log.record(std::move(entry));

            co_return http::json_response_t(
                http::json_t::json_obj_t{
                    {"success", false},
                    {"error", "Gateway Proxy Error"},
                    {"message", "Failed to proxy request to backend"},
                    {"requestId", request_id},
                    {"details", error}
                },

                http::e_status::internal_server_error
            );
        }

        entry.m_status = upstream->m_status;

        m_log.record(std::move(entry));

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Proxy] [{}] Response: {} ({}ms)", request_id, upstream->m_status, duration.count());
#endif // CXXGATE_USE_LOGGING_IMPL

        auto data = http::json_t::try_deserialize(upstream->m_body);

        if (!data.has_value())
            data = http::json_t::json_obj_t{{"data", upstream->m_body}};

        http::headers_t headers{};

        for (auto& [name, value] : upstream->m_headers) {
            if (is_forwarded_header(name) && !boost::iequals(name, "content-type"))
                headers[name] = std::move(value);
        }

        headers["X-Gateway-Request-ID"] = request_id;
        headers["X-Gateway-Duration"] = fmt::format("{}ms", duration.count());
        headers["X-Proxied-From"] = m_options.m_backend_url;

        co_return http::json_response_t(*data, static_cast<http::e_status>(upstream->m_status), std::move(headers));
    }
}
