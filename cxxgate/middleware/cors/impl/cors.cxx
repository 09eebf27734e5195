#include <cxxgate.hxx>

namespace cxxgate::middleware::cors {
    c_cors_middleware::c_cors_middleware(const domains::c_domain_registry& registry, cors_options_t options)
        : m_registry(registry), m_options(std::move(options)) {
    }

    boost::asio::awaitable<http::response_t> c_cors_middleware::handle(const http::request_t& request, next_t next) {
        const auto origin = request.header("Origin").value_or(std::string{});

        if (!origin.empty()) {
            const auto match = m_registry.match_origin(origin);

            if (match == domains::e_origin_match::denied) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[CORS] Blocked origin: {}", origin);
#endif // CXXGATE_USE_LOGGING_IMPL

                co_return http::json_response_t(
                    http::json_t::json_obj_t{
                        {"success", false},
                        {"error", "CORS Error"},
                        {"message", fmt::format("CORS policy violation: Origin {} not allowed", origin)},
                        {"origin", origin}
                    },

                    http::e_status::forbidden
                );
            }

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[CORS] Allowed {} origin: {}", domains::origin_match_to_str(match), origin);
#endif // CXXGATE_USE_LOGGING_IMPL
        }

        if (request.method() == http::e_method::options) {
            http::response_t response{};

            response.m_status = m_options.m_preflight_status;

            add_cors_headers(response, origin);

            if (!m_options.m_allowed_methods.empty())
                response.m_headers["Access-Control-Allow-Methods"] = fmt::format("{}", fmt::join(m_options.m_allowed_methods, ", "));

            if (!m_options.m_allowed_headers.empty()) {
                response.m_headers["Access-Control-Allow-Headers"] = fmt::format("{}", fmt::join(m_options.m_allowed_headers, ", "));
            }
            else if (auto requested = request.header("Access-Control-Request-Headers"); requested.has_value())
                response.m_headers["Access-Control-Allow-Headers"] = *requested;

            if (m_options.m_max_age > 0)
                response.m_headers["Access-Control-Max-Age"] = std::to_string(m_options.m_max_age);

            co_return response;
        }

        auto response = co_await next(request);

        add_cors_headers(response, origin);

        co_return response;
    }

    void c_cors_middleware::add_cors_headers(http::response_t& response, const std::string& origin) const {
        if (!origin.empty()) {
            response.headers()["Access-Control-Allow-Origin"] = origin;

            response.headers()["Vary"] = "Origin";

            if (m_options.m_allow_credentials)
                response.headers()["Access-Control-Allow-Credentials"] = "true";
        }

        if (!m_options.m_exposed_headers.empty())
            response.headers()["Access-Control-Expose-Headers"] = fmt::format("{}", fmt::join(m_options.m_exposed_headers, ", "));
    }
}
