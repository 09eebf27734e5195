#include <cxxgate.hxx>

namespace cxxgate::middleware::auth {
    c_auth_middleware::c_auth_middleware(domains::c_domain_registry& registry)
        : m_registry(registry) {
    }

    bool c_auth_middleware::is_public_path(const std::string_view& path) {
        return path == "/health" || path.starts_with("/gateway/");
    }

    http::response_t c_auth_middleware::unauthorized(const std::string_view& error, const std::string_view& message, const std::string& origin) {
        return http::json_response_t(
            http::json_t::json_obj_t{
                {"success", false},
                {"error", std::string(error)},
                {"message", std::string(message)},
                {"origin", origin.empty() ? std::string("unknown") : origin}
            },

            http::e_status::unauthorized
        );
    }

    boost::asio::awaitable<http::response_t> c_auth_middleware::handle(const http::request_t& request, next_t next) {
        if (is_public_path(request.path()))
            co_return co_await next(request);

        const auto origin = request.header("Origin").value_or(std::string{});

        if (!origin.empty() && (m_registry.is_configured(origin) || m_registry.matches_pattern(origin))) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Auth] Origin authenticated without key: {}", origin);
#endif // CXXGATE_USE_LOGGING_IMPL

            co_return co_await next(request);
        }

        const auto api_key = request.header("X-API-Key");

        if (!api_key.has_value() || api_key->empty()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Auth] No API key provided for origin {}", origin.empty() ? "unknown" : origin);
#endif // CXXGATE_USE_LOGGING_IMPL

            co_return unauthorized("Authentication Required", "API key is required for this origin", origin);
        }

        if (!m_registry.validate_api_key(*api_key)) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Auth] Invalid API key {} for origin {}", *api_key, origin.empty() ? "unknown" : origin);
#endif // CXXGATE_USE_LOGGING_IMPL

            co_return unauthorized("Invalid API Key", "The provided API key is not valid", origin);
        }

        const auto client_domain = request.header("X-Client-Domain");

        if (!origin.empty() && !m_registry.is_registered(origin)) {
            auto metadata = http::json_t::json_obj_t{
                {"userAgent", request.header("User-Agent").value_or(std::string{})},
                {"firstSeen", http::iso_timestamp()}
            };

            if (client_domain.has_value())
                metadata["clientDomain"] = *client_domain;

            m_registry.register_domain(origin, *api_key, std::move(metadata));
        }

        http::request_t authenticated = request;

        authenticated.auth() = http::auth_info_t{
            *api_key,
            origin,
            client_domain.value_or(std::string{}),
            m_registry.api_key_info(*api_key)
        };

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::info,

            "[Auth] {} {} | App: {} | Origin: {}",

            http::method_to_str(authenticated.method()), authenticated.path(),

            authenticated.auth()->m_app_name, origin.empty() ? "unknown" : origin
        );
#endif // CXXGATE_USE_LOGGING_IMPL

        co_return co_await next(authenticated);
    }
}
