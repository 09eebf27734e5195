#include <cxxgate.hxx>

namespace cxxgate::gateway {
    namespace {
        using json_obj_t = http::json_t::json_obj_t;

        http::response_t bad_request(const std::string_view& error, const std::string_view& message) {
            return http::json_response_t(
                json_obj_t{
                    {"success", false},
                    {"error", std::string(error)},
                    {"message", std::string(message)}
                },

                http::e_status::bad_request
            );
        }

        json_obj_t port_value(const std::string& port) {
            std::int32_t value{};

            if (auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value); ec == std::errc() && ptr == port.data() + port.size())
                return value;

            return port;
        }

        template <typename _type_t>
        std::optional<_type_t> positive_query(const http::request_t& request, const std::string_view& key) {
            const auto query = request.query();

            const auto it = query.find(key);

            if (it == query.end())
                return std::nullopt;

            _type_t value{};

            if (auto [ptr, ec] = std::from_chars(it->second.data(), it->second.data() + it->second.size(), value); ec != std::errc() || value <= 0)
                return std::nullopt;

            return value;
        }
    }

    c_gateway::c_gateway(cxxgate_cfg_t cfg, std::shared_ptr<dispatch::c_base_http_client> client)
        : m_cfg(std::move(cfg)),
          m_client(client ? std::move(client) : std::make_shared<dispatch::c_http_client>(m_cfg.m_gateway.m_verify_tls)),
          m_domains(m_cfg.m_gateway.m_allowed_origins, m_cfg.m_gateway.m_domain_patterns, m_cfg.m_gateway.m_api_keys),
          m_log(m_cfg.m_gateway.m_log_capacity),
          m_validator(m_store, m_permissions),
          m_dispatcher(
              m_validator,

              *m_client,

              m_log,

              dispatch::dispatcher_options_t{m_cfg.m_gateway.m_request_timeout, m_cfg.m_gateway.m_default_protocol}
          ) {
        const auto templates = m_store.load(m_cfg.m_gateway.m_templates_path);

        const auto declared = m_permissions.load(m_cfg.m_gateway.m_application, m_cfg.m_gateway.manifest_path());

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::info,

            "[Gateway] Loaded {} templates, {} declared for application \"{}\"",

            templates, declared, m_cfg.m_gateway.m_application
        );
#endif // CXXGATE_USE_LOGGING_IMPL

        m_app.cfg() = m_cfg;

        install_middlewares();
        install_routes();

        m_app.build();
    }

    void c_gateway::start() {
#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Gateway] Gateway URL: {}", m_cfg.m_gateway.m_gateway_url);
        g_logging->log(e_log_level::info, "[Gateway] Backend URL: {}", m_cfg.m_gateway.m_backend_url);
        g_logging->log(e_log_level::info, "[Gateway] Environment: {}", config::environment_to_str(m_cfg.m_gateway.m_environment));
        g_logging->log(e_log_level::info, "[Gateway] Allowed origins: {}", fmt::join(m_cfg.m_gateway.m_allowed_origins, ", "));
        g_logging->log(e_log_level::info, "[Gateway] Domain patterns: {}", fmt::join(m_cfg.m_gateway.m_domain_patterns, ", "));
#endif // CXXGATE_USE_LOGGING_IMPL

        m_app.start(m_cfg);
    }

    void c_gateway::install_middlewares() {
        m_app.add_middleware(std::make_shared<middleware::cors::c_cors_middleware>(m_domains));

        m_app.add_middleware(std::make_shared<middleware::auth::c_auth_middleware>(m_domains));

        m_app.add_middleware(
            std::make_shared<middleware::rate_limit::c_rate_limit_middleware>(
                middleware::rate_limit::rate_limit_options_t{m_cfg.m_gateway.m_rate_limit_window, m_cfg.m_gateway.m_rate_limit_max}
            )
        );

        middleware::proxy::proxy_options_t proxy_options{};

        proxy_options.m_backend_url = m_cfg.m_gateway.m_backend_url;
        proxy_options.m_timeout = m_cfg.m_gateway.m_request_timeout;

        m_app.add_middleware(std::make_shared<middleware::proxy::c_proxy_middleware>(*m_client, m_log, std::move(proxy_options)));
    }

    void c_gateway::install_routes() {
        m_app.add_method(http::e_method::get, "/health", [this](http::http_ctx_t&&) -> http::response_t {
            return http::json_response_t(
                json_obj_t{
                    {"status", "healthy"},
                    {"service", std::string(k_service)},
                    {"version", std::string(k_version)},
                    {"timestamp", http::iso_timestamp()},
                    {"environment", std::string(config::environment_to_str(m_cfg.m_gateway.m_environment))},
                    {"port", port_value(m_cfg.m_port)},
                    {"backendUrl", m_cfg.m_gateway.m_backend_url}
                }
            );
        });

        m_app.add_method(http::e_method::get, "/gateway/info", [this](http::http_ctx_t&&) -> http::response_t {
            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {
                        "gateway", {
                            {"version", std::string(k_version)},
                            {"environment", std::string(config::environment_to_str(m_cfg.m_gateway.m_environment))},
                            {"backendUrl", m_cfg.m_gateway.m_backend_url},
                            {"allowedOrigins", m_cfg.m_gateway.m_allowed_origins},
                            {"domainPatterns", m_cfg.m_gateway.m_domain_patterns}
                        }
                    },
                    {"registeredDomains", m_domains.registered_domains()},
                    {"stats", m_log.stats().to_json()}
                }
            );
        });

        m_app.add_method(http::e_method::get, "/gateway/stats", [this](http::http_ctx_t&& ctx) -> http::response_t {
            const auto window = positive_query<std::int64_t>(ctx.request(), "windowMs");

            const auto stats = window.has_value()
                                 ? m_log.stats(std::chrono::milliseconds(*window))
                                 : m_log.stats();

            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {"stats", stats.to_json()},
                    {"timestamp", http::iso_timestamp()}
                }
            );
        });

        m_app.add_method(http::e_method::get, "/gateway/logs", [this](http::http_ctx_t&& ctx) -> http::response_t {
            const auto limit = positive_query<std::size_t>(ctx.request(), "limit").value_or(50u);

            auto logs = json_obj_t::array();

            for (const auto& entry : m_log.recent(limit))
                logs.push_back(entry.to_json());

            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {"logs", std::move(logs)},
                    {"timestamp", http::iso_timestamp()}
                }
            );
        });

        m_app.add_method(http::e_method::get, "/gateway/domains", [this](http::http_ctx_t&&) -> http::response_t {
            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {"configuredOrigins", m_domains.allowed_origins()},
                    {"domainPatterns", m_domains.domain_patterns()},
                    {"registeredDomains", m_domains.registered_domains()},
                    {"timestamp", http::iso_timestamp()}
                }
            );
        });

        m_app.add_method(http::e_method::post, "/gateway/register-domain", [this](http::http_ctx_t&& ctx) -> http::response_t {
            const auto& body = ctx.json();

            const auto domain = body ? http::json_t::value_or<std::string>(*body, "domain", "") : std::string{};

            const auto api_key = body ? http::json_t::value_or<std::string>(*body, "apiKey", "") : std::string{};

            if (domain.empty() || api_key.empty())
                return bad_request("Missing required fields", "Domain and API key are required");

            auto metadata = body ? http::json_t::value_or<json_obj_t>(*body, "metadata", json_obj_t::object()) : json_obj_t::object();

            if (metadata.is_null())
                metadata = json_obj_t::object();

            if (!m_domains.register_domain(domain, api_key, std::move(metadata))) {
                return http::json_response_t(
                    json_obj_t{
                        {"success", false},
                        {"error", "Invalid API Key"},
                        {"message", "The provided API key is not valid"}
                    },

                    http::e_status::unauthorized
                );
            }

            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {"message", "Domain registered successfully"},
                    {"domain", domain},
                    {"appName", m_domains.api_key_info(api_key)},
                    {"timestamp", http::iso_timestamp()}
                }
            );
        });

        m_app.add_method(http::e_method::post, "/gateway/generate-key", [this](http::http_ctx_t&& ctx) -> http::response_t {
            if (m_cfg.m_gateway.m_environment != config::e_environment::development) {
                return http::json_response_t(
                    json_obj_t{
                        {"success", false},
                        {"error", "Forbidden"},
                        {"message", "Key generation is only available in development mode"}
                    },

                    http::e_status::forbidden
                );
            }

            const auto& body = ctx.json();

            auto prefix = body ? http::json_t::value_or<std::string>(*body, "prefix", "sdk") : std::string("sdk");

            auto description = body ? http::json_t::value_or<std::string>(*body, "description", "") : std::string{};

            if (prefix.empty())
                prefix = "sdk";

            if (description.empty())
                description = "Generated API key";

            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {"apiKey", domains::c_domain_registry::generate_api_key(prefix)},
                    {"description", description},
                    {"timestamp", http::iso_timestamp()},
                    {"note", "This key is for development use only"}
                }
            );
        });

        m_app.add_method(http::e_method::get, "/gateway/templates", [this](http::http_ctx_t&&) -> http::response_t {
            return http::json_response_t(
                json_obj_t{
                    {"success", true},
                    {"application", m_validator.application()},
                    {"templates", m_validator.list().to_json()}
                }
            );
        });

        m_app.add_method(http::e_method::post, "/gateway/invoke-template", [this](http::http_ctx_t&& ctx) -> boost::asio::awaitable<http::response_t> {
            co_return co_await invoke_template(std::move(ctx));
        });

        m_app.set_not_found_handler([](const http::request_t&) { return not_found(); });
    }

    boost::asio::awaitable<http::response_t> c_gateway::invoke_template(http::http_ctx_t&& ctx) {
        const auto& body = ctx.json();

        if (!body.has_value() || !body->is_object())
            co_return bad_request("Bad Request", "Request body must be a JSON object");

        const auto name = http::json_t::value_or<std::string>(*body, "templateName", "");

        if (name.empty())
            co_return bad_request("Missing required fields", "templateName is required");

        auto context = json_obj_t::object();

        if (const auto it = body->find("context"); it != body->end() && !it->is_null()) {
            if (!it->is_object())
                co_return bad_request("Bad Request", "context must be a JSON object");

            context = *it;
        }

        std::optional<json_obj_t> payload{};

        if (const auto it = body->find("body"); it != body->end() && !it->is_null())
            payload = *it;

        const auto& request = ctx.request();

        dispatch::invocation_source_t source{};

        source.m_origin = request.header("Origin");

        if (request.auth().has_value()) {
            source.m_api_key = request.auth()->m_api_key;
        }
        else
            source.m_api_key = request.header("X-API-Key");

        const auto result = co_await m_dispatcher.invoke(name, std::move(context), std::move(payload), std::move(source));

        co_return http::json_response_t(result.to_json(), status_of(result));
    }

    http::e_status c_gateway::status_of(const dispatch::invocation_result_t& result) {
        if (result.m_success || !result.m_error_kind.has_value())
            return result.m_success ? http::e_status::ok : http::e_status::internal_server_error;

        switch (*result.m_error_kind) {
            case e_invoke_error::template_not_found:
                return http::e_status::not_found;
            case e_invoke_error::template_not_declared:
                return http::e_status::forbidden;
            case e_invoke_error::template_malformed:
                return http::e_status::unprocessable_entity;
            case e_invoke_error::transport_failure:
                return http::e_status::bad_gateway;
        }

        return http::e_status::internal_server_error;
    }

    http::response_t c_gateway::not_found() {
        return http::json_response_t(
            json_obj_t{
                {"success", false},
                {"error", "Not Found"},
                {"message", "API endpoint not found"},
                {
                    "availableEndpoints", {
                        "GET /health",
                        "GET /gateway/info",
                        "GET /gateway/stats",
                        "GET /gateway/logs",
                        "GET /gateway/domains",
                        "GET /gateway/templates",
                        "POST /gateway/register-domain",
                        "POST /gateway/generate-key (dev only)",
                        "POST /gateway/invoke-template",
                        "ALL /api* (proxied to backend)"
                    }
                }
            },

            http::e_status::not_found
        );
    }
}
