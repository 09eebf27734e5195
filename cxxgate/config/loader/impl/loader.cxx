#include <cxxgate.hxx>

namespace cxxgate::config {
    namespace {
        using json_obj_t = shared::json_traits_t::json_obj_t;

        template <typename _type_t>
        std::optional<_type_t> read_optional(const json_obj_t& obj, const std::string_view& key, const std::string_view& section) {
            const auto it = obj.find(std::string(key));

            if (it == obj.end() || it->is_null())
                return std::nullopt;

            try {
                return it->template get<_type_t>();
            }
            catch (const nlohmann::json::exception& e) {
                throw exceptions::config_exception_t(fmt::format("Invalid value for {}.{}: {}", section, key, e.what()));
            }
        }

        template <typename _type_t>
        void read(const json_obj_t& obj, const std::string_view& key, _type_t& target, const std::string_view& section) {
            if (auto value = read_optional<_type_t>(obj, key, section); value.has_value())
                target = std::move(*value);
        }

        template <typename _duration_t>
        void read_duration(const json_obj_t& obj, const std::string_view& key, _duration_t& target, const std::string_view& section) {
            const auto value = read_optional<std::int64_t>(obj, key, section);

            if (!value.has_value())
                return;

            if (*value <= 0)
                throw exceptions::config_exception_t(fmt::format("Invalid value for {}.{}: must be positive", section, key));

            target = _duration_t(*value);
        }

        const json_obj_t& section(const json_obj_t& obj, const std::string_view& key) {
            static const json_obj_t k_empty = json_obj_t::object();

            const auto it = obj.find(std::string(key));

            if (it == obj.end())
                return k_empty;

            if (!it->is_object())
                throw exceptions::config_exception_t(fmt::format("Configuration section \"{}\" must be an object", key));

            return *it;
        }

        std::string validated_port(const std::string& port) {
            std::uint32_t value{};

            const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);

            if (ec != std::errc() || ptr != port.data() + port.size() || value == 0u || value > 65535u)
                throw exceptions::config_exception_t(fmt::format("Invalid port: \"{}\"", port));

            return port;
        }

#ifdef CXXGATE_HAS_LOGGING_IMPL
        e_log_level str_to_log_level(const std::string& level) {
            if (boost::iequals(level, "debug"))
                return e_log_level::debug;

            if (boost::iequals(level, "info"))
                return e_log_level::info;

            if (boost::iequals(level, "warning"))
                return e_log_level::warning;

            if (boost::iequals(level, "error"))
                return e_log_level::error;

            if (boost::iequals(level, "critical"))
                return e_log_level::critical;

            if (boost::iequals(level, "none"))
                return e_log_level::none;

            throw exceptions::config_exception_t(fmt::format("Unknown log level: \"{}\"", level));
        }
#endif // CXXGATE_HAS_LOGGING_IMPL
    }

    std::optional<std::string> process_env(const std::string& name) {
        const auto* value = std::getenv(name.c_str());

        if (!value)
            return std::nullopt;

        return std::string(value);
    }

    cxxgate_cfg_t preset(const e_environment environment, const env_lookup_t& env) {
        cxxgate_cfg_t cfg{};

        auto& gateway = cfg.m_gateway;

        gateway.m_environment = environment;

        const auto add_key = [&](const std::string& variable, const std::string& app_name) {
            if (auto key = env(variable); key.has_value() && !key->empty())
                gateway.m_api_keys.emplace(std::move(*key), app_name);
        };

        switch (environment) {
            case e_environment::development:
                {
                    cfg.m_port = "9000";

                    gateway.m_gateway_url = "http://localhost:9000";
                    gateway.m_backend_url = "http://localhost:8000";

                    gateway.m_allowed_origins = {
                        "http://localhost:3000",
                        "http://localhost:3001",
                        "http://localhost:3002"
                    };

                    gateway.m_domain_patterns = {"http://localhost:*"};

                    gateway.m_api_keys = {
                        {"development-key-1", "App 1 Development"},
                        {"development-key-2", "App 2 Development"}
                    };

                    break;
                }

            case e_environment::staging:
                {
                    cfg.m_host = "0.0.0.0";
                    cfg.m_port = "9000";

                    gateway.m_gateway_url = "https://gateway-staging.company.com";
                    gateway.m_backend_url = "https://api-staging.company.com";

                    gateway.m_allowed_origins = {
                        "https://app1-staging.company.com",
                        "https://widget-staging.company.com"
                    };

                    gateway.m_domain_patterns = {"https://*-staging.company.com"};

                    add_key("STAGING_API_KEY_1", "App 1 Staging");
                    add_key("STAGING_API_KEY_2", "Widget Staging");

                    break;
                }

            case e_environment::production:
                {
                    cfg.m_host = "0.0.0.0";
                    cfg.m_port = "443";

                    gateway.m_gateway_url = "https://gateway.company.com";
                    gateway.m_backend_url = "https://api.company.com";

                    gateway.m_allowed_origins = {
                        "https://app1.company.com",
                        "https://widget.company.com"
                    };

                    gateway.m_domain_patterns = {
                        "https://*.company.com",
                        "https://*.trusted-partner.com"
                    };

                    add_key("PROD_API_KEY_1", "App 1 Production");
                    add_key("PROD_API_KEY_2", "Widget Production");

#ifdef CXXGATE_HAS_LOGGING_IMPL
                    cfg.m_logger.m_level = e_log_level::warning;
#endif // CXXGATE_HAS_LOGGING_IMPL

                    break;
                }
        }

        return cfg;
    }

    void apply_json(cxxgate_cfg_t& cfg, const shared::json_traits_t::json_obj_t& document) {
        if (!document.is_object())
            throw exceptions::config_exception_t("Configuration document must be a JSON object");

        read(document, "host", cfg.m_host, "root");

        {
            const auto it = document.find("port");

            if (it != document.end()) {
                if (it->is_number_unsigned()) {
                    cfg.m_port = validated_port(std::to_string(it->get<std::uint64_t>()));
                }
                else if (it->is_string()) {
                    cfg.m_port = validated_port(it->get<std::string>());
                }
                else
                    throw exceptions::config_exception_t("Invalid value for root.port: expected a number or a string");
            }
        }

        {
            const auto& server = section(document, "server");

            read(server, "workers", cfg.m_server.m_workers, "server");
            read(server, "maxConnections", cfg.m_server.m_max_connections, "server");
            read(server, "maxRequestSize", cfg.m_server.m_max_request_size, "server");
        }

        {
            const auto& http_section = section(document, "http");

            read_duration(http_section, "keepAliveTimeout", cfg.m_http.m_keep_alive_timeout, "http");

            const auto response_class = read_optional<std::string>(http_section, "responseClass", "http");

            if (response_class.has_value()) {
                if (boost::iequals(*response_class, "plain")) {
                    cfg.m_http.m_response_class = http::e_response_class::plain;
                }
                else if (boost::iequals(*response_class, "json")) {
                    cfg.m_http.m_response_class = http::e_response_class::json;
                }
                else
                    throw exceptions::config_exception_t(fmt::format("Unknown response class: \"{}\"", *response_class));
            }
        }

#ifdef CXXGATE_HAS_LOGGING_IMPL
        {
            const auto& logger = section(document, "logger");

            const auto level = read_optional<std::string>(logger, "level", "logger");

            if (level.has_value())
                cfg.m_logger.m_level = str_to_log_level(*level);

            read(logger, "async", cfg.m_logger.m_async, "logger");
            read(logger, "forceFlush", cfg.m_logger.m_force_flush, "logger");
        }
#endif // CXXGATE_HAS_LOGGING_IMPL

        const auto& gateway = section(document, "gateway");

        auto& out = cfg.m_gateway;

        {
            const auto environment = read_optional<std::string>(gateway, "environment", "gateway");

            if (environment.has_value()) {
                auto parsed = str_to_environment(*environment);

                if (!parsed.has_value())
                    throw exceptions::config_exception_t(fmt::format("Unknown environment: \"{}\"", *environment));

                out.m_environment = *parsed;
            }
        }

        read(gateway, "gatewayUrl", out.m_gateway_url, "gateway");
        read(gateway, "backendUrl", out.m_backend_url, "gateway");
        read(gateway, "allowedOrigins", out.m_allowed_origins, "gateway");
        read(gateway, "domainPatterns", out.m_domain_patterns, "gateway");
        read(gateway, "apiKeys", out.m_api_keys, "gateway");
        read(gateway, "application", out.m_application, "gateway");
        read(gateway, "defaultProtocol", out.m_default_protocol, "gateway");
        read(gateway, "verifyTls", out.m_verify_tls, "gateway");
        read(gateway, "logCapacity", out.m_log_capacity, "gateway");

        {
            const auto templates_path = read_optional<std::string>(gateway, "templatesPath", "gateway");
            const auto manifest_path = read_optional<std::string>(gateway, "manifestPath", "gateway");

            if (templates_path.has_value())
                out.m_templates_path = *templates_path;

            if (manifest_path.has_value())
                out.m_manifest_path = *manifest_path;
        }

        read_duration(gateway, "requestTimeoutMs", out.m_request_timeout, "gateway");

        {
            const auto& rate_limit = section(gateway, "rateLimit");

            read_duration(rate_limit, "windowMs", out.m_rate_limit_window, "gateway.rateLimit");
            read(rate_limit, "maxRequests", out.m_rate_limit_max, "gateway.rateLimit");
        }

        if (out.m_log_capacity == 0u)
            throw exceptions::config_exception_t("Invalid value for gateway.logCapacity: must be positive");

        if (out.m_rate_limit_max == 0u)
            throw exceptions::config_exception_t("Invalid value for gateway.rateLimit.maxRequests: must be positive");
    }

    void apply_env(cxxgate_cfg_t& cfg, const env_lookup_t& env) {
        if (auto port = env("PORT"); port.has_value() && !port->empty())
            cfg.m_port = validated_port(*port);

        if (auto gateway_url = env("GATEWAY_URL"); gateway_url.has_value() && !gateway_url->empty())
            cfg.m_gateway.m_gateway_url = std::move(*gateway_url);

        if (auto backend_url = env("BACKEND_URL"); backend_url.has_value() && !backend_url->empty())
            cfg.m_gateway.m_backend_url = std::move(*backend_url);

        if (auto application = env("CXXGATE_APP_ID"); application.has_value() && !application->empty())
            cfg.m_gateway.m_application = std::move(*application);
    }

    cxxgate_cfg_t load(const std::optional<boost::filesystem::path>& path, const env_lookup_t& env) {
        auto environment = e_environment::development;

        if (auto name = env("CXXGATE_ENV"); name.has_value() && !name->empty()) {
            auto parsed = str_to_environment(*name);

            if (!parsed.has_value())
                throw exceptions::config_exception_t(fmt::format("Unknown environment: \"{}\"", *name));

            environment = *parsed;
        }

        auto cfg = preset(environment, env);

        if (path.has_value()) {
            if (!boost::filesystem::exists(*path))
                throw exceptions::config_exception_t(fmt::format("Configuration file not found: {}", path->string()));

            shared::json_traits_t::json_obj_t document{};

            try {
                document = shared::json_traits_t::load(*path);
            }
            catch (const std::runtime_error& e) {
                throw exceptions::config_exception_t(e.what());
            }

            apply_json(cfg, document);
        }

        apply_env(cfg, env);

        return cfg;
    }
}
