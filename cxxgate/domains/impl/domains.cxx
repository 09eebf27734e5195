#include <cxxgate.hxx>

namespace cxxgate::domains {
    c_domain_registry::c_domain_registry(
        std::vector<std::string> allowed_origins,
        std::vector<std::string> domain_patterns,

        api_keys_t api_keys
    )
        : m_allowed_origins(std::move(allowed_origins)),
          m_domain_patterns(std::move(domain_patterns)),
          m_api_keys(std::move(api_keys)) {
        m_compiled_patterns.reserve(m_domain_patterns.size());

        for (const auto& pattern : m_domain_patterns) {
            std::string expr{};

            expr.reserve(pattern.size() * 2u);

            for (const auto c : pattern) {
                switch (c) {
                    case '*':
                        expr += "[^.]*";

                        break;
                    case '.':
                    case '\\':
                    case '+':
                    case '?':
                    case '(':
                    case ')':
                    case '[':
                    case ']':
                    case '{':
                    case '}':
                    case '^':
                    case '$':
                    case '|':
                        expr += '\\';
                        expr += c;

                        break;
                    default:
                        expr += c;
                }
            }

            try {
                m_compiled_patterns.emplace_back(expr, std::regex::ECMAScript);
            }
            catch (const std::regex_error& e) {
                throw exceptions::config_exception_t(fmt::format("Invalid domain pattern '{}': {}", pattern, e.what()));
            }
        }
    }

    bool c_domain_registry::register_domain(
        const std::string& domain,
        const std::string& api_key,

        shared::json_traits_t::json_obj_t metadata
    ) {
        if (!validate_api_key(api_key)) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Domains] Invalid API key for domain: {}", domain);
#endif // CXXGATE_USE_LOGGING_IMPL

            return false;
        }

        {
            std::unique_lock lock(m_mutex);

            m_registered.insert_or_assign(
                domain,

                registered_domain_t{api_key, http::iso_timestamp(), std::move(metadata)}
            );
        }

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Domains] Domain registered: {} ({})", domain, api_key_info(api_key));
#endif // CXXGATE_USE_LOGGING_IMPL

        return true;
    }

    bool c_domain_registry::unregister_domain(const std::string& domain) {
        std::size_t erased{};

        {
            std::unique_lock lock(m_mutex);

            erased = m_registered.erase(domain);
        }

#ifdef CXXGATE_USE_LOGGING_IMPL
        if (erased)
            g_logging->log(e_log_level::info, "[Domains] Domain unregistered: {}", domain);
#endif // CXXGATE_USE_LOGGING_IMPL

        return erased > 0u;
    }

    bool c_domain_registry::is_registered(const std::string& domain) const {
        std::shared_lock lock(m_mutex);

        return m_registered.contains(domain);
    }

    bool c_domain_registry::validate_api_key(const std::string& api_key) const {
        return !api_key.empty() && m_api_keys.contains(api_key);
    }

    std::string c_domain_registry::api_key_info(const std::string& api_key) const {
        const auto it = m_api_keys.find(api_key);

        return it != m_api_keys.end() ? it->second : "Unknown";
    }

    bool c_domain_registry::is_configured(const std::string& origin) const {
        return std::find(m_allowed_origins.begin(), m_allowed_origins.end(), origin) != m_allowed_origins.end();
    }

    bool c_domain_registry::matches_pattern(const std::string& origin) const {
        if (origin.empty())
            return false;

        return std::any_of(
            m_compiled_patterns.begin(), m_compiled_patterns.end(),

            [&origin](const std::regex& re) { return std::regex_match(origin, re); }
        );
    }

    e_origin_match c_domain_registry::match_origin(const std::string& origin) const {
        if (origin.empty())
            return e_origin_match::no_origin;

        if (is_configured(origin))
            return e_origin_match::configured;

        if (is_registered(origin))
            return e_origin_match::registered;

        if (matches_pattern(origin))
            return e_origin_match::pattern;

        return e_origin_match::denied;
    }

    shared::json_traits_t::json_obj_t c_domain_registry::registered_domains() const {
        auto out = shared::json_traits_t::json_obj_t::object();

        std::shared_lock lock(m_mutex);

        for (const auto& [domain, info] : m_registered) {
            out[domain] = {
                {"appName", api_key_info(info.m_api_key)},
                {"registeredAt", info.m_registered_at},
                {"metadata", info.m_metadata}
            };
        }

        return out;
    }

    std::string c_domain_registry::generate_api_key(const std::string_view& prefix) {
        const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();

        const auto uuid = boost::uuids::random_generator()();

        std::uint64_t random{};

        for (std::size_t i{}; i < sizeof(random); i++)
            random = (random << 8u) | uuid.data[i];

        return fmt::format("{}-{}-{}", prefix, http::utils::to_base36(static_cast<std::uint64_t>(now_ms)), http::utils::to_base36(random));
    }

    bool c_domain_registry::is_valid_api_key_format(const std::string_view& api_key) {
        static const std::regex k_development_key{"^development-key-\\d+$"};
        static const std::regex k_generated_key{"^[a-z]+-[a-z0-9]+-[a-z0-9]+$"};

        if (api_key.empty())
            return false;

        const std::string key{api_key};

        return std::regex_match(key, k_development_key) || std::regex_match(key, k_generated_key);
    }
}
