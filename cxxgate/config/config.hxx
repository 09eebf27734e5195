/**
 * @file config.hxx
 * @brief Gateway configuration section and deployment environments.
 */

#ifndef CXXGATE_CONFIG_HXX
#define CXXGATE_CONFIG_HXX

namespace cxxgate::config {
    /**
     * @brief Deployment environment selecting a configuration preset.
     */
    enum struct e_environment : std::uint8_t {
        development, ///< Local development: localhost origins, development keys, key generation enabled.
        staging,     ///< Staging deployment.
        production   ///< Production deployment.
    };

    /**
     * @brief Convert an environment to its name.
     * @param environment Environment value.
     * @return Lower-case name.
     */
    CXXGATE_INLINE constexpr std::string_view environment_to_str(const e_environment& environment) {
        switch (environment) {
            case e_environment::development:
                return "development";
            case e_environment::staging:
                return "staging";
            case e_environment::production:
                return "production";
        }

        return "development";
    }

    /**
     * @brief Parse an environment name.
     * @param name Environment name (case-insensitive).
     * @return The environment, or nullopt for unknown names.
     */
    CXXGATE_INLINE std::optional<e_environment> str_to_environment(const std::string_view& name) {
        if (boost::iequals(name, "development"))
            return e_environment::development;

        if (boost::iequals(name, "staging"))
            return e_environment::staging;

        if (boost::iequals(name, "production"))
            return e_environment::production;

        return std::nullopt;
    }

    /**
     * @brief Gateway-specific configuration parameters.
     */
    struct gateway_cfg_t {
        /** @brief Deployment environment. (default: development) */
        e_environment m_environment{e_environment::development};

        /** @brief Public URL of this gateway. */
        std::string m_gateway_url{"http://localhost:9000"};

        /** @brief Backend that /api* requests are forwarded to. */
        std::string m_backend_url{"http://localhost:8000"};

        /** @brief Origins accepted without an API key. */
        std::vector<std::string> m_allowed_origins{};

        /** @brief Wildcard origin patterns accepted without an API key. */
        std::vector<std::string> m_domain_patterns{};

        /** @brief API key -> application name. */
        std::map<std::string, std::string> m_api_keys{};

        /** @brief Application whose manifest grants template permissions. (default: app2) */
        std::string m_application{"app2"};

        /** @brief Request templates document. */
        boost::filesystem::path m_templates_path{"config/requests.json"};

        /** @brief Manifest of the application; empty means `<application>/manifest.json`. */
        boost::filesystem::path m_manifest_path{};

        /** @brief Upper bound of outbound calls. (default: 30 s) */
        std::chrono::milliseconds m_request_timeout{std::chrono::seconds(30)};

        /** @brief Protocol of templates that don't name one. (default: https) */
        std::string m_default_protocol{"https"};

        /** @brief Verify upstream TLS certificates. (default: true) */
        bool m_verify_tls{true};

        /** @brief Request log capacity. (default: 1000) */
        std::size_t m_log_capacity{1000u};

        /** @brief Rate limiting window. (default: 15 min) */
        std::chrono::milliseconds m_rate_limit_window{std::chrono::minutes(15)};

        /** @brief Requests allowed per key within the window. (default: 1000) */
        std::size_t m_rate_limit_max{1000u};

      public:
        /**
         * @brief Resolved manifest path.
         * @return m_manifest_path, or `<application>/manifest.json` when unset.
         */
        [[nodiscard]] CXXGATE_INLINE boost::filesystem::path manifest_path() const {
            if (!m_manifest_path.empty())
                return m_manifest_path;

            return boost::filesystem::path(m_application) / "manifest.json";
        }
    };
}

#endif // CXXGATE_CONFIG_HXX
