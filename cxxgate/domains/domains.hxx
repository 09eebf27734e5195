/**
 * @file domains.hxx
 * @brief Origin policy of the gateway: configured origins, wildcard patterns, API keys and runtime registrations.
 */

#ifndef CXXGATE_DOMAINS_HXX
#define CXXGATE_DOMAINS_HXX

namespace cxxgate::domains {
    /**
     * @brief Outcome of matching an Origin header against the policy.
     */
    enum struct e_origin_match : std::uint8_t {
        no_origin,  ///< Request carried no Origin header.
        configured, ///< Origin is listed in the configured allowed origins.
        registered, ///< Origin was registered at runtime with a valid API key.
        pattern,    ///< Origin matches one of the wildcard domain patterns.
        denied      ///< None of the above.
    };

    /**
     * @brief A domain registered at runtime.
     */
    struct registered_domain_t {
        /** @brief API key the domain was registered with. */
        std::string m_api_key{};

        /** @brief ISO-8601 registration timestamp. */
        std::string m_registered_at{};

        /** @brief Free-form metadata supplied at registration. */
        shared::json_traits_t::json_obj_t m_metadata = shared::json_traits_t::json_obj_t::object();
    };

    /**
     * @brief Thread-safe registry of the domains the gateway accepts.
     *
     * Configured origins, patterns and API keys are fixed at construction;
     * registered domains change at runtime and are guarded by a shared mutex.
     */
    class c_domain_registry {
      public:
        /** @brief API key -> application name. */
        using api_keys_t = std::map<std::string, std::string>;

      public:
        /**
         * @brief Construct the registry.
         * @param allowed_origins Exact origins accepted without an API key.
         * @param domain_patterns Wildcard patterns; `*` matches one DNS label.
         * @param api_keys Known API keys mapped to their application name.
         * @throws exceptions::config_exception_t if a pattern can't be compiled.
         */
        c_domain_registry(
            std::vector<std::string> allowed_origins,
            std::vector<std::string> domain_patterns,

            api_keys_t api_keys
        );

      public:
        /**
         * @brief Register a domain for an API key.
         * @param domain Origin to register (e.g. "https://widget.example.com").
         * @param api_key Key the registration is made with.
         * @param metadata Free-form metadata.
         * @return false if the key is unknown, true otherwise (re-registration overwrites).
         */
        bool register_domain(
            const std::string& domain,
            const std::string& api_key,

            shared::json_traits_t::json_obj_t metadata = shared::json_traits_t::json_obj_t::object()
        );

        /**
         * @brief Remove a runtime registration.
         * @param domain Registered origin.
         * @return true if the domain was registered.
         */
        bool unregister_domain(const std::string& domain);

        /**
         * @brief Check whether a domain was registered at runtime.
         * @param domain Origin to look up.
         * @return true if registered.
         */
        [[nodiscard]] bool is_registered(const std::string& domain) const;

        /**
         * @brief Check whether an API key is known.
         * @param api_key Key to check.
         * @return true if the key is configured.
         */
        [[nodiscard]] bool validate_api_key(const std::string& api_key) const;

        /**
         * @brief Application name of an API key.
         * @param api_key Key to look up.
         * @return The application name, or "Unknown".
         */
        [[nodiscard]] std::string api_key_info(const std::string& api_key) const;

        /**
         * @brief Check whether an origin is one of the configured origins.
         * @param origin Origin to check.
         * @return true if configured.
         */
        [[nodiscard]] bool is_configured(const std::string& origin) const;

        /**
         * @brief Check whether an origin matches a wildcard pattern.
         * @param origin Origin to check; empty never matches.
         * @return true on a full match of any pattern.
         */
        [[nodiscard]] bool matches_pattern(const std::string& origin) const;

        /**
         * @brief Classify an origin. Checked in order: configured, registered, pattern.
         * @param origin Origin header value, possibly empty.
         * @return Match outcome.
         */
        [[nodiscard]] e_origin_match match_origin(const std::string& origin) const;

        /**
         * @brief Snapshot of the runtime registrations.
         * @return JSON `{ domain: { appName, registeredAt, metadata } }`.
         */
        [[nodiscard]] shared::json_traits_t::json_obj_t registered_domains() const;

      public:
        /**
         * @brief Generate a new API key.
         * @param prefix Key prefix.
         * @return `<prefix>-<base36 epoch ms>-<random base36>`.
         */
        static std::string generate_api_key(const std::string_view& prefix = "sdk");

        /**
         * @brief Check that a key has a generated or development format.
         * @param api_key Key to check.
         * @return true for `development-key-<n>` or `<letters>-<base36>-<base36>`.
         */
        static bool is_valid_api_key_format(const std::string_view& api_key);

      public:
        [[nodiscard]] CXXGATE_INLINE const auto& allowed_origins() const { return m_allowed_origins; }

        [[nodiscard]] CXXGATE_INLINE const auto& domain_patterns() const { return m_domain_patterns; }

        [[nodiscard]] CXXGATE_INLINE const auto& api_keys() const { return m_api_keys; }

      private:
        /** @brief Configured origins. */
        std::vector<std::string> m_allowed_origins{};

        /** @brief Raw wildcard patterns, as configured. */
        std::vector<std::string> m_domain_patterns{};

        /** @brief Compiled wildcard patterns. */
        std::vector<std::regex> m_compiled_patterns{};

        /** @brief Known API keys. */
        api_keys_t m_api_keys{};

        /** @brief Runtime registrations. */
        std::unordered_map<std::string, registered_domain_t> m_registered{};

        /** @brief Guards m_registered. */
        mutable std::shared_mutex m_mutex{};
    };

    /**
     * @brief Printable name of an origin match.
     * @param match Match outcome.
     * @return Lower-case name.
     */
    CXXGATE_INLINE constexpr std::string_view origin_match_to_str(const e_origin_match& match) {
        switch (match) {
            case e_origin_match::no_origin:
                return "no_origin";
            case e_origin_match::configured:
                return "configured";
            case e_origin_match::registered:
                return "registered";
            case e_origin_match::pattern:
                return "pattern";
            case e_origin_match::denied:
                return "denied";
        }

        return "denied";
    }
}

#endif // CXXGATE_DOMAINS_HXX
