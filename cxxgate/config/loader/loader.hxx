/**
 * @file loader.hxx
 * @brief Building the configuration from presets, a JSON file and environment variables.
 *
 * Sources in increasing precedence: the preset of the environment named by
 * `CXXGATE_ENV` (development when unset), the JSON configuration file, then
 * the individual environment variables (`PORT`, `GATEWAY_URL`, `BACKEND_URL`,
 * `CXXGATE_APP_ID`).
 */

#ifndef CXXGATE_CONFIG_LOADER_HXX
#define CXXGATE_CONFIG_LOADER_HXX

namespace cxxgate::config {
    /** @brief Environment variable lookup, replaceable for tests. */
    using env_lookup_t = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Read a variable from the process environment.
     * @param name Variable name.
     * @return The value, or nullopt when unset.
     */
    std::optional<std::string> process_env(const std::string& name);

    /**
     * @brief Configuration preset of an environment.
     *
     * Staging and production read their API keys from `STAGING_API_KEY_1/2`
     * and `PROD_API_KEY_1/2`; unset keys are left out.
     *
     * @param environment Deployment environment.
     * @param env Environment lookup.
     * @return The preset configuration.
     */
    cxxgate_cfg_t preset(e_environment environment, const env_lookup_t& env = process_env);

    /**
     * @brief Overlay a JSON configuration document.
     * @param cfg Configuration to modify.
     * @param document Parsed configuration document; absent keys are left unchanged.
     * @throws exceptions::config_exception_t on values of the wrong type or out of range.
     */
    void apply_json(cxxgate_cfg_t& cfg, const shared::json_traits_t::json_obj_t& document);

    /**
     * @brief Overlay the individual environment variables.
     * @param cfg Configuration to modify.
     * @param env Environment lookup.
     * @throws exceptions::config_exception_t if PORT is not a valid port.
     */
    void apply_env(cxxgate_cfg_t& cfg, const env_lookup_t& env = process_env);

    /**
     * @brief Build the complete configuration.
     * @param path JSON configuration file; nullopt to use presets and environment only.
     * @param env Environment lookup.
     * @return The configuration.
     * @throws exceptions::config_exception_t on an unknown CXXGATE_ENV, an unreadable file or invalid values.
     */
    cxxgate_cfg_t load(const std::optional<boost::filesystem::path>& path, const env_lookup_t& env = process_env);
}

#endif // CXXGATE_CONFIG_LOADER_HXX
