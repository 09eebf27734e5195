#include <cxxgate.hxx>

namespace cxxgate::templates {
    namespace {
        /**
         * @brief Read an optional string field, warning when it has another type.
         */
        std::optional<std::string> string_field(const std::string& name, const json_obj_t& config, const std::string_view& key) {
            const auto it = config.find(std::string(key));

            if (it == config.end() || it->is_null())
                return std::nullopt;

            if (!it->is_string()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Templates] Template \"{}\": field '{}' is not a string, ignored", name, key);
#endif // CXXGATE_USE_LOGGING_IMPL

                return std::nullopt;
            }

            return it->get<std::string>();
        }

        /**
         * @brief Read an optional map of strings; scalar values are kept in their JSON text.
         */
        std::map<std::string, std::string> string_map_field(const std::string& name, const json_obj_t& config, const std::string_view& key) {
            std::map<std::string, std::string> out{};

            const auto it = config.find(std::string(key));

            if (it == config.end() || it->is_null())
                return out;

            if (!it->is_object()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Templates] Template \"{}\": field '{}' is not an object, ignored", name, key);
#endif // CXXGATE_USE_LOGGING_IMPL

                return out;
            }

            for (const auto& [entry_key, entry_value] : it->items()) {
                if (entry_value.is_string())
                    out.emplace(entry_key, entry_value.get<std::string>());
                else if (entry_value.is_primitive() && !entry_value.is_null())
                    out.emplace(entry_key, entry_value.dump());
                else {
#ifdef CXXGATE_USE_LOGGING_IMPL
                    g_logging->log(e_log_level::warning, "[Templates] Template \"{}\": {}.{} is not a scalar, ignored", name, key, entry_key);
#endif // CXXGATE_USE_LOGGING_IMPL
                }
            }

            return out;
        }
    }

    request_template_t request_template_t::from_json(const std::string& name, const json_obj_t& config) {
        request_template_t out{};

        out.m_name = name;

        out.m_method = boost::to_upper_copy(string_field(name, config, "method").value_or(""));
        out.m_protocol = string_field(name, config, "protocol");
        out.m_host = string_field(name, config, "host").value_or("");
        out.m_path = string_field(name, config, "path").value_or("");

        out.m_headers = string_map_field(name, config, "headers");
        out.m_query = string_map_field(name, config, "query");

        return out;
    }

    json_obj_t request_template_t::to_json() const {
        json_obj_t out = {
            {"method", m_method},
            {"host", m_host},
            {"path", m_path}
        };

        if (m_protocol)
            out["protocol"] = *m_protocol;

        if (!m_headers.empty())
            out["headers"] = m_headers;

        if (!m_query.empty())
            out["query"] = m_query;

        return out;
    }
}
