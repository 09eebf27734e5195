#include <cxxgate.hxx>

namespace cxxgate::templates {
    std::size_t c_template_store::load(const boost::filesystem::path& path) {
        if (m_loaded)
            return m_templates.size();

        boost::system::error_code error_code{};

        if (!boost::filesystem::exists(path, error_code)) {
            m_loaded = true;

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Templates] No request templates found at {}", path.string());
#endif // CXXGATE_USE_LOGGING_IMPL

            return 0u;
        }

        try {
            return load(shared::json_traits_t::load(path));
        }
        catch (const std::exception& e) {
            m_loaded = true;

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Templates] Error loading request templates: {}", e.what());
#endif // CXXGATE_USE_LOGGING_IMPL
        }

        return 0u;
    }

    std::size_t c_template_store::load(const json_obj_t& document) {
        if (m_loaded)
            return m_templates.size();

        m_loaded = true;

        if (!document.is_object()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Templates] Request templates document is not a JSON object");
#endif // CXXGATE_USE_LOGGING_IMPL

            return 0u;
        }

        for (const auto& [name, config] : document.items()) {
            if (!config.is_object()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::warning, "[Templates] Template \"{}\" is not a JSON object, skipped", name);
#endif // CXXGATE_USE_LOGGING_IMPL

                continue;
            }

            m_templates.insert_or_assign(name, request_template_t::from_json(name, config));
        }

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(e_log_level::info, "[Templates] Loaded {} request templates", m_templates.size());
#endif // CXXGATE_USE_LOGGING_IMPL

        return m_templates.size();
    }

    std::optional<request_template_t> c_template_store::get(const std::string& name) const {
        const auto it = m_templates.find(name);

        if (it == m_templates.end())
            return std::nullopt;

        return it->second;
    }

    bool c_template_store::contains(const std::string& name) const {
        return m_templates.contains(name);
    }

    std::vector<std::string> c_template_store::names() const {
        std::vector<std::string> out{};

        out.reserve(m_templates.size());

        for (const auto& [name, _] : m_templates)
            out.emplace_back(name);

        return out;
    }
}
