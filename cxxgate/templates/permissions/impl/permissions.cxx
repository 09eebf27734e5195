#include <cxxgate.hxx>

namespace cxxgate::templates {
    std::size_t c_permission_registry::load(const std::string& application, const boost::filesystem::path& path) {
        m_application = application;

        boost::system::error_code error_code{};

        if (!boost::filesystem::exists(path, error_code)) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Permissions] No manifest.json found for {} at {}", application, path.string());
#endif // CXXGATE_USE_LOGGING_IMPL

            return 0u;
        }

        try {
            return load(application, shared::json_traits_t::load(path));
        }
        catch (const std::exception& e) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Permissions] Error loading manifest of {}: {}", application, e.what());
#endif // CXXGATE_USE_LOGGING_IMPL
        }

        return 0u;
    }

    std::size_t c_permission_registry::load(const std::string& application, const json_obj_t& manifest) {
        m_application = application;

        m_entries.clear();

        m_products = 0u;

        const auto product_it = manifest.is_object() ? manifest.find("product") : manifest.end();

        if (!manifest.is_object() || product_it == manifest.end() || !product_it->is_object()) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Permissions] Manifest of {} declares no products", application);
#endif // CXXGATE_USE_LOGGING_IMPL

            return 0u;
        }

        for (const auto& [product, product_cfg] : product_it->items()) {
            m_products++;

            if (!product_cfg.is_object())
                continue;

            const auto requests_it = product_cfg.find("requests");

            if (requests_it == product_cfg.end() || !requests_it->is_object())
                continue;

            for (const auto& [name, _] : requests_it->items())
                m_entries.insert_or_assign(name, permission_entry_t{application, product, true});
        }

#ifdef CXXGATE_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::info,

            "[Permissions] Loaded manifest permissions for {} products ({} templates) of {}",

            m_products, m_entries.size(), application
        );
#endif // CXXGATE_USE_LOGGING_IMPL

        return m_entries.size();
    }

    bool c_permission_registry::is_declared(const std::string& name) const {
        return m_entries.contains(name);
    }

    std::optional<permission_entry_t> c_permission_registry::entry(const std::string& name) const {
        const auto it = m_entries.find(name);

        if (it == m_entries.end())
            return std::nullopt;

        return it->second;
    }

    std::vector<std::string> c_permission_registry::declared() const {
        std::vector<std::string> out{};

        out.reserve(m_entries.size());

        for (const auto& [name, _] : m_entries)
            out.emplace_back(name);

        return out;
    }
}
