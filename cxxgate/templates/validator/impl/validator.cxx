#include <cxxgate.hxx>

namespace cxxgate::templates {
    json_obj_t template_listing_t::to_json() const {
        return {
            {"configured", m_configured},
            {"declared", m_declared},
            {"valid", m_valid}
        };
    }

    c_validator::c_validator(const c_template_store& store, const c_permission_registry& permissions)
        : m_store(store), m_permissions(permissions) {
    }

    request_template_t c_validator::validate(const std::string& name) const {
        auto request_template = m_store.get(name);

        if (!request_template)
            throw exceptions::template_exception_t(
                e_invoke_error::template_not_found,

                fmt::format("Template \"{}\" not found in request templates", name)
            );

        if (!m_permissions.is_declared(name))
            throw exceptions::template_exception_t(
                e_invoke_error::template_not_declared,

                fmt::format("Template \"{}\" not declared in manifest for application \"{}\"", name, m_permissions.application())
            );

        if (request_template->m_method.empty())
            throw exceptions::template_exception_t(
                e_invoke_error::template_malformed,

                fmt::format("Template \"{}\" missing required field: method", name)
            );

        if (http::str_to_method(request_template->m_method) == http::e_method::unknown)
            throw exceptions::template_exception_t(
                e_invoke_error::template_malformed,

                fmt::format("Template \"{}\" has unsupported method: {}", name, request_template->m_method)
            );

        if (request_template->m_host.empty())
            throw exceptions::template_exception_t(
                e_invoke_error::template_malformed,

                fmt::format("Template \"{}\" missing required field: host", name)
            );

        return std::move(*request_template);
    }

    template_listing_t c_validator::list() const {
        template_listing_t out{};

        out.m_configured = m_store.names();
        out.m_declared = m_permissions.declared();

        for (const auto& name : out.m_configured) {
            if (m_permissions.is_declared(name))
                out.m_valid.push_back(name);
        }

        return out;
    }
}
