/**
 * @file templates.hxx
 * @brief Request templates: declarative outbound requests addressed by name.
 *
 * A template names an outbound call (method, protocol, host, path, headers, query)
 * whose strings may carry `<%= dotted.path %>` placeholders filled from a caller
 * supplied context at invocation time.
 */

#ifndef CXXGATE_TEMPLATES_HXX
#define CXXGATE_TEMPLATES_HXX

namespace cxxgate::templates {
    /** @brief JSON tree type used for contexts, bodies and configuration. */
    using json_obj_t = shared::json_traits_t::json_obj_t;

    /**
     * @brief A named outbound request description.
     */
    struct request_template_t {
        /** @brief Template name (store key). */
        std::string m_name{};

        /** @brief HTTP method, upper case. Empty when missing from the configuration. */
        std::string m_method{};

        /** @brief Protocol ("http" or "https"), a trailing ':' is tolerated. */
        std::optional<std::string> m_protocol{};

        /** @brief Host, optionally with ":port". Empty when missing from the configuration. */
        std::string m_host{};

        /** @brief Path pattern. */
        std::string m_path{};

        /** @brief Header patterns. */
        std::map<std::string, std::string> m_headers{};

        /** @brief Query parameter patterns. */
        std::map<std::string, std::string> m_query{};

      public:
        /**
         * @brief Build a template from its configuration entry.
         *
         * Fields of the wrong type are skipped with a warning; the Validator
         * reports missing required fields later.
         *
         * @param name Template name.
         * @param config JSON object of the entry.
         * @return The template.
         */
        static request_template_t from_json(const std::string& name, const json_obj_t& config);

        /**
         * @brief Serialize in the configuration shape.
         * @return JSON object.
         */
        [[nodiscard]] json_obj_t to_json() const;
    };

    /**
     * @brief A template after placeholder substitution.
     */
    struct processed_template_t {
        /** @brief Rendered copy of the template. */
        request_template_t m_template{};

        /** @brief Body to send, if any. */
        std::optional<json_obj_t> m_body{};

        /** @brief Raw text of the placeholders that could not be resolved. */
        std::vector<std::string> m_unresolved{};
    };
}

#include "store/store.hxx"

#include "permissions/permissions.hxx"

#include "processor/processor.hxx"

#include "validator/validator.hxx"

#endif // CXXGATE_TEMPLATES_HXX
