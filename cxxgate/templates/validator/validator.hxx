/**
 * @file validator.hxx
 * @brief Existence, declaration and shape checks run before any template is dispatched.
 */

#ifndef CXXGATE_TEMPLATES_VALIDATOR_HXX
#define CXXGATE_TEMPLATES_VALIDATOR_HXX

namespace cxxgate::templates {
    /**
     * @brief Template names by availability.
     */
    struct template_listing_t {
        /** @brief Names present in the template store. */
        std::vector<std::string> m_configured{};

        /** @brief Names declared by the application's manifest. */
        std::vector<std::string> m_declared{};

        /** @brief Configured and declared. */
        std::vector<std::string> m_valid{};

      public:
        [[nodiscard]] json_obj_t to_json() const;
    };

    /**
     * @brief Cross-checks the template store against the permission registry.
     */
    class c_validator {
      public:
        /**
         * @brief Construct the validator over loaded components.
         * @param store Template store, must outlive the validator.
         * @param permissions Permission registry, must outlive the validator.
         */
        c_validator(const c_template_store& store, const c_permission_registry& permissions);

      public:
        /**
         * @brief Check that a template may be invoked.
         * @param name Template name.
         * @return A copy of the template.
         * @throws exceptions::template_exception_t with kind template_not_found,
         *         template_not_declared or template_malformed.
         */
        [[nodiscard]] request_template_t validate(const std::string& name) const;

        /**
         * @brief List templates by availability.
         * @return Configured, declared and valid names.
         */
        [[nodiscard]] template_listing_t list() const;

        [[nodiscard]] CXXGATE_INLINE const std::string& application() const { return m_permissions.application(); }

      private:
        /** @brief Template store. */
        const c_template_store& m_store;

        /** @brief Permission registry. */
        const c_permission_registry& m_permissions;
    };
}

#endif // CXXGATE_TEMPLATES_VALIDATOR_HXX
