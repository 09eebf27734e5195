/**
 * @file permissions.hxx
 * @brief Per-application permission registry built from the application's manifest.
 */

#ifndef CXXGATE_TEMPLATES_PERMISSIONS_HXX
#define CXXGATE_TEMPLATES_PERMISSIONS_HXX

namespace cxxgate::templates {
    /**
     * @brief Declaration of a template by an application.
     */
    struct permission_entry_t {
        /** @brief Application id. */
        std::string m_application{};

        /** @brief Product of the manifest that declares the template. */
        std::string m_product{};

        /** @brief Always true for loaded entries. */
        bool m_declared{true};
    };

    /**
     * @brief Set of template names an application declared in its manifest.
     *
     * Manifest shape: `{ "product": { "<product>": { "requests": { "<template>": {...} } } } }`.
     */
    class c_permission_registry {
      public:
        c_permission_registry() = default;

      public:
        /**
         * @brief Load an application's manifest from disk.
         * @param application Application id.
         * @param path Path of manifest.json.
         * @return Number of declared templates.
         */
        std::size_t load(const std::string& application, const boost::filesystem::path& path);

        /**
         * @brief Load an application's manifest from a parsed document.
         * @param application Application id.
         * @param manifest Parsed manifest.
         * @return Number of declared templates.
         */
        std::size_t load(const std::string& application, const json_obj_t& manifest);

        [[nodiscard]] bool is_declared(const std::string& name) const;

        /**
         * @brief Declaration details of a template.
         * @param name Template name.
         * @return The entry, or nullopt if the application did not declare it.
         */
        [[nodiscard]] std::optional<permission_entry_t> entry(const std::string& name) const;

        /**
         * @brief Declared template names, sorted.
         * @return Template names.
         */
        [[nodiscard]] std::vector<std::string> declared() const;

        [[nodiscard]] CXXGATE_INLINE std::size_t products() const { return m_products; }

        [[nodiscard]] CXXGATE_INLINE const std::string& application() const { return m_application; }

      private:
        /** @brief Application the manifest belongs to. */
        std::string m_application{};

        /** @brief Declared templates. */
        std::map<std::string, permission_entry_t> m_entries{};

        /** @brief Number of products read from the manifest. */
        std::size_t m_products{};
    };
}

#endif // CXXGATE_TEMPLATES_PERMISSIONS_HXX
