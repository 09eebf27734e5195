/**
 * @file store.hxx
 * @brief Read-only store of request templates, loaded once at startup.
 */

#ifndef CXXGATE_TEMPLATES_STORE_HXX
#define CXXGATE_TEMPLATES_STORE_HXX

namespace cxxgate::templates {
    /**
     * @brief Template name -> request template.
     *
     * Loading never throws: a missing or malformed document leaves the store
     * empty and logs a warning. Once loaded the store is immutable, so
     * concurrent readers need no locking.
     */
    class c_template_store {
      public:
        c_template_store() = default;

      public:
        /**
         * @brief Load templates from a JSON file.
         * @param path Path of the templates document.
         * @return Number of templates in the store. A second call is a no-op.
         */
        std::size_t load(const boost::filesystem::path& path);

        /**
         * @brief Load templates from a parsed document.
         * @param document JSON object keyed by template name.
         * @return Number of templates in the store. A second call is a no-op.
         */
        std::size_t load(const json_obj_t& document);

        /**
         * @brief Look a template up by name.
         * @param name Template name.
         * @return A copy of the template, or nullopt.
         */
        [[nodiscard]] std::optional<request_template_t> get(const std::string& name) const;

        [[nodiscard]] bool contains(const std::string& name) const;

        /**
         * @brief Names of every stored template, sorted.
         * @return Template names.
         */
        [[nodiscard]] std::vector<std::string> names() const;

        [[nodiscard]] CXXGATE_INLINE std::size_t size() const { return m_templates.size(); }

        [[nodiscard]] CXXGATE_INLINE bool loaded() const { return m_loaded; }

      private:
        /** @brief Stored templates. */
        std::map<std::string, request_template_t> m_templates{};

        /** @brief Set by the first load() call, whatever its outcome. */
        bool m_loaded{false};
    };
}

#endif // CXXGATE_TEMPLATES_STORE_HXX
