/**
 * @file processor.hxx
 * @brief Placeholder parser and resolver for request templates.
 *
 * Placeholders have the form `<%= a.b.c %>`. Text is parsed into literal and
 * placeholder segments; placeholders are resolved against a JSON context tree,
 * walking objects by key and arrays by decimal index.
 */

#ifndef CXXGATE_TEMPLATES_PROCESSOR_HXX
#define CXXGATE_TEMPLATES_PROCESSOR_HXX

namespace cxxgate::templates {
    /**
     * @brief Kind of a parsed segment.
     */
    enum struct e_segment_kind : std::uint8_t {
        literal,    ///< Text copied as-is.
        placeholder ///< `<%= path %>` to resolve.
    };

    /**
     * @brief One piece of a parsed template string.
     */
    struct segment_t {
        /** @brief Segment kind. */
        e_segment_kind m_kind{e_segment_kind::literal};

        /** @brief Literal text, or the raw placeholder text including delimiters. */
        std::string m_text{};

        /** @brief Dotted path of a placeholder, split on '.'. Empty for literals. */
        std::vector<std::string> m_path{};
    };

    /**
     * @brief Stateless template renderer.
     */
    class c_processor {
      public:
        /**
         * @brief Split text into literal and placeholder segments.
         *
         * A `<%=` not closed by `%>` before the next `%` is literal text.
         * Adjacent literal runs are merged.
         *
         * @param text Text to parse.
         * @return Segments in order.
         */
        static std::vector<segment_t> parse(const std::string_view& text);

        /**
         * @brief Resolve a dotted path against a context.
         *
         * The walk starts at the context root; when that fails and the first
         * segment is `context`, the rest of the path is walked from the root.
         *
         * @param path Path segments.
         * @param context Context tree.
         * @return Text of the leaf value, or nullopt.
         */
        static std::optional<std::string> resolve(const std::vector<std::string>& path, const json_obj_t& context);

        /**
         * @brief Substitute every resolvable placeholder in a string.
         *
         * Unresolvable placeholders stay verbatim and are reported.
         *
         * @param text Text to render.
         * @param context Context tree.
         * @param unresolved Receives the raw text of placeholders that stayed verbatim.
         * @return Rendered text.
         */
        static std::string render_string(
            const std::string_view& text,
            const json_obj_t& context,

            std::vector<std::string>* unresolved = nullptr
        );

        /**
         * @brief Render a template: path, header values and query values.
         * @param request_template Template to render; not modified.
         * @param context Context tree.
         * @param body Optional body attached to the result.
         * @return Rendered copy.
         */
        static processed_template_t render(
            const request_template_t& request_template,
            const json_obj_t& context,

            std::optional<json_obj_t> body = std::nullopt
        );

      private:
        /**
         * @brief Walk a path from a node.
         * @return Leaf node, or nullptr.
         */
        static const json_obj_t* walk(
            const json_obj_t& node,

            std::vector<std::string>::const_iterator begin,
            std::vector<std::string>::const_iterator end
        );

        /**
         * @brief Text representation of a leaf value.
         */
        static std::string leaf_to_text(const json_obj_t& value);
    };
}

#endif // CXXGATE_TEMPLATES_PROCESSOR_HXX
