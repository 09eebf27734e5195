/**
 * @file internal.hxx
 * @brief Internal implementation details for route handling.
 */

#ifndef CXXGATE_ROUTE_INTERNAL_HXX
#define CXXGATE_ROUTE_INTERNAL_HXX

namespace cxxgate::route {
    struct route_t;
}

namespace cxxgate::route::internal {
    /**
     * @brief Trie node for route path matching.
     *
     * Static segments are preferred over the `{name}` dynamic segment of the
     * same level.
     *
     * @tparam _type_t Type of the handler stored in the node.
     */
    template <typename _type_t>
    struct trie_node_t {
        /**
         * @brief Construct a new trie node with pre-allocated capacity.
         */
        CXXGATE_INLINE trie_node_t() {
            m_values.reserve(4u);
            m_child.reserve(8u);
        }

      public:
        /**
         * @brief Insert a new route handler into the trie.
         * @param method HTTP method to handle.
         * @param path URL path pattern to match.
         * @param handler Handler function to store.
         * @return true if inserted.
         * @throws base_exception_t on malformed patterns or duplicate routes.
         */
        bool insert(const http::e_method& method, const http::path_t& path, _type_t handler);

        /**
         * @brief Find a matching route handler in the trie.
         * @param method HTTP method to match.
         * @param path URL path to match.
         * @return Optional containing handler and parameters if found.
         */
        std::optional<std::pair<_type_t, http::params_t>> find(const http::e_method& method, const http::path_t& path) const;

        /**
         * @brief Check whether any method is registered for a path.
         * @param path URL path to match.
         * @return true if the path matches a node holding at least one handler.
         */
        bool has_path(const http::path_t& path) const;

      private:
        /**
         * @brief Walk the trie along a concrete path.
         * @param path Path to walk.
         * @param params Receives the dynamic segment values.
         * @return Matching node or nullptr.
         */
        const trie_node_t* walk(const http::path_t& path, http::params_t& params) const;

        /**
         * @brief Normalize a URL path by dropping a trailing slash.
         * @param path Path to normalize.
         * @return Normalized path string.
         */
        CXXGATE_INLINE http::path_t normalize_path(const http::path_t& path) const {
            if (path.empty())
                return "/";

            return (path.size() > 1u && path.back() == '/') ? path.substr(0, path.size() - 1u) : path;
        }

        /**
         * @brief Check if a path segment is dynamic.
         * @param segment Path segment to check.
         * @return true if the segment is `{name}`.
         */
        CXXGATE_INLINE constexpr bool is_dynamic_segment(const std::string_view& segment) const {
            return segment.size() >= 2u && segment.front() == '{' && segment.back() == '}';
        }

        /**
         * @brief Check if a path segment is broken (missing opening or closing brace).
         * @param segment Path segment to check.
         * @return true if broken segment.
         */
        CXXGATE_INLINE constexpr bool is_broken_segment(const std::string_view& segment) const {
            return (segment.front() == '{' && segment.back() != '}') || (segment.front() != '{' && segment.back() == '}');
        }

        /**
         * @brief Splits a path into segments.
         * @param path The path to split.
         * @return Vector of path segments.
         */
        std::vector<std::string> split_path(const http::path_t& path) const;

      private:
        /** @brief Map of HTTP methods to their handlers. */
        boost::unordered_map<http::e_method, _type_t> m_values{};

        /** @brief Child nodes for static path segments. */
        boost::unordered_map<std::string, std::shared_ptr<trie_node_t>> m_child{};

        /** @brief Parameter name for the dynamic child. */
        std::string m_param{};

        /** @brief Child node for dynamic path segments. */
        std::shared_ptr<trie_node_t> m_dynamic_child{};
    };

    /**
     * @brief Check if a type is an awaitable HTTP response.
     * @tparam _assigned_t Type to check.
     */
    template <typename _assigned_t>
    struct is_awaitable_response_t {
        static constexpr bool value = false;
    };

    /**
     * @brief Specialization for awaitable HTTP responses.
     * @tparam _executor Executor type.
     */
    template <typename _executor>
    struct is_awaitable_response_t<boost::asio::awaitable<http::response_t, _executor>> {
        static constexpr bool value = true;
    };

    /**
     * @brief Concept for async handler functions.
     * @tparam _fn_t Type to check.
     */
    template <typename _fn_t>
    concept async_handler_c = is_awaitable_response_t<std::invoke_result_t<const _fn_t&, http::http_ctx_t&&>>::value;

    /**
     * @brief Concept for sync handler functions.
     * @tparam _fn_t Type to check.
     */
    template <typename _fn_t>
    concept sync_handler_c = requires(const _fn_t& fn, http::http_ctx_t ctx) {
        { fn(std::move(ctx)) } -> std::convertible_to<http::response_t>;
    };
}

#endif // CXXGATE_ROUTE_INTERNAL_HXX
