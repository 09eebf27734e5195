#include <cxxgate.hxx>

namespace cxxgate::route::internal {
    template <typename _type_t>
    bool trie_node_t<_type_t>::insert(
        const http::e_method& method,
        const http::path_t& path,

        _type_t handler
    ) {
        const auto normalized_path = normalize_path(path);
        const auto segments = split_path(normalized_path);

        auto node = this;

        for (const auto& segment : segments) {
            if (segment.empty())
                throw base_exception_t(fmt::format("Error while inserting route: empty segment in path: {}", normalized_path));

            if (node->is_broken_segment(segment))
                throw base_exception_t(fmt::format("Error while inserting route: malformed dynamic segment: {}", segment));

            if (node->is_dynamic_segment(segment)) {
                auto param_name = segment.substr(1u, segment.size() - 2u);

                if (param_name.empty())
                    throw base_exception_t(fmt::format("Error while inserting route: dynamic segment without name: {}", normalized_path));

                if (!node->m_dynamic_child) {
                    node->m_dynamic_child = std::make_shared<trie_node_t>();

                    node->m_param = std::move(param_name);
                }
                else if (node->m_param != param_name)
                    throw base_exception_t(fmt::format("Error while inserting route: conflicting parameter name '{}' (already '{}')", param_name, node->m_param));

                node = node->m_dynamic_child.get();
            }
            else {
                auto& child = node->m_child[segment];

                if (!child)
                    child = std::make_shared<trie_node_t>();

                node = child.get();
            }
        }

        if (node->m_values.find(method) != node->m_values.end())
            throw base_exception_t(fmt::format("Error while inserting route: route already exists: {} {}", http::method_to_str(method), normalized_path));

        node->m_values.emplace(method, std::move(handler));

        return true;
    }

    template <typename _type_t>
    const trie_node_t<_type_t>* trie_node_t<_type_t>::walk(const http::path_t& path, http::params_t& params) const {
        const auto segments = split_path(normalize_path(path));

        auto node = this;

        for (const auto& segment : segments) {
            if (segment.empty())
                return nullptr;

            auto it = node->m_child.find(segment);

            if (it != node->m_child.end()) {
                node = it->second.get();
            }
            else if (node->m_dynamic_child) {
                params.emplace(node->m_param, segment);

                node = node->m_dynamic_child.get();
            }
            else
                return nullptr;
        }

        return node;
    }

    template <typename _type_t>
    std::optional<std::pair<_type_t, http::params_t>> trie_node_t<_type_t>::find(
        const http::e_method& method,
        const http::path_t& path
    ) const {
        http::params_t params{};

        const auto node = walk(path, params);

        if (!node)
            return std::nullopt;

        auto it = node->m_values.find(method);

        if (it == node->m_values.end())
            return std::nullopt;

        return std::make_pair(it->second, std::move(params));
    }

    template <typename _type_t>
    bool trie_node_t<_type_t>::has_path(const http::path_t& path) const {
        http::params_t params{};

        const auto node = walk(path, params);

        return node && !node->m_values.empty();
    }

    template <typename _type_t>
    std::vector<std::string> trie_node_t<_type_t>::split_path(const http::path_t& path) const {
        std::vector<std::string> segments{};

        if (path == "/")
            return segments;

        std::size_t start = path.front() == '/' ? 1u : 0u;
        std::size_t end = path.find('/', start);

        while (end != std::string::npos) {
            segments.emplace_back(path.substr(start, end - start));

            start = end + 1u;
            end = path.find('/', start);
        }

        if (start < path.size())
            segments.emplace_back(path.substr(start));

        return segments;
    }

    /**
     * @brief Explicit template instantiation for the router of the framework.
     */
    template struct trie_node_t<std::shared_ptr<route_t>>;
}
