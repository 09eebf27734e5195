#include <cxxgate.hxx>

namespace cxxgate::templates {
    namespace {
        constexpr std::string_view k_open = "<%=";
        constexpr std::string_view k_close = "%>";

        /**
         * @brief Append literal text, merging with a preceding literal segment.
         */
        void push_literal(std::vector<segment_t>& segments, const std::string_view& text) {
            if (text.empty())
                return;

            if (!segments.empty() && segments.back().m_kind == e_segment_kind::literal) {
                segments.back().m_text.append(text);

                return;
            }

            segments.push_back(segment_t{e_segment_kind::literal, std::string(text), {}});
        }
    }

    std::vector<segment_t> c_processor::parse(const std::string_view& text) {
        std::vector<segment_t> segments{};

        std::size_t pos{};

        while (pos < text.size()) {
            const auto open = text.find(k_open, pos);

            if (open == std::string_view::npos) {
                push_literal(segments, text.substr(pos));

                break;
            }

            push_literal(segments, text.substr(pos, open - pos));

            const auto content_begin = open + k_open.size();
            const auto percent = text.find('%', content_begin);

            if (percent == std::string_view::npos
                || percent == content_begin
                || text.substr(percent, k_close.size()) != k_close) {
                push_literal(segments, k_open);

                pos = content_begin;

                continue;
            }

            auto content = std::string(text.substr(content_begin, percent - content_begin));

            boost::trim(content);

            segment_t placeholder{e_segment_kind::placeholder, std::string(text.substr(open, percent + k_close.size() - open)), {}};

            boost::split(placeholder.m_path, content, boost::is_any_of("."));

            segments.emplace_back(std::move(placeholder));

            pos = percent + k_close.size();
        }

        return segments;
    }

    const json_obj_t* c_processor::walk(
        const json_obj_t& node,

        std::vector<std::string>::const_iterator begin,
        std::vector<std::string>::const_iterator end
    ) {
        auto current = &node;

        for (auto it = begin; it != end; ++it) {
            const auto& key = *it;

            if (current->is_object()) {
                const auto found = current->find(key);

                if (found == current->end())
                    return nullptr;

                current = &*found;
            }
            else if (current->is_array()) {
                std::size_t index{};

                const auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);

                if (key.empty() || ec != std::errc{} || ptr != key.data() + key.size() || index >= current->size())
                    return nullptr;

                current = &(*current)[index];
            }
            else
                return nullptr;
        }

        return current;
    }

    std::string c_processor::leaf_to_text(const json_obj_t& value) {
        if (value.is_string())
            return value.get<std::string>();

        return value.dump();
    }

    std::optional<std::string> c_processor::resolve(const std::vector<std::string>& path, const json_obj_t& context) {
        if (path.empty() || (path.size() == 1u && path.front().empty()))
            return std::nullopt;

        if (const auto leaf = walk(context, path.begin(), path.end()))
            return leaf_to_text(*leaf);

        if (path.size() > 1u && path.front() == "context") {
            if (const auto leaf = walk(context, std::next(path.begin()), path.end()))
                return leaf_to_text(*leaf);
        }

        return std::nullopt;
    }

    std::string c_processor::render_string(
        const std::string_view& text,
        const json_obj_t& context,

        std::vector<std::string>* unresolved
    ) {
        if (text.find(k_open) == std::string_view::npos)
            return std::string(text);

        std::string out{};

        out.reserve(text.size());

        for (const auto& segment : parse(text)) {
            if (segment.m_kind == e_segment_kind::literal) {
                out += segment.m_text;

                continue;
            }

            if (auto value = resolve(segment.m_path, context)) {
                out += *value;

                continue;
            }

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Templates] Template variable \"{}\" not found in context", boost::join(segment.m_path, "."));
#endif // CXXGATE_USE_LOGGING_IMPL

            if (unresolved)
                unresolved->push_back(segment.m_text);

            out += segment.m_text;
        }

        return out;
    }

    processed_template_t c_processor::render(
        const request_template_t& request_template,
        const json_obj_t& context,

        std::optional<json_obj_t> body
    ) {
        processed_template_t out{};

        out.m_template = request_template;

        out.m_template.m_path = render_string(request_template.m_path, context, &out.m_unresolved);

        for (auto& [_, value] : out.m_template.m_headers)
            value = render_string(value, context, &out.m_unresolved);

        for (auto& [_, value] : out.m_template.m_query)
            value = render_string(value, context, &out.m_unresolved);

        if (body && !body->is_null())
            out.m_body = std::move(body);

        return out;
    }
}
