#include <cxxgate.hxx>

namespace cxxgate::dispatch {
    shared::json_traits_t::json_obj_t invocation_result_t::to_json() const {
        shared::json_traits_t::json_obj_t out = {
            {"success", m_success}
        };

        if (m_status)
            out["status"] = *m_status;

        if (m_headers) {
            auto headers = shared::json_traits_t::json_obj_t::object();

            for (const auto& [key, value] : *m_headers)
                headers[key] = value;

            out["headers"] = std::move(headers);
        }

        if (m_data)
            out["data"] = *m_data;

        out["duration"] = m_duration.count();

        if (m_error)
            out["error"] = *m_error;

        if (m_error_kind)
            out["errorKind"] = std::string(invoke_error_to_str(*m_error_kind));

        return out;
    }

    c_dispatcher::c_dispatcher(
        const templates::c_validator& validator,

        c_base_http_client& client,

        stats::c_request_log& log,

        dispatcher_options_t options
    )
        : m_validator(validator),
          m_client(client),
          m_log(log),
          m_options(std::move(options)) {
    }

    std::string c_dispatcher::build_url(const templates::request_template_t& request_template, const std::string_view& default_protocol) {
        auto protocol = request_template.m_protocol.value_or(std::string(default_protocol));

        if (!protocol.empty() && protocol.back() == ':')
            protocol.pop_back();

        if (protocol.empty())
            protocol = default_protocol;

        const auto base = fmt::format("{}://{}", protocol, request_template.m_host);

        auto parsed = boost::urls::parse_uri(base);

        if (!parsed)
            throw exceptions::transport_exception_t(fmt::format("Invalid URL '{}': {}", base, parsed.error().message()));

        try {
            boost::urls::url url{*parsed};

            std::string_view path = request_template.m_path;
            std::string_view inline_query{};

            if (const auto query_pos = path.find('?'); query_pos != std::string_view::npos) {
                inline_query = path.substr(query_pos + 1u);

                path = path.substr(0u, query_pos);
            }

            if (!path.empty() && path.front() != '/')
                url.set_path(fmt::format("/{}", path));
            else
                url.set_path(path);

            if (!inline_query.empty())
                url.set_query(inline_query);

            for (const auto& [key, value] : request_template.m_query)
                url.params().append({key, value});

            return std::string(url.c_str());
        }
        catch (const boost::system::system_error& e) {
            throw exceptions::transport_exception_t(fmt::format("Invalid URL for template \"{}\": {}", request_template.m_name, e.what()));
        }
    }

    boost::asio::awaitable<invocation_result_t> c_dispatcher::invoke(
        std::string name,

        shared::json_traits_t::json_obj_t context,

        std::optional<shared::json_traits_t::json_obj_t> body,

        invocation_source_t source
    ) {
        const auto started = std::chrono::steady_clock::now();

        const auto id = m_log.begin();

        stats::log_entry_t entry{};

        {
            entry.m_id = id;
            entry.m_request_id = stats::c_request_log::make_request_id(id);
            entry.m_method = "POST";
            entry.m_path = "/gateway/invoke-template";
            entry.m_template = name;
            entry.m_origin = source.m_origin;
            entry.m_api_key = source.m_api_key;
        }

        invocation_result_t result{};

        try {
            auto request_template = m_validator.validate(name);

            auto processed = templates::c_processor::render(request_template, context, std::move(body));

            entry.m_method = processed.m_template.m_method;
            entry.m_path = processed.m_template.m_path;

            outbound_request_t request{};

            {
                request.m_method = http::str_to_method(processed.m_template.m_method);
                request.m_url = build_url(processed.m_template, m_options.m_default_protocol);
                request.m_timeout = m_options.m_timeout;

                for (const auto& [key, value] : processed.m_template.m_headers)
                    request.m_headers.insert_or_assign(key, value);

                if (processed.m_body) {
                    if (processed.m_body->is_string())
                        request.m_body = processed.m_body->get<std::string>();
                    else
                        request.m_body = shared::json_traits_t::serialize(*processed.m_body);

                    request.m_headers.try_emplace("Content-Type", "application/json");
                }
            }

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(
                e_log_level::info,

                "[Dispatcher] [{}] Invoking template \"{}\": {} {}",

                entry.m_request_id, name, processed.m_template.m_method, request.m_url
            );
#endif // CXXGATE_USE_LOGGING_IMPL

            auto response = co_await m_client.send(std::move(request));

            result.m_success = true;
            result.m_status = response.m_status;
            result.m_headers = std::move(response.m_headers);

            if (auto data = shared::json_traits_t::try_deserialize(response.m_body))
                result.m_data = std::move(*data);
            else
                result.m_data = std::move(response.m_body);

            entry.m_status = response.m_status;
        }
        catch (const exceptions::template_exception_t& e) {
            result.m_error = e.message();
            result.m_error_kind = e.kind();
        }
        catch (const exceptions::transport_exception_t& e) {
            result.m_error = e.message();
            result.m_error_kind = e_invoke_error::transport_failure;
        }

        result.m_duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        {
            entry.m_duration = result.m_duration;
            entry.m_error = result.m_error;
            entry.m_timestamp = stats::log_clock_t::now();
        }

#ifdef CXXGATE_USE_LOGGING_IMPL
        if (result.m_success) {
            g_logging->log(e_log_level::info, "[Dispatcher] [{}] Response: {} ({}ms)", entry.m_request_id, *result.m_status, result.m_duration.count());
        }
        else
            g_logging->log(
                e_log_level::warning,

                "[Dispatcher] [{}] Invocation of \"{}\" failed ({}): {}",

                entry.m_request_id, name, invoke_error_to_str(*result.m_error_kind), *result.m_error
            );
#endif // CXXGATE_USE_LOGGING_IMPL

        m_log.record(std::move(entry));

        co_return result;
    }
}
