#include <cxxgate.hxx>

namespace cxxgate::sdk {
    using json_obj_t = shared::json_traits_t::json_obj_t;

    std::chrono::milliseconds retry_policy_t::delay_for(const std::uint32_t attempt) const {
        if (attempt == 0u)
            return std::chrono::milliseconds::zero();

        const auto delay = static_cast<double>(m_base_delay.count()) * std::pow(m_multiplier, static_cast<double>(attempt - 1u));

        if (delay >= static_cast<double>(m_max_delay.count()))
            return m_max_delay;

        return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
    }

    bool retry_policy_t::should_retry(const std::optional<std::int32_t>& status) const {
        if (!status.has_value())
            return true;

        if (*status == 408 || *status == 429)
            return true;

        return *status < 400 || *status >= 500;
    }

    c_gateway_client::c_gateway_client(sdk_cfg_t cfg, std::shared_ptr<dispatch::c_base_http_client> client)
        : m_cfg(std::move(cfg)),
          m_client(client ? std::move(client) : std::make_shared<dispatch::c_http_client>()) {
        while (!m_cfg.m_gateway_url.empty() && m_cfg.m_gateway_url.back() == '/')
            m_cfg.m_gateway_url.pop_back();

        if (m_cfg.m_retry.m_max_attempts == 0u)
            m_cfg.m_retry.m_max_attempts = 1u;
    }

    void c_gateway_client::add_observer(observer_t observer) {
        if (!observer)
            return;

        std::lock_guard lock(m_observers_mutex);

        m_observers.push_back(std::move(observer));
    }

    bool c_gateway_client::remove_observer(const observer_t& observer) {
        std::lock_guard lock(m_observers_mutex);

        const auto it = std::find(m_observers.begin(), m_observers.end(), observer);

        if (it == m_observers.end())
            return false;

        m_observers.erase(it);

        return true;
    }

    template <typename _fn_t>
    void c_gateway_client::notify(_fn_t&& fn) const {
        std::vector<observer_t> observers{};

        {
            std::lock_guard lock(m_observers_mutex);

            observers = m_observers;
        }

        for (const auto& observer : observers) {
            try {
                fn(*observer);
            }
            catch (const std::exception& e) {
#ifdef CXXGATE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::error, "[SDK] Observer error: {}", e.what());
#else
                std::cerr << fmt::format("[SDK] Observer error: {}", e.what()) << "\n";
#endif // CXXGATE_USE_LOGGING_IMPL
            }
        }
    }

    std::string c_gateway_client::make_request_id() {
        const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();

        const auto uuid = boost::uuids::random_generator()();

        std::uint64_t random{};

        for (std::size_t i{}; i < sizeof(random); i++)
            random = (random << 8u) | uuid.data[i];

        return fmt::format("req-{}-{}", now_ms, http::utils::to_base36(random).substr(0u, 9u));
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::execute(
        http::e_method method,

        std::string path,

        std::optional<json_obj_t> body,

        bool require_success
    ) {
        const auto url = m_cfg.m_gateway_url + path;

        const auto request_id = make_request_id();

        const auto method_str = http::method_to_str(method);

        dispatch::outbound_request_t request{};

        request.m_method = method;
        request.m_url = url;
        request.m_timeout = m_cfg.m_timeout;

        request.m_headers = {
            {"Content-Type", "application/json"},
            {"X-Request-ID", request_id}
        };

        if (!m_cfg.m_client_domain.empty())
            request.m_headers["X-Client-Domain"] = m_cfg.m_client_domain;

        if (m_cfg.m_api_key.has_value())
            request.m_headers["X-API-Key"] = *m_cfg.m_api_key;

        if (body.has_value() && method != http::e_method::get)
            request.m_body = body->is_string() ? body->get<std::string>() : http::json_t::serialize(*body);

        std::string last_error{};

        std::optional<std::int32_t> last_status{};

        std::uint32_t attempts{};

        for (std::uint32_t attempt = 1u; attempt <= m_cfg.m_retry.m_max_attempts; attempt++) {
            attempts = attempt;

            notify([&](c_base_observer& observer) {
                observer.on_request(request_event_t{request_id, method_str, url, attempt});
            });

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[SDK] [{}] Attempt {}: {} {}", request_id, attempt, method_str, path);
#endif // CXXGATE_USE_LOGGING_IMPL

            std::optional<dispatch::outbound_response_t> response{};

            try {
                response = co_await m_client->send(request);
            }
            catch (const exceptions::transport_exception_t& e) {
                last_error = e.message();
                last_status.reset();
            }

            auto retry = true;

            if (response.has_value()) {
                last_status = response->m_status;

                const auto ok = response->m_status >= 200 && response->m_status < 300;

                auto data = http::json_t::try_deserialize(response->m_body);

                if (ok && data.has_value()) {
                    if (require_success && data->is_object() && !http::json_t::value_or<bool>(*data, "success", true)) {
                        last_error = fmt::format("Gateway reported failure: {}", http::json_t::value_or<std::string>(*data, "error", "Unknown error"));

                        retry = false;
                    }
                    else {
                        notify([&](c_base_observer& observer) {
                            observer.on_response(response_event_t{request_id, url, response->m_status, *data, attempt});
                        });

                        co_return std::move(*data);
                    }
                }
                else if (ok) {
                    last_error = fmt::format("Invalid JSON response: {}", response->m_status);
                }
                else {
                    const auto message = data.has_value() && data->is_object()
                                           ? http::json_t::value_or<std::string>(*data, "message", http::json_t::value_or<std::string>(*data, "error", "Unknown error"))
                                           : std::string("Unknown error");

                    last_error = fmt::format("API request failed: {} - {}", response->m_status, message);

                    retry = m_cfg.m_retry.should_retry(response->m_status);
                }
            }

#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[SDK] [{}] Attempt {} failed: {}", request_id, attempt, last_error);
#endif // CXXGATE_USE_LOGGING_IMPL

            if (!retry || attempt == m_cfg.m_retry.m_max_attempts)
                break;

            if (const auto delay = m_cfg.m_retry.delay_for(attempt); delay > std::chrono::milliseconds::zero()) {
                boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

                timer.expires_after(delay);

                co_await timer.async_wait(boost::asio::use_awaitable);
            }
        }

        notify([&](c_base_observer& observer) {
            observer.on_error(error_event_t{request_id, url, last_error, last_status, attempts});
        });

        throw exceptions::sdk_exception_t(last_error, static_cast<std::size_t>(last_status.value_or(0)));
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::invoke_template(std::string name, json_obj_t context, std::optional<json_obj_t> body) {
        json_obj_t payload = {
            {"templateName", std::move(name)},
            {"context", std::move(context)}
        };

        if (body.has_value())
            payload["body"] = std::move(*body);

        co_return co_await execute(http::e_method::post, "/gateway/invoke-template", std::move(payload), true);
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::request(http::e_method method, std::string endpoint, std::optional<json_obj_t> body) {
        if (!endpoint.empty() && endpoint.front() != '/')
            endpoint.insert(endpoint.begin(), '/');

        co_return co_await execute(method, "/api" + endpoint, std::move(body), false);
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::health_check() {
        co_return co_await execute(http::e_method::get, "/health", std::nullopt, false);
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::gateway_info() {
        co_return co_await execute(http::e_method::get, "/gateway/info", std::nullopt, false);
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::gateway_stats() {
        co_return co_await execute(http::e_method::get, "/gateway/stats", std::nullopt, false);
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::templates() {
        co_return co_await execute(http::e_method::get, "/gateway/templates", std::nullopt, false);
    }

    boost::asio::awaitable<json_obj_t> c_gateway_client::register_domain(json_obj_t metadata) {
        if (!m_cfg.m_api_key.has_value())
            throw exceptions::sdk_exception_t("An API key is required to register a domain");

        if (!metadata.is_object())
            metadata = json_obj_t::object();

        metadata["timestamp"] = http::iso_timestamp();
        metadata["sdkVersion"] = std::string(k_sdk_version);

        json_obj_t payload = {
            {"domain", m_cfg.m_client_domain},
            {"apiKey", *m_cfg.m_api_key},
            {"metadata", std::move(metadata)}
        };

        co_return co_await execute(http::e_method::post, "/gateway/register-domain", std::move(payload), true);
    }
}
