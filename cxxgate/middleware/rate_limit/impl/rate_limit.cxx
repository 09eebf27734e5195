#include <cxxgate.hxx>

namespace cxxgate::middleware::rate_limit {
    c_rate_limit_middleware::c_rate_limit_middleware(rate_limit_options_t options, now_fn_t now)
        : m_options(std::move(options)), m_now(std::move(now)) {
        if (m_options.m_max_requests == 0u)
            throw exceptions::config_exception_t("Rate limit must allow at least one request");

        if (m_options.m_window <= std::chrono::milliseconds::zero())
            throw exceptions::config_exception_t("Rate limit window must be positive");
    }

    std::string c_rate_limit_middleware::key_for(const http::request_t& request) {
        if (request.auth().has_value() && !request.auth()->m_api_key.empty())
            return request.auth()->m_api_key;

        return request.client().remote_addr();
    }

    std::size_t c_rate_limit_middleware::tracked() const {
        std::lock_guard lock(m_mutex);

        return m_hits.size();
    }

    boost::asio::awaitable<http::response_t> c_rate_limit_middleware::handle(const http::request_t& request, next_t next) {
        const auto now = m_now();

        const auto window_start = now - m_options.m_window;

        const auto key = key_for(request);

        bool limited{false};

        std::size_t used{};

        {
            std::lock_guard lock(m_mutex);

            for (auto it = m_hits.begin(); it != m_hits.end();) {
                auto& hits = it->second;

                while (!hits.empty() && hits.front() <= window_start)
                    hits.pop_front();

                if (hits.empty()) {
                    it = m_hits.erase(it);
                }
                else
                    ++it;
            }

            auto& hits = m_hits[key];

            if (hits.size() >= m_options.m_max_requests) {
                limited = true;
            }
            else
                hits.push_back(now);

            used = hits.size();
        }

        const auto window_ms = m_options.m_window.count();

        if (limited) {
#ifdef CXXGATE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[RateLimit] Limit exceeded for {}", key);
#endif // CXXGATE_USE_LOGGING_IMPL

            const auto window_s = static_cast<double>(window_ms) / 1000.0;

            co_return http::json_response_t(
                http::json_t::json_obj_t{
                    {"success", false},
                    {"error", "Rate Limit Exceeded"},
                    {"message", fmt::format("Too many requests. Limit: {} per {} seconds", m_options.m_max_requests, window_s)},
                    {"retryAfter", static_cast<std::int64_t>(std::ceil(window_s))}
                },

                http::e_status::too_many_requests
            );
        }

        auto response = co_await next(request);

        response.headers()["X-RateLimit-Limit"] = std::to_string(m_options.m_max_requests);
        response.headers()["X-RateLimit-Remaining"] = std::to_string(m_options.m_max_requests - used);
        response.headers()["X-RateLimit-Reset"] = http::iso_timestamp(now + m_options.m_window);

        co_return response;
    }
}
