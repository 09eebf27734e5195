#include <cxxgate.hxx>

namespace cxxgate::stats {
    shared::json_traits_t::json_obj_t log_entry_t::to_json() const {
        shared::json_traits_t::json_obj_t out = {
            {"id", m_id},
            {"requestId", m_request_id},
            {"method", m_method},
            {"path", m_path},
            {"timestamp", http::iso_timestamp(m_timestamp)}
        };

        if (m_template)
            out["templateName"] = *m_template;

        if (m_origin)
            out["origin"] = *m_origin;

        if (m_api_key)
            out["apiKey"] = *m_api_key;

        if (m_status)
            out["status"] = *m_status;

        if (m_duration)
            out["duration"] = m_duration->count();

        if (m_error)
            out["error"] = *m_error;

        return out;
    }

    shared::json_traits_t::json_obj_t stats_t::to_json() const {
        return {
            {"totalRequests", m_total_requests},
            {"recentRequests", m_recent_requests},
            {"averageResponseTime", m_average_response_time},
            {"successRate", m_success_rate},
            {"topOrigins", m_top_origins},
            {"topApiKeys", m_top_api_keys},
            {"statusCodes", m_status_codes}
        };
    }

    c_request_log::c_request_log(std::size_t capacity)
        : m_capacity(std::max<std::size_t>(capacity, 1u)) {
    }

    std::uint64_t c_request_log::begin() {
        return m_total.fetch_add(1u, std::memory_order_relaxed) + 1u;
    }

    void c_request_log::record(log_entry_t entry) {
        std::lock_guard lock(m_mutex);

        m_entries.emplace_back(std::move(entry));

        while (m_entries.size() > m_capacity)
            m_entries.pop_front();
    }

    stats_t c_request_log::stats(const std::chrono::milliseconds& window) const {
        return stats(window, log_clock_t::now());
    }

    stats_t c_request_log::stats(const std::chrono::milliseconds& window, const log_clock_t::time_point& now) const {
        stats_t out{};

        out.m_total_requests = total();

        const auto window_start = now - window;

        std::int64_t duration_sum{};
        std::size_t duration_count{};
        std::size_t successful{};

        std::lock_guard lock(m_mutex);

        for (const auto& entry : m_entries) {
            if (entry.m_timestamp <= window_start)
                continue;

            out.m_recent_requests++;

            if (entry.m_duration) {
                duration_sum += entry.m_duration->count();

                duration_count++;
            }

            if (entry.m_status && *entry.m_status < 400)
                successful++;

            out.m_top_origins[entry.m_origin.value_or("unknown")]++;
            out.m_top_api_keys[entry.m_api_key.value_or("none")]++;
            out.m_status_codes[entry.m_status ? std::to_string(*entry.m_status) : "error"]++;
        }

        if (duration_count > 0u)
            out.m_average_response_time = std::llround(static_cast<double>(duration_sum) / static_cast<double>(duration_count));

        if (out.m_recent_requests > 0u)
            out.m_success_rate = std::llround(static_cast<double>(successful) * 100.0 / static_cast<double>(out.m_recent_requests));

        return out;
    }

    std::vector<log_entry_t> c_request_log::recent(std::size_t limit) const {
        std::lock_guard lock(m_mutex);

        const auto count = std::min(limit, m_entries.size());

        return {m_entries.rbegin(), m_entries.rbegin() + static_cast<std::ptrdiff_t>(count)};
    }

    std::size_t c_request_log::size() const {
        std::lock_guard lock(m_mutex);

        return m_entries.size();
    }

    std::string c_request_log::make_request_id(std::uint64_t id, const log_clock_t::time_point& at) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();

        return fmt::format("req-{}-{}", id, ms);
    }
}
