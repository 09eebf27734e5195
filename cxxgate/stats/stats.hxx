/**
 * @file stats.hxx
 * @brief Bounded in-memory request log with rolling statistics.
 */

#ifndef CXXGATE_STATS_HXX
#define CXXGATE_STATS_HXX

namespace cxxgate::stats {
    /** @brief Clock used to stamp log entries. */
    using log_clock_t = std::chrono::system_clock;

    /**
     * @brief One completed request (template invocation or proxied call).
     */
    struct log_entry_t {
        /** @brief Monotonic id assigned by c_request_log::begin(). */
        std::uint64_t m_id{};

        /** @brief Printable id, `req-<id>-<epoch ms>`. */
        std::string m_request_id{};

        /** @brief HTTP method of the outbound or proxied call. */
        std::string m_method{};

        /** @brief Path of the outbound or proxied call. */
        std::string m_path{};

        /** @brief Template name for template invocations. */
        std::optional<std::string> m_template{};

        /** @brief Origin of the inbound request. */
        std::optional<std::string> m_origin{};

        /** @brief Caller identifier (API key) of the inbound request. */
        std::optional<std::string> m_api_key{};

        /** @brief Upstream status; absent for transport failures and rejected invocations. */
        std::optional<std::int32_t> m_status{};

        /** @brief Elapsed time. */
        std::optional<std::chrono::milliseconds> m_duration{};

        /** @brief Error message for failures. */
        std::optional<std::string> m_error{};

        /** @brief Completion time. */
        log_clock_t::time_point m_timestamp{};

      public:
        /**
         * @brief Serialize to the JSON shape served by /gateway/logs.
         * @return JSON object; absent optionals are omitted.
         */
        [[nodiscard]] shared::json_traits_t::json_obj_t to_json() const;
    };

    /**
     * @brief Aggregates over a trailing time window.
     */
    struct stats_t {
        /** @brief All requests ever begun. */
        std::uint64_t m_total_requests{};

        /** @brief Entries inside the window. */
        std::size_t m_recent_requests{};

        /** @brief Rounded mean duration in ms of windowed entries with a duration. */
        std::int64_t m_average_response_time{};

        /** @brief Rounded percentage of windowed entries with status < 400. */
        std::int64_t m_success_rate{};

        /** @brief Origin -> count ("unknown" when absent). */
        std::map<std::string, std::size_t> m_top_origins{};

        /** @brief API key -> count ("none" when absent). */
        std::map<std::string, std::size_t> m_top_api_keys{};

        /** @brief Status -> count ("error" when absent). */
        std::map<std::string, std::size_t> m_status_codes{};

      public:
        [[nodiscard]] shared::json_traits_t::json_obj_t to_json() const;
    };

    /**
     * @brief Thread-safe fixed-capacity FIFO of log entries.
     */
    class c_request_log {
      public:
        /** @brief Default trailing window of stats(). */
        static constexpr std::chrono::milliseconds k_default_window{std::chrono::hours(1)};

      public:
        /**
         * @brief Construct the log.
         * @param capacity Maximum number of retained entries (at least 1).
         */
        explicit c_request_log(std::size_t capacity = 1000u);

      public:
        /**
         * @brief Reserve the next request id and count the request.
         * @return Fresh id, starting at 1.
         */
        std::uint64_t begin();

        /**
         * @brief Append an entry, evicting the oldest beyond capacity.
         * @param entry Completed entry.
         */
        void record(log_entry_t entry);

        /**
         * @brief Statistics over the trailing window ending now.
         * @param window Window length.
         * @return Aggregates.
         */
        [[nodiscard]] stats_t stats(const std::chrono::milliseconds& window = k_default_window) const;

        /**
         * @brief Statistics over the trailing window ending at a given time.
         *
         * An entry is inside the window when its timestamp is strictly after `now - window`.
         *
         * @param window Window length.
         * @param now End of the window.
         * @return Aggregates.
         */
        [[nodiscard]] stats_t stats(const std::chrono::milliseconds& window, const log_clock_t::time_point& now) const;

        /**
         * @brief Most recent entries.
         * @param limit Maximum number of entries.
         * @return Entries, newest first.
         */
        [[nodiscard]] std::vector<log_entry_t> recent(std::size_t limit = 50u) const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] CXXGATE_INLINE std::size_t capacity() const { return m_capacity; }

        [[nodiscard]] CXXGATE_INLINE std::uint64_t total() const { return m_total.load(std::memory_order_relaxed); }

      public:
        /**
         * @brief Build the printable request id of a log entry.
         * @param id Id from begin().
         * @param at Time the request started.
         * @return `req-<id>-<epoch ms>`.
         */
        static std::string make_request_id(std::uint64_t id, const log_clock_t::time_point& at = log_clock_t::now());

      private:
        /** @brief Maximum number of retained entries. */
        std::size_t m_capacity{};

        /** @brief Retained entries, oldest first. */
        std::deque<log_entry_t> m_entries{};

        /** @brief All requests ever begun. */
        std::atomic<std::uint64_t> m_total{};

        /** @brief Guards m_entries. */
        mutable std::mutex m_mutex{};
    };
}

#endif // CXXGATE_STATS_HXX
