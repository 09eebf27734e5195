/**
 * @file rate_limit.hxx
 * @brief Sliding-window rate limiting middleware for CXXGATE.
 */

#ifndef CXXGATE_MIDDLEWARE_RATE_LIMIT_HXX
#define CXXGATE_MIDDLEWARE_RATE_LIMIT_HXX

namespace cxxgate::middleware::rate_limit {
    /**
     * @brief Configuration options for the rate limiter.
     */
    struct rate_limit_options_t {
        /** @brief Length of the sliding window. (default: 15 minutes) */
        std::chrono::milliseconds m_window{std::chrono::minutes(15)};

        /** @brief Requests allowed per key inside the window. (default: 1000) */
        std::size_t m_max_requests{1000u};
    };

    /**
     * @brief Limits requests per API key, or per remote address for unauthenticated callers.
     */
    class c_rate_limit_middleware : public c_base_middleware {
      public:
        /** @brief Clock source, replaceable for tests. */
        using now_fn_t = std::function<std::chrono::system_clock::time_point()>;

      public:
        /**
         * @brief Construct the limiter.
         * @param options Window and limit.
         * @param now Clock source.
         */
        explicit c_rate_limit_middleware(rate_limit_options_t options = {}, now_fn_t now = &std::chrono::system_clock::now);

      public:
        boost::asio::awaitable<http::response_t> handle(const http::request_t& request, next_t next) override;

        /**
         * @brief Key a request is counted under.
         * @param request Inbound request.
         * @return The authenticated API key, else the remote address.
         */
        static std::string key_for(const http::request_t& request);

        /**
         * @brief Number of keys currently tracked.
         */
        [[nodiscard]] std::size_t tracked() const;

      private:
        /** @brief Window and limit. */
        rate_limit_options_t m_options{};

        /** @brief Clock source. */
        now_fn_t m_now;

        /** @brief Guards m_hits. */
        mutable std::mutex m_mutex{};

        /** @brief Request timestamps inside the window, per key. */
        std::unordered_map<std::string, std::deque<std::chrono::system_clock::time_point>> m_hits{};
    };
}

#endif // CXXGATE_MIDDLEWARE_RATE_LIMIT_HXX
