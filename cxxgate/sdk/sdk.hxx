/**
 * @file sdk.hxx
 * @brief Client SDK for applications talking to a gateway.
 */

#ifndef CXXGATE_SDK_HXX
#define CXXGATE_SDK_HXX

namespace cxxgate::sdk {
    /** @brief SDK version sent in registration metadata. */
    inline constexpr std::string_view k_sdk_version = "1.0.0";

    /**
     * @brief Bounded retry policy with exponential backoff.
     */
    struct retry_policy_t {
        /** @brief Total attempts including the first one. (default: 3) */
        std::uint32_t m_max_attempts{3u};

        /** @brief Delay after the first failed attempt. (default: 1000 ms) */
        std::chrono::milliseconds m_base_delay{1000};

        /** @brief Growth factor between consecutive delays. (default: 2.0) */
        double m_multiplier{2.0};

        /** @brief Upper bound of a single delay. (default: 30 s) */
        std::chrono::milliseconds m_max_delay{std::chrono::seconds(30)};

      public:
        /**
         * @brief Delay to wait after a failed attempt.
         * @param attempt 1-based number of the attempt that failed.
         * @return min(base * multiplier^(attempt - 1), max).
         */
        [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t attempt) const;

        /**
         * @brief Whether a failed attempt may be retried.
         * @param status HTTP status of the failure, nullopt for transport failures.
         * @return False for client errors (4xx other than 408 and 429), true otherwise.
         */
        [[nodiscard]] bool should_retry(const std::optional<std::int32_t>& status) const;
    };

    /**
     * @brief An attempt is about to be sent.
     */
    struct request_event_t {
        std::string m_request_id{};

        std::string m_method{};

        std::string m_url{};

        std::uint32_t m_attempt{};
    };

    /**
     * @brief A request succeeded.
     */
    struct response_event_t {
        std::string m_request_id{};

        std::string m_url{};

        std::int32_t m_status{};

        shared::json_traits_t::json_obj_t m_data{};

        std::uint32_t m_attempt{};
    };

    /**
     * @brief A request failed for good.
     */
    struct error_event_t {
        std::string m_request_id{};

        std::string m_url{};

        std::string m_error{};

        /** @brief Last HTTP status, absent for transport failures. */
        std::optional<std::int32_t> m_status{};

        std::uint32_t m_attempts{};
    };

    /**
     * @brief Receives SDK events. Every callback defaults to doing nothing.
     */
    class c_base_observer {
      public:
        virtual void on_request(const request_event_t&) {}

        virtual void on_response(const response_event_t&) {}

        virtual void on_error(const error_event_t&) {}

        /**
         * @brief Virtual destructor.
         */
        virtual ~c_base_observer() = default;
    };

    /** @brief Shared pointer type for observers. */
    using observer_t = std::shared_ptr<c_base_observer>;

    /**
     * @brief Configuration of the client.
     */
    struct sdk_cfg_t {
        /** @brief Base URL of the gateway. (default: http://localhost:9000) */
        std::string m_gateway_url{"http://localhost:9000"};

        /** @brief API key sent as X-API-Key. */
        std::optional<std::string> m_api_key{};

        /** @brief Domain sent as X-Client-Domain and registered by register_domain(). */
        std::string m_client_domain{};

        /** @brief Upper bound of one attempt. (default: 30 s) */
        std::chrono::milliseconds m_timeout{std::chrono::seconds(30)};

        /** @brief Retry policy. */
        retry_policy_t m_retry{};
    };

    /**
     * @brief Client for the gateway endpoints.
     *
     * Every call retries according to the policy and throws
     * exceptions::sdk_exception_t once it gives up.
     */
    class c_gateway_client {
      public:
        /**
         * @brief Construct the client.
         * @param cfg Client configuration.
         * @param client Outbound transport; a Beast client is created when null.
         */
        explicit c_gateway_client(sdk_cfg_t cfg, std::shared_ptr<dispatch::c_base_http_client> client = nullptr);

      public:
        /**
         * @brief Register an observer.
         * @param observer Observer to notify.
         */
        void add_observer(observer_t observer);

        /**
         * @brief Remove an observer.
         * @param observer Previously added observer.
         * @return true if it was registered.
         */
        bool remove_observer(const observer_t& observer);

      public:
        /**
         * @brief Invoke a template through `/gateway/invoke-template`.
         * @param name Template name.
         * @param context Placeholder context.
         * @param body Optional request body.
         * @return The invocation result document.
         * @throws exceptions::sdk_exception_t if the gateway reports a failure.
         */
        boost::asio::awaitable<shared::json_traits_t::json_obj_t> invoke_template(
            std::string name,

            shared::json_traits_t::json_obj_t context = shared::json_traits_t::json_obj_t::object(),

            std::optional<shared::json_traits_t::json_obj_t> body = std::nullopt
        );

        /**
         * @brief Call a proxied backend endpoint, `/api<endpoint>`.
         * @param method HTTP method.
         * @param endpoint Endpoint below /api, e.g. "/users".
         * @param body Optional body, not sent for GET.
         * @return The response document.
         */
        boost::asio::awaitable<shared::json_traits_t::json_obj_t> request(
            http::e_method method,

            std::string endpoint,

            std::optional<shared::json_traits_t::json_obj_t> body = std::nullopt
        );

        boost::asio::awaitable<shared::json_traits_t::json_obj_t> health_check();

        boost::asio::awaitable<shared::json_traits_t::json_obj_t> gateway_info();

        boost::asio::awaitable<shared::json_traits_t::json_obj_t> gateway_stats();

        boost::asio::awaitable<shared::json_traits_t::json_obj_t> templates();

        /**
         * @brief Register the client domain with the configured API key.
         * @param metadata Extra metadata merged into the registration.
         * @return The registration document.
         * @throws exceptions::sdk_exception_t if no API key is configured or registration fails.
         */
        boost::asio::awaitable<shared::json_traits_t::json_obj_t> register_domain(
            shared::json_traits_t::json_obj_t metadata = shared::json_traits_t::json_obj_t::object()
        );

      public:
        /**
         * @brief Generate a request id, `req-<epoch ms>-<random base36>`.
         */
        static std::string make_request_id();

        [[nodiscard]] CXXGATE_INLINE const auto& cfg() const { return m_cfg; }

        /**
         * @brief Change the API key used by later calls.
         */
        CXXGATE_INLINE void set_api_key(std::string api_key) { m_cfg.m_api_key = std::move(api_key); }

      private:
        /**
         * @brief Send a request with retries.
         * @param method HTTP method.
         * @param path Path below the gateway URL.
         * @param body Optional body.
         * @param require_success Treat `success == false` in a 2xx document as a failure.
         * @return The response document.
         */
        boost::asio::awaitable<shared::json_traits_t::json_obj_t> execute(
            http::e_method method,

            std::string path,

            std::optional<shared::json_traits_t::json_obj_t> body,

            bool require_success
        );

        /**
         * @brief Call a member of every observer.
         */
        template <typename _fn_t>
        void notify(_fn_t&& fn) const;

      private:
        /** @brief Configuration. */
        sdk_cfg_t m_cfg{};

        /** @brief Outbound transport. */
        std::shared_ptr<dispatch::c_base_http_client> m_client;

        /** @brief Guards m_observers. */
        mutable std::mutex m_observers_mutex{};

        /** @brief Registered observers. */
        std::vector<observer_t> m_observers{};
    };
}

#endif // CXXGATE_SDK_HXX
