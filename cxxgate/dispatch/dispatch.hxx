/**
 * @file dispatch.hxx
 * @brief Template invocation: validate, render, call out, record.
 */

#ifndef CXXGATE_DISPATCH_HXX
#define CXXGATE_DISPATCH_HXX

#include "client/client.hxx"

namespace cxxgate::dispatch {
    /**
     * @brief Identity of the inbound caller, recorded in the request log.
     */
    struct invocation_source_t {
        /** @brief Origin header of the inbound request. */
        std::optional<std::string> m_origin{};

        /** @brief Caller identifier (API key). */
        std::optional<std::string> m_api_key{};
    };

    /**
     * @brief Outcome of one template invocation.
     *
     * Any received upstream response is a success, whatever its status.
     */
    struct invocation_result_t {
        /** @brief true if a response was received. */
        bool m_success{false};

        /** @brief Upstream status (success only). */
        std::optional<std::int32_t> m_status{};

        /** @brief Upstream headers (success only). */
        std::optional<http::headers_t> m_headers{};

        /** @brief Upstream body, parsed as JSON when possible, otherwise the raw text (success only). */
        std::optional<shared::json_traits_t::json_obj_t> m_data{};

        /** @brief Elapsed time. */
        std::chrono::milliseconds m_duration{};

        /** @brief Error message (failure only). */
        std::optional<std::string> m_error{};

        /** @brief Error kind (failure only). */
        std::optional<e_invoke_error> m_error_kind{};

      public:
        /**
         * @brief Serialize to `{ success, status?, headers?, data?, duration, error?, errorKind? }`.
         * @return JSON object.
         */
        [[nodiscard]] shared::json_traits_t::json_obj_t to_json() const;
    };

    /**
     * @brief Dispatcher tuning.
     */
    struct dispatcher_options_t {
        /** @brief Upper bound of the outbound call. (default: 30 s) */
        std::chrono::milliseconds m_timeout{std::chrono::seconds(30)};

        /** @brief Protocol used when a template has none. (default: https) */
        std::string m_default_protocol{"https"};
    };

    /**
     * @brief Runs template invocations end to end.
     *
     * Every invocation, whatever its outcome, appends exactly one entry to the
     * request log. Validation runs before any network call; the dispatcher never
     * retries.
     */
    class c_dispatcher {
      public:
        /**
         * @brief Construct the dispatcher over its collaborators.
         * @param validator Template validator.
         * @param client Outbound transport.
         * @param log Request log.
         * @param options Tuning.
         */
        c_dispatcher(
            const templates::c_validator& validator,

            c_base_http_client& client,

            stats::c_request_log& log,

            dispatcher_options_t options = {}
        );

      public:
        /**
         * @brief Invoke a template.
         * @param name Template name.
         * @param context Context for placeholder substitution.
         * @param body Optional body; strings are sent verbatim, other values as JSON.
         * @param source Inbound caller identity.
         * @return The invocation result. Never throws for validation or transport failures.
         */
        boost::asio::awaitable<invocation_result_t> invoke(
            std::string name,

            shared::json_traits_t::json_obj_t context,

            std::optional<shared::json_traits_t::json_obj_t> body = std::nullopt,

            invocation_source_t source = {}
        );

        /**
         * @brief Build the absolute URL of a rendered template.
         *
         * `{protocol}://{host}{path}` followed by the percent-encoded query map.
         *
         * @param request_template Rendered template.
         * @param default_protocol Protocol when the template has none.
         * @return The URL.
         * @throws exceptions::transport_exception_t if no valid URL can be formed.
         */
        static std::string build_url(const templates::request_template_t& request_template, const std::string_view& default_protocol = "https");

        [[nodiscard]] CXXGATE_INLINE const auto& options() const { return m_options; }

      private:
        /** @brief Template validator. */
        const templates::c_validator& m_validator;

        /** @brief Outbound transport. */
        c_base_http_client& m_client;

        /** @brief Request log. */
        stats::c_request_log& m_log;

        /** @brief Tuning. */
        dispatcher_options_t m_options{};
    };
}

#endif // CXXGATE_DISPATCH_HXX
