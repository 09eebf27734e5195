/**
 * @file http_ctx.hxx
 * @brief HTTP context passed to route handlers.
 */

#ifndef CXXGATE_HTTP_HTTP_CTX_HXX
#define CXXGATE_HTTP_HTTP_CTX_HXX

namespace cxxgate::http {
    /**
     * @brief HTTP context structure bundling the request with matched route parameters.
     */
    struct http_ctx_t {
        /**
         * @brief Default constructor.
         */
        CXXGATE_INLINE http_ctx_t() = default;

        /**
         * @brief Constructor initializing with request and parameters.
         * @param request HTTP request object.
         * @param params Route parameters.
         */
        CXXGATE_INLINE http_ctx_t(const request_t& request, const params_t& params)
            : m_request(request), m_params(params) {
        }

      public:
        CXXGATE_INLINE http_ctx_t(const http_ctx_t&) = delete;

        CXXGATE_INLINE http_ctx_t& operator=(const http_ctx_t&) = delete;

        CXXGATE_INLINE http_ctx_t(http_ctx_t&&) = default;

        CXXGATE_INLINE http_ctx_t& operator=(http_ctx_t&&) = default;

      public:
        /**
         * @brief Parse the request body as JSON.
         *
         * The result is cached; an empty or malformed body yields nullopt.
         *
         * @return Parsed JSON document, or nullopt.
         */
        CXXGATE_INLINE const std::optional<json_t::json_obj_t>& json() {
            if (!m_json_parsed) {
                m_json_parsed = true;

                if (!m_request.body().empty())
                    m_json = json_t::try_deserialize(m_request.body());
            }

            return m_json;
        }

      public:
        /**
         * @brief Getter for the HTTP request object.
         * @return Reference to the request_t object.
         */
        CXXGATE_INLINE auto& request() { return m_request; }

        /**
         * @brief Getter for the route parameters.
         * @return Reference to the params_t object.
         */
        CXXGATE_INLINE auto& params() { return m_params; }

      private:
        /** @brief HTTP request object. */
        request_t m_request{};

        /** @brief Route parameters. */
        params_t m_params{};

        /** @brief Cached JSON body. */
        std::optional<json_t::json_obj_t> m_json{};

        /** @brief Whether json() has already run. */
        bool m_json_parsed{false};
    };
}

#endif // CXXGATE_HTTP_HTTP_CTX_HXX
