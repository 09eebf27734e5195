/**
 * @file mock_client.hxx
 * @brief Scripted outbound transport and coroutine helpers shared by the tests.
 */

#ifndef CXXGATE_TESTS_MOCK_CLIENT_HXX
#define CXXGATE_TESTS_MOCK_CLIENT_HXX

#include <cxxgate.hxx>

namespace cxxgate::tests {
    /**
     * @brief Outbound client returning queued replies and recording every request.
     *
     * An empty queue answers 200 with `{"ok":true}`. A queued reply without a
     * response throws transport_exception_t with the queued message.
     */
    class c_mock_http_client : public dispatch::c_base_http_client {
      public:
        struct reply_t {
            std::optional<dispatch::outbound_response_t> m_response{};

            std::string m_error{};
        };

      public:
        boost::asio::awaitable<dispatch::outbound_response_t> send(dispatch::outbound_request_t request) override {
            reply_t reply{};

            {
                std::lock_guard lock(m_mutex);

                m_requests.push_back(std::move(request));

                if (!m_replies.empty()) {
                    reply = std::move(m_replies.front());

                    m_replies.pop_front();
                }
                else
                    reply.m_response = dispatch::outbound_response_t{200, {{"Content-Type", "application/json"}}, R"({"ok":true})"};
            }

            if (!reply.m_response)
                throw exceptions::transport_exception_t(reply.m_error);

            co_return std::move(*reply.m_response);
        }

      public:
        void respond(std::int32_t status, std::string body, http::headers_t headers = {{"Content-Type", "application/json"}}) {
            std::lock_guard lock(m_mutex);

            m_replies.push_back(reply_t{dispatch::outbound_response_t{status, std::move(headers), std::move(body)}, {}});
        }

        void fail(std::string error) {
            std::lock_guard lock(m_mutex);

            m_replies.push_back(reply_t{std::nullopt, std::move(error)});
        }

        [[nodiscard]] std::vector<dispatch::outbound_request_t> requests() const {
            std::lock_guard lock(m_mutex);

            return m_requests;
        }

      private:
        mutable std::mutex m_mutex{};

        std::deque<reply_t> m_replies{};

        std::vector<dispatch::outbound_request_t> m_requests{};
    };

    /**
     * @brief Run a coroutine to completion on a fresh io_context and return its result.
     */
    template <typename _fn_t>
    auto run_awaitable(_fn_t&& fn) {
        boost::asio::io_context io_context;

        auto future = boost::asio::co_spawn(io_context, std::forward<_fn_t>(fn), boost::asio::use_future);

        io_context.run();

        return future.get();
    }

    /**
     * @brief Build an inbound request.
     */
    inline http::request_t make_request(
        http::e_method method,
        std::string uri,

        http::headers_t headers = {},

        std::string body = {}
    ) {
        http::request_t request{};

        request.method() = method;
        request.uri() = std::move(uri);
        request.headers() = std::move(headers);
        request.body() = std::move(body);
        request.client() = http::request_t::client_info_t("10.0.0.7", 51000u);

        return request;
    }

    /**
     * @brief Parse a response body as JSON.
     */
    inline shared::json_traits_t::json_obj_t body_of(const http::response_t& response) {
        return shared::json_traits_t::deserialize(response.m_body);
    }
}

#endif // CXXGATE_TESTS_MOCK_CLIENT_HXX
