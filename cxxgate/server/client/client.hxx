/**
 * @file client.hxx
 * @brief Client connection handling for the CXXGATE server.
 */

#ifndef CXXGATE_SERVER_CLIENT_HXX
#define CXXGATE_SERVER_CLIENT_HXX

namespace cxxgate {
    class c_cxxgate;

    namespace server {
        class c_server;

        /**
         * @brief Represents a client connection to the server.
         *
         * Reads requests in a keep-alive loop, hands them to the gateway and
         * writes the responses back.
         */
        struct client_t {
            /**
             * @brief Constructs a new client session.
             * @param socket TCP socket for the connection
             * @param gate Reference to the main CXXGATE instance
             * @param server Reference to the server instance
             */
            CXXGATE_INLINE client_t(boost::asio::ip::tcp::socket&& socket, c_cxxgate& gate, c_server& server)
                : m_cxxgate(gate),
                  m_server(server),
                  m_socket(std::move(socket)) {
            }

          public:
            /**
             * @brief Starts processing client requests.
             * @return Awaitable that completes when the client disconnects
             */
            boost::asio::awaitable<void> start();

          private:
            /**
             * @brief Handles an individual HTTP request.
             * @param req The HTTP request to handle
             * @return Awaitable that completes when the response is written
             * @throws boost::system::system_error If writing the response fails
             */
            boost::asio::awaitable<void> handle_request(http::request_t&& req);

            /**
             * @brief Writes an error response and marks the connection for closing.
             * @param status Status to reply with (400, 413 or 500)
             * @return Awaitable that completes when the response is written
             */
            boost::asio::awaitable<void> write_error(std::size_t status);

          private:
            /** @brief Flag indicating if the connection should be closed. */
            bool m_close{false};

            /** @brief HTTP version of the last request. */
            std::uint32_t m_version{11u};

            /** @brief Reference to the main CXXGATE instance. */
            c_cxxgate& m_cxxgate;

            /** @brief Reference to the server instance. */
            c_server& m_server;

            /** @brief TCP socket for the connection. */
            boost::asio::ip::tcp::socket m_socket;

            /** @brief Buffer for incoming data. */
            boost::beast::flat_buffer m_buffer;
        };
    }
}

#endif // CXXGATE_SERVER_CLIENT_HXX
