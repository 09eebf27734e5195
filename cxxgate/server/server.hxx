/**
 * @file server.hxx
 * @brief Server implementation for handling client connections.
 */

#ifndef CXXGATE_SERVER_HXX
#define CXXGATE_SERVER_HXX

#include "client/client.hxx"

namespace cxxgate::server {
    /**
     * @brief Main server class that manages client connections.
     *
     * Handles incoming connections, manages worker threads, and coordinates
     * with the main CXXGATE instance for request processing.
     */
    class c_server : public std::enable_shared_from_this<c_server> {
      public:
        /**
         * @brief Constructs a new server instance.
         * @param gate Reference to the main CXXGATE instance
         * @param host Hostname or IP address to bind to
         * @param port Port number to listen on
         * @throws boost::system::system_error If the endpoint can't be bound
         * @throws exceptions::server_exception_t If listening fails
         */
        c_server(c_cxxgate& gate, const std::string& host, std::int32_t port);

      public:
        /**
         * @brief Destructor that ensures server is stopped.
         */
        CXXGATE_INLINE ~c_server() { stop(); }

      public:
        /**
         * @brief Starts the server with the specified number of worker threads.
         * @param workers_count Number of worker threads to start, 0 for hardware concurrency
         * @throws exceptions::server_exception_t If server fails to start
         */
        void start(std::int32_t workers_count);

        /**
         * @brief Stops the server and all client connections.
         *
         * When called from a worker thread the pool is joined on destruction instead.
         */
        void stop();

      public:
        /**
         * @brief Gets the IO context used by the server.
         * @return Reference to the IO context
         */
        CXXGATE_INLINE auto& io_ctx() { return m_io_ctx; }

        /**
         * @brief Checks if the server is running.
         * @param m Memory order for the atomic load
         * @return true if server is running, false otherwise
         */
        CXXGATE_INLINE bool running(const std::memory_order& m) const { return m_running.load(m); }

        /**
         * @brief Port the acceptor is bound to.
         */
        [[nodiscard]] CXXGATE_INLINE std::uint16_t port() const { return m_acceptor.local_endpoint().port(); }

      private:
        /**
         * @brief Asynchronously accepts incoming client connections.
         * @return Awaitable that completes when the acceptor is closed
         */
        boost::asio::awaitable<void> do_accept();

      private:
        /** @brief Reference to the main CXXGATE instance. */
        c_cxxgate& m_cxxgate;

        /** @brief IO context for handling asynchronous operations. */
        boost::asio::io_context m_io_ctx;

        /** @brief TCP acceptor for incoming connections. */
        boost::asio::ip::tcp::acceptor m_acceptor;

        /** @brief Atomic flag indicating if server is running. */
        std::atomic_bool m_running{false};

        /** @brief Thread pool for handling client connections. */
        std::unique_ptr<boost::asio::thread_pool> m_thread_pool{};
    };
}

#endif // CXXGATE_SERVER_HXX
