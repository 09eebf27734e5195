/**
 * @file exception.hxx
 * @brief Defines the exception hierarchy used throughout the CXXGATE.
 *
 * Provides a base exception class (`base_exception_t`) derived from `std::runtime_error`,
 * as well as the specialized exception types raised by the server, the template
 * pipeline, the outbound transport and the client SDK. All exceptions support status
 * codes, custom message prefixes, and full error formatting.
 */

#ifndef CXXGATE_EXCEPTION_HXX
#define CXXGATE_EXCEPTION_HXX

namespace cxxgate {
    /**
     * @brief Base exception type for all errors in CXXGATE.
     *
     * Inherits from std::runtime_error and provides status code handling,
     * optional message prefixes, and full error formatting.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct a base exception with a plain message.
         * @param str Error message.
         */
        CXXGATE_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct a base exception with a message, status code, and optional prefix.
         * @param str Error message.
         * @param status Associated status code.
         * @param prefix Optional prefix to include in the formatted message.
         */
        CXXGATE_INLINE base_exception_t(const std::string& str, const std::size_t& status, const std::string_view& prefix = "")
            : std::runtime_error(str), m_status(status), m_prefix(prefix), m_message(str) {
            if (!m_prefix.empty()) {
                m_what = fmt::format("[{}] {}", m_prefix, m_message);
            }
            else
                m_what = m_message;
        }

      public:
        /**
         * @brief Obtaining the status code associated with an exception (mutable).
         * @return Reference to the status code.
         */
        CXXGATE_INLINE auto& status() { return m_status; }

        /**
         * @brief Obtaining the status code associated with an exception (read-only).
         * @return Const reference to the status code.
         */
        CXXGATE_INLINE const auto& status() const { return m_status; }

        /**
         * @brief Get the prefix of the message used in the exception (read-only).
         * @return Const reference to the message prefix.
         */
        CXXGATE_INLINE const auto& prefix() const { return m_prefix; }

        /**
         * @brief Get the message used in the exception (read-only).
         * @return Const reference to the message.
         */
        CXXGATE_INLINE const auto& message() const { return m_message; }

        /**
         * @brief Get the full formatted error message.
         * @return Pointer to a null-terminated C-string with the exception message.
         */
        CXXGATE_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Status code associated with the exception. */
        std::size_t m_status{};

        /** @brief Optional prefix used to qualify the error message. */
        std::string m_prefix{};

        /** @brief Raw message content (without prefix). */
        std::string m_message{};

        /** @brief Cached full message string used in what(). */
        std::string m_what{};
    };

    /**
     * @brief Kinds of failures an invocation can end with.
     */
    enum struct e_invoke_error : std::uint8_t {
        template_not_found,    ///< No template with that name in the store.
        template_not_declared, ///< Template exists but the application did not declare it.
        template_malformed,    ///< Template lacks a required field.
        transport_failure      ///< Network, DNS, TLS or timeout failure on the outbound call.
    };

    /**
     * @brief Convert an invocation error kind to its wire name.
     * @param kind Error kind.
     * @return Snake-case name of the kind.
     */
    CXXGATE_INLINE constexpr std::string_view invoke_error_to_str(const e_invoke_error& kind) {
        switch (kind) {
            case e_invoke_error::template_not_found:
                return "template_not_found";
            case e_invoke_error::template_not_declared:
                return "template_not_declared";
            case e_invoke_error::template_malformed:
                return "template_malformed";
            case e_invoke_error::transport_failure:
                return "transport_failure";
        }

        return "unknown";
    }

    namespace exceptions {
        /**
         * @brief Exception type for server-client errors in CXXGATE.
         *
         * Automatically sets the prefix to "Server-Client".
         */
        struct client_exception_t : public base_exception_t {
            /**
             * @brief Construct a new client_exception_t with a message and status.
             * @param str Error message to describe the exception.
             * @param status Status code associated with the exception.
             * @param prefix Prefix to prepend to the error message.
             */
            CXXGATE_INLINE client_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Server-Client"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception type for server errors in CXXGATE.
         *
         * Automatically sets the prefix to "Server".
         */
        struct server_exception_t : public base_exception_t {
            /**
             * @brief Construct a new server_exception_t with a message and status.
             * @param str Error message.
             * @param status Associated status code.
             * @param prefix Optional prefix to include in the formatted message.
             */
            CXXGATE_INLINE server_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Server"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception type for HTTP processing errors in CXXGATE.
         *
         * Automatically sets the prefix to "HTTP-Processing".
         */
        struct processing_exception_t : public base_exception_t {
            /**
             * @brief Construct a new processing_exception_t with a message and status.
             * @param str Error message.
             * @param status Associated status code.
             * @param prefix Optional prefix to include in the formatted message.
             */
            CXXGATE_INLINE processing_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "HTTP-Processing"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception type for invalid configuration values.
         *
         * Automatically sets the prefix to "Config".
         */
        struct config_exception_t : public base_exception_t {
            CXXGATE_INLINE config_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Config"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception raised by template validation.
         *
         * Carries the invocation error kind so callers can map it to a result value.
         */
        struct template_exception_t : public base_exception_t {
            /**
             * @brief Construct a new template_exception_t.
             * @param kind Kind of the validation failure.
             * @param str Error message.
             * @param prefix Optional prefix to include in the formatted message.
             */
            CXXGATE_INLINE template_exception_t(
                const e_invoke_error& kind,

                const std::string& str,

                const std::string_view& prefix = "Templates"
            )
                : base_exception_t(str, 0u, prefix), m_kind(kind) {
            }

          public:
            /**
             * @brief Get the failure kind.
             * @return Const reference to the kind.
             */
            CXXGATE_INLINE const auto& kind() const { return m_kind; }

          private:
            /** @brief Kind of the validation failure. */
            e_invoke_error m_kind{};
        };

        /**
         * @brief Exception raised when an outbound HTTP exchange fails before a response is read.
         *
         * Automatically sets the prefix to "Transport".
         */
        struct transport_exception_t : public base_exception_t {
            CXXGATE_INLINE transport_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "Transport"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Exception raised by the client SDK after its retry policy is exhausted.
         *
         * The status holds the last HTTP status received, or 0 for transport failures.
         */
        struct sdk_exception_t : public base_exception_t {
            CXXGATE_INLINE sdk_exception_t(
                const std::string& str,

                const std::size_t& status = 0u,
                const std::string_view& prefix = "SDK"
            )
                : base_exception_t(str, status, prefix) {
            }
        };
    }
}

#endif // CXXGATE_EXCEPTION_HXX
