/**
 * @file internal.hxx
 * @brief Internal utilities for HTTP, including case-insensitive string comparison.
 */

#ifndef CXXGATE_HTTP_UTILS_INTERNAL_HXX
#define CXXGATE_HTTP_UTILS_INTERNAL_HXX

/**
 * @brief Internal namespace for HTTP utilities.
 */
namespace cxxgate::http::internal {
    /**
     * @brief Case-insensitive comparator for header and parameter names.
     */
    struct ci_less_t {
        /** @brief Enables heterogeneous lookup with string views. */
        using is_transparent = void;

        /**
         * @brief Compare two strings case-insensitively.
         * @param lhs Left-hand side string view.
         * @param rhs Right-hand side string view.
         * @return True if lhs is less than rhs (case-insensitive), false otherwise.
         */
        CXXGATE_INLINE bool operator()(const std::string_view& lhs, const std::string_view& rhs) const {
            return boost::algorithm::ilexicographical_compare(lhs, rhs);
        }
    };
}

#endif // CXXGATE_HTTP_UTILS_INTERNAL_HXX
