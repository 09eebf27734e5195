/**
 * @file json_traits.hxx
 * @brief Type traits and utilities for JSON serialization/deserialization using nlohmann::json.
 */

#ifndef CXXGATE_SHARED_JSON_TRAITS_HXX
#define CXXGATE_SHARED_JSON_TRAITS_HXX

namespace shared {
    /**
     * @brief JSON traits using nlohmann::json for serialization.
     */
    struct json_traits_t final {
        /** @brief The JSON type used for serialization (std::string). */
        using json_type_t = std::string;

        /** @brief The tree type used for deserialization (nlohmann::json). */
        using json_obj_t = nlohmann::json;

        /**
         * @brief Serialize a value to a JSON string using nlohmann::json.
         * @tparam _type_t The type of the value to serialize (default is json_obj_t).
         * @param value The value to serialize.
         * @return The serialized JSON string.
         */
        template <typename _type_t = json_obj_t>
        CXXGATE_INLINE static json_type_t serialize(const _type_t& value) {
            try {
                nlohmann::json j = value;

                return j.dump();
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't serialize value to json: {}", e.what()));
            }
        }

        /**
         * @brief Deserialize a value from a JSON string using nlohmann::json.
         * @tparam _type_t The type of the value to deserialize to (default is json_obj_t).
         * @param json The JSON string to deserialize from.
         * @return The deserialized value.
         */
        template <typename _type_t = json_obj_t>
        CXXGATE_INLINE static _type_t deserialize(const std::string_view& json) {
            try {
                nlohmann::json j = nlohmann::json::parse(json);

                return j.get<_type_t>();
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't deserialize json to value: {}", e.what()));
            }
        }

        /**
         * @brief Try to deserialize a JSON string without throwing.
         * @param json The JSON string to parse.
         * @return The parsed tree, or nullopt if the input is not valid JSON.
         */
        CXXGATE_INLINE static std::optional<json_obj_t> try_deserialize(const std::string_view& json) {
            auto j = nlohmann::json::parse(json, nullptr, false);

            if (j.is_discarded())
                return std::nullopt;

            return j;
        }

        /**
         * @brief Read and parse a JSON document from disk.
         * @param path Path of the document.
         * @return The parsed tree.
         * @throws std::runtime_error if the file can't be opened or parsed.
         */
        CXXGATE_INLINE static json_obj_t load(const boost::filesystem::path& path) {
            std::ifstream stream(path.string());

            if (!stream)
                throw std::runtime_error(fmt::format("Can't open json file: {}", path.string()));

            try {
                return nlohmann::json::parse(stream);
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't parse json file {}: {}", path.string(), e.what()));
            }
        }

        /**
         * @brief Get a value from a JSON object using nlohmann::json.
         * @tparam _type_t The type of the value to retrieve.
         * @param obj The JSON object to access.
         * @param key The key to access in the JSON object.
         * @return The value retrieved from the JSON object.
         */
        template <typename _type_t>
        CXXGATE_INLINE static _type_t at(const json_obj_t& obj, const std::string_view& key) { return obj.at(std::string(key)).get<_type_t>(); }

        /**
         * @brief Get a value from a JSON object, or a fallback when absent or of another type.
         * @tparam _type_t The type of the value to retrieve.
         * @param obj The JSON object to access.
         * @param key The key to access in the JSON object.
         * @param fallback Value returned when the key can't be read as _type_t.
         * @return The value or the fallback.
         */
        template <typename _type_t>
        CXXGATE_INLINE static _type_t value_or(const json_obj_t& obj, const std::string_view& key, _type_t fallback) {
            if (!obj.is_object())
                return fallback;

            const auto it = obj.find(std::string(key));

            if (it == obj.end())
                return fallback;

            try {
                return it->template get<_type_t>();
            }
            catch (const nlohmann::json::exception&) {
                return fallback;
            }
        }
    };
}

#endif // CXXGATE_SHARED_JSON_TRAITS_HXX
