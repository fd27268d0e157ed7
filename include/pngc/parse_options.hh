/**
 * @file parse_options.hh
 * @brief Parsing options for chunk records
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngc {

    /**
     * @struct parse_options
     * @brief Configuration options for chunk::parse() and chunk::read()
     *
     * The defaults accept every structurally sound record with a matching
     * CRC, whatever its chunk type.
     */
    struct parse_options {
        /**
         * @brief Strict chunk type checking
         *
         * When true, a record whose chunk type fails chunk_type::is_valid()
         * is rejected with invalid_chunk_type.
         * When false, the record is accepted and a "chunk_type" warning is
         * reported through on_warning.
         */
        bool strict = false;

        /**
         * @brief Maximum allowed data length in bytes
         *
         * Records declaring a longer payload fail with invalid_chunk_length.
         * Values above 2^31 have no effect, the format never allows more.
         */
        std::uint32_t max_chunk_length = std::uint32_t(1) << 31;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the record where the warning occurred
         * @param category Warning category (e.g., "chunk_type")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngc
