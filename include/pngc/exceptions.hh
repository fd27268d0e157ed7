/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * Every failure of the library is reported by throwing one of the classes
 * below. All of them derive from png_error, which carries an errc value
 * naming the kind of failure.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngc {

    /**
     * @enum errc
     * @brief Kind of failure carried by every png_error
     */
    enum class errc {
        io,                   ///< Truncated input or failing stream
        invalid_chunk_type,   ///< Chunk type rejected by a checked constructor or strict parsing
        invalid_chunk_length, ///< Data length exceeds the allowed maximum
        invalid_crc,          ///< Stored CRC does not match the computed one
        numeric_conversion,   ///< Length does not fit the target integer width
        invalid_utf8          ///< Chunk data is not valid UTF-8
    };

    /**
     * @class png_error
     * @brief Base exception class for all library errors
     *
     * Catch this class to handle every library failure in one place and
     * dispatch on code() if needed.
     */
    class png_error : public std::runtime_error {
    public:
        png_error(errc code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] errc code() const noexcept { return m_code; }

    private:
        errc m_code;
    };

    /**
     * @class io_error
     * @brief Thrown when fewer bytes are available than the format requires,
     *        or when the underlying stream fails.
     */
    class io_error : public png_error {
    public:
        explicit io_error(const std::string& msg)
            : png_error(errc::io, msg) {}
    };

    /**
     * @class parse_error
     * @brief Base of the errors raised when input bytes violate the chunk format
     *
     * Never thrown directly; catch it to handle any format violation.
     */
    class parse_error : public png_error {
    protected:
        parse_error(errc code, const std::string& msg)
            : png_error(code, msg) {}
    };

    class invalid_chunk_type : public parse_error {
    public:
        explicit invalid_chunk_type(const std::string& msg)
            : parse_error(errc::invalid_chunk_type, msg) {}
    };

    class invalid_chunk_length : public parse_error {
    public:
        explicit invalid_chunk_length(const std::string& msg)
            : parse_error(errc::invalid_chunk_length, msg) {}
    };

    class invalid_crc : public parse_error {
    public:
        explicit invalid_crc(const std::string& msg)
            : parse_error(errc::invalid_crc, msg) {}
    };

    class numeric_conversion_error : public png_error {
    public:
        explicit numeric_conversion_error(const std::string& msg)
            : png_error(errc::numeric_conversion, msg) {}
    };

    /**
     * @class invalid_utf8
     * @brief Thrown by chunk::data_as_string() only
     */
    class invalid_utf8 : public png_error {
    public:
        explicit invalid_utf8(const std::string& msg)
            : png_error(errc::invalid_utf8, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @param args Arguments streamed one after another into the message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_AS
     * @brief Throw the given png_error subclass with formatted message
     * @param type Exception class (e.g. invalid_crc)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_AS(type, ...) \
        throw ::pngc::type(::pngc::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) THROW_AS(io_error, __VA_ARGS__)

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_AS_IF
     * @brief Conditionally throw the given png_error subclass
     */
    #define THROW_AS_IF(condition, type, ...) \
        do { if (condition) THROW_AS(type, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngc
