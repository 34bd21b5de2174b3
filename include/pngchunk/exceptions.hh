/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the chunk codec
 *
 * Every failure of the codec is reported by throwing one of the classes
 * below. The set is closed: decode and text-conversion failures derive from
 * parse_error and carry an error_kind, stream failures are io_error.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @enum error_kind
     * @brief Reason a parse_error was raised
     */
    enum class error_kind {
        invalid_format,     ///< Text chunk type is not exactly 4 ASCII letters
        invalid_chunk_type, ///< Decoded chunk type fails the validity check
        invalid_length,     ///< Declared payload length exceeds the configured limit
        truncated_input,    ///< Input ends before the declared record does
        checksum_mismatch,  ///< Embedded CRC differs from the recomputed one
        encoding_error      ///< Payload is not valid UTF-8
    };

    /**
     * @brief Get a short name for an error kind
     * @param kind Error kind
     * @return Static string such as "checksum_mismatch"
     */
    inline const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_format:
                return "invalid_format";
            case error_kind::invalid_chunk_type:
                return "invalid_chunk_type";
            case error_kind::invalid_length:
                return "invalid_length";
            case error_kind::truncated_input:
                return "truncated_input";
            case error_kind::checksum_mismatch:
                return "checksum_mismatch";
            case error_kind::encoding_error:
                return "encoding_error";
        }
        return "unknown";
    }

    /**
     * @class chunk_error
     * @brief Base exception class for all codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunk-related error with a single catch block.
     */
    class chunk_error : public std::runtime_error {
    public:
        explicit chunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for stream I/O errors
     *
     * Thrown when the underlying std::istream or std::ostream fails.
     */
    class io_error : public chunk_error {
    public:
        explicit io_error(const std::string& msg)
            : chunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed input
     *
     * Thrown when a chunk type or a chunk record does not follow the
     * PNG 1.2 chunk layout. kind() tells the failures apart.
     */
    class parse_error : public chunk_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : chunk_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    class invalid_format_error : public parse_error {
    public:
        explicit invalid_format_error(const std::string& msg)
            : parse_error(error_kind::invalid_format, msg) {}
    };

    /**
     * @class invalid_chunk_type_error
     * @brief A decoded record carries a type with a non-letter byte or a set reserved bit
     */
    class invalid_chunk_type_error : public parse_error {
    public:
        invalid_chunk_type_error(const std::array<std::uint8_t, 4>& type, const std::string& msg)
            : parse_error(error_kind::invalid_chunk_type, msg), m_type(type) {}

        /// Raw bytes of the rejected type
        [[nodiscard]] const std::array<std::uint8_t, 4>& type_bytes() const noexcept { return m_type; }

    private:
        std::array<std::uint8_t, 4> m_type;
    };

    /**
     * @class truncated_input_error
     * @brief Input is shorter than the record it declares
     */
    class truncated_input_error : public parse_error {
    public:
        truncated_input_error(std::size_t needed, std::size_t available, const std::string& msg)
            : parse_error(error_kind::truncated_input, msg), m_needed(needed), m_available(available) {}

        /// Bytes required for the record (or for its header when the length is unknown)
        [[nodiscard]] std::size_t needed() const noexcept { return m_needed; }
        /// Bytes that were actually present
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

    private:
        std::size_t m_needed;
        std::size_t m_available;
    };

    /**
     * @class checksum_mismatch_error
     * @brief The CRC stored in a record does not match its type and payload
     */
    class checksum_mismatch_error : public parse_error {
    public:
        checksum_mismatch_error(std::uint32_t expected, std::uint32_t actual, const std::string& msg)
            : parse_error(error_kind::checksum_mismatch, msg), m_expected(expected), m_actual(actual) {}

        /// CRC read from the input
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC computed over the decoded type and payload
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    class encoding_error : public parse_error {
    public:
        encoding_error(std::size_t offset, const std::string& msg)
            : parse_error(error_kind::encoding_error, msg), m_offset(offset) {}

        /// Payload offset of the first byte that starts an invalid sequence
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     */
    #define THROW_PARSE(kind, ...) \
        throw ::pngchunk::parse_error(kind, ::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
