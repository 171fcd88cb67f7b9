/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the munge library
 * @author Igor
 * @date 14/08/2025
 *
 * Every decode or encode failure is fatal to the call that raised it. The
 * hierarchy lets callers catch everything with munge_error, or pick out a
 * specific failure kind.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace munge {

    /**
     * @class munge_error
     * @brief Base exception class for all munge-related errors
     */
    class munge_error : public std::runtime_error {
    public:
        explicit munge_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Short reads, failed seeks and failed writes
     */
    class io_error : public munge_error {
    public:
        explicit io_error(const std::string& msg)
            : munge_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Structurally invalid data
     *
     * Base of all format errors. Thrown directly when nesting exceeds
     * parse_options::max_depth.
     */
    class parse_error : public munge_error {
    public:
        explicit parse_error(const std::string& msg)
            : munge_error(msg) {}
    };

    /**
     * @class size_mismatch_error
     * @brief Declared chunk sizes disagree with the bytes actually present
     *
     * Raised when a child overruns its parent, when the children of a chunk
     * do not end exactly on the parent's boundary, or when a payload runs
     * past the end of the stream.
     */
    class size_mismatch_error : public parse_error {
    public:
        explicit size_mismatch_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class missing_child_error
     * @brief A single-valued schema field has no matching child
     */
    class missing_child_error : public parse_error {
    public:
        explicit missing_child_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class invalid_discriminant_error
     * @brief An enum field holds a value with no declared variant
     */
    class invalid_discriminant_error : public parse_error {
    public:
        invalid_discriminant_error(const std::string& msg, std::uint32_t value)
            : parse_error(msg), m_value(value) {}

        [[nodiscard]] std::uint32_t value() const noexcept { return m_value; }

    private:
        std::uint32_t m_value;
    };

    /**
     * @class string_too_long_error
     * @brief A null-terminated string has no terminator within the size cap
     */
    class string_too_long_error : public parse_error {
    public:
        explicit string_too_long_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class invalid_pack_error
     * @brief A hash-addressed pack node does not hold exactly one child
     */
    class invalid_pack_error : public parse_error {
    public:
        explicit invalid_pack_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class content_error
     * @brief Format specific content problems
     *
     * Bad root tag, unexpected children in strict mode, unwritable values
     * and malformed resource paths.
     */
    class content_error : public parse_error {
    public:
        explicit content_error(const std::string& msg)
            : parse_error(msg) {}
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
     * @def THROW_MUNGE
     * @brief Throw an exception of the given type with formatted message
     * @param type Exception class deriving from munge_error
     * @param ... Variable arguments to format into error message
     */
    #define THROW_MUNGE(type, ...) \
        throw type(::munge::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_MUNGE_IF
     * @brief Conditionally throw an exception of the given type
     */
    #define THROW_MUNGE_IF(condition, type, ...) \
        do { if (condition) THROW_MUNGE(type, __VA_ARGS__); } while(0)

    #define THROW_IO(...) \
        THROW_MUNGE(::munge::io_error, __VA_ARGS__)

    #define THROW_PARSE(...) \
        THROW_MUNGE(::munge::parse_error, __VA_ARGS__)

    #define THROW_SIZE_MISMATCH(...) \
        THROW_MUNGE(::munge::size_mismatch_error, __VA_ARGS__)

    #define THROW_CONTENT(...) \
        THROW_MUNGE(::munge::content_error, __VA_ARGS__)

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_SIZE_MISMATCH_IF(condition, ...) \
        do { if (condition) THROW_SIZE_MISMATCH(__VA_ARGS__); } while(0)

    #define THROW_CONTENT_IF(condition, ...) \
        do { if (condition) THROW_CONTENT(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace munge
