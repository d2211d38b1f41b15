#ifndef NBJSON_PARSER_H
#define NBJSON_PARSER_H

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <spdlog/logger.h>

#ifndef NBJ_DEFAULT_MAX_DEPTH
#define NBJ_DEFAULT_MAX_DEPTH 2048
#endif

#ifndef NBJ_DEFAULT_FEEDER_CAPACITY
#define NBJ_DEFAULT_FEEDER_CAPACITY 16
#endif

namespace nbjson
{

class feeder_error : public std::exception
{
public:

    enum error_reason
    {
        CAPACITY_EXCEEDED,
        ALREADY_CLOSED,
    };

private:

    error_reason m_reason;

public:

    explicit feeder_error(const error_reason reason) noexcept
    : m_reason(reason)
    {
    }

    error_reason reason() const noexcept
    {
        return m_reason;
    }

    const char* what() const noexcept override
    {
        switch (m_reason)
        {
        case CAPACITY_EXCEEDED:
            return "Feeder capacity exceeded";
        case ALREADY_CLOSED:
            return "Feeder already closed";
        }

        return ""; // to suppress compiler warnings -- LCOV_EXCL_LINE
    }
}; // class feeder_error

// LCOV_EXCL_START
inline std::ostream& operator<<(
    std::ostream& out,
    const feeder_error::error_reason reason)
{
    switch (reason)
    {
        case feeder_error::CAPACITY_EXCEEDED:
            return out << "CAPACITY_EXCEEDED";
        case feeder_error::ALREADY_CLOSED:
            return out << "ALREADY_CLOSED";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

// Bounded FIFO of input bytes. The caller pushes bytes with feed() until
// is_full() or until it runs out of input, in which case it calls done().
// The parser pulls bytes with next_input().
class feeder final
{
private:

    std::size_t m_capacity;
    std::unique_ptr<char[]> m_buffer;
    std::size_t m_head = 0; // index of the oldest pending byte
    std::size_t m_size = 0;
    bool m_done = false;

    static std::size_t checked_capacity(const std::size_t capacity)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument(
                "feeder capacity must be greater than zero");
        }

        return capacity;
    }

    void push(const char c) noexcept
    {
        m_buffer[(m_head + m_size) % m_capacity] = c;
        ++m_size;
    }

public:

    explicit feeder(const std::size_t capacity = NBJ_DEFAULT_FEEDER_CAPACITY)
    : m_capacity(checked_capacity(capacity))
    , m_buffer(new char[m_capacity])
    {
    }

    feeder(const feeder&) = delete;
    feeder(feeder&&) = delete;
    feeder& operator=(const feeder&) = delete;
    feeder& operator=(feeder&&) = delete;

    void feed(const char c)
    {
        if (m_done)
        {
            throw feeder_error(feeder_error::ALREADY_CLOSED);
        }

        if (is_full())
        {
            throw feeder_error(feeder_error::CAPACITY_EXCEEDED);
        }

        push(c);
    }

    // Feeds as many bytes as there is room for and returns how many
    // were taken
    std::size_t feed(const char* const data, const std::size_t length)
    {
        if (m_done)
        {
            throw feeder_error(feeder_error::ALREADY_CLOSED);
        }

        std::size_t fed = 0;
        while (fed < length && !is_full())
        {
            push(data[fed++]);
        }

        return fed;
    }

    std::size_t feed(const std::string_view data)
    {
        return feed(data.data(), data.size());
    }

    void done() noexcept
    {
        m_done = true;
    }

    // Same as done(). The caller-facing feeder interface names it
    // mark_done(); done() is the short form used with feed().
    void mark_done() noexcept
    {
        done();
    }

    bool is_done() const noexcept
    {
        return m_done;
    }

    bool is_full() const noexcept
    {
        return m_size == m_capacity;
    }

    bool has_input() const noexcept
    {
        return m_size != 0;
    }

    bool is_done_and_empty() const noexcept
    {
        return m_done && m_size == 0;
    }

    std::size_t size() const noexcept
    {
        return m_size;
    }

    std::size_t capacity() const noexcept
    {
        return m_capacity;
    }

    std::size_t free_space() const noexcept
    {
        return m_capacity - m_size;
    }

    char peek_input() const
    {
        if (m_size == 0)
        {
            throw std::logic_error("[nbjson] feeder has no pending input");
        }

        return m_buffer[m_head];
    }

    char next_input()
    {
        const char c = peek_input();
        m_head = (m_head + 1) % m_capacity;
        --m_size;

        return c;
    }
}; // class feeder

enum class event
{
    NeedMoreInput,
    Error,
    Eof,
    StartObject,
    EndObject,
    StartArray,
    EndArray,
    FieldName,
    ValueString,
    ValueInt,
    ValueDouble,
    ValueTrue,
    ValueFalse,
    ValueNull,
};

namespace detail
{

inline const char* event_name(const event e) noexcept
{
    switch (e)
    {
    case event::NeedMoreInput:
        return "NeedMoreInput";
    case event::Error:
        return "Error";
    case event::Eof:
        return "Eof";
    case event::StartObject:
        return "StartObject";
    case event::EndObject:
        return "EndObject";
    case event::StartArray:
        return "StartArray";
    case event::EndArray:
        return "EndArray";
    case event::FieldName:
        return "FieldName";
    case event::ValueString:
        return "ValueString";
    case event::ValueInt:
        return "ValueInt";
    case event::ValueDouble:
        return "ValueDouble";
    case event::ValueTrue:
        return "ValueTrue";
    case event::ValueFalse:
        return "ValueFalse";
    case event::ValueNull:
        return "ValueNull";
    }

    return "Unknown"; // LCOV_EXCL_LINE
}

} // namespace detail

inline std::ostream& operator<<(std::ostream& out, const event e)
{
    return out << detail::event_name(e);
}

class parse_error : public std::exception
{
public:

    enum error_reason
    {
        EXPECTED_VALUE,
        EXPECTED_OPENING_BRACKET,
        EXPECTED_OPENING_QUOTE,
        EXPECTED_COLON,
        EXPECTED_COMMA_OR_CLOSING_BRACKET,
        MISMATCHED_CLOSING_BRACKET,
        UNEXPECTED_END_OF_INPUT,
        EMPTY_INPUT,
        INVALID_VALUE,
        INVALID_ESCAPE_SEQUENCE,
        INVALID_UTF16_CHARACTER,
        EXPECTED_UTF16_LOW_SURROGATE,
        INVALID_UTF8_SEQUENCE,
        UNESCAPED_CONTROL_CHARACTER,
        UNTERMINATED_VALUE,
        EXCEEDED_NESTING_LIMIT,
        TRAILING_CHARACTERS,
    };

    enum error_category
    {
        STRUCTURAL,
        LEXICAL,
        DEPTH_LIMIT,
        TRAILING_DATA,
    };

private:

    std::size_t m_offset;
    error_reason m_reason;

public:

    explicit parse_error(
        const std::size_t offset,
        const error_reason reason) noexcept
    : m_offset(offset)
    , m_reason(reason)
    {
    }

    // Offset of the offending byte, or the number of bytes consumed when
    // the input ended prematurely
    std::size_t offset() const noexcept
    {
        return m_offset;
    }

    error_reason reason() const noexcept
    {
        return m_reason;
    }

    error_category category() const noexcept
    {
        switch (m_reason)
        {
        case INVALID_VALUE:
        case INVALID_ESCAPE_SEQUENCE:
        case INVALID_UTF16_CHARACTER:
        case EXPECTED_UTF16_LOW_SURROGATE:
        case INVALID_UTF8_SEQUENCE:
        case UNESCAPED_CONTROL_CHARACTER:
        case UNTERMINATED_VALUE:
            return LEXICAL;
        case EXCEEDED_NESTING_LIMIT:
            return DEPTH_LIMIT;
        case TRAILING_CHARACTERS:
            return TRAILING_DATA;
        default:
            return STRUCTURAL;
        }
    }

    const char* what() const noexcept override
    {
        switch (m_reason)
        {
        case EXPECTED_VALUE:
            return "Expected a value";
        case EXPECTED_OPENING_BRACKET:
            return "Expected opening bracket";
        case EXPECTED_OPENING_QUOTE:
            return "Expected opening quote";
        case EXPECTED_COLON:
            return "Expected colon";
        case EXPECTED_COMMA_OR_CLOSING_BRACKET:
            return "Expected comma or closing bracket";
        case MISMATCHED_CLOSING_BRACKET:
            return "Mismatched closing bracket";
        case UNEXPECTED_END_OF_INPUT:
            return "Unexpected end of input";
        case EMPTY_INPUT:
            return "Empty input";
        case INVALID_VALUE:
            return "Invalid value";
        case INVALID_ESCAPE_SEQUENCE:
            return "Invalid escape sequence";
        case INVALID_UTF16_CHARACTER:
            return "Invalid UTF-16 character";
        case EXPECTED_UTF16_LOW_SURROGATE:
            return "Expected UTF-16 low surrogate";
        case INVALID_UTF8_SEQUENCE:
            return "Invalid UTF-8 sequence";
        case UNESCAPED_CONTROL_CHARACTER:
            return "Unescaped control character";
        case UNTERMINATED_VALUE:
            return "Unterminated value";
        case EXCEEDED_NESTING_LIMIT:
            return "Exceeded nesting limit";
        case TRAILING_CHARACTERS:
            return "Trailing characters after the root value";
        }

        return ""; // to suppress compiler warnings -- LCOV_EXCL_LINE
    }
}; // class parse_error

// LCOV_EXCL_START
inline std::ostream& operator<<(
    std::ostream& out,
    const parse_error::error_reason reason)
{
    switch (reason)
    {
        case parse_error::EXPECTED_VALUE:
            return out << "EXPECTED_VALUE";
        case parse_error::EXPECTED_OPENING_BRACKET:
            return out << "EXPECTED_OPENING_BRACKET";
        case parse_error::EXPECTED_OPENING_QUOTE:
            return out << "EXPECTED_OPENING_QUOTE";
        case parse_error::EXPECTED_COLON:
            return out << "EXPECTED_COLON";
        case parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET:
            return out << "EXPECTED_COMMA_OR_CLOSING_BRACKET";
        case parse_error::MISMATCHED_CLOSING_BRACKET:
            return out << "MISMATCHED_CLOSING_BRACKET";
        case parse_error::UNEXPECTED_END_OF_INPUT:
            return out << "UNEXPECTED_END_OF_INPUT";
        case parse_error::EMPTY_INPUT:
            return out << "EMPTY_INPUT";
        case parse_error::INVALID_VALUE:
            return out << "INVALID_VALUE";
        case parse_error::INVALID_ESCAPE_SEQUENCE:
            return out << "INVALID_ESCAPE_SEQUENCE";
        case parse_error::INVALID_UTF16_CHARACTER:
            return out << "INVALID_UTF16_CHARACTER";
        case parse_error::EXPECTED_UTF16_LOW_SURROGATE:
            return out << "EXPECTED_UTF16_LOW_SURROGATE";
        case parse_error::INVALID_UTF8_SEQUENCE:
            return out << "INVALID_UTF8_SEQUENCE";
        case parse_error::UNESCAPED_CONTROL_CHARACTER:
            return out << "UNESCAPED_CONTROL_CHARACTER";
        case parse_error::UNTERMINATED_VALUE:
            return out << "UNTERMINATED_VALUE";
        case parse_error::EXCEEDED_NESTING_LIMIT:
            return out << "EXCEEDED_NESTING_LIMIT";
        case parse_error::TRAILING_CHARACTERS:
            return out << "TRAILING_CHARACTERS";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

namespace detail
{

// Tells whether a character is acceptable JSON whitespace to separate tokens
inline bool is_whitespace(const char c)
{
    switch (c)
    {
    case ' ':
    case '\n':
    case '\r':
    case '\t':
        return true;
    }

    return false;
}

// There is an std::isdigit() but it's weird (takes an int among other things)
inline bool is_digit(const char c)
{
    return c >= '0' && c <= '9';
}

inline bool is_hex_digit(const char c)
{
    switch (c)
    {
    case 'a':
    case 'A':
    case 'b':
    case 'B':
    case 'c':
    case 'C':
    case 'd':
    case 'D':
    case 'e':
    case 'E':
    case 'f':
    case 'F':
        return true;
    default:
        return is_digit(c);
    }
}

// Characters that may continue a number. Anything else terminates it and
// is left in the feeder for the next token.
inline bool is_number_char(const char c)
{
    switch (c)
    {
    case '+':
    case '-':
    case '.':
    case 'e':
    case 'E':
        return true;
    default:
        return is_digit(c);
    }
}

inline bool is_high_surrogate(const std::uint16_t code_unit)
{
    return code_unit >= 0xD800 && code_unit <= 0xDBFF;
}

inline bool is_low_surrogate(const std::uint16_t code_unit)
{
    return code_unit >= 0xDC00 && code_unit <= 0xDFFF;
}

// Thrown by the UTF-16 helpers below, never propagated outside of the library
struct encoding_error
{
};

inline std::uint32_t utf16_to_utf32(std::uint16_t high, std::uint16_t low)
{
    std::uint32_t result;

    if (high <= 0xD7FF || high >= 0xE000)
    {
        if (low != 0)
        {
            // Since the high code unit is not a surrogate, the low code unit
            // should be zero
            throw encoding_error();
        }

        result = high;
    }
    else
    {
        if (high > 0xDBFF) // we already know high >= 0xD800
        {
            throw encoding_error();
        }

        if (!is_low_surrogate(low))
        {
            throw encoding_error();
        }

        high -= 0xD800;
        low -= 0xDC00;
        result = 0x010000 + ((high << 10) | low);
    }

    return result;
}

inline std::array<std::uint8_t, 4> utf32_to_utf8(const std::uint32_t utf32_char)
{
    std::array<std::uint8_t, 4> result {};

    if (utf32_char <= 0x00007F)
    {
        std::get<0>(result) = static_cast<std::uint8_t>(utf32_char);
    }
    else if (utf32_char <= 0x0007FF)
    {
        std::get<0>(result) =
            static_cast<std::uint8_t>(
                0xC0 | ((utf32_char & (0x1F << 6)) >> 6));
        std::get<1>(result) =
            static_cast<std::uint8_t>(
                0x80 | (utf32_char & 0x3F));
    }
    else if (utf32_char <= 0x00FFFF)
    {
        std::get<0>(result) =
            static_cast<std::uint8_t>(
                0xE0 | ((utf32_char & (0x0F << 12)) >> 12));
        std::get<1>(result) =
            static_cast<std::uint8_t>(
                0x80 | ((utf32_char & (0x3F << 6)) >> 6));
        std::get<2>(result) =
            static_cast<std::uint8_t>(
                0x80 | (utf32_char & 0x3F));
    }
    else if (utf32_char <= 0x10FFFF)
    {
        std::get<0>(result) =
            static_cast<std::uint8_t>(
                0xF0 | ((utf32_char & (0x07 << 18)) >> 18));
        std::get<1>(result) =
            static_cast<std::uint8_t>(
                0x80 | ((utf32_char & (0x3F << 12)) >> 12));
        std::get<2>(result) =
            static_cast<std::uint8_t>(
                0x80 | ((utf32_char & (0x3F << 6)) >> 6));
        std::get<3>(result) =
            static_cast<std::uint8_t>(
                0x80 | (utf32_char & 0x3F));
    }
    else
    {
        throw encoding_error();
    }

    return result;
}

inline std::array<std::uint8_t, 4> utf16_to_utf8(
    const std::uint16_t high,
    const std::uint16_t low)
{
    return utf32_to_utf8(utf16_to_utf32(high, low));
}

inline std::uint8_t parse_hex_digit(const char c)
{
    if (is_digit(c))
    {
        return static_cast<std::uint8_t>(c - '0');
    }

    switch (c)
    {
    case 'a':
    case 'A':
        return 0xa;
    case 'b':
    case 'B':
        return 0xb;
    case 'c':
    case 'C':
        return 0xc;
    case 'd':
    case 'D':
        return 0xd;
    case 'e':
    case 'E':
        return 0xe;
    case 'f':
    case 'F':
        return 0xf;
    default:
        throw encoding_error();
    }
}

inline std::uint16_t parse_utf16_escape_sequence(
    const std::array<char, 4>& sequence)
{
    std::uint16_t result = 0;

    for (const char c : sequence)
    {
        result = static_cast<std::uint16_t>(result << 4);
        result |= parse_hex_digit(c);
    }

    return result;
}

// The NUL code point is written as a single zero byte
inline void write_utf8_char(
    std::string& out,
    const std::array<std::uint8_t, 4>& c)
{
    out.push_back(static_cast<char>(std::get<0>(c)));

    for (std::size_t i = 1; i < c.size() && c[i]; ++i)
    {
        out.push_back(static_cast<char>(c[i]));
    }
}

} // namespace detail

enum value_type
{
    String,
    Number,
    Boolean,
    Null
};

class bad_value_cast : public std::invalid_argument
{
public:

    using std::invalid_argument::invalid_argument;
};

// Thrown by parser::value() when the last event carries no value
class bad_value_access : public std::logic_error
{
private:

    event m_event;

public:

    explicit bad_value_access(const event e)
    : std::logic_error(
        std::string("parser::value(): no value available after event ")
        + detail::event_name(e))
    , m_event(e)
    {
    }

    event last_event() const noexcept
    {
        return m_event;
    }
}; // class bad_value_access

class value final
{
private:

    value_type m_type = Null;
    std::string_view m_raw_value = "null";

public:

    explicit value() noexcept = default;

    explicit value(
        const value_type type,
        const std::string_view raw_value = "") noexcept
    : m_type(type)
    , m_raw_value(raw_value)
    {
    }

    value_type type() const noexcept
    {
        return m_type;
    }

    // For strings, the decoded UTF-8 text. For numbers, the literal as it
    // appeared in the input.
    std::string_view raw() const noexcept
    {
        return m_raw_value;
    }

    template<typename T>
    T as() const;

    template<typename T>
    void to(T& dest) const
    {
        dest = as<T>();
    }
}; // class value

namespace detail
{

// Trick to prevent static_assert() from always going off (see as_impl() below)
template<typename>
inline constexpr bool type_dependent_false = false;

template<typename T>
T as_impl(const value_type type, const std::string_view raw_value)
{
    if constexpr (
        std::is_same_v<T, std::string_view> || std::is_same_v<T, std::string>)
    {
        if (type != String)
        {
            throw bad_value_cast("value::as<T>(): value type is not String");
        }

        return T(raw_value);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        if (type != Boolean)
        {
            throw bad_value_cast("value::as<T>(): value type is not Boolean");
        }

        return !raw_value.empty() && raw_value[0] == 't';
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        if (type != Number)
        {
            throw bad_value_cast("value::as<T>(): value type is not Number");
        }

        T result {}; // value initialize to silence compiler warnings
        const auto begin = raw_value.data();
        const auto end = raw_value.data() + raw_value.size();
        const auto [parse_end, error] = std::from_chars(begin, end, result);
        if (parse_end != end || error != std::errc())
        {
            throw std::range_error("value::as<T>() could not parse the number");
        }
        return result;
    }
    else // if constexpr
    {
        static_assert(
            type_dependent_false<T>,
            "value::as<T>(): T is not one of the supported types "
            "(std::string_view, std::string, bool, arithmetic types, plus "
            "all of the above wrapped in std::optional)");
    }
}

} // namespace detail

// The conversion value::as<T>() performs when value_as is not specialized
template<typename T>
T value_as_default(const value v)
{
    if (v.type() == Null)
    {
        throw bad_value_cast(
            "cannot call value::as<T>() on values of type Null: "
            "consider checking value::type() first, or use "
            "value::as<std::optional<T>>()");
    }

    return detail::as_impl<T>(v.type(), v.raw());
}

// Specialize to teach value::as<T>() about more types. The second parameter
// is there for std::enable_if_t.
template<typename T, typename = void>
struct value_as
{
    T operator()(const value v) const
    {
        return value_as_default<T>(v);
    }
}; // struct value_as

template<typename T>
struct value_as<std::optional<T>>
{
    std::optional<T> operator()(const value v) const
    {
        if (v.type() == Null)
        {
            return std::nullopt;
        }

        return value_as<T>()(v);
    }
}; // struct value_as<std::optional<T>>

template<typename T>
T value::as() const
{
    return value_as<T>()(*this);
}

// Non-blocking JSON parser. Every call to next_event() consumes bytes from
// the feeder until it can report exactly one event. When the feeder runs
// dry before that, NeedMoreInput is returned and all scanning progress is
// kept, so the caller can feed more bytes (or call done()) and try again.
// Error and Eof are terminal.
class parser final
{
public:

    enum nesting_mode
    {
        MODE_TOP_LEVEL,
        MODE_ARRAY,
        MODE_OBJECT_KEY,
        MODE_OBJECT_VALUE,
    };

private:

    enum lexer_state
    {
        BEFORE_ROOT,
        BEFORE_VALUE, // after a colon, or after a comma in an array
        BEFORE_VALUE_OR_CLOSING_BRACKET, // in case the array is empty
        BEFORE_FIELD_NAME, // after a comma in an object
        BEFORE_FIELD_NAME_OR_CLOSING_BRACKET, // in case the object is empty
        BEFORE_COLON,
        AFTER_VALUE,
        IN_STRING,
        IN_ESCAPE_SEQUENCE,
        IN_UTF16_SEQUENCE,
        IN_NUMBER,
        IN_LITERAL,
        AFTER_ROOT,
        FINISHED,
        FAILED,
    };

    enum number_state
    {
        SIGN_OR_FIRST_DIGIT,
        FIRST_DIGIT,
        AFTER_LEADING_ZERO,
        INTEGRAL_PART,
        FRACTIONAL_PART_FIRST_DIGIT,
        FRACTIONAL_PART,
        EXPONENT_SIGN_OR_FIRST_DIGIT,
        EXPONENT_FIRST_DIGIT,
        EXPONENT,
    };

    std::unique_ptr<nbjson::feeder> m_owned_feeder;
    nbjson::feeder* m_feeder;

    std::unique_ptr<nesting_mode[]> m_modes;
    std::size_t m_max_depth;
    std::size_t m_depth = 0;

    lexer_state m_state = BEFORE_ROOT;

    number_state m_number_state = SIGN_OR_FIRST_DIGIT;
    bool m_number_is_double = false;

    std::string_view m_literal;
    std::size_t m_literal_offset = 0;
    event m_literal_event = event::ValueNull;

    std::array<char, 4> m_utf16_seq {};
    std::size_t m_utf16_seq_offset = 0;
    std::uint16_t m_high_surrogate = 0;

    // Continuation bytes still expected by the current UTF-8 sequence, and
    // the range allowed for the next one
    std::size_t m_utf8_pending = 0;
    unsigned char m_utf8_lower = 0x80;
    unsigned char m_utf8_upper = 0xBF;

    std::string m_buffer;
    event m_event = event::NeedMoreInput;
    std::size_t m_parsed_bytes = 0;
    std::optional<parse_error> m_error;
    std::shared_ptr<spdlog::logger> m_logger;

    static std::size_t checked_max_depth(const std::size_t max_depth)
    {
        if (max_depth == 0)
        {
            throw std::invalid_argument(
                "parser max_depth must be greater than zero");
        }

        return max_depth;
    }

    event fail(const parse_error::error_reason reason, const std::size_t offset)
    {
        m_state = FAILED;
        m_error.emplace(offset, reason);

        if (m_logger)
        {
            m_logger->debug(
                "parse error at byte {}: {}",
                offset,
                m_error->what());
        }

        return event::Error;
    }

    // The offending byte is the one just consumed
    event fail(const parse_error::error_reason reason)
    {
        return fail(reason, m_parsed_bytes != 0 ? m_parsed_bytes - 1 : 0);
    }

    void complete_value() noexcept
    {
        m_state = (m_depth == 0) ? AFTER_ROOT : AFTER_VALUE;
    }

    event begin_container(const nesting_mode mode)
    {
        if (m_depth == m_max_depth)
        {
            return fail(parse_error::EXCEEDED_NESTING_LIMIT);
        }

        m_modes[m_depth++] = mode;

        if (mode == MODE_ARRAY)
        {
            m_state = BEFORE_VALUE_OR_CLOSING_BRACKET;
            return event::StartArray;
        }

        m_state = BEFORE_FIELD_NAME_OR_CLOSING_BRACKET;
        return event::StartObject;
    }

    event end_container(const char bracket)
    {
        const nesting_mode mode = current_mode();
        const bool matches = (bracket == ']')
            ? mode == MODE_ARRAY
            : (mode == MODE_OBJECT_KEY || mode == MODE_OBJECT_VALUE);

        if (!matches)
        {
            return fail(parse_error::MISMATCHED_CLOSING_BRACKET);
        }

        --m_depth;
        complete_value();

        return (bracket == ']') ? event::EndArray : event::EndObject;
    }

    void begin_string() noexcept
    {
        m_buffer.clear();
        m_high_surrogate = 0;
        m_utf8_pending = 0;
        m_state = IN_STRING;
    }

    event begin_literal(const std::string_view literal, const event e)
    {
        m_literal = literal;
        m_literal_offset = 1; // the first character selected the literal
        m_literal_event = e;
        m_state = IN_LITERAL;

        return event::NeedMoreInput;
    }

    event begin_number(const char c)
    {
        m_buffer.clear();
        m_number_state = SIGN_OR_FIRST_DIGIT;
        m_number_is_double = false;
        m_state = IN_NUMBER;

        return consume_number(c);
    }

    event begin_value(const char c)
    {
        switch (c)
        {
        case '{':
            return begin_container(MODE_OBJECT_KEY);
        case '[':
            return begin_container(MODE_ARRAY);
        case '"':
            begin_string();
            return event::NeedMoreInput;
        case 't':
            return begin_literal("true", event::ValueTrue);
        case 'f':
            return begin_literal("false", event::ValueFalse);
        case 'n':
            return begin_literal("null", event::ValueNull);
        case '-':
            return begin_number(c);
        default:
            if (detail::is_digit(c))
            {
                return begin_number(c);
            }
            return fail(parse_error::EXPECTED_VALUE);
        }
    }

    // Sets up the validation of the continuation bytes following a UTF-8
    // lead byte (see Table 3-7 of the Unicode standard)
    bool begin_utf8_sequence(const unsigned char lead) noexcept
    {
        m_utf8_lower = 0x80;
        m_utf8_upper = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF)
        {
            m_utf8_pending = 1;
        }
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            m_utf8_pending = 2;
            if (lead == 0xE0)
            {
                m_utf8_lower = 0xA0; // overlong
            }
            else if (lead == 0xED)
            {
                m_utf8_upper = 0x9F; // surrogates
            }
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            m_utf8_pending = 3;
            if (lead == 0xF0)
            {
                m_utf8_lower = 0x90; // overlong
            }
            else if (lead == 0xF4)
            {
                m_utf8_upper = 0x8F; // above U+10FFFF
            }
        }
        else
        {
            return false;
        }

        return true;
    }

    event end_string()
    {
        if (current_mode() == MODE_OBJECT_KEY)
        {
            m_state = BEFORE_COLON;
            return event::FieldName;
        }

        complete_value();
        return event::ValueString;
    }

    event consume_string(const char c)
    {
        const auto byte = static_cast<unsigned char>(c);

        if (m_utf8_pending != 0)
        {
            if (byte < m_utf8_lower || byte > m_utf8_upper)
            {
                return fail(parse_error::INVALID_UTF8_SEQUENCE);
            }

            m_utf8_lower = 0x80;
            m_utf8_upper = 0xBF;
            --m_utf8_pending;
            m_buffer.push_back(c);

            return event::NeedMoreInput;
        }

        if (c == '\\')
        {
            m_state = IN_ESCAPE_SEQUENCE;
            return event::NeedMoreInput;
        }

        if (m_high_surrogate != 0)
        {
            return fail(parse_error::EXPECTED_UTF16_LOW_SURROGATE);
        }

        if (c == '"')
        {
            return end_string();
        }

        if (byte < 0x20)
        {
            return fail(parse_error::UNESCAPED_CONTROL_CHARACTER);
        }

        if (byte >= 0x80 && !begin_utf8_sequence(byte))
        {
            return fail(parse_error::INVALID_UTF8_SEQUENCE);
        }

        m_buffer.push_back(c);

        return event::NeedMoreInput;
    }

    event consume_escape_sequence(const char c)
    {
        if (m_high_surrogate != 0 && c != 'u')
        {
            return fail(parse_error::EXPECTED_UTF16_LOW_SURROGATE);
        }

        m_state = IN_STRING;

        switch (c)
        {
        case '"':
            m_buffer.push_back('"');
            break;
        case '\\':
            m_buffer.push_back('\\');
            break;
        case '/':
            m_buffer.push_back('/');
            break;
        case 'b':
            m_buffer.push_back('\b');
            break;
        case 'f':
            m_buffer.push_back('\f');
            break;
        case 'n':
            m_buffer.push_back('\n');
            break;
        case 'r':
            m_buffer.push_back('\r');
            break;
        case 't':
            m_buffer.push_back('\t');
            break;
        case 'u':
            m_utf16_seq_offset = 0;
            m_state = IN_UTF16_SEQUENCE;
            break;
        default:
            return fail(parse_error::INVALID_ESCAPE_SEQUENCE);
        }

        return event::NeedMoreInput;
    }

    event consume_utf16_sequence(const char c)
    {
        if (!detail::is_hex_digit(c))
        {
            return fail(parse_error::INVALID_ESCAPE_SEQUENCE);
        }

        m_utf16_seq[m_utf16_seq_offset++] = c;

        if (m_utf16_seq_offset < m_utf16_seq.size())
        {
            return event::NeedMoreInput;
        }

        m_utf16_seq_offset = 0;
        m_state = IN_STRING;

        try
        {
            const std::uint16_t code_unit =
                detail::parse_utf16_escape_sequence(m_utf16_seq);

            if (m_high_surrogate != 0)
            {
                // We were waiting for the low surrogate
                // (that now is code_unit)
                if (!detail::is_low_surrogate(code_unit))
                {
                    return fail(parse_error::EXPECTED_UTF16_LOW_SURROGATE);
                }

                detail::write_utf8_char(
                    m_buffer,
                    detail::utf16_to_utf8(m_high_surrogate, code_unit));
                m_high_surrogate = 0;
            }
            else if (detail::is_high_surrogate(code_unit))
            {
                m_high_surrogate = code_unit;
            }
            else
            {
                detail::write_utf8_char(
                    m_buffer,
                    detail::utf16_to_utf8(code_unit, 0));
            }
        }
        catch (const detail::encoding_error&)
        {
            return fail(parse_error::INVALID_UTF16_CHARACTER);
        }

        return event::NeedMoreInput;
    }

    // Checks that the number looks OK according to the JSON specification,
    // one character at a time
    event consume_number(const char c)
    {
        switch (m_number_state)
        {
        case SIGN_OR_FIRST_DIGIT:
            if (c == '-') // leading plus sign not allowed
            {
                m_number_state = FIRST_DIGIT;
                break;
            }
            [[fallthrough]];
        case FIRST_DIGIT:
            if (c == '0')
            {
                // If zero is the first digit, then it must be the ONLY digit
                // of the integral part
                m_number_state = AFTER_LEADING_ZERO;
                break;
            }
            if (detail::is_digit(c))
            {
                m_number_state = INTEGRAL_PART;
                break;
            }
            return fail(parse_error::INVALID_VALUE);

        case INTEGRAL_PART:
            if (detail::is_digit(c))
            {
                break;
            }
            [[fallthrough]];
        case AFTER_LEADING_ZERO:
            if (c == '.')
            {
                m_number_state = FRACTIONAL_PART_FIRST_DIGIT;
                m_number_is_double = true;
                break;
            }
            if (c == 'e' || c == 'E')
            {
                m_number_state = EXPONENT_SIGN_OR_FIRST_DIGIT;
                m_number_is_double = true;
                break;
            }
            return fail(parse_error::INVALID_VALUE);

        case FRACTIONAL_PART:
            if (c == 'e' || c == 'E')
            {
                m_number_state = EXPONENT_SIGN_OR_FIRST_DIGIT;
                break;
            }
            [[fallthrough]];
        case FRACTIONAL_PART_FIRST_DIGIT:
            if (detail::is_digit(c))
            {
                m_number_state = FRACTIONAL_PART;
                break;
            }
            return fail(parse_error::INVALID_VALUE);

        case EXPONENT_SIGN_OR_FIRST_DIGIT:
            if (c == '+' || c == '-')
            {
                m_number_state = EXPONENT_FIRST_DIGIT;
                break;
            }
            [[fallthrough]];
        case EXPONENT_FIRST_DIGIT:
        case EXPONENT:
            if (detail::is_digit(c))
            {
                m_number_state = EXPONENT;
                break;
            }
            return fail(parse_error::INVALID_VALUE);
        }

        m_buffer.push_back(c);

        return event::NeedMoreInput;
    }

    // Called when the next byte cannot continue the number, or at the end
    // of the input. That byte has not been consumed.
    event end_number()
    {
        switch (m_number_state)
        {
        case AFTER_LEADING_ZERO:
        case INTEGRAL_PART:
        case FRACTIONAL_PART:
        case EXPONENT:
            break;
        default:
            return fail(parse_error::INVALID_VALUE, m_parsed_bytes);
        }

        complete_value();

        return m_number_is_double ? event::ValueDouble : event::ValueInt;
    }

    event end_of_input()
    {
        switch (m_state)
        {
        case BEFORE_ROOT:
            return fail(parse_error::EMPTY_INPUT, m_parsed_bytes);

        case AFTER_ROOT:
            m_state = FINISHED;
            if (m_logger)
            {
                m_logger->trace("end of input after {} bytes", m_parsed_bytes);
            }
            return event::Eof;

        case IN_NUMBER:
            return end_number();

        case IN_STRING:
        case IN_ESCAPE_SEQUENCE:
        case IN_UTF16_SEQUENCE:
        case IN_LITERAL:
            return fail(parse_error::UNTERMINATED_VALUE, m_parsed_bytes);

        default:
            return fail(parse_error::UNEXPECTED_END_OF_INPUT, m_parsed_bytes);
        }
    }

    // Returns NeedMoreInput when the byte was consumed without completing
    // an event
    event consume(const char c)
    {
        switch (m_state)
        {
        case BEFORE_ROOT:
            if (detail::is_whitespace(c))
            {
                break;
            }
            if (c != '{' && c != '[')
            {
                return fail(parse_error::EXPECTED_OPENING_BRACKET);
            }
            return begin_value(c);

        case BEFORE_VALUE_OR_CLOSING_BRACKET:
            if (c == ']')
            {
                return end_container(c);
            }
            [[fallthrough]];
        case BEFORE_VALUE:
            if (detail::is_whitespace(c))
            {
                break;
            }
            return begin_value(c);

        case BEFORE_FIELD_NAME_OR_CLOSING_BRACKET:
            if (c == '}')
            {
                return end_container(c);
            }
            [[fallthrough]];
        case BEFORE_FIELD_NAME:
            if (detail::is_whitespace(c))
            {
                break;
            }
            if (c != '"')
            {
                return fail(parse_error::EXPECTED_OPENING_QUOTE);
            }
            begin_string();
            break;

        case BEFORE_COLON:
            if (detail::is_whitespace(c))
            {
                break;
            }
            if (c != ':')
            {
                return fail(parse_error::EXPECTED_COLON);
            }
            m_modes[m_depth - 1] = MODE_OBJECT_VALUE;
            m_state = BEFORE_VALUE;
            break;

        case AFTER_VALUE:
            if (detail::is_whitespace(c))
            {
                break;
            }
            if (c == ',')
            {
                if (current_mode() == MODE_ARRAY)
                {
                    m_state = BEFORE_VALUE;
                }
                else
                {
                    m_modes[m_depth - 1] = MODE_OBJECT_KEY;
                    m_state = BEFORE_FIELD_NAME;
                }
                break;
            }
            if (c == '}' || c == ']')
            {
                return end_container(c);
            }
            return fail(parse_error::EXPECTED_COMMA_OR_CLOSING_BRACKET);

        case IN_STRING:
            return consume_string(c);

        case IN_ESCAPE_SEQUENCE:
            return consume_escape_sequence(c);

        case IN_UTF16_SEQUENCE:
            return consume_utf16_sequence(c);

        case IN_NUMBER:
            return consume_number(c);

        case IN_LITERAL:
            if (c != m_literal[m_literal_offset])
            {
                return fail(parse_error::INVALID_VALUE);
            }
            if (++m_literal_offset < m_literal.size())
            {
                break;
            }
            complete_value();
            return m_literal_event;

        case AFTER_ROOT:
            if (detail::is_whitespace(c))
            {
                break;
            }
            return fail(parse_error::TRAILING_CHARACTERS);

        // LCOV_EXCL_START
        case FINISHED:
        case FAILED:
            throw std::runtime_error(
                "[nbjson] this line should never be reached, "
                "please file a bug report");
        // LCOV_EXCL_STOP
        }

        return event::NeedMoreInput;
    }

    event advance()
    {
        switch (m_state)
        {
        case FINISHED:
            return event::Eof;
        case FAILED:
            return event::Error;
        default:
            break;
        }

        while (true)
        {
            if (m_feeder->is_done_and_empty())
            {
                return end_of_input();
            }

            if (!m_feeder->has_input())
            {
                return event::NeedMoreInput;
            }

            if (m_state == IN_NUMBER
                && !detail::is_number_char(m_feeder->peek_input()))
            {
                return end_number();
            }

            const char c = m_feeder->next_input();
            ++m_parsed_bytes;

            const event e = consume(c);
            if (e != event::NeedMoreInput)
            {
                return e;
            }
        }
    }

public:

    // Creates a parser reading from a feeder of its own
    explicit parser(const std::size_t max_depth = NBJ_DEFAULT_MAX_DEPTH)
    : m_owned_feeder(std::make_unique<nbjson::feeder>())
    , m_feeder(m_owned_feeder.get())
    , m_modes(new nesting_mode[checked_max_depth(max_depth)])
    , m_max_depth(max_depth)
    {
    }

    // Creates a parser reading from a feeder owned by the caller, which
    // must outlive the parser
    explicit parser(
        nbjson::feeder& input,
        const std::size_t max_depth = NBJ_DEFAULT_MAX_DEPTH)
    : m_feeder(&input)
    , m_modes(new nesting_mode[checked_max_depth(max_depth)])
    , m_max_depth(max_depth)
    {
    }

    parser(const parser&) = delete;
    parser(parser&&) = delete;
    parser& operator=(const parser&) = delete;
    parser& operator=(parser&&) = delete;

    nbjson::feeder& feeder() noexcept
    {
        return *m_feeder;
    }

    const nbjson::feeder& feeder() const noexcept
    {
        return *m_feeder;
    }

    event next_event()
    {
        m_event = advance();
        return m_event;
    }

    // The value carried by the last event. The returned view is valid until
    // the next call to next_event().
    nbjson::value value() const
    {
        switch (m_event)
        {
        case event::FieldName:
        case event::ValueString:
            return nbjson::value(String, m_buffer);
        case event::ValueInt:
        case event::ValueDouble:
            return nbjson::value(Number, m_buffer);
        case event::ValueTrue:
            return nbjson::value(Boolean, "true");
        case event::ValueFalse:
            return nbjson::value(Boolean, "false");
        case event::ValueNull:
            return nbjson::value(Null, "null");
        default:
            break;
        }

        throw bad_value_access(m_event);
    }

    const std::optional<parse_error>& error() const noexcept
    {
        return m_error;
    }

    std::size_t parsed_bytes() const noexcept
    {
        return m_parsed_bytes;
    }

    std::size_t depth() const noexcept
    {
        return m_depth;
    }

    std::size_t max_depth() const noexcept
    {
        return m_max_depth;
    }

    nesting_mode current_mode() const noexcept
    {
        return (m_depth == 0) ? MODE_TOP_LEVEL : m_modes[m_depth - 1];
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger) noexcept
    {
        m_logger = std::move(logger);
    }

    const std::shared_ptr<spdlog::logger>& logger() const noexcept
    {
        return m_logger;
    }
}; // class parser

} // namespace nbjson

#endif // NBJSON_PARSER_H
