#ifndef NBTCRAFT_SNBT_HPP
#define NBTCRAFT_SNBT_HPP

#include <algorithm>
#include <charconv>
#include <cctype>
#include <limits>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "core.hpp"
#include "error.hpp"
#include "tag.hpp"

namespace nbtcraft {

namespace internal {

inline bool is_unquoted_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '+' || c == '_' || c == '-';
}

inline std::string quote_string(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

inline std::string quote_key(const std::string& key) {
    if (!key.empty() && std::all_of(key.begin(), key.end(), is_unquoted_char))
        return key;
    return quote_string(key);
}

template <typename T> std::string format_number(T value) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, ptr);
}

inline void write_snbt(std::string& out, const NBTTag& tag, bool sort_keys);

template <typename T> void write_snbt_array(std::string& out, const std::vector<T>& values, char prefix, const char* suffix) {
    out += '[';
    out += prefix;
    out += ';';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += format_number(static_cast<long_t>(values[i]));
        out += suffix;
    }
    out += ']';
}

inline void write_snbt(std::string& out, const NBTTag& tag, bool sort_keys) {
    switch (tag.type()) {
        case TAG_BYTE: out += format_number(static_cast<int>(tag.get<sbyte_t>())) + "b"; break;
        case TAG_SHORT: out += format_number(tag.get<short_t>()) + "s"; break;
        case TAG_INT: out += format_number(tag.get<int_t>()); break;
        case TAG_LONG: out += format_number(tag.get<long_t>()) + "l"; break;
        case TAG_FLOAT: out += format_number(tag.get<float>()) + "f"; break;
        case TAG_DOUBLE: out += format_number(tag.get<double>()) + "d"; break;
        case TAG_STRING: out += quote_string(tag.get<std::string>()); break;
        case TAG_BYTEARRAY: write_snbt_array(out, tag.get<ByteArray>(), 'B', "b"); break;
        case TAG_INTARRAY: write_snbt_array(out, tag.get<IntArray>(), 'I', ""); break;
        case TAG_LONGARRAY: write_snbt_array(out, tag.get<LongArray>(), 'L', "l"); break;
        case TAG_LIST: {
            out += '[';
            bool first = true;
            for (const NBTTag& element : tag.get<List>()) {
                if (!first) out += ',';
                first = false;
                write_snbt(out, element, sort_keys);
            }
            out += ']';
            break;
        }
        case TAG_COMPOUND: {
            std::vector<const NamedTag*> entries;
            for (const NamedTag& entry : tag.get<Compound>())
                entries.push_back(&entry);
            if (sort_keys)
                std::sort(entries.begin(), entries.end(),
                    [](const NamedTag* a, const NamedTag* b) { return a->name < b->name; });
            out += '{';
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) out += ',';
                out += quote_key(entries[i]->name);
                out += ':';
                write_snbt(out, entries[i]->tag, sort_keys);
            }
            out += '}';
            break;
        }
        case TAG_END:
            throw nbt_error(errc::type_mismatch, "End tags have no SNBT form");
    }
}

class SnbtParser {
public:
    SnbtParser(std::string_view text, const decode_options& options) : m_text(text), m_pos(0), m_options(options) {}

    NBTTag parse_root() {
        NBTTag tag = this->parse_value(0);
        this->skip_ws();
        if (m_pos != m_text.size())
            this->fail("unexpected trailing characters");
        return tag;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw nbt_error(errc::invalid_snbt, what + " at offset " + std::to_string(m_pos));
    }

    void skip_ws() {
        while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos])))
            ++m_pos;
    }

    bool at_end() const { return m_pos >= m_text.size(); }
    char peek() const { return m_text[m_pos]; }

    void expect(char c) {
        this->skip_ws();
        if (this->at_end() || this->peek() != c)
            this->fail(std::string("expected '") + c + "'");
        ++m_pos;
    }

    // Consumes a separating comma, or returns false at the closing bracket.
    bool next_element(char close, bool first) {
        this->skip_ws();
        if (this->at_end())
            this->fail(std::string("unclosed structure, expected '") + close + "'");
        if (this->peek() == close) {
            ++m_pos;
            return false;
        }
        if (!first) {
            if (this->peek() != ',')
                this->fail("elements must be comma separated");
            ++m_pos;
        }
        return true;
    }

    std::string parse_quoted() {
        char quote = m_text[m_pos++];
        std::string value;
        while (true) {
            if (this->at_end())
                this->fail("unclosed string");
            char c = m_text[m_pos++];
            if (c == quote)
                return value;
            if (c == '\\') {
                if (this->at_end())
                    this->fail("unclosed string");
                char escaped = m_text[m_pos++];
                if (escaped != '\\' && escaped != '"' && escaped != '\'')
                    this->fail(std::string("invalid escape '\\") + escaped + "'");
                c = escaped;
            }
            value += c;
        }
    }

    std::string parse_unquoted() {
        std::size_t start = m_pos;
        while (!this->at_end() && is_unquoted_char(this->peek()))
            ++m_pos;
        if (m_pos == start)
            this->fail("expected a value");
        return std::string(m_text.substr(start, m_pos - start));
    }

    template <typename T> T parse_integer(const std::string& digits) {
        long_t value = 0;
        const char* begin = digits.data();
        if (*begin == '+')
            ++begin;
        auto [ptr, ec] = std::from_chars(begin, digits.data() + digits.size(), value);
        if (ec != std::errc() || ptr != digits.data() + digits.size() ||
            value < std::numeric_limits<T>::min() || value > std::numeric_limits<T>::max())
            this->fail("integer " + digits + " out of range");
        return static_cast<T>(value);
    }

    template <typename T> T parse_floating(const std::string& number) {
        T value = 0;
        const char* begin = number.data() + (number[0] == '+' ? 1 : 0);
        auto [ptr, ec] = std::from_chars(begin, number.data() + number.size(), value);
        if (ec != std::errc() || ptr != number.data() + number.size())
            this->fail("malformed number " + number);
        return value;
    }

    NBTTag parse_scalar(const std::string& token) {
        static const std::regex integer_pattern(R"(([+-]?(?:0|[1-9][0-9]*))([bBsSlL]?))");
        static const std::regex suffixed_float_pattern(R"(([+-]?(?:[0-9]+\.?|[0-9]*\.[0-9]+)(?:[eE][+-]?[0-9]+)?)([fFdD]))");
        static const std::regex plain_float_pattern(R"([+-]?(?:[0-9]+\.|[0-9]*\.[0-9]+)(?:[eE][+-]?[0-9]+)?)");

        std::smatch m;
        if (std::regex_match(token, m, integer_pattern)) {
            std::string digits = m[1].str();
            switch (m[2].length() ? std::tolower(static_cast<unsigned char>(m[2].str()[0])) : 'i') {
                case 'b': return this->parse_integer<sbyte_t>(digits);
                case 's': return this->parse_integer<short_t>(digits);
                case 'l': return this->parse_integer<long_t>(digits);
                default: return this->parse_integer<int_t>(digits);
            }
        }
        bool suffixed = std::regex_match(token, m, suffixed_float_pattern);
        if (suffixed || std::regex_match(token, plain_float_pattern)) {
            std::string number = suffixed ? m[1].str() : token;
            if (suffixed && std::tolower(static_cast<unsigned char>(m[2].str()[0])) == 'f')
                return this->parse_floating<float>(number);
            return this->parse_floating<double>(number);
        }
        if (token == "true")
            return static_cast<sbyte_t>(1);
        if (token == "false")
            return static_cast<sbyte_t>(0);
        // anything else unquoted is a string, as the game reads it
        return token;
    }

    template <typename T> std::vector<T> parse_typed_array(char suffix) {
        std::vector<T> values;
        for (bool first = true; this->next_element(']', first); first = false) {
            this->skip_ws();
            std::string token = this->parse_unquoted();
            char found = std::tolower(static_cast<unsigned char>(token.back()));
            bool has_suffix = std::isalpha(static_cast<unsigned char>(found));
            if ((suffix == 0 && has_suffix) || (suffix != 0 && found != suffix))
                this->fail("wrong element " + token + " in typed array");
            std::string digits = has_suffix ? token.substr(0, token.size() - 1) : token;
            if (digits.empty() || !std::regex_match(digits, std::regex(R"([+-]?(?:0|[1-9][0-9]*))")))
                this->fail("expected an integer, found " + token);
            values.push_back(this->parse_integer<T>(digits));
        }
        return values;
    }

    NBTTag parse_value(std::size_t depth) {
        this->skip_ws();
        if (this->at_end())
            this->fail("nothing to parse");
        char c = this->peek();
        if (c == '"' || c == '\'')
            return this->parse_quoted();
        if (c == '{' || c == '[') {
            if (depth > m_options.max_depth)
                throw nbt_error(errc::depth_exceeded, "SNBT nesting exceeds the limit of " +
                    std::to_string(m_options.max_depth));
        }
        if (c == '{') {
            ++m_pos;
            Compound compound;
            for (bool first = true; this->next_element('}', first); first = false) {
                this->skip_ws();
                if (this->at_end())
                    this->fail("unclosed compound");
                std::string key = (this->peek() == '"' || this->peek() == '\'') ? this->parse_quoted() : this->parse_unquoted();
                this->expect(':');
                compound.set(key, this->parse_value(depth + 1));
            }
            return compound;
        }
        if (c == '[') {
            // typed arrays: [B;...] [I;...] [L;...]
            if (m_pos + 2 < m_text.size() && m_text[m_pos + 2] == ';') {
                char kind = m_text[m_pos + 1];
                if (kind == 'B' || kind == 'I' || kind == 'L') {
                    m_pos += 3;
                    if (kind == 'B') return this->parse_typed_array<sbyte_t>('b');
                    if (kind == 'I') return this->parse_typed_array<int_t>(0);
                    return this->parse_typed_array<long_t>('l');
                }
            }
            ++m_pos;
            List list;
            for (bool first = true; this->next_element(']', first); first = false)
                list.push_back(this->parse_value(depth + 1));
            return list;
        }
        return this->parse_scalar(this->parse_unquoted());
    }

    std::string_view m_text;
    std::size_t m_pos;
    decode_options m_options;
};

}

/// @brief Renders a tag as stringified NBT, e.g. `{name:"x",pos:[I;1,2,3]}`.
/// @param sort_keys Emit compound entries sorted by name instead of in insertion order.
inline std::string to_snbt(const NBTTag& tag, bool sort_keys = false) {
    std::string out;
    internal::write_snbt(out, tag, sort_keys);
    return out;
}

/// @brief Parses stringified NBT.
/// Unsuffixed integers are Ints, unsuffixed decimals Doubles, `true`/`false` Bytes, and other unquoted words Strings.
/// An empty list `[]` has element kind End.
/// @exception Throws `invalid_snbt` on syntax errors and `type_mismatch` for lists mixing element kinds.
inline NBTTag parse_snbt(std::string_view text, const decode_options& options = {}) {
    return internal::SnbtParser(text, options).parse_root();
}

}

#endif
