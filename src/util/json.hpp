#ifndef PIIREDACTOR_UTIL_JSON_HPP
#define PIIREDACTOR_UTIL_JSON_HPP

#include <string>
#include <vector>
#include <utility>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <cstdio>
#include <cmath>
#include <cctype>
#include <iomanip>

/**
 * @file json.hpp
 * @brief A small self-contained JSON value type with a parser and a serializer.
 *
 * DESIGN GOALS:
 *   - Header-only, no external JSON library.
 *   - Objects keep insertion order so serialized records read the way they were built
 *     (full_text, masked, spans, ...).
 *   - Strings are UTF-8 and are written without \u escaping of non-ASCII text, so Greek
 *     stays readable in output files. Only quotes, backslashes and control characters
 *     are escaped.
 *   - Parse errors throw std::runtime_error with the byte offset of the problem.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using piiredactor::util::json::JsonValue;
 *
 *   JsonValue span = JsonValue::object();
 *   span.set("entity_type", "PERSON");
 *   span.set("start_position", 0);
 *   std::string out = span.dump();            // {"entity_type":"PERSON","start_position":0}
 *
 *   JsonValue parsed = piiredactor::util::json::parse(out);
 *   int64_t start = parsed.at("start_position").asInt();
 *   @endcode
 */

namespace piiredactor {
namespace util {
namespace json {

class JsonValue
{
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    JsonValue() : m_type(Type::Null), m_bool(false), m_number(0.0) {}
    JsonValue(bool b) : m_type(Type::Bool), m_bool(b), m_number(0.0) {}
    JsonValue(int n) : m_type(Type::Number), m_bool(false), m_number(static_cast<double>(n)) {}
    JsonValue(int64_t n) : m_type(Type::Number), m_bool(false), m_number(static_cast<double>(n)) {}
    JsonValue(size_t n) : m_type(Type::Number), m_bool(false), m_number(static_cast<double>(n)) {}
    JsonValue(double n) : m_type(Type::Number), m_bool(false), m_number(n) {}
    JsonValue(const char *s) : m_type(Type::String), m_bool(false), m_number(0.0), m_string(s) {}
    JsonValue(const std::string &s) : m_type(Type::String), m_bool(false), m_number(0.0), m_string(s) {}

    static JsonValue array()
    {
        JsonValue v;
        v.m_type = Type::Array;
        return v;
    }

    static JsonValue object()
    {
        JsonValue v;
        v.m_type = Type::Object;
        return v;
    }

    Type type() const { return m_type; }
    bool isNull() const { return m_type == Type::Null; }
    bool isBool() const { return m_type == Type::Bool; }
    bool isNumber() const { return m_type == Type::Number; }
    bool isString() const { return m_type == Type::String; }
    bool isArray() const { return m_type == Type::Array; }
    bool isObject() const { return m_type == Type::Object; }

    bool asBool() const
    {
        expect(Type::Bool, "bool");
        return m_bool;
    }

    double asNumber() const
    {
        expect(Type::Number, "number");
        return m_number;
    }

    int64_t asInt() const
    {
        expect(Type::Number, "number");
        if (std::floor(m_number) != m_number) {
            throw std::runtime_error("json: expected an integer, got " + dump());
        }
        return static_cast<int64_t>(m_number);
    }

    const std::string& asString() const
    {
        expect(Type::String, "string");
        return m_string;
    }

    // ---- arrays ----
    const std::vector<JsonValue>& items() const
    {
        expect(Type::Array, "array");
        return m_array;
    }

    void push(const JsonValue &value)
    {
        expect(Type::Array, "array");
        m_array.push_back(value);
    }

    size_t size() const
    {
        if (m_type == Type::Array) return m_array.size();
        if (m_type == Type::Object) return m_object.size();
        return 0;
    }

    // ---- objects ----
    const std::vector<std::pair<std::string, JsonValue>>& members() const
    {
        expect(Type::Object, "object");
        return m_object;
    }

    // Returns nullptr when the key is absent.
    const JsonValue* find(const std::string &key) const
    {
        expect(Type::Object, "object");
        for (const auto &kv : m_object) {
            if (kv.first == key) {
                return &kv.second;
            }
        }
        return nullptr;
    }

    const JsonValue& at(const std::string &key) const
    {
        const JsonValue *v = find(key);
        if (!v) {
            throw std::runtime_error("json: missing key '" + key + "'");
        }
        return *v;
    }

    bool contains(const std::string &key) const
    {
        return m_type == Type::Object && find(key) != nullptr;
    }

    // Replaces an existing key in place, appends otherwise.
    void set(const std::string &key, const JsonValue &value)
    {
        expect(Type::Object, "object");
        for (auto &kv : m_object) {
            if (kv.first == key) {
                kv.second = value;
                return;
            }
        }
        m_object.emplace_back(key, value);
    }

    /**
     * @brief Serialize. indent < 0 gives the compact form; otherwise members are
     *        placed one per line, indented by `indent` spaces per level.
     */
    std::string dump(int indent = -1) const
    {
        std::ostringstream oss;
        write(oss, indent, 0);
        return oss.str();
    }

    static std::string escape(const std::string &in)
    {
        std::ostringstream oss;
        for (char c : in) {
            switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b";  break;
            case '\f': oss << "\\f";  break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
                break;
            }
        }
        return oss.str();
    }

private:
    void expect(Type t, const char *name) const
    {
        if (m_type != t) {
            throw std::runtime_error(std::string("json: expected ") + name + ", got " + dump());
        }
    }

    static void newline(std::ostringstream &oss, int indent, int depth)
    {
        if (indent < 0) {
            return;
        }
        oss << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
    }

    void write(std::ostringstream &oss, int indent, int depth) const
    {
        switch (m_type) {
        case Type::Null:
            oss << "null";
            break;
        case Type::Bool:
            oss << (m_bool ? "true" : "false");
            break;
        case Type::Number: {
            char buf[32];
            if (std::floor(m_number) == m_number && std::fabs(m_number) < 1e15) {
                std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(m_number));
            } else {
                std::snprintf(buf, sizeof(buf), "%.15g", m_number);
            }
            oss << buf;
            break;
        }
        case Type::String:
            oss << '"' << escape(m_string) << '"';
            break;
        case Type::Array:
            oss << '[';
            for (size_t i = 0; i < m_array.size(); ++i) {
                if (i) oss << ',';
                newline(oss, indent, depth + 1);
                m_array[i].write(oss, indent, depth + 1);
            }
            if (!m_array.empty()) newline(oss, indent, depth);
            oss << ']';
            break;
        case Type::Object:
            oss << '{';
            for (size_t i = 0; i < m_object.size(); ++i) {
                if (i) oss << ',';
                newline(oss, indent, depth + 1);
                oss << '"' << escape(m_object[i].first) << "\":";
                if (indent >= 0) oss << ' ';
                m_object[i].second.write(oss, indent, depth + 1);
            }
            if (!m_object.empty()) newline(oss, indent, depth);
            oss << '}';
            break;
        }
    }

    Type m_type;
    bool m_bool;
    double m_number;
    std::string m_string;
    std::vector<JsonValue> m_array;
    std::vector<std::pair<std::string, JsonValue>> m_object;
};

namespace detail {

class Parser
{
public:
    // Deeper documents are rejected rather than parsed with unbounded recursion.
    static constexpr size_t MAX_DEPTH = 128;

    explicit Parser(const std::string &text) : m_text(text), m_pos(0), m_depth(0) {}

    JsonValue parseDocument()
    {
        JsonValue v = parseValue();
        skipWs();
        if (m_pos != m_text.size()) {
            fail("trailing characters");
        }
        return v;
    }

private:
    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::runtime_error("json: " + what + " at offset " + std::to_string(m_pos));
    }

    void skipWs()
    {
        while (m_pos < m_text.size() &&
               (m_text[m_pos] == ' ' || m_text[m_pos] == '\t' ||
                m_text[m_pos] == '\n' || m_text[m_pos] == '\r')) {
            ++m_pos;
        }
    }

    bool consume(char c)
    {
        skipWs();
        if (m_pos < m_text.size() && m_text[m_pos] == c) {
            ++m_pos;
            return true;
        }
        return false;
    }

    void require(char c)
    {
        if (!consume(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    bool matchLiteral(const char *lit)
    {
        size_t n = std::char_traits<char>::length(lit);
        if (m_text.compare(m_pos, n, lit) == 0) {
            m_pos += n;
            return true;
        }
        return false;
    }

    JsonValue parseValue()
    {
        skipWs();
        if (m_pos >= m_text.size()) {
            fail("unexpected end of input");
        }
        char c = m_text[m_pos];
        if (c == '{' || c == '[') {
            if (++m_depth > MAX_DEPTH) {
                fail("nesting deeper than " + std::to_string(MAX_DEPTH) + " levels");
            }
            JsonValue nested = c == '{' ? parseObject() : parseArray();
            --m_depth;
            return nested;
        }
        if (c == '"') return JsonValue(parseString());
        if (matchLiteral("true")) return JsonValue(true);
        if (matchLiteral("false")) return JsonValue(false);
        if (matchLiteral("null")) return JsonValue();
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber();
        fail(std::string("unexpected character '") + c + "'");
    }

    JsonValue parseObject()
    {
        require('{');
        JsonValue obj = JsonValue::object();
        if (consume('}')) {
            return obj;
        }
        do {
            skipWs();
            if (m_pos >= m_text.size() || m_text[m_pos] != '"') {
                fail("expected object key");
            }
            std::string key = parseString();
            require(':');
            obj.set(key, parseValue());
        } while (consume(','));
        require('}');
        return obj;
    }

    JsonValue parseArray()
    {
        require('[');
        JsonValue arr = JsonValue::array();
        if (consume(']')) {
            return arr;
        }
        do {
            arr.push(parseValue());
        } while (consume(','));
        require(']');
        return arr;
    }

    JsonValue parseNumber()
    {
        size_t start = m_pos;
        if (m_text[m_pos] == '-') ++m_pos;
        while (m_pos < m_text.size() &&
               (std::isdigit(static_cast<unsigned char>(m_text[m_pos])) ||
                m_text[m_pos] == '.' || m_text[m_pos] == 'e' || m_text[m_pos] == 'E' ||
                m_text[m_pos] == '+' || m_text[m_pos] == '-')) {
            ++m_pos;
        }
        const std::string token = m_text.substr(start, m_pos - start);
        try {
            size_t used = 0;
            double d = std::stod(token, &used);
            if (used != token.size()) {
                fail("malformed number '" + token + "'");
            }
            return JsonValue(d);
        } catch (const std::logic_error &) {
            fail("malformed number '" + token + "'");
        }
    }

    unsigned parseHex4()
    {
        if (m_pos + 4 > m_text.size()) {
            fail("truncated \\u escape");
        }
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char h = m_text[m_pos++];
            v <<= 4;
            if (h >= '0' && h <= '9') v |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') v |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') v |= static_cast<unsigned>(h - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return v;
    }

    static void appendUtf8(unsigned cp, std::string &out)
    {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parseString()
    {
        // caller guarantees m_text[m_pos] == '"'
        ++m_pos;
        std::string out;
        while (true) {
            if (m_pos >= m_text.size()) {
                fail("unterminated string");
            }
            char c = m_text[m_pos++];
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (m_pos >= m_text.size()) {
                fail("unterminated escape");
            }
            char e = m_text[m_pos++];
            switch (e) {
            case '"':  out.push_back('"');  break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/');  break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                unsigned cp = parseHex4();
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (!matchLiteral("\\u")) {
                        fail("unpaired surrogate");
                    }
                    unsigned low = parseHex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("invalid low surrogate");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                appendUtf8(cp, out);
                break;
            }
            default:
                fail(std::string("unknown escape '\\") + e + "'");
            }
        }
        return out;
    }

    const std::string &m_text;
    size_t m_pos;
    size_t m_depth;
};

} // namespace detail

/**
 * @brief Parse a complete JSON document.
 * @throw std::runtime_error on malformed input.
 */
inline JsonValue parse(const std::string &text)
{
    detail::Parser parser(text);
    return parser.parseDocument();
}

} // namespace json
} // namespace util
} // namespace piiredactor

#endif // PIIREDACTOR_UTIL_JSON_HPP
