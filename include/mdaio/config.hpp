#pragma once

// Plain-struct configuration in the ASCII key-value format:
//
//   # reader settings
//   reader {
//       max_rank = 4
//       read_data = true
//   }
//   log_level = "info"
//   log_file = ""
//
// Structs opt in with ADL free functions fields(T&) / fields(const T&)
// returning a tuple of field(name, member). Missing keys keep their
// defaults; unknown keys are an error.

#include <cctype>
#include <concepts>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace mdaio {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<const char*>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

namespace detail {

// ============================================================================
// Value conversion
// ============================================================================

template <typename T>
void parse_and_assign(T& target, const std::string& value) {
    auto fail = [&]() {
        throw std::runtime_error("invalid value '" + value + "'");
    };
    if constexpr (std::is_same_v<T, bool>) {
        if (value == "true" || value == "1") target = true;
        else if (value == "false" || value == "0") target = false;
        else fail();
    } else if constexpr (std::is_arithmetic_v<T>) {
        auto iss = std::istringstream{value};
        auto v = T{};
        iss >> v;
        if (iss.fail() || !iss.eof()) fail();
        target = v;
    } else if constexpr (std::is_same_v<T, std::string>) {
        target = value;
    } else if constexpr (HasEnumStrings<T>) {
        target = from_string(std::type_identity<T>{}, value);
    } else {
        throw std::runtime_error("unsupported type for config value");
    }
}

template <typename T>
auto format_value(const T& value) -> std::string {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_floating_point_v<T>) {
        auto oss = std::ostringstream{};
        oss << std::setprecision(15) << value;
        auto s = oss.str();
        if (s.find('.') == std::string::npos && s.find('e') == std::string::npos) {
            s += ".0";
        }
        return s;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return std::to_string(value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        auto s = std::string{"\""};
        for (char c : value) {
            switch (c) {
                case '"':  s += "\\\""; break;
                case '\\': s += "\\\\"; break;
                case '\n': s += "\\n"; break;
                case '\t': s += "\\t"; break;
                default:   s += c; break;
            }
        }
        return s + "\"";
    } else if constexpr (HasEnumStrings<T>) {
        return format_value(std::string(to_string(value)));
    } else {
        static_assert(HasEnumStrings<T>, "unsupported type for config value");
    }
}

// ============================================================================
// Tokenizer over the ASCII format
// ============================================================================

class ascii_tokenizer {
public:
    explicit ascii_tokenizer(std::istream& stream) : is_(stream) {}

    void skip_ws() {
        while (is_) {
            while (is_ && std::isspace(peek())) get();
            if (peek() == '#') {
                while (is_ && get() != '\n') {}
            } else {
                break;
            }
        }
    }

    auto at_end() -> bool {
        skip_ws();
        return peek() == std::char_traits<char>::eof();
    }

    auto peek() -> int { return is_.peek(); }
    auto get() -> char { return static_cast<char>(is_.get()); }

    void expect(char c) {
        skip_ws();
        if (peek() != c) {
            throw std::runtime_error(std::string("expected '") + c + "'");
        }
        get();
    }

    auto read_identifier() -> std::string {
        skip_ws();
        auto s = std::string{};
        while (is_ && (std::isalnum(peek()) || peek() == '_')) {
            s += get();
        }
        if (s.empty()) {
            throw std::runtime_error("expected identifier");
        }
        return s;
    }

    // A quoted string (with escapes) or a bare token up to whitespace
    auto read_value() -> std::string {
        skip_ws();
        if (peek() == '"') {
            get();
            auto result = std::string{};
            while (true) {
                if (peek() == std::char_traits<char>::eof()) {
                    throw std::runtime_error("unterminated string");
                }
                char c = get();
                if (c == '"') break;
                if (c == '\\') {
                    char next = get();
                    switch (next) {
                        case 'n': result += '\n'; break;
                        case 't': result += '\t'; break;
                        default:  result += next; break;
                    }
                } else {
                    result += c;
                }
            }
            return result;
        }
        auto token = std::string{};
        while (is_ && peek() != std::char_traits<char>::eof() &&
               !std::isspace(peek()) && peek() != '}' && peek() != '#') {
            token += get();
        }
        if (token.empty()) {
            throw std::runtime_error("expected value");
        }
        return token;
    }

private:
    std::istream& is_;
};

// ============================================================================
// Group parsing and writing
// ============================================================================

template <typename T>
void read_group(ascii_tokenizer& tok, T& obj, bool nested);

template <typename T>
void read_entry(ascii_tokenizer& tok, const std::string& key, T& target) {
    if constexpr (HasFields<T>) {
        tok.expect('{');
        read_group(tok, target, true);
    } else {
        tok.expect('=');
        auto text = tok.read_value();
        try {
            parse_and_assign(target, text);
        } catch (const std::exception& e) {
            throw std::runtime_error(key + ": " + e.what());
        }
    }
}

template <typename T>
void read_group(ascii_tokenizer& tok, T& obj, bool nested) {
    while (true) {
        if (tok.at_end()) {
            if (nested) throw std::runtime_error("expected '}'");
            return;
        }
        if (tok.peek() == '}') {
            if (!nested) throw std::runtime_error("unexpected '}'");
            tok.get();
            return;
        }
        auto key = tok.read_identifier();
        auto found = false;
        std::apply([&](auto&&... f) {
            ((!found && key == f.first ? (read_entry(tok, key, f.second), found = true) : false), ...);
        }, fields(obj));
        if (!found) {
            throw std::runtime_error("unknown config key: " + key);
        }
    }
}

template <typename T>
void write_group(std::ostream& os, const T& obj, int depth) {
    auto indent = std::string(static_cast<std::size_t>(depth) * 4, ' ');
    std::apply([&](auto&&... f) {
        ([&] {
            using value_t = std::remove_cvref_t<decltype(f.second)>;
            if constexpr (HasFields<value_t>) {
                os << indent << f.first << " {\n";
                write_group(os, f.second, depth + 1);
                os << indent << "}\n";
            } else {
                os << indent << f.first << " = " << format_value(f.second) << "\n";
            }
        }(), ...);
    }, fields(obj));
}

// ============================================================================
// Dotted-path setter
// ============================================================================

template <typename T>
void set_impl(T& obj, const std::string& path, const std::string& value);

template <typename T>
void set_field(T& target, const std::string& rest, const std::string& value) {
    if (rest.empty()) {
        parse_and_assign(target, value);
    } else if constexpr (HasFields<T>) {
        set_impl(target, rest, value);
    } else {
        throw std::runtime_error("cannot descend into '" + rest + "': not a struct");
    }
}

template <typename T>
void set_impl(T& obj, const std::string& path, const std::string& value) {
    auto dot = path.find('.');
    auto key = path.substr(0, dot);
    auto rest = dot != std::string::npos ? path.substr(dot + 1) : std::string{};

    auto found = false;
    std::apply([&](auto&&... f) {
        ((!found && key == f.first ? (set_field(f.second, rest, value), found = true) : false), ...);
    }, fields(obj));

    if (!found) {
        throw std::runtime_error("field not found: " + key);
    }
}

} // namespace detail

// ============================================================================
// Public interface
// ============================================================================

template <HasFields T>
void load_config(std::istream& is, T& config) {
    auto tok = detail::ascii_tokenizer{is};
    detail::read_group(tok, config, false);
}

template <HasFields T>
void load_config_file(const std::string& filename, T& config) {
    auto file = std::ifstream{filename};
    if (!file) {
        throw std::runtime_error("cannot open config file '" + filename + "'");
    }
    load_config(file, config);
}

template <HasFields T>
void save_config(std::ostream& os, const T& config) {
    detail::write_group(os, config, 0);
}

/**
 * Set a field by dot-separated path, parsing the text for the field's type.
 *
 *   set(config, "reader.max_rank", "2");
 *   set(config, "log_level", "debug");
 */
template <HasFields T>
void set(T& config, const std::string& path, const std::string& value) {
    detail::set_impl(config, path, value);
}

} // namespace mdaio
