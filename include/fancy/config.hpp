#pragma once

#include <cctype>
#include <cstddef>
#include <istream>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include "core.hpp"
#include "exec_context.hpp"

namespace fancy {

// =============================================================================
// Field wrapper for named serialization
// =============================================================================

template<typename T>
struct field_t {
    const char* name;
    T& value;
};

template<typename T>
constexpr field_t<T> field(const char* name, T& value) {
    return field_t<T>{name, value};
}

template<typename T>
constexpr field_t<const T> field(const char* name, const T& value) {
    return field_t<const T>{name, value};
}

template<typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template<typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<const char*>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

// =============================================================================
// config_t: Execution settings read from key = value text
// =============================================================================

struct config_t {
    exec policy = exec::cpu;
    std::size_t num_threads = 0;
    std::string log_file;
};

inline auto fields(const config_t& c) {
    return std::make_tuple(
        field("exec", c.policy),
        field("num_threads", c.num_threads),
        field("log_file", c.log_file));
}

inline auto fields(config_t& c) {
    return std::make_tuple(
        field("exec", c.policy),
        field("num_threads", c.num_threads),
        field("log_file", c.log_file));
}

// =============================================================================
// String escapes shared by the reader and the writer
// =============================================================================

inline auto escape_string(const std::string& s) -> std::string {
    auto out = std::string{};
    for (auto c : s) {
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\t') {
            out += "\\t";
        } else {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
    }
    return out;
}

inline char unescape_char(char c) {
    if (c == 'n') return '\n';
    if (c == 't') return '\t';
    return c;
}

// =============================================================================
// config_reader: parses the whole text up front, then looks keys up by name
// =============================================================================
//
// Each non-blank line is `key = value # comment`. String values are quoted,
// numbers are bare. Keys that are never read are ignored, and reading a key
// the text does not define returns false.
//
class config_reader {
public:
    explicit config_reader(std::istream& is) {
        auto line = std::string{};
        auto lineno = 0;
        while (std::getline(is, line)) {
            ++lineno;
            parse_line(line, lineno);
        }
    }

    void begin_named(const char* name) {
        _pending = name;
    }

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read(T& value) -> bool {
        auto entry = take_pending();
        if (!entry) return false;
        if (entry->quoted) {
            throw std::runtime_error("config_reader: " + entry->key + " expects a number, got a string");
        }
        if constexpr (std::is_unsigned_v<T>) {
            if (!entry->text.empty() && entry->text[0] == '-') {
                throw std::runtime_error("config_reader: " + entry->key + " must not be negative, got " + entry->text);
            }
        }
        auto iss = std::istringstream{entry->text};
        auto parsed = T{};
        iss >> parsed;
        if (entry->text.empty() || iss.fail() || !iss.eof()) {
            throw std::runtime_error("config_reader: " + entry->key + ": failed to parse number '" + entry->text + "'");
        }
        value = parsed;
        return true;
    }

    auto read(std::string& value) -> bool {
        auto entry = take_pending();
        if (!entry) return false;
        if (!entry->quoted) {
            throw std::runtime_error("config_reader: " + entry->key + " expects a quoted string");
        }
        value = entry->text;
        return true;
    }

    template<typename E>
        requires HasEnumStrings<E>
    auto read(E& value) -> bool {
        auto s = std::string{};
        if (!read(s)) return false;
        value = from_string(std::type_identity<E>{}, s);
        return true;
    }

private:
    struct entry_t {
        std::string key;
        std::string text;
        bool quoted = false;
    };

    std::map<std::string, entry_t> _entries;
    const char* _pending = nullptr;

    auto take_pending() -> const entry_t* {
        if (!_pending) {
            throw std::runtime_error("config_reader: read without a field name");
        }
        auto it = _entries.find(_pending);
        _pending = nullptr;
        return it == _entries.end() ? nullptr : &it->second;
    }

    void parse_line(const std::string& line, int lineno) {
        auto where = [lineno] { return "config_reader: line " + std::to_string(lineno) + ": "; };
        auto is_blank = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        auto i = std::size_t(0);
        auto skip_blank = [&] { while (i < line.size() && is_blank(line[i])) ++i; };

        skip_blank();
        if (i == line.size() || line[i] == '#') {
            return;
        }

        auto entry = entry_t{};
        while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '_')) {
            entry.key += line[i++];
        }
        if (entry.key.empty()) {
            throw std::runtime_error(where() + "expected a key");
        }
        skip_blank();
        if (i == line.size() || line[i] != '=') {
            throw std::runtime_error(where() + "expected '=' after " + entry.key);
        }
        ++i;
        skip_blank();

        if (i < line.size() && line[i] == '"') {
            entry.quoted = true;
            ++i;
            auto closed = false;
            while (i < line.size()) {
                auto c = line[i++];
                if (c == '"') {
                    closed = true;
                    break;
                }
                if (c == '\\' && i < line.size()) {
                    c = unescape_char(line[i++]);
                }
                entry.text += c;
            }
            if (!closed) {
                throw std::runtime_error(where() + "unterminated string");
            }
        } else {
            while (i < line.size() && !is_blank(line[i]) && line[i] != '#') {
                entry.text += line[i++];
            }
        }

        skip_blank();
        if (i < line.size() && line[i] != '#') {
            throw std::runtime_error(where() + "unexpected text after the value of " + entry.key);
        }
        auto key = entry.key;
        _entries[key] = std::move(entry);
    }
};

// =============================================================================
// config_writer: one `key = value` line per field
// =============================================================================

class config_writer {
public:
    explicit config_writer(std::ostream& os) : _os(os) {}

    void begin_named(const char* name) {
        _pending = name;
    }

    template<typename T>
        requires std::is_arithmetic_v<T>
    void write(const T& value) {
        line() << value << "\n";
    }

    void write(const std::string& value) {
        line() << '"' << escape_string(value) << "\"\n";
    }

    template<typename E>
        requires HasEnumStrings<E>
    void write(const E& value) {
        write(std::string(to_string(value)));
    }

private:
    std::ostream& _os;
    const char* _pending = nullptr;

    auto line() -> std::ostream& {
        if (_pending) {
            _os << _pending << " = ";
            _pending = nullptr;
        }
        return _os;
    }
};

// =============================================================================
// Whole-struct read/write through fields()
// =============================================================================

template<HasFields T>
void read_fields(config_reader& ar, T& value) {
    std::apply([&ar](auto... f) {
        ((ar.begin_named(f.name), ar.read(f.value)), ...);
    }, fields(value));
}

template<HasFields T>
void write_fields(config_writer& ar, const T& value) {
    std::apply([&ar](auto... f) {
        ((ar.begin_named(f.name), ar.write(f.value)), ...);
    }, fields(value));
}

inline auto read_config(std::istream& is) -> config_t {
    auto cfg = config_t{};
    auto reader = config_reader{is};
    read_fields(reader, cfg);
    return cfg;
}

inline void write_config(std::ostream& os, const config_t& cfg) {
    auto writer = config_writer{os};
    write_fields(writer, cfg);
}

// Override one field from unquoted text, e.g. set(cfg, "exec", "omp")
inline void set(config_t& cfg, const std::string& key, const std::string& value) {
    auto found = false;
    std::apply([&](auto... f) {
        ([&] {
            if (found || key != f.name) return;
            using value_t = std::remove_cvref_t<decltype(f.value)>;
            auto text = std::string(f.name) + " = ";
            if constexpr (std::is_arithmetic_v<value_t>) {
                text += value;
            } else {
                text += "\"" + escape_string(value) + "\"";
            }
            auto iss = std::istringstream{text};
            auto reader = config_reader{iss};
            reader.begin_named(f.name);
            found = reader.read(f.value);
        }(), ...);
    }, fields(cfg));
    if (!found) {
        throw std::runtime_error("set: unknown config key " + key);
    }
}

// Apply a configuration to an existing context
inline void configure(exec_context_t& ctx, const config_t& cfg) {
    ctx.policy = cfg.policy;
    ctx.set_num_threads(cfg.num_threads);
    if (!cfg.log_file.empty()) {
        ctx.set_log_file(cfg.log_file);
    }
}

} // namespace fancy
