#include "clarg/param.hpp"
#include "clarg/errors.hpp"

#include <cctype>
#include <cmath>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace {

static std::string_view trimWs(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static bool tryParseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

// Base 10 only: "010" is ten, not eight.
template <typename T>
static bool tryParseSignedInt(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && std::numeric_limits<T>::is_signed, "signed integer required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < static_cast<long long>(std::numeric_limits<T>::min()) || v > static_cast<long long>(std::numeric_limits<T>::max())) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

template <typename T>
static bool tryParseUnsignedInt(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && !std::numeric_limits<T>::is_signed, "unsigned integer required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    if (t.front() == '-') return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) return false;
    out = static_cast<T>(v);
    return true;
}

template <typename T>
static bool tryParseFloat(std::string_view s, T& out) {
    static_assert(std::is_floating_point_v<T>, "floating point required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    if constexpr (std::is_same_v<T, float>) {
        const float v = std::strtof(tmp.c_str(), &end);
        if (errno != 0) return false;
        if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
        out = v;
        return true;
    } else {
        const double v = std::strtod(tmp.c_str(), &end);
        if (errno != 0) return false;
        if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
        out = static_cast<T>(v);
        return true;
    }
}

// Go-style durations: "1h30m", "250ms", "1.5s", unitless "0".
static bool tryParseDuration(std::string_view s, std::chrono::milliseconds& out) {
    const auto sv = trimWs(s);
    if (sv.empty()) return false;

    std::size_t pos = 0;
    int sign = 1;
    if (sv[pos] == '+' || sv[pos] == '-') {
        if (sv[pos] == '-') sign = -1;
        ++pos;
    }
    if (pos >= sv.size()) return false;

    if (sv.substr(pos) == "0") {
        out = std::chrono::milliseconds(0);
        return true;
    }

    double totalMs = 0.0;
    while (pos < sv.size()) {
        const std::size_t numStart = pos;
        bool seenDigit = false;
        bool seenDot = false;
        for (; pos < sv.size(); ++pos) {
            const char ch = sv[pos];
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                seenDigit = true;
                continue;
            }
            if (ch == '.' && !seenDot) {
                seenDot = true;
                continue;
            }
            break;
        }
        if (!seenDigit) return false;
        const std::size_t numEnd = pos;
        if (pos >= sv.size()) return false; // unit required

        std::string_view unit;
        double multiplier = 0.0;
        const auto rest = sv.substr(pos);
        if (rest.rfind("ns", 0) == 0) {
            unit = "ns";
            multiplier = 1e-6;
        } else if (rest.rfind("us", 0) == 0) {
            unit = "us";
            multiplier = 1e-3;
        } else if (rest.rfind("ms", 0) == 0) {
            unit = "ms";
            multiplier = 1.0;
        } else if (rest.rfind("s", 0) == 0) {
            unit = "s";
            multiplier = 1000.0;
        } else if (rest.rfind("m", 0) == 0) {
            unit = "m";
            multiplier = 60.0 * 1000.0;
        } else if (rest.rfind("h", 0) == 0) {
            unit = "h";
            multiplier = 60.0 * 60.0 * 1000.0;
        } else {
            return false;
        }

        double value = 0.0;
        if (!tryParseFloat<double>(sv.substr(numStart, numEnd - numStart), value)) return false;

        totalMs += value * multiplier;
        pos += unit.size();
    }

    totalMs *= static_cast<double>(sign);
    const double rounded = totalMs >= 0 ? std::floor(totalMs + 0.5) : std::ceil(totalMs - 0.5);
    // 2^63 is exactly representable; int64 covers [-2^63, 2^63).
    constexpr double kInt64Bound = 9223372036854775808.0;
    if (!(rounded < kInt64Bound) || rounded < -kInt64Bound) return false;
    out = std::chrono::milliseconds(static_cast<std::int64_t>(rounded));
    return true;
}

[[noreturn]] static void rejectToken(const std::string& token, const std::string& typeName) {
    throw std::invalid_argument("value \"" + token + "\" cannot be converted to type " + typeName);
}

} // namespace

namespace clarg {

const char* toString(ValueType type) {
    switch (type) {
        case ValueType::Bool: return "bool";
        case ValueType::Int: return "int";
        case ValueType::Int64: return "int64";
        case ValueType::Uint64: return "uint64";
        case ValueType::Float: return "float";
        case ValueType::Double: return "double";
        case ValueType::Duration: return "duration";
        case ValueType::String: return "string";
        case ValueType::Custom: return "custom";
    }
    return "unknown";
}

std::string toString(const ArgValue& value) {
    return std::visit(
        [](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
            if constexpr (std::is_same_v<T, std::chrono::milliseconds>) return std::to_string(x.count()) + "ms";
            if constexpr (std::is_same_v<T, std::string>) return x;
            if constexpr (std::is_floating_point_v<T>) {
                std::ostringstream oss;
                oss << x;
                return oss.str();
            }
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) return std::to_string(x);
            return {};
        },
        value);
}

void validateName(const std::string& name) {
    if (name.empty()) throw InvalidNameError(name, "name is empty");
    if (name.front() == '-') throw InvalidNameError(name, "name must not start with '-'");
    for (const char ch : name) {
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == '=') {
            throw InvalidNameError(name, "name must not contain blanks or '='");
        }
    }
}

Param Param::flag(std::string name, std::string helpText) {
    return Param(std::move(name), Kind::Flag, ValueType::Bool, 0, false, std::move(helpText));
}

Param Param::argument(std::string name, ValueType type, int arity, bool isSwitch, std::string helpText) {
    if (type == ValueType::Custom) {
        throw std::invalid_argument("argument " + name + ": ValueType::Custom requires a converter");
    }
    return Param(std::move(name), Kind::Argument, type, arity, isSwitch, std::move(helpText));
}

Param Param::argument(std::string name,
                      Converter converter,
                      std::string typeName,
                      int arity,
                      bool isSwitch,
                      std::string helpText) {
    if (!converter) throw std::invalid_argument("argument " + name + ": empty converter");
    Param p(std::move(name), Kind::Argument, ValueType::Custom, arity, isSwitch, std::move(helpText));
    p.converter_ = std::move(converter);
    p.customTypeName_ = typeName.empty() ? std::string("custom") : std::move(typeName);
    return p;
}

std::string Param::typeName() const {
    if (valueType_ == ValueType::Custom) return customTypeName_;
    return toString(valueType_);
}

Param Param::renamed(std::string name) const {
    Param copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

ArgValue Param::convert(const std::string& token) const {
    switch (valueType_) {
        case ValueType::Bool: {
            bool out = false;
            if (!tryParseBool(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::Int: {
            int out = 0;
            if (!tryParseSignedInt<int>(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::Int64: {
            std::int64_t out = 0;
            if (!tryParseSignedInt<std::int64_t>(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::Uint64: {
            std::uint64_t out = 0;
            if (!tryParseUnsignedInt<std::uint64_t>(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::Float: {
            float out = 0.0f;
            if (!tryParseFloat<float>(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::Double: {
            double out = 0.0;
            if (!tryParseFloat<double>(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::Duration: {
            std::chrono::milliseconds out{};
            if (!tryParseDuration(token, out)) rejectToken(token, typeName());
            return out;
        }
        case ValueType::String:
            return token;
        case ValueType::Custom:
            try {
                return converter_(token);
            } catch (const std::invalid_argument&) {
                throw;
            } catch (const std::exception& e) {
                throw std::invalid_argument("value \"" + token + "\" cannot be converted to type " + customTypeName_ + ": " + e.what());
            } catch (...) {
                rejectToken(token, customTypeName_);
            }
    }
    rejectToken(token, typeName());
}

} // namespace clarg
