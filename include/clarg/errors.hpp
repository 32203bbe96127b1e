#ifndef CLARG_ERRORS_HPP
#define CLARG_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace clarg {

// Base of every exception thrown by clarg. Parse-time problems are reported as
// Warning records instead (see matcher.hpp).
class Error : public std::runtime_error {
public:
    Error(std::string name, const std::string& message)
        : std::runtime_error(message), name_(std::move(name)) {}

    // The parameter the error is about.
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Declaration time.
class DuplicateNameError : public Error {
public:
    explicit DuplicateNameError(const std::string& name)
        : Error(name, "parameter already declared: " + name) {}
};

class InvalidArityError : public Error {
public:
    InvalidArityError(const std::string& name, int arity)
        : Error(name, "argument " + name + " needs an arity of at least 1, got " + std::to_string(arity)) {}
};

class InvalidNameError : public Error {
public:
    InvalidNameError(const std::string& name, const std::string& reason)
        : Error(name, "invalid parameter name \"" + name + "\": " + reason) {}
};

// Access time.
class UnknownParameterError : public Error {
public:
    explicit UnknownParameterError(const std::string& name)
        : Error(name, "unknown parameter: " + name) {}
};

class NotYetParsedError : public Error {
public:
    explicit NotYetParsedError(const std::string& name)
        : Error(name, "parameter " + name + " requested before parse()") {}
};

class MissingValueError : public Error {
public:
    explicit MissingValueError(const std::string& name)
        : Error(name, "argument " + name + " has no value") {}
};

class ParameterKindError : public Error {
public:
    ParameterKindError(const std::string& name, const std::string& expected)
        : Error(name, "parameter " + name + " is not " + expected) {}
};

class ValueTypeError : public Error {
public:
    ValueTypeError(const std::string& name, const std::string& requested)
        : Error(name, "argument " + name + " does not hold values of type " + requested) {}
};

} // namespace clarg

#endif // CLARG_ERRORS_HPP
