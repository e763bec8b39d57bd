#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace sigil::command {

class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Malformed declaration detected while compiling a command tree.
class ProcessingException : public CommandException {
public:
    explicit ProcessingException(const std::string& msg)
        : CommandException("Command processing error: " + msg) {}
};

// Raised by IArgumentType::parse. `reason` is a stable, machine-readable code
// ("invalid-number", "number-out-of-range:1:64", "player-not-online", ...).
class ArgumentTypeError : public CommandException {
public:
    ArgumentTypeError(std::string input, std::string reason)
        : CommandException("Cannot parse '" + input + "': " + reason),
          input_(std::move(input)),
          reason_(std::move(reason)) {}

    const std::string& input() const { return input_; }
    const std::string& reason() const { return reason_; }

private:
    std::string input_;
    std::string reason_;
};

class ParseException : public CommandException {
public:
    enum class Kind { MISSING_REQUIRED, INVALID_VALUE, TOO_MANY_ARGS, UNKNOWN_TYPE };

    ParseException(Kind kind, std::string argument, const std::string& msg)
        : CommandException(msg), kind_(kind), argument_(std::move(argument)) {}

    Kind kind() const { return kind_; }
    const std::string& argument() const { return argument_; }

private:
    Kind kind_;
    std::string argument_;
};

class MissingArgumentException : public ParseException {
public:
    explicit MissingArgumentException(const std::string& argument)
        : ParseException(Kind::MISSING_REQUIRED, argument,
                         "Missing required argument: " + argument) {}
};

class InvalidArgumentValueException : public ParseException {
public:
    InvalidArgumentValueException(const std::string& argument,
                                  std::string input, std::string reason)
        : ParseException(Kind::INVALID_VALUE, argument,
                         "Invalid value '" + input + "' for argument " +
                             argument + ": " + reason),
          input_(std::move(input)),
          reason_(std::move(reason)) {}

    const std::string& input() const { return input_; }
    const std::string& reason() const { return reason_; }

private:
    std::string input_;
    std::string reason_;
};

class TooManyArgumentsException : public ParseException {
public:
    TooManyArgumentsException(size_t expected, size_t got)
        : ParseException(Kind::TOO_MANY_ARGS, "",
                         "Too many arguments: expected " +
                             std::to_string(expected) + ", got " +
                             std::to_string(got)),
          expected_(expected),
          got_(got) {}

    size_t expected() const { return expected_; }
    size_t got() const { return got_; }

private:
    size_t expected_;
    size_t got_;
};

class UnknownArgumentTypeException : public ParseException {
public:
    UnknownArgumentTypeException(const std::string& argument,
                                 std::string type_name)
        : ParseException(Kind::UNKNOWN_TYPE, argument,
                         "Unknown argument type '" + type_name +
                             "' for argument " + argument),
          type_name_(std::move(type_name)) {}

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

class PermissionDeniedException : public CommandException {
public:
    explicit PermissionDeniedException(std::string permission)
        : CommandException("Permission denied: " + permission),
          permission_(std::move(permission)) {}

    const std::string& permission() const { return permission_; }

private:
    std::string permission_;
};

class PlayerOnlyException : public CommandException {
public:
    PlayerOnlyException()
        : CommandException("This command can only be used by players") {}
};

class CooldownActiveException : public CommandException {
public:
    explicit CooldownActiveException(std::chrono::milliseconds remaining)
        : CommandException("Cooldown active: " +
                           std::to_string(remaining.count()) + "ms remaining"),
          remaining_(remaining) {}

    std::chrono::milliseconds remaining() const { return remaining_; }

private:
    std::chrono::milliseconds remaining_;
};

// Wraps anything that escaped a compiled executor.
class HandlerInvocationFailure : public CommandException {
public:
    HandlerInvocationFailure(const std::string& path, const std::string& cause)
        : CommandException("Handler for '" + path + "' failed: " + cause),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace sigil::command
