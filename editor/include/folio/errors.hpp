#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace folio {

// Failure of a single command step. Carries the offending command's id and
// type tag; the history is left exactly as it was before the step.
class CommandError : public std::runtime_error {
public:
    CommandError(const std::string& message, std::string command_id, std::string command_type)
        : std::runtime_error(message), command_id_(std::move(command_id)), command_type_(std::move(command_type)) {}

    const std::string& commandId() const noexcept { return command_id_; }
    const std::string& commandType() const noexcept { return command_type_; }

private:
    std::string command_id_;
    std::string command_type_;
};

// execute() or redo of a command failed, e.g. the referenced slide is gone.
class ExecutionError : public CommandError {
public:
    using CommandError::CommandError;
};

// undo() of a command failed, e.g. the slide was changed outside the history.
class UndoError : public CommandError {
public:
    using CommandError::CommandError;
};

// Missing, unknown or malformed type tag while rebuilding a command.
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace folio
