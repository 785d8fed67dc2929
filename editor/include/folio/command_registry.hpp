#pragma once

#include "folio/command.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

// Maps a command type tag to a factory that rebuilds the command from its
// toJson() form. Owned by the service layer and passed by reference.
class CommandRegistry {
public:
    using Factory = std::function<std::unique_ptr<Command>(const json&)>;

    // Later registrations for the same tag replace earlier ones.
    void add(const std::string& tag, Factory factory);
    bool remove(const std::string& tag);
    bool contains(const std::string& tag) const;
    std::vector<std::string> tags() const;

    // Throws RegistryError for a missing/unknown tag or a payload the
    // factory rejects.
    std::unique_ptr<Command> create(const json& payload) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;
};

// Installs CreateSlide, UpdateSlide, DeleteSlide and MoveSlide.
void registerSlideCommands(CommandRegistry& registry);

} // namespace folio
