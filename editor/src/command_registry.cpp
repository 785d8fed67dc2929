#include "folio/command_registry.hpp"
#include "commands/create_slide.hpp"
#include "commands/delete_slide.hpp"
#include "commands/move_slide.hpp"
#include "commands/update_slide.hpp"
#include "folio/errors.hpp"
#include <algorithm>

namespace folio {

void CommandRegistry::add(const std::string& tag, Factory factory) {
    if (tag.empty()) throw std::invalid_argument("command tag must not be empty");
    if (!factory) throw std::invalid_argument("command factory must not be empty: " + tag);
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[tag] = std::move(factory);
}

bool CommandRegistry::remove(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.erase(tag) != 0;
}

bool CommandRegistry::contains(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(tag) != 0;
}

std::vector<std::string> CommandRegistry::tags() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : factories_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<Command> CommandRegistry::create(const json& payload) const {
    if (!payload.is_object()) {
        throw RegistryError("command payload must be a JSON object");
    }
    auto t = payload.find("type");
    if (t == payload.end() || !t->is_string()) {
        throw RegistryError("command payload must contain a 'type' field");
    }
    const std::string tag = t->get<std::string>();

    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(tag);
        if (it == factories_.end()) {
            throw RegistryError("unknown command type: " + tag);
        }
        factory = it->second;
    }

    std::unique_ptr<Command> cmd;
    try {
        cmd = factory(payload);
    } catch (const json::exception& e) {
        throw RegistryError("malformed " + tag + " payload: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw RegistryError("malformed " + tag + " payload: " + e.what());
    }
    if (!cmd) throw RegistryError("factory for " + tag + " returned no command");
    return cmd;
}

void registerSlideCommands(CommandRegistry& registry) {
    registry.add(CreateSlideCommand::kType, &CreateSlideCommand::fromJson);
    registry.add(UpdateSlideCommand::kType, &UpdateSlideCommand::fromJson);
    registry.add(DeleteSlideCommand::kType, &DeleteSlideCommand::fromJson);
    registry.add(MoveSlideCommand::kType, &MoveSlideCommand::fromJson);
}

} // namespace folio
