#include "errlens/classify/registry.hpp"

#include <stdexcept>
#include <utility>

namespace errlens::classify {

ErrorKindRegistry ErrorKindRegistry::canonical() {
    ErrorKindRegistry registry;

    registry.add(ErrorKind(ErrorKindId::ResourceNotFound, "Resource not found",
                           R"(([A-Za-z\s]+)\s+'(.*)'\s+(?:not found|could not be found))",
                           {"azure_resource", "invalid_resource_name"}),
                 handle_resource_not_found);

    registry.add(ErrorKind(ErrorKindId::CharacterNotAllowed, "Character not allowed",
                           R"([Pp]arameter\s+'(.*)'\s+.*pattern[:\s]+'(.*)')",
                           {"parameter", "regex"}),
                 handle_character_not_allowed);

    registry.add(ErrorKind(ErrorKindId::CommandNotFound, "Command not found",
                           R"((['"])(.*)\1 is not in the \1(az\s.*)\1 command group)",
                           {"quote", "subcommand", "command_group"}),
                 handle_command_not_found);

    registry.add(ErrorKind(ErrorKindId::ArgumentRequired, "Argument required",
                           R"(the following arguments are required)"),
                 handle_argument_required);

    registry.add(ErrorKind(ErrorKindId::ValueRequired, "Value Required",
                           R"(expected (at least)?\s?one argument)", {"at_least"}),
                 handle_value_required);

    return registry;
}

void ErrorKindRegistry::add(ErrorKind kind, ErrorHandlerFn handler) {
    if (!handler) {
        throw std::invalid_argument("expected a handler for error kind '" + kind.label() + "'");
    }
    entries_.push_back(RegisteredKind{std::move(kind), std::move(handler)});
}

const ErrorKind* ErrorKindRegistry::find(ErrorKindId id) const {
    for (const auto& entry : entries_) {
        if (entry.kind.id() == id) {
            return &entry.kind;
        }
    }
    return nullptr;
}

} // namespace errlens::classify
