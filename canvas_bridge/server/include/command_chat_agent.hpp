#pragma once

#include "collaborators.hpp"

#include <string>

namespace canvas::server {

// Runs an external command per query and returns its standard output. The
// query replaces "{query}" in the command template (shell-quoted) or is
// appended as the last argument when the template has no placeholder.
class CommandChatAgent : public ChatAgent {
public:
    explicit CommandChatAgent(std::string command_template);

    std::string answer(const std::string& query) override;

    static std::string render_command(const std::string& command_template, const std::string& query);

private:
    std::string command_template_;
};

}  // namespace canvas::server
