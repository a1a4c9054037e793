#include "command_chat_agent.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>

namespace canvas::server {

namespace {

constexpr std::string_view kPlaceholder = "{query}";

std::string shell_quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

int exit_code(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

}  // namespace

CommandChatAgent::CommandChatAgent(std::string command_template) : command_template_(std::move(command_template)) {
    if (command_template_.empty()) {
        throw std::invalid_argument("Agent command must not be empty");
    }
}

std::string CommandChatAgent::render_command(const std::string& command_template, const std::string& query) {
    std::string command = command_template;
    const auto quoted = shell_quote(query);
    const auto pos = command.find(kPlaceholder);
    if (pos == std::string::npos) {
        return command + " " + quoted;
    }
    std::size_t cursor = pos;
    while (cursor != std::string::npos) {
        command.replace(cursor, kPlaceholder.size(), quoted);
        cursor = command.find(kPlaceholder, cursor + quoted.size());
    }
    return command;
}

std::string CommandChatAgent::answer(const std::string& query) {
    const auto command = render_command(command_template_, query) + " 2>/dev/null";
    FILE* pipe = ::popen(command.c_str(), "r");
    if (pipe == nullptr) {
        throw std::runtime_error("Unable to start agent command");
    }
    std::string output;
    std::array<char, 4096> buf{};
    std::size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        output.append(buf.data(), n);
    }
    const int code = exit_code(::pclose(pipe));
    if (code != 0) {
        throw std::runtime_error("Agent command exited with code " + std::to_string(code));
    }
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }
    return output;
}

}  // namespace canvas::server
