#include "client/ClientCommands.hpp"
#include "capabilities/registry/CapabilityIds.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace EchoAgent::Client {

namespace {

constexpr const char* UnreachableMessage =
    "Error: Server is not reachable. Please ensure the server is running.";

bool ensure_reachable(AgentClient& client, std::ostream& out) {
    if (client.check_health() != HealthStatus::Healthy) {
        out << UnreachableMessage << "\n";
        return false;
    }
    return true;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void print_agent_info(AgentClient& client, std::ostream& out) {
    auto card = client.get_agent_card();
    if (!card) {
        out << "Failed to retrieve agent card\n";
        return;
    }
    out << "Agent Name: " << card->value("name", std::string{}) << "\n"
        << "Description: " << card->value("description", std::string{}) << "\n"
        << "Version: " << card->value("version", std::string{}) << "\n"
        << "\nSkills:\n";
    if (card->contains("skills") && (*card)["skills"].is_array()) {
        for (const auto& skill : (*card)["skills"]) {
            out << "  - " << skill.value("name", std::string{}) << ": "
                << skill.value("description", std::string{}) << "\n";
        }
    }
}

/// Text to show for a finished invocation, or nullopt when there is none.
std::optional<std::string> response_text(const std::optional<InvokeResult>& result) {
    if (!result) {
        return std::nullopt;
    }
    if (result->text) {
        return result->text;
    }
    if (!result->completed()) {
        return "Task " + result->state + ": " + result->metadata.value("error", std::string("no detail"));
    }
    return std::nullopt;
}

} // anonymous namespace

int run_info(AgentClient& client, std::ostream& out) {
    if (!ensure_reachable(client, out)) return ExitCode::Unreachable;
    print_agent_info(client, out);
    return ExitCode::Ok;
}

int run_echo(AgentClient& client, const std::string& message, const std::string& capability,
             const std::optional<std::string>& prefix, std::ostream& out) {
    if (!ensure_reachable(client, out)) return ExitCode::Unreachable;

    nlohmann::json parameters = nlohmann::json::object();
    if (capability == Capabilities::CapabilityIds::EchoWithPrefix && prefix) {
        parameters["prefix"] = *prefix;
    }

    auto result = client.send_message(message, capability, parameters);
    if (auto text = response_text(result)) {
        out << "Response: " << *text << "\n";
        return result->completed() ? ExitCode::Ok : ExitCode::Failed;
    }
    out << "Failed to get response from agent\n";
    return ExitCode::Failed;
}

int run_health(AgentClient& client, std::ostream& out) {
    switch (client.check_health()) {
        case HealthStatus::Healthy:
            out << "Server is healthy\n";
            return ExitCode::Ok;
        case HealthStatus::Unhealthy:
            out << "Server responded but is not healthy\n";
            return ExitCode::Failed;
        case HealthStatus::Unreachable:
            break;
    }
    out << "Server is not reachable\n";
    return ExitCode::Unreachable;
}

InteractiveShell::InteractiveShell(AgentClient& client, std::istream& in, std::ostream& out)
    : client_(client), in_(in), out_(out)
{
}

int InteractiveShell::run() {
    if (!ensure_reachable(client_, out_)) return ExitCode::Unreachable;

    out_ << "A2A Echo Agent Interactive Mode\n"
         << "Type 'quit' to exit, 'info' for agent information\n"
         << "Use '/prefix <prefix>' to set a prefix for echo_with_prefix\n"
         << std::string(50, '-') << "\n";

    std::string line;
    while (true) {
        out_ << "You: " << std::flush;
        if (!std::getline(in_, line)) {
            out_ << "\nGoodbye!\n";
            break;
        }
        if (!handle_line(line)) {
            break;
        }
    }
    return ExitCode::Ok;
}

bool InteractiveShell::handle_line(const std::string& raw) {
    // "/prefix " keeps trailing spaces of the prefix itself
    if (raw.rfind("/prefix ", 0) == 0) {
        prefix_ = raw.substr(8);
        out_ << "Prefix set to: '" << *prefix_ << "'\n";
        return true;
    }

    const std::string line = trim(raw);
    if (lower(line) == "quit") {
        return false;
    }
    if (lower(line) == "info") {
        print_agent_info(client_, out_);
        return true;
    }
    if (line.rfind("/clear", 0) == 0) {
        prefix_.reset();
        out_ << "Prefix cleared\n";
        return true;
    }
    if (line.empty()) {
        return true;
    }

    std::string capability = Capabilities::CapabilityIds::Echo;
    nlohmann::json parameters = nlohmann::json::object();
    if (prefix_ && !prefix_->empty()) {
        capability = Capabilities::CapabilityIds::EchoWithPrefix;
        parameters["prefix"] = *prefix_;
    }

    auto result = client_.send_message(line, capability, parameters);
    if (auto text = response_text(result)) {
        out_ << "Agent: " << *text << "\n";
    } else {
        out_ << "Failed to get response from agent\n";
    }
    return true;
}

} // namespace EchoAgent::Client
