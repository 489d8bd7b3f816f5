// clientMain.cpp - Command line client for the echo agent.
#include "ClientCommands.hpp"
#include "ClientOptions.hpp"
#include "options/Options.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    using namespace EchoAgent::Client;

    auto logger = std::make_shared<Logger>("EchoAgentClient");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Warning);
    logger->add_sink(stdout_sink);

    try {
        client_opts::register_options();
        shared_opts::Options::set_program_info("echo-agent-client", "1.0.0");

        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }
        logger->set_level(client_opts::get_log_level());

        AgentClient client(client_opts::get_server_url(), client_opts::get_timeout_seconds(), logger);

        switch (client_opts::get_command()) {
            case client_opts::Command::Info:
                return run_info(client, std::cout);
            case client_opts::Command::Echo: {
                auto args = client_opts::get_echo_args();
                return run_echo(client, args.message, args.capability, args.prefix, std::cout);
            }
            case client_opts::Command::Interactive: {
                InteractiveShell shell(client, std::cin, std::cout);
                return shell.run();
            }
            case client_opts::Command::Health:
                return run_health(client, std::cout);
            case client_opts::Command::None:
                break;
        }
        logger->error("No command given");
        return 2;

    } catch (const std::exception& e) {
        logger->error("Exception in client: " + std::string(e.what()));
        return 1;
    }
}
