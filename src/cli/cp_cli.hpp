#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <ssh/session.hpp>
#include <ssh/connection.hpp>
#include <managers/file_roots_materializer.hpp>
#include <managers/cp_client.hpp>

// One-shot front end: `sshcp <target> <command> [args...]`.
class CpCLI {
public:
    CpCLI();

    using CommandHandler = std::function<void(CpCLI&, const std::vector<std::string>&)>;

    // Returns the process exit code: 0 if every transfer succeeded.
    int run(const std::string& target_id, const std::string& command,
            const std::vector<std::string>& args);

    void print_help() const;

    // Print a result line and count failures.
    void report(const TransferResult& result);
    void report(const std::vector<TransferResult>& results);
    void report_failure(const std::string& msg);

    // Public state
    std::optional<Config> config;
    std::unique_ptr<SessionManager> session;
    std::unique_ptr<SSHConnection> shell;
    std::unique_ptr<FileRootsMaterializer> store;
    std::unique_ptr<SSHCpClient> client;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
        size_t min_args;
        bool needs_connection;
    };

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help,
                     size_t min_args, bool needs_connection = true);
    void register_all_commands();

    bool require_config();
    bool require_connection(const std::string& target_id);

    std::map<std::string, Command> commands_;
    int failures_ = 0;
};
