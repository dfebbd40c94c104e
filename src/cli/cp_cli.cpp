#include "cp_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <iostream>

// Optional positional argument
static std::string arg_or(const std::vector<std::string>& args, size_t i,
                          const std::string& fallback = "") {
    return i < args.size() ? args[i] : fallback;
}

CpCLI::CpCLI() {
    register_all_commands();
}

void CpCLI::add_command(const std::string& name, CommandHandler handler,
                        const std::string& usage, const std::string& help,
                        size_t min_args, bool needs_connection) {
    commands_[name] = Command{std::move(handler), usage, help, min_args, needs_connection};
}

void CpCLI::register_all_commands() {
    add_command("cache_file", [](CpCLI& cli, const std::vector<std::string>& args) {
        cli.report(cli.client->cache_file(args[0], arg_or(args, 1, "base")));
    }, "<uri> [saltenv]", "Cache a file and mirror it to the target", 1);

    add_command("cache_dir", [](CpCLI& cli, const std::vector<std::string>& args) {
        cli.report(cli.client->cache_dir(args[0], arg_or(args, 1, "base"),
                                         arg_or(args, 2), arg_or(args, 3)));
    }, "<uri> [saltenv] [include] [exclude]", "Cache every file below a salt:// directory", 1);

    add_command("cache_master", [](CpCLI& cli, const std::vector<std::string>& args) {
        cli.report(cli.client->cache_master(arg_or(args, 0, "base")));
    }, "[saltenv]", "Cache every file in a saltenv", 0);

    add_command("get_file", [](CpCLI& cli, const std::vector<std::string>& args) {
        cli.report(cli.client->get_file(args[0], args[1], arg_or(args, 2, "base")));
    }, "<uri> <dest> [saltenv]", "Copy a salt:// file to a target path", 2);

    add_command("get_dir", [](CpCLI& cli, const std::vector<std::string>& args) {
        cli.report(cli.client->get_dir(args[0], args[1], arg_or(args, 2, "base")));
    }, "<uri> <dest> [saltenv]", "Copy a salt:// directory to a target path", 2);

    add_command("get_url", [](CpCLI& cli, const std::vector<std::string>& args) {
        std::string env = arg_or(args, 2, "base");
        if (args[1] == "-") {
            auto r = cli.client->get_url_contents(args[0], env);
            if (r.is_err()) {
                cli.report_failure(r.error);
                return;
            }
            std::cout << r.value;
            return;
        }
        cli.report(cli.client->get_url(args[0], args[1], env));
    }, "<uri> <dest|-> [saltenv]", "Fetch a URL to the target (\"-\" prints it instead)", 2);

    add_command("get_template", [](CpCLI& cli, const std::vector<std::string>& args) {
        TemplateContext context;
        for (size_t i = 2; i < args.size(); i++) {
            auto eq = args[i].find('=');
            if (eq == std::string::npos) {
                cli.report_failure("Expected key=value, got '" + args[i] + "'");
                return;
            }
            context[args[i].substr(0, eq)] = args[i].substr(eq + 1);
        }
        cli.report(cli.client->get_template(args[0], args[1], "vars", context));
    }, "<uri> <dest> [key=value...]", "Render a template and copy it to the target", 2);

    add_command("is_cached", [](CpCLI& cli, const std::vector<std::string>& args) {
        auto r = cli.client->is_cached(args[0], arg_or(args, 1, "base"));
        if (r.is_err()) {
            cli.report_failure(r.error);
            return;
        }
        const std::string& path = r.value;
        if (path.empty()) {
            cli.report_failure(args[0] + " is not cached");
            return;
        }
        std::cout << theme::ok(path);
    }, "<path> [saltenv]", "Print the target-side cache path of a file", 1);

    add_command("list_master", [](CpCLI& cli, const std::vector<std::string>& args) {
        for (const auto& f : cli.store->file_list(arg_or(args, 0, "base"), arg_or(args, 1))) {
            std::cout << f << "\n";
        }
    }, "[saltenv] [prefix]", "List the files in a saltenv", 0, false);

    add_command("list_master_dirs", [](CpCLI& cli, const std::vector<std::string>& args) {
        for (const auto& d : cli.store->dir_list(arg_or(args, 0, "base"), arg_or(args, 1))) {
            std::cout << d << "\n";
        }
    }, "[saltenv] [prefix]", "List the directories in a saltenv", 0, false);

    add_command("list_states", [](CpCLI& cli, const std::vector<std::string>& args) {
        for (const auto& state : cli.store->list_states(arg_or(args, 0, "base"))) {
            std::cout << state << "\n";
        }
    }, "[saltenv]", "List the states in a saltenv", 0, false);

    add_command("envs", [](CpCLI& cli, const std::vector<std::string>&) {
        for (const auto& env : cli.store->envs()) {
            std::cout << env << "\n";
        }
    }, "", "List the configured saltenvs", 0, false);
}

bool CpCLI::require_config() {
    if (config) return true;

    auto result = Config::load_global();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Run 'sshcp init' to create one.");
        return false;
    }
    config = result.value;
    store = std::make_unique<FileRootsMaterializer>(config->file_roots());
    return true;
}

bool CpCLI::require_connection(const std::string& target_id) {
    if (client) return true;

    auto target = config->target(target_id);
    if (target.is_err()) {
        std::cout << theme::fail(target.error);
        return false;
    }

    session = std::make_unique<SessionManager>(target.value);
    auto r = session->establish([](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    });
    if (r.failed()) {
        std::cout << theme::fail(r.stderr_data);
        return false;
    }

    shell = std::make_unique<SSHConnection>(*session);
    client = std::make_unique<SSHCpClient>(*shell, *store, config->cache(), target_id);
    return true;
}

void CpCLI::report(const TransferResult& result) {
    if (result.ok()) {
        std::cout << theme::ok(result.remote_path);
        return;
    }
    report_failure(fmt::format("{} ({}): {}", result.remote_path,
                               transfer_status_name(result.status), result.error));
}

void CpCLI::report(const std::vector<TransferResult>& results) {
    if (results.empty()) {
        std::cout << theme::info("Nothing to transfer");
        return;
    }
    for (const auto& r : results) report(r);
}

void CpCLI::report_failure(const std::string& msg) {
    failures_++;
    std::cout << theme::fail(msg);
}

int CpCLI::run(const std::string& target_id, const std::string& command,
               const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        print_help();
        return 1;
    }

    const Command& cmd = it->second;
    if (args.size() < cmd.min_args) {
        std::cout << theme::fail("Missing arguments.");
        std::cout << theme::step("Usage: sshcp " + target_id + " " + command + " " + cmd.usage);
        return 1;
    }

    if (!require_config()) return 1;
    if (cmd.needs_connection && !require_connection(target_id)) return 1;

    try {
        cmd.handler(*this, args);
    } catch (const CpConfigError& e) {
        sshcp_log_error(e.what());
        report_failure(e.what());
    }

    if (session) session->close();
    return failures_ == 0 ? 0 : 1;
}

void CpCLI::print_help() const {
    std::cout << theme::section("Commands");
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::TEAL << "    " << name << " "
                  << theme::color::RESET << theme::color::AMBER << cmd.usage
                  << theme::color::RESET << "\n"
                  << theme::color::DIM << "        " << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}
