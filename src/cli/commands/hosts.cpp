#include "../base_cli.hpp"
#include "../theme.hpp"
#include <util/string_utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void list_hosts(BaseCLI& cli) {
    const auto& hosts = cli.hosts->hosts();
    if (hosts.empty()) {
        std::cout << theme::dim("  No bare-metal hosts registered.") << "\n";
        return;
    }
    std::cout << "\n";
    std::cout << theme::table_header(fmt::format("{:<16} {:<32} {}", "NAME", "ADDRESS", "KEY"));
    for (const auto& [name, h] : hosts) {
        std::cout << fmt::format("  {:<16} {:<32} {}\n", name,
                                 fmt::format("{}@{}:{}", h.user, h.host, h.port),
                                 h.ssh_key_path.empty() ? "-" : h.ssh_key_path);
    }
    std::cout << "\n";
}

static void do_hosts(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_config()) { cli.mark_failed(); return; }

    std::vector<std::string> args;
    for (auto& a : StringUtils::split(StringUtils::trim(arg), " ")) {
        if (!a.empty()) args.push_back(a);
    }

    if (args.empty()) {
        list_hosts(cli);
        return;
    }

    if (args[0] == "add") {
        if (args.size() < 4) {
            std::cout << theme::fail("Usage: hosts add <name> <host> <user> [key]");
            cli.mark_failed();
            return;
        }
        HostEntry entry;
        entry.name = args[1];
        entry.host = args[2];
        entry.user = args[3];
        if (args.size() > 4) entry.ssh_key_path = args[4];

        auto r = cli.hosts->add(entry);
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
            cli.mark_failed();
            return;
        }
        std::cout << theme::ok(fmt::format("Registered {} ({}@{})", entry.name, entry.user, entry.host));
        return;
    }

    if (args[0] == "remove") {
        if (args.size() < 2) {
            std::cout << theme::fail("Usage: hosts remove <name>");
            cli.mark_failed();
            return;
        }
        auto r = cli.hosts->remove(args[1]);
        if (r.is_err()) {
            std::cout << theme::fail(r.error);
            cli.mark_failed();
            return;
        }
        std::cout << theme::ok("Removed " + args[1]);
        return;
    }

    std::cout << theme::fail("Unknown hosts subcommand: " + args[0]);
    cli.mark_failed();
}

void register_host_commands(BaseCLI& cli) {
    cli.add_command("hosts", do_hosts, "List, add or remove bare-metal hosts");
}
