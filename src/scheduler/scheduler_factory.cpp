#include "scheduler_factory.hpp"
#include "slurm_scheduler.hpp"
#include "baremetal_scheduler.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

Result<SchedulerHandle> make_scheduler(const Config& config, const HostRegistry& hosts) {
    SchedulerHandle handle;
    const auto& runner_cfg = config.runner();

    if (runner_cfg.scheduler == "baremetal") {
        const HostEntry* host = hosts.find(runner_cfg.host);
        if (!host) {
            return Result<SchedulerHandle>::Err("Unknown bare-metal host: '" + runner_cfg.host + "'");
        }
        SessionTarget target;
        target.host = host->host;
        target.user = host->user;
        target.port = host->port;
        if (!host->ssh_key_path.empty()) target.ssh_key_path = expand_home(host->ssh_key_path);
        handle.runner = std::make_unique<SSHRunner>(target);
        handle.scheduler = std::make_unique<BaremetalScheduler>(*handle.runner, host->name);
        return Result<SchedulerHandle>::Ok(std::move(handle));
    }

    const auto& login = config.login();
    if (login.host.empty()) {
        handle.runner = std::make_unique<LocalRunner>();
    } else {
        SessionTarget target;
        target.host = login.host;
        target.user = login.user;
        target.password = login.password;
        target.port = login.port;
        target.timeout = login.timeout;
        target.ssh_key_path = login.ssh_key_path;
        handle.runner = std::make_unique<SSHRunner>(target);
    }
    handle.scheduler = std::make_unique<SlurmScheduler>(*handle.runner);
    return Result<SchedulerHandle>::Ok(std::move(handle));
}
