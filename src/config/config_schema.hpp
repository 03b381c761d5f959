#pragma once

#include <string>

#include "utils/logging.hpp"

namespace pyrunner::config {

struct RunnerConfig {
    std::string container_cli = "docker";
    std::string image = "python:3.11-slim";
    std::string workspace_root = "~/.pyrunner/workspace";
    std::string user = "65534:65534";
    bool read_only_root = true;
    std::string cpus = "1.0";
    std::string memory = "1g";
    std::string extra_run_args =
        "--pids-limit 256 --tmpfs /tmp --tmpfs /var/tmp --security-opt no-new-privileges";
    bool deny_network_at_exec = true;
    std::string host_alias = "host.docker.internal";
    int bootstrap_timeout_s = 2 * 60;
    int probe_timeout_s = 10;
    int install_timeout_s = 5 * 60;
};

struct ToolConfig {
    bool enabled = true;
    bool allow_pip = false;
    int default_timeout_ms = 15000;
    int max_timeout_ms = 15000;
    long max_output_bytes = 64 * 1024;
};

struct Config {
    RunnerConfig runner;
    ToolConfig tool;
    utils::LogConfig log;
};

}  // namespace pyrunner::config
