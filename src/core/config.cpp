#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshcp";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Ensure directory exists
    fs::create_directories(config_path.parent_path());

    // Default config content
    const char* default_config = R"(# sshcp configuration
# Control-side cache; one subtree per namespace and target
cachedir: "~/.sshcp/cache"

# Cache location on every target
remote_cachedir: "/var/tmp/sshcp/cache"

namespace: "salt-ssh"

# salt:// lookups, first match wins
file_roots:
  base:
    - "/srv/salt"

targets:
  # web1:
  #   host: "web1.example.com"
  #   port: 22
  #   user: "root"
  #   ssh_key_path: "~/.ssh/id_ed25519"
  #   timeout: 30
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static TargetConfig parse_target_config(const std::string& id, const YAML::Node& node) {
    TargetConfig target;
    target.id = id;
    target.host = node["host"].as<std::string>(id);
    target.port = node["port"].as<int>(22);
    target.user = node["user"].as<std::string>("root");
    target.timeout = node["timeout"].as<int>(30);

    if (node["password"]) {
        target.password = node["password"].as<std::string>();
    }

    if (node["ssh_key_path"]) {
        target.ssh_key_path = expand_user(node["ssh_key_path"].as<std::string>());
    }

    return target;
}

static FileRoots parse_file_roots(const YAML::Node& node) {
    FileRoots roots;
    if (!node || !node.IsMap()) return roots;

    for (const auto& kv : node) {
        std::string env = kv.first.as<std::string>();
        if (kv.second.IsSequence()) {
            roots[env] = kv.second.as<std::vector<std::string>>(std::vector<std::string>());
        } else if (kv.second.IsScalar()) {
            roots[env].push_back(kv.second.as<std::string>());
        }
    }
    return roots;
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.cache_.cachedir = expand_user(root["cachedir"].as<std::string>("~/.sshcp/cache"));
        config.cache_.remote_cachedir = root["remote_cachedir"].as<std::string>(DEFAULT_REMOTE_CACHEDIR);
        config.cache_.connection_namespace = root["namespace"].as<std::string>(DEFAULT_NAMESPACE);

        config.file_roots_ = parse_file_roots(root["file_roots"]);

        if (root["targets"] && root["targets"].IsMap()) {
            for (const auto& kv : root["targets"]) {
                std::string id = kv.first.as<std::string>();
                config.targets_[id] = parse_target_config(
                    id, kv.second.IsMap() ? kv.second : YAML::Node());
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load(get_global_config_path());
}

Result<TargetConfig> Config::target(const std::string& id) const {
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        return Result<TargetConfig>::Err("Unknown target '" + id + "'");
    }
    return Result<TargetConfig>::Ok(it->second);
}
