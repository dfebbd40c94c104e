#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.sshcp/config.yaml
    static Result<Config> load_global();

    // Load config from an explicit path
    static Result<Config> load(const fs::path& path);

    // Accessors
    const CacheSettings& cache() const { return cache_; }
    const FileRoots& file_roots() const { return file_roots_; }
    const std::map<std::string, TargetConfig>& targets() const { return targets_; }

    Result<TargetConfig> target(const std::string& id) const;

public:
    Config() = default;

private:
    CacheSettings cache_;
    FileRoots file_roots_;
    std::map<std::string, TargetConfig> targets_;
};

// Helper to check if config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
