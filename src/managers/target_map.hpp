#pragma once

#include <map>
#include <optional>
#include <string>

// Where each control-side cached file was placed on the target during this
// client's lifetime. Last write wins. Introspection only.
class TargetMap {
public:
    void record(const std::string& local_path, const std::string& remote_path) {
        entries_[local_path] = remote_path;
    }

    std::optional<std::string> lookup(const std::string& local_path) const {
        auto it = entries_.find(local_path);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& local_path) const { return entries_.count(local_path) > 0; }
    size_t size() const { return entries_.size(); }
    const std::map<std::string, std::string>& entries() const { return entries_; }

private:
    std::map<std::string, std::string> entries_;
};
