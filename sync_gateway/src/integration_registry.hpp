#pragma once

#include "integration.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>

class IntegrationRegistry {
public:
    using Discovery = std::function<void(IntegrationRegistry&)>;

    // Returns false (and keeps the first) when the id is already taken
    bool register_integration(std::shared_ptr<Integration> integration);

    std::shared_ptr<Integration> get(const std::string& id) const;
    bool has(const std::string& id) const;
    std::vector<std::shared_ptr<Integration>> all() const;
    size_t size() const;
    void clear();

    // Runs discover to completion exactly once per registry, even when
    // several request threads arrive together. If discover throws, the next
    // caller tries again.
    void load_all(const Discovery& discover);
    bool is_loaded() const { return loaded_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Integration>> integrations_;

    std::once_flag load_once_;
    std::atomic<bool> loaded_{false};
};
