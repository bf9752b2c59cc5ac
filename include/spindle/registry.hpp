/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "spindle/job.hpp"
#include "spindle/types.hpp"

namespace spindle {

// In-memory job table. Sharded so lookups for unrelated jobs do not contend;
// field-level consistency is the Job's own lock.
class Registry final {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // 16 random bytes, hex encoded; never one that is currently registered.
    [[nodiscard]] JobId generateId() const;

    // False if the id is already taken.
    bool insert(std::shared_ptr<Job> job);
    [[nodiscard]] std::shared_ptr<Job> find(const JobId& id) const;
    bool remove(const JobId& id);

    [[nodiscard]] std::size_t countRunning(const std::string& owner) const;
    [[nodiscard]] std::vector<std::shared_ptr<Job>> snapshot() const;
    [[nodiscard]] std::size_t size() const;

private:
    static constexpr std::size_t kShards = 16;

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<JobId, std::shared_ptr<Job>> jobs;
    };

    [[nodiscard]] Shard& shardFor(const JobId& id) const;

    mutable std::array<Shard, kShards> shards_;
};

}
