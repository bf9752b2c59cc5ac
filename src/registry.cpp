/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "spindle/registry.hpp"
#include "spindle/logger.hpp"
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>

namespace spindle {

namespace {
std::string randomToken(std::size_t bytes) {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dist(0, 255);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes; ++i) {
        ss << std::setw(2) << dist(engine);
    }
    return ss.str();
}
}

JobId Registry::generateId() const {
    while (true) {
        JobId id = randomToken(16);
        if (!find(id)) {
            return id;
        }
        LOG_WARN("Job id collision, regenerating");
    }
}

bool Registry::insert(std::shared_ptr<Job> job) {
    if (!job) {
        return false;
    }
    auto& shard = shardFor(job->id());
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto inserted = shard.jobs.emplace(job->id(), job);
    return inserted.second;
}

std::shared_ptr<Job> Registry::find(const JobId& id) const {
    auto& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.jobs.find(id);
    return it == shard.jobs.end() ? nullptr : it->second;
}

bool Registry::remove(const JobId& id) {
    auto& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.jobs.erase(id) > 0;
}

std::size_t Registry::countRunning(const std::string& owner) const {
    std::size_t count = 0;
    for (const auto& job : snapshot()) {
        if (job->owner() && *job->owner() == owner && job->isRunning()) {
            ++count;
        }
    }
    return count;
}

std::vector<std::shared_ptr<Job>> Registry::snapshot() const {
    std::vector<std::shared_ptr<Job>> jobs;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& entry : shard.jobs) {
            jobs.push_back(entry.second);
        }
    }
    return jobs;
}

std::size_t Registry::size() const {
    std::size_t total = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.jobs.size();
    }
    return total;
}

Registry::Shard& Registry::shardFor(const JobId& id) const {
    return shards_[std::hash<JobId>{}(id) % kShards];
}

}
