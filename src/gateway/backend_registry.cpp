#include "gateway/backend_registry.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace mcpgate {

void BackendRegistry::add(std::shared_ptr<IBackend> backend) {
    if (!backend || backend->name().empty()) {
        throw std::invalid_argument("Backend must have a non-empty name");
    }

    auto entry = std::make_shared<Entry>();
    entry->backend = backend;
    entry->registered_at = std::chrono::system_clock::now();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!entries_.try_emplace(backend->name(), std::move(entry)).second) {
        throw std::invalid_argument(std::format("Duplicate backend name: {}", backend->name()));
    }
    order_.push_back(backend->name());
}

size_t BackendRegistry::initialize_all() {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& name : order_) {
            entries.push_back(entries_.at(name));
        }
    }

    size_t healthy = 0;
    for (const auto& entry : entries) {
        const auto& name = entry->backend->name();
        utils::Timer timer;
        try {
            entry->backend->initialize();
            const auto elapsed = std::chrono::milliseconds(timer.elapsed_ms());
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                entry->status = BackendStatus::HEALTHY;
                entry->init_duration = elapsed;
            }
            ++healthy;
            utils::log::info(std::format("Backend '{}' ({}) initialized in {}ms",
                                         name, entry->backend->type(), elapsed.count()));
        } catch (const std::exception& e) {
            mark_crashed(name, e.what());
        }
    }

    utils::log::info(std::format("Initialized {}/{} backends successfully", healthy, entries.size()));
    return healthy;
}

Result<std::shared_ptr<IBackend>> BackendRegistry::resolve(const std::string& name) const {
    auto entry = find(name);
    if (!entry) {
        return Result<std::shared_ptr<IBackend>>::error(ErrorCode::BACKEND_NOT_FOUND,
            std::format("Backend not found: {}", name));
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->status == BackendStatus::CRASHED) {
        return Result<std::shared_ptr<IBackend>>::error(ErrorCode::BACKEND_CRASHED,
            std::format("Backend {} is crashed: {}", name, entry->crash_reason));
    }
    return Result<std::shared_ptr<IBackend>>::ok(entry->backend);
}

std::shared_ptr<IBackendTransport> BackendRegistry::create_transport(const std::string& backend) {
    auto resolved = resolve(backend);
    if (resolved.is_error()) {
        throw std::runtime_error(resolved.error_message());
    }
    return resolved.value()->create_transport();
}

void BackendRegistry::mark_crashed(const std::string& name, const std::string& reason) {
    auto entry = find(name);
    if (!entry) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->status = BackendStatus::CRASHED;
        entry->crash_reason = reason;
        entry->crashed_at = std::chrono::system_clock::now();
    }
    utils::log::error(std::format("Backend '{}' marked crashed: {}", name, reason));
}

void BackendRegistry::record_request(const std::string& name, bool success) {
    auto entry = find(name);
    if (!entry) {
        return;
    }
    entry->request_count.fetch_add(1, std::memory_order_relaxed);
    if (!success) {
        entry->error_count.fetch_add(1, std::memory_order_relaxed);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->last_activity = std::chrono::system_clock::now();
}

std::vector<BackendInfo> BackendRegistry::list() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& name : order_) {
            entries.push_back(entries_.at(name));
        }
    }

    std::vector<BackendInfo> infos;
    infos.reserve(entries.size());
    for (const auto& entry : entries) {
        BackendInfo info;
        info.name = entry->backend->name();
        info.type = entry->backend->type();
        info.request_count = entry->request_count.load(std::memory_order_relaxed);
        info.error_count = entry->error_count.load(std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            info.status = entry->status;
            info.crash_reason = entry->crash_reason;
            info.registered_at = entry->registered_at;
            info.last_activity = entry->last_activity;
            info.crashed_at = entry->crashed_at;
            info.init_duration = entry->init_duration;
        }
        infos.push_back(std::move(info));
    }
    return infos;
}

std::vector<std::string> BackendRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return order_;
}

size_t BackendRegistry::healthy_count() const {
    size_t healthy = 0;
    for (const auto& info : list()) {
        if (info.status == BackendStatus::HEALTHY) {
            ++healthy;
        }
    }
    return healthy;
}

size_t BackendRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::shared_ptr<BackendRegistry::Entry> BackendRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = entries_.find(name);
    return it != entries_.end() ? it->second : nullptr;
}

} // namespace mcpgate
