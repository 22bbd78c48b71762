#include "BundleStore.hpp"

#include <algorithm>

std::optional<Envelope> BundleStore::lookup(const std::string& deviceId,
                                            const std::string& context) const {
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return std::nullopt;

    // Newest generation wins
    const auto& envs = it->second;
    for (auto rit = envs.rbegin(); rit != envs.rend(); ++rit) {
        if (rit->context == context) return *rit;
    }
    return std::nullopt;
}

void BundleStore::insert(const std::string& deviceId, Envelope envelope) {
    m_devices[deviceId].push_back(std::move(envelope));
}

bool BundleStore::remove(const std::string& deviceId) {
    return m_devices.erase(deviceId) > 0;
}

std::size_t BundleStore::removeContext(const std::string& deviceId, const std::string& context) {
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return 0;

    auto& envs = it->second;
    const auto before = envs.size();
    envs.erase(std::remove_if(envs.begin(), envs.end(),
                              [&](const Envelope& e) { return e.context == context; }),
               envs.end());
    const auto removed = before - envs.size();
    if (envs.empty()) m_devices.erase(it);
    return removed;
}

std::size_t BundleStore::countContext(const std::string& deviceId, const std::string& context) const {
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return 0;
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(),
                                                  [&](const Envelope& e) { return e.context == context; }));
}

bool BundleStore::contains(const std::string& deviceId) const {
    return m_devices.count(deviceId) > 0;
}

std::vector<DeviceSummary> BundleStore::enumerate() const {
    std::vector<DeviceSummary> out;
    out.reserve(m_devices.size());
    for (const auto& [deviceId, envs] : m_devices) {
        DeviceSummary s;
        s.deviceId = deviceId;
        for (const auto& e : envs) {
            s.contexts.push_back(e.context);
            s.createdAt.push_back(e.createdAt);
        }
        out.push_back(std::move(s));
    }
    return out;
}
