#pragma once
#include "Envelope.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

// Registered tokens and the contexts they protect, as returned by enumerate()
struct DeviceSummary {
    std::string deviceId;
    std::vector<std::string> contexts;    // insertion order, duplicates kept
    std::vector<std::string> createdAt;   // parallel to contexts
};

// In-memory device -> envelopes mapping. Persistence lives in BundleDatabase.
// Envelopes for a device keep insertion order; duplicate contexts are allowed
// and lookups prefer the most recently inserted match.
class BundleStore {
public:
    std::optional<Envelope> lookup(const std::string& deviceId,
                                   const std::string& context) const;

    void insert(const std::string& deviceId, Envelope envelope);

    // Device-granular removal. Returns false if the device had no entry.
    bool remove(const std::string& deviceId);

    // Drops every envelope for (device, context); the device entry goes away
    // with its last envelope. Returns the number removed.
    std::size_t removeContext(const std::string& deviceId, const std::string& context);

    std::size_t countContext(const std::string& deviceId, const std::string& context) const;

    bool contains(const std::string& deviceId) const;
    bool empty() const { return m_devices.empty(); }

    std::vector<DeviceSummary> enumerate() const;

    // Raw access for the persistence layer
    const std::map<std::string, std::vector<Envelope>>& devices() const { return m_devices; }

    bool operator==(const BundleStore& other) const { return m_devices == other.m_devices; }

private:
    std::map<std::string, std::vector<Envelope>> m_devices;
};
