#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "app_catalog.hpp"
#include "device.hpp"
#include "event_bus.hpp"
#include "log_ring.hpp"
#include "result.hpp"

namespace pelo {

// =============================================================================
// DeviceRegistry: device list, active selection, catalog and status
// =============================================================================
// Mutated only by poll() and select(). Every change is published on the
// EventBus after the internal lock is released.
class DeviceRegistry {
public:
    using Enumerator = std::function<Result<std::vector<Device>>()>;
    using CatalogLoader =
        std::function<Result<std::vector<CatalogEntry>>(const std::optional<std::string>& abi)>;

    static constexpr const char* INITIAL_STATUS = "Checking device connection...";
    static constexpr const char* NO_DEVICE_STATUS =
        "❌ No device detected. Please connect your device and enable USB debugging.";

    DeviceRegistry(Enumerator enumerate, CatalogLoader load_catalog, EventBus& bus, LogSink log);

    // One enumeration cycle. A result with the same size and first serial as
    // the current set is a no-op (no log, no event). Returns true on change.
    // silent: skip the status log line (heartbeat)
    bool poll(bool silent = false);

    // Explicit pick; false (and no change) if serial is not registered
    bool select(const std::string& serial);

    std::vector<Device> devices() const;
    std::optional<Device> activeDevice() const;
    std::string status() const;

    std::vector<CatalogEntry> catalog() const;
    bool setEntrySelected(const std::string& name, bool selected);
    void setAllSelected(bool selected);
    std::vector<CatalogEntry> selectedEntries() const;
    size_t catalogReloadCount() const;

    static std::string connectedStatus(const Device& device);

private:
    struct Pending {
        bool devices_changed = false;
        bool active_changed = false;
        bool catalog_reloaded = false;
        bool status_changed = false;
        // Catalog to load once the lock is released
        bool load_catalog = false;
        std::optional<std::string> load_abi;
        size_t load_generation = 0;
    };

    // Caller holds mutex_
    void setActiveLocked(const Device& device, Pending& pending);
    void reloadCatalogLocked(Pending& pending);
    // Caller must not hold mutex_
    void loadCatalog(const Pending& pending);
    void publish(const Pending& pending);

    Enumerator enumerate_;
    CatalogLoader load_catalog_;
    EventBus& bus_;
    LogSink log_;

    mutable std::mutex mutex_;
    bool initialized_ = false;   // first poll always applies
    std::vector<Device> devices_;
    std::optional<Device> active_;
    std::vector<CatalogEntry> catalog_;
    std::string status_ = INITIAL_STATUS;
    size_t catalog_reloads_ = 0;
    size_t catalog_generation_ = 0;   // bumped per reload; stale loads are dropped
};

} // namespace pelo
