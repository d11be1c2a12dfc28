#include "device_registry.hpp"
#include "pelo_log.hpp"

#include <algorithm>

namespace pelo {

DeviceRegistry::DeviceRegistry(Enumerator enumerate, CatalogLoader load_catalog,
                               EventBus& bus, LogSink log)
    : enumerate_(std::move(enumerate)),
      load_catalog_(std::move(load_catalog)),
      bus_(bus),
      log_(std::move(log)) {}

std::string DeviceRegistry::connectedStatus(const Device& device) {
    return "✅ Connected to " + device.displayName();
}

// =============================================================================
// Poll / select
// =============================================================================

bool DeviceRegistry::poll(bool silent) {
    std::vector<Device> fresh;
    auto listed = enumerate_();
    if (listed.is_ok()) {
        fresh = std::move(listed).value();
    } else {
        // Unreachable bridge reads as "no devices"
        PLOG_WARN("Registry", "Enumeration failed: %s", listed.error().message.c_str());
        if (!silent && log_) log_("Device check failed: " + listed.error().message, "error");
    }

    Pending pending;
    std::string status_line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool changed = !initialized_ ||
                       fresh.size() != devices_.size() ||
                       (!fresh.empty() && !devices_.empty() && fresh[0].serial != devices_[0].serial);
        initialized_ = true;
        if (!changed) return false;

        devices_ = std::move(fresh);
        pending.devices_changed = true;

        if (devices_.empty()) {
            bool had_active = active_.has_value();
            active_.reset();
            if (!catalog_.empty()) {
                catalog_.clear();
                pending.catalog_reloaded = true;
            }
            pending.active_changed = had_active;
            pending.status_changed = status_ != NO_DEVICE_STATUS;
            status_ = NO_DEVICE_STATUS;
        } else {
            auto keep = active_
                ? std::find_if(devices_.begin(), devices_.end(),
                               [&](const Device& d) { return d.serial == active_->serial; })
                : devices_.end();

            if (keep == devices_.end()) {
                auto wifi = std::find_if(devices_.begin(), devices_.end(),
                                         [](const Device& d) { return d.isWifi(); });
                setActiveLocked(wifi != devices_.end() ? *wifi : devices_.front(), pending);
            } else if (*keep != *active_) {
                // Same serial, refreshed attributes
                bool abi_changed = keep->abi != active_->abi;
                active_ = *keep;
                pending.active_changed = true;
                if (abi_changed) reloadCatalogLocked(pending);
            }

            std::string status = connectedStatus(*active_);
            pending.status_changed = status != status_;
            status_ = status;
        }
        status_line = status_;
        PLOG_INFO("Registry", "%zu device(s), active=%s", devices_.size(),
                  active_ ? active_->serial.c_str() : "(none)");
    }

    loadCatalog(pending);
    if (!silent && log_) log_(status_line, "status");
    publish(pending);
    return true;
}

bool DeviceRegistry::select(const std::string& serial) {
    Pending pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&](const Device& d) { return d.serial == serial; });
        if (it == devices_.end()) {
            PLOG_WARN("Registry", "select(%s): not registered", serial.c_str());
            return false;
        }
        // An explicit pick always reloads, even for the current device
        Device picked = *it;
        active_ = picked;
        pending.active_changed = true;
        reloadCatalogLocked(pending);
        status_ = connectedStatus(picked);
        pending.status_changed = true;
    }
    loadCatalog(pending);
    if (log_) log_(status(), "status");
    publish(pending);
    return true;
}

void DeviceRegistry::setActiveLocked(const Device& device, Pending& pending) {
    active_ = device;
    pending.active_changed = true;
    reloadCatalogLocked(pending);
}

void DeviceRegistry::reloadCatalogLocked(Pending& pending) {
    ++catalog_reloads_;
    pending.catalog_reloaded = true;
    catalog_.clear();
    pending.load_generation = ++catalog_generation_;
    pending.load_catalog = active_.has_value() && static_cast<bool>(load_catalog_);
    pending.load_abi = active_ ? active_->abi : std::nullopt;
}

void DeviceRegistry::loadCatalog(const Pending& pending) {
    if (!pending.load_catalog) return;

    auto loaded = load_catalog_(pending.load_abi);
    if (loaded.is_err()) {
        PLOG_ERROR("Registry", "Catalog load failed: %s", loaded.error().message.c_str());
        if (log_) log_("Error loading app list: " + loaded.error().message, "error");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // A newer selection already cleared the catalog for another device
    if (pending.load_generation != catalog_generation_) return;
    catalog_ = std::move(loaded).value();
}

void DeviceRegistry::publish(const Pending& pending) {
    if (pending.devices_changed) {
        DevicesChangedEvent e;
        for (const auto& d : devices()) e.serials.push_back(d.serial);
        bus_.publish(e);
    }
    if (pending.active_changed) {
        ActiveDeviceChangedEvent e;
        if (auto active = activeDevice()) {
            e.serial = active->serial;
            e.display_name = active->displayName();
            e.abi = active->abi.value_or("");
            e.transport = transportName(active->transport);
        }
        bus_.publish(e);
    }
    if (pending.catalog_reloaded) {
        CatalogReloadedEvent e;
        auto active = activeDevice();
        e.abi = active ? active->abi.value_or("") : "";
        e.entry_count = catalog().size();
        bus_.publish(e);
    }
    if (pending.status_changed) {
        StatusChangedEvent e;
        e.status = status();
        bus_.publish(e);
    }
}

// =============================================================================
// Accessors
// =============================================================================

std::vector<Device> DeviceRegistry::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::optional<Device> DeviceRegistry::activeDevice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::string DeviceRegistry::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::vector<CatalogEntry> DeviceRegistry::catalog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_;
}

bool DeviceRegistry::setEntrySelected(const std::string& name, bool selected) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& e : catalog_) {
        if (e.name == name) {
            e.selected = selected;
            return true;
        }
    }
    return false;
}

void DeviceRegistry::setAllSelected(bool selected) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& e : catalog_) e.selected = selected;
}

std::vector<CatalogEntry> DeviceRegistry::selectedEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CatalogEntry> picked;
    for (const auto& e : catalog_) {
        if (e.selected) picked.push_back(e);
    }
    return picked;
}

size_t DeviceRegistry::catalogReloadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_reloads_;
}

} // namespace pelo
