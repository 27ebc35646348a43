#pragma once

#include <optional>

#include "common/models.hpp"

namespace hwidwatch {

// Source of hardware snapshots. Implementations may return partial data
// (degraded raw-text records); std::nullopt means collection failed outright.
class HardwareCollector
{
public:
    virtual ~HardwareCollector() = default;
    virtual std::optional<Snapshot> collect() = 0;
};

/**
 * Linux collector:
 * - disk serials via `lsblk -dno NAME,MODEL,SERIAL`, else /sys/block/<dev>/device/serial
 * - BIOS, motherboard and platform identifiers from /sys/class/dmi/id
 * - MAC addresses from /sys/class/net/<iface>/address
 * - inventory: /proc/cpuinfo, /proc/meminfo, `lspci -mm` (gpu, audio),
 *   `lsusb`, /sys/bus/pci/slots and /sys/class/tpm
 *
 * Collection fails only when every identifying source is unreadable.
 * DMI serials are root-readable only on most distributions; unreadable
 * sources degrade to raw-text records instead of failing.
 */
class LinuxHardwareCollector : public HardwareCollector
{
public:
    std::optional<Snapshot> collect() override;
};

} // namespace hwidwatch
