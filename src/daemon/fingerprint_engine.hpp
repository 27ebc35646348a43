#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace hwidwatch {

// Component names used in Snapshot::components.
namespace component {
constexpr const char *kDisk = "disk";
constexpr const char *kBios = "bios";
constexpr const char *kMotherboard = "motherboard";
constexpr const char *kPlatform = "platform";
constexpr const char *kMac = "mac";
// Inventory only; never part of the fingerprint.
constexpr const char *kCpu = "cpu";
constexpr const char *kMemory = "memory";
constexpr const char *kGpu = "gpu";
constexpr const char *kAudio = "audio_devices";
constexpr const char *kUsb = "usb_devices";
constexpr const char *kSlots = "system_slots";
constexpr const char *kTpm = "tpm";
} // namespace component

// Field names inside a component's FieldSet.
namespace field {
constexpr const char *kSerialNumber = "SerialNumber";
constexpr const char *kUuid = "UUID";
constexpr const char *kModel = "Model";
constexpr const char *kVendor = "Vendor";
constexpr const char *kVersion = "Version";
constexpr const char *kName = "Name";
constexpr const char *kMacAddress = "MacAddress";
constexpr const char *kLogicalProcessors = "LogicalProcessors";
constexpr const char *kTotalKiB = "TotalKiB";
constexpr const char *kSwapKiB = "SwapKiB";
constexpr const char *kAddress = "Address";
constexpr const char *kClass = "Class";
constexpr const char *kId = "Id";
constexpr const char *kBus = "Bus";
constexpr const char *kDevice = "Device";
constexpr const char *kPresent = "Present";
} // namespace field

class FingerprintEngine
{
public:
    // MD5 over the sorted, '|'-joined canonical values: disk serials, BIOS
    // serial, motherboard serial and platform UUID. Never fails; missing
    // values are left out and an empty subset yields an invalid fingerprint.
    static Fingerprint computeFingerprint(const Snapshot &snapshot);

    // The sorted values computeFingerprint hashes.
    static std::vector<std::string> canonicalValues(const Snapshot &snapshot);

    // Recovers "Key : Value" / "Key=Value" blocks from raw tool output.
    // A blank line ends one instance. Output starting with "Error:" yields
    // nothing.
    static std::vector<FieldSet> parseKeyValueBlocks(const std::string &text);

    // Structured instances, or the parsed raw text for degraded records.
    static std::vector<FieldSet> instancesOf(const ComponentRecord &record);
};

} // namespace hwidwatch
