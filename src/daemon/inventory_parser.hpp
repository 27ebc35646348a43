#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace hwidwatch {

/**
 * Parsers for the non-identifying inventory components of a snapshot
 * (cpu, memory, gpu, audio_devices, usb_devices, system_slots, tpm).
 *
 * Each takes the text of one source and returns a ComponentRecord. When the
 * text holds nothing usable the record is degraded to "Error: <reason>" raw
 * text, the same shape LinuxHardwareCollector uses for unreadable sources.
 * FingerprintEngine never reads these components.
 */

// /proc/cpuinfo: one instance per distinct model name, with the number of
// logical processors that report it.
ComponentRecord parseCpuInfo(const std::string &text);

// /proc/meminfo: MemTotal and SwapTotal in KiB.
ComponentRecord parseMemInfo(const std::string &text);

// `lspci -mm` output, keeping the devices whose class starts with one of
// classPrefixes (case-insensitive).
ComponentRecord parseLspciDevices(const std::string &text,
                                  const std::vector<std::string> &classPrefixes);

// `lsusb` output ("Bus 001 Device 002: ID 8087:0024 Description").
ComponentRecord parseLsusb(const std::string &text);

} // namespace hwidwatch
