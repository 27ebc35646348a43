#include "daemon/inventory_parser.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <sstream>

#include "daemon/fingerprint_engine.hpp"

namespace hwidwatch {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

ComponentRecord degraded(const std::string &reason)
{
    ComponentRecord record;
    record.rawText = "Error: " + reason;
    return record;
}

// Splits "key<TAB>: value" and "Key:   value" lines.
bool splitColonLine(const std::string &line, std::string &key, std::string &value)
{
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, colon));
    value = trim(line.substr(colon + 1));
    return !key.empty();
}

} // namespace

ComponentRecord parseCpuInfo(const std::string &text)
{
    std::istringstream stream(text);
    std::string line;
    std::string vendor;
    std::vector<std::string> order;
    std::map<std::string, int> processors;
    int logicalWithoutModel = 0;

    std::string key;
    std::string value;
    while (std::getline(stream, line)) {
        if (!splitColonLine(line, key, value)) {
            continue;
        }
        if (key == "vendor_id" && vendor.empty()) {
            vendor = value;
        } else if (key == "model name") {
            if (processors.find(value) == processors.end()) {
                order.push_back(value);
            }
            ++processors[value];
        } else if (key == "processor") {
            ++logicalWithoutModel;
        }
    }

    ComponentRecord record;
    for (const std::string &model : order) {
        FieldSet fields;
        fields[field::kName] = model;
        fields[field::kLogicalProcessors] = std::to_string(processors[model]);
        if (!vendor.empty()) {
            fields[field::kVendor] = vendor;
        }
        record.instances.push_back(std::move(fields));
    }

    // Some ARM kernels list processors without a model name.
    if (record.instances.empty() && logicalWithoutModel > 0) {
        FieldSet fields;
        fields[field::kLogicalProcessors] = std::to_string(logicalWithoutModel);
        if (!vendor.empty()) {
            fields[field::kVendor] = vendor;
        }
        record.instances.push_back(std::move(fields));
    }

    if (record.instances.empty()) {
        return degraded("no processors listed in cpuinfo");
    }
    return record;
}

ComponentRecord parseMemInfo(const std::string &text)
{
    static const std::regex kibPattern(R"(^(\d+)\s*kB$)");

    std::istringstream stream(text);
    std::string line;
    std::string key;
    std::string value;
    FieldSet fields;
    while (std::getline(stream, line)) {
        if (!splitColonLine(line, key, value)) {
            continue;
        }
        std::smatch match;
        if (!std::regex_match(value, match, kibPattern)) {
            continue;
        }
        if (key == "MemTotal") {
            fields[field::kTotalKiB] = match[1].str();
        } else if (key == "SwapTotal") {
            fields[field::kSwapKiB] = match[1].str();
        }
    }

    if (fields.find(field::kTotalKiB) == fields.end()) {
        return degraded("MemTotal missing from meminfo");
    }
    ComponentRecord record;
    record.instances.push_back(std::move(fields));
    return record;
}

ComponentRecord parseLspciDevices(const std::string &text,
                                  const std::vector<std::string> &classPrefixes)
{
    // lspci -mm: slot "class" "vendor" "device" [-rXX] [-pXX] ["subvendor" "subdevice"]
    static const std::regex quoted(R"xx("([^"]*)")xx");

    std::istringstream stream(text);
    std::string line;
    ComponentRecord record;
    while (std::getline(stream, line)) {
        line = trim(line);
        const auto space = line.find(' ');
        if (line.empty() || space == std::string::npos) {
            continue;
        }

        std::vector<std::string> values;
        const std::string rest = line.substr(space + 1);
        for (auto it = std::sregex_iterator(rest.begin(), rest.end(), quoted);
             it != std::sregex_iterator(); ++it) {
            values.push_back((*it)[1].str());
        }
        if (values.size() < 3) {
            continue;
        }

        const std::string deviceClass = toLower(values[0]);
        const bool wanted = std::any_of(classPrefixes.begin(), classPrefixes.end(),
                                        [&deviceClass](const std::string &prefix) {
            return deviceClass.rfind(toLower(prefix), 0) == 0;
        });
        if (!wanted) {
            continue;
        }

        FieldSet fields;
        fields[field::kAddress] = line.substr(0, space);
        fields[field::kClass] = values[0];
        fields[field::kVendor] = values[1];
        fields[field::kName] = values[2];
        record.instances.push_back(std::move(fields));
    }

    if (record.instances.empty()) {
        return degraded("no matching PCI devices");
    }
    return record;
}

ComponentRecord parseLsusb(const std::string &text)
{
    static const std::regex linePattern(
        R"(^Bus\s+(\d+)\s+Device\s+(\d+):\s+ID\s+([0-9a-fA-F]{4}:[0-9a-fA-F]{4})\s*(.*)$)");

    std::istringstream stream(text);
    std::string line;
    ComponentRecord record;
    while (std::getline(stream, line)) {
        line = trim(line);
        std::smatch match;
        if (!std::regex_match(line, match, linePattern)) {
            continue;
        }
        FieldSet fields;
        fields[field::kBus] = match[1].str();
        fields[field::kDevice] = match[2].str();
        fields[field::kId] = match[3].str();
        const std::string description = trim(match[4].str());
        if (!description.empty()) {
            fields[field::kName] = description;
        }
        record.instances.push_back(std::move(fields));
    }

    if (record.instances.empty()) {
        return degraded("no USB devices listed");
    }
    return record;
}

} // namespace hwidwatch
