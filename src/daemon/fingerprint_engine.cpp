#include "daemon/fingerprint_engine.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <QByteArray>
#include <QCryptographicHash>

namespace hwidwatch {

namespace {

std::string trim(const std::string &value)
{
    const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Firmware fills unset identifiers with vendor boilerplate; such values would
// make unrelated hosts collide.
bool isPlaceholder(const std::string &value)
{
    static const std::vector<std::string> placeholders = {
        "",
        "{}",
        "unknown",
        "none",
        "n/a",
        "to be filled by o.e.m.",
        "default string",
        "not specified",
        "system serial number",
    };
    const std::string lowered = toLower(value);
    return std::find(placeholders.begin(), placeholders.end(), lowered)
        != placeholders.end();
}

void collectField(const Snapshot &snapshot, const char *componentName,
                  const char *fieldName, std::vector<std::string> &out)
{
    const auto it = snapshot.components.find(componentName);
    if (it == snapshot.components.end()) {
        return;
    }

    for (const FieldSet &instance : FingerprintEngine::instancesOf(it->second)) {
        const auto fieldIt = instance.find(fieldName);
        if (fieldIt == instance.end()) {
            continue;
        }
        const std::string value = trim(fieldIt->second);
        if (!isPlaceholder(value)) {
            out.push_back(value);
        }
    }
}

} // namespace

std::vector<std::string> FingerprintEngine::canonicalValues(const Snapshot &snapshot)
{
    std::vector<std::string> values;
    collectField(snapshot, component::kDisk, field::kSerialNumber, values);
    collectField(snapshot, component::kBios, field::kSerialNumber, values);
    collectField(snapshot, component::kMotherboard, field::kSerialNumber, values);
    collectField(snapshot, component::kPlatform, field::kUuid, values);
    std::sort(values.begin(), values.end());
    return values;
}

Fingerprint FingerprintEngine::computeFingerprint(const Snapshot &snapshot)
{
    const std::vector<std::string> values = canonicalValues(snapshot);

    std::string combined;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            combined += '|';
        }
        combined += values[i];
    }

    const QByteArray digest = QCryptographicHash::hash(
        QByteArray::fromStdString(combined), QCryptographicHash::Md5);

    Fingerprint fingerprint;
    fingerprint.digest = digest.toHex().toStdString();
    fingerprint.valid = !values.empty();
    return fingerprint;
}

std::vector<FieldSet> FingerprintEngine::parseKeyValueBlocks(const std::string &text)
{
    std::vector<FieldSet> results;
    if (text.empty() || trim(text).rfind("Error:", 0) == 0) {
        return results;
    }

    FieldSet current;
    std::istringstream in(text);
    std::string rawLine;
    while (std::getline(in, rawLine)) {
        const std::string line = trim(rawLine);
        if (line.empty()) {
            if (!current.empty()) {
                results.push_back(current);
                current.clear();
            }
            continue;
        }

        std::string key;
        std::string value;
        const auto colon = line.find(" : ");
        if (colon != std::string::npos) {
            key = trim(line.substr(0, colon));
            value = trim(line.substr(colon + 3));
        } else {
            const auto equals = line.find('=');
            if (equals == std::string::npos || equals == 0) {
                continue;
            }
            key = trim(line.substr(0, equals));
            value = trim(line.substr(equals + 1));
        }

        if (!key.empty() && !value.empty() && value != "{}") {
            current[key] = value;
        }
    }

    if (!current.empty()) {
        results.push_back(current);
    }
    return results;
}

std::vector<FieldSet> FingerprintEngine::instancesOf(const ComponentRecord &record)
{
    if (record.rawText.has_value()) {
        return parseKeyValueBlocks(*record.rawText);
    }
    return record.instances;
}

} // namespace hwidwatch
