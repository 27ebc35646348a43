#include "daemon/hardware_collector.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <QDir>
#include <QFile>
#include <QProcess>
#include <QRegularExpression>
#include <QStringList>
#include <QSysInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/fingerprint_engine.hpp"
#include "daemon/inventory_parser.hpp"

namespace hwidwatch {

namespace {

const QString kDmiDir = QStringLiteral("/sys/class/dmi/id/");

QString runCommand(const QString &program, const QStringList &arguments,
                   int *exitCode)
{
    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        if (exitCode) {
            *exitCode = -1;
        }
        return {};
    }

    process.closeWriteChannel();

    if (!process.waitForFinished()) {
        if (exitCode) {
            *exitCode = -1;
        }
        return {};
    }

    if (exitCode) {
        *exitCode = process.exitCode();
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        return {};
    }

    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

std::optional<std::string> readSysFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll()).trimmed().toStdString();
}

ComponentRecord degraded(const QString &reason)
{
    ComponentRecord record;
    record.rawText = QStringLiteral("Error: %1").arg(reason).toStdString();
    return record;
}

// Builds one FieldSet from DMI attribute files; fails when the identifying
// attribute (the first entry) is unreadable.
ComponentRecord dmiRecord(const std::vector<std::pair<const char *, QString>> &attributes)
{
    FieldSet fields;
    for (std::size_t i = 0; i < attributes.size(); ++i) {
        const auto value = readSysFile(kDmiDir + attributes[i].second);
        if (!value.has_value()) {
            if (i == 0) {
                return degraded(kDmiDir + attributes[i].second + QStringLiteral(" unreadable"));
            }
            continue;
        }
        fields[attributes[i].first] = *value;
    }

    ComponentRecord record;
    record.instances.push_back(std::move(fields));
    return record;
}

ComponentRecord collectDisks()
{
    int exitCode = 0;
    const QString output = runCommand(
        QStringLiteral("lsblk"),
        {QStringLiteral("-d"), QStringLiteral("-n"), QStringLiteral("-P"),
         QStringLiteral("-e"), QStringLiteral("7,11"),
         QStringLiteral("-o"), QStringLiteral("NAME,MODEL,SERIAL")},
        &exitCode);

    ComponentRecord record;
    if (exitCode == 0 && !output.isEmpty()) {
        static const QRegularExpression pairPattern(QStringLiteral("(\\w+)=\"([^\"]*)\""));
        for (const QString &line : output.split(QChar('\n'), Qt::SkipEmptyParts)) {
            QString name;
            FieldSet fields;
            auto matches = pairPattern.globalMatch(line);
            while (matches.hasNext()) {
                const auto match = matches.next();
                const QString key = match.captured(1);
                const QString value = match.captured(2).trimmed();
                if (key == QStringLiteral("NAME")) {
                    name = value;
                } else if (key == QStringLiteral("MODEL") && !value.isEmpty()) {
                    fields[field::kModel] = value.toStdString();
                } else if (key == QStringLiteral("SERIAL") && !value.isEmpty()) {
                    fields[field::kSerialNumber] = value.toStdString();
                }
            }
            if (!name.isEmpty()) {
                fields[field::kName] = name.toStdString();
                record.instances.push_back(std::move(fields));
            }
        }
        if (!record.instances.empty()) {
            return record;
        }
    }

    // lsblk missing or empty: fall back to the block device attributes.
    const QDir blockDir(QStringLiteral("/sys/block"));
    const QStringList devices = blockDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &device : devices) {
        if (device.startsWith(QStringLiteral("loop")) || device.startsWith(QStringLiteral("ram"))) {
            continue;
        }
        const QString base = blockDir.absoluteFilePath(device) + QStringLiteral("/device/");
        FieldSet fields;
        fields[field::kName] = device.toStdString();
        if (const auto serial = readSysFile(base + QStringLiteral("serial"))) {
            fields[field::kSerialNumber] = *serial;
        }
        if (const auto model = readSysFile(base + QStringLiteral("model"))) {
            fields[field::kModel] = *model;
        }
        record.instances.push_back(std::move(fields));
    }

    if (record.instances.empty()) {
        return degraded(QStringLiteral("no block devices found"));
    }
    return record;
}

ComponentRecord collectMacAddresses()
{
    const QDir netDir(QStringLiteral("/sys/class/net"));
    const QStringList interfaces = netDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot
                                                    | QDir::System);
    ComponentRecord record;
    for (const QString &iface : interfaces) {
        if (iface == QStringLiteral("lo")) {
            continue;
        }
        const auto address = readSysFile(netDir.absoluteFilePath(iface)
                                         + QStringLiteral("/address"));
        if (!address.has_value() || address->empty()
            || *address == "00:00:00:00:00:00") {
            continue;
        }
        FieldSet fields;
        fields[field::kName] = iface.toStdString();
        fields[field::kMacAddress] = *address;
        record.instances.push_back(std::move(fields));
    }

    if (record.instances.empty()) {
        return degraded(QStringLiteral("no network interfaces with a MAC address"));
    }
    return record;
}

ComponentRecord fromFile(const QString &path, ComponentRecord (*parse)(const std::string &))
{
    const auto text = readSysFile(path);
    if (!text.has_value()) {
        return degraded(path + QStringLiteral(" unreadable"));
    }
    return parse(*text);
}

// Output of a command that must exit 0; std::nullopt carries the reason.
std::optional<std::string> commandOutput(const QString &program, const QStringList &arguments,
                                         QString *reason)
{
    int exitCode = 0;
    const QString output = runCommand(program, arguments, &exitCode);
    if (exitCode != 0) {
        *reason = QStringLiteral("%1 failed (exit %2)").arg(program).arg(exitCode);
        return std::nullopt;
    }
    return output.toStdString();
}

ComponentRecord collectPciSlots()
{
    const QDir slotsDir(QStringLiteral("/sys/bus/pci/slots"));
    ComponentRecord record;
    for (const QString &slot : slotsDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        FieldSet fields;
        fields[field::kName] = slot.toStdString();
        if (const auto address = readSysFile(slotsDir.absoluteFilePath(slot)
                                             + QStringLiteral("/address"))) {
            fields[field::kAddress] = *address;
        }
        record.instances.push_back(std::move(fields));
    }
    if (record.instances.empty()) {
        return degraded(QStringLiteral("no PCI slots exposed in /sys/bus/pci/slots"));
    }
    return record;
}

// An absent TPM is a fact, not a failure.
ComponentRecord collectTpm()
{
    const QDir tpmDir(QStringLiteral("/sys/class/tpm"));
    const QStringList devices = tpmDir.entryList({QStringLiteral("tpm*")},
                                                 QDir::Dirs | QDir::NoDotAndDotDot
                                                 | QDir::System);
    ComponentRecord record;
    for (const QString &device : devices) {
        FieldSet fields;
        fields[field::kName] = device.toStdString();
        fields[field::kPresent] = "yes";
        if (const auto major = readSysFile(tpmDir.absoluteFilePath(device)
                                           + QStringLiteral("/tpm_version_major"))) {
            fields[field::kVersion] = *major;
        }
        record.instances.push_back(std::move(fields));
    }
    if (record.instances.empty()) {
        FieldSet absent;
        absent[field::kPresent] = "no";
        record.instances.push_back(std::move(absent));
    }
    return record;
}

void collectInventory(Snapshot &snapshot)
{
    snapshot.components[component::kCpu] =
        fromFile(QStringLiteral("/proc/cpuinfo"), &parseCpuInfo);
    snapshot.components[component::kMemory] =
        fromFile(QStringLiteral("/proc/meminfo"), &parseMemInfo);

    QString reason;
    const auto lspci = commandOutput(QStringLiteral("lspci"), {QStringLiteral("-mm")}, &reason);
    if (lspci.has_value()) {
        snapshot.components[component::kGpu] = parseLspciDevices(
            *lspci, {"VGA compatible controller", "3D controller", "Display controller"});
        snapshot.components[component::kAudio] = parseLspciDevices(
            *lspci, {"Audio device", "Multimedia audio controller"});
    } else {
        snapshot.components[component::kGpu] = degraded(reason);
        snapshot.components[component::kAudio] = degraded(reason);
    }

    const auto lsusb = commandOutput(QStringLiteral("lsusb"), {}, &reason);
    snapshot.components[component::kUsb] =
        lsusb.has_value() ? parseLsusb(*lsusb) : degraded(reason);
    snapshot.components[component::kSlots] = collectPciSlots();
    snapshot.components[component::kTpm] = collectTpm();
}

bool isIdentifyingComponent(const std::string &name)
{
    return name == component::kDisk || name == component::kBios
        || name == component::kMotherboard || name == component::kPlatform
        || name == component::kMac;
}

} // namespace

std::optional<Snapshot> LinuxHardwareCollector::collect()
{
    Snapshot snapshot;
    snapshot.collectedAt = std::chrono::system_clock::now();

    snapshot.components[component::kDisk] = collectDisks();
    snapshot.components[component::kBios] = dmiRecord({
        {field::kSerialNumber, QStringLiteral("product_serial")},
        {field::kVendor, QStringLiteral("bios_vendor")},
        {field::kVersion, QStringLiteral("bios_version")},
    });
    snapshot.components[component::kMotherboard] = dmiRecord({
        {field::kSerialNumber, QStringLiteral("board_serial")},
        {field::kVendor, QStringLiteral("board_vendor")},
        {field::kModel, QStringLiteral("board_name")},
    });
    snapshot.components[component::kPlatform] = dmiRecord({
        {field::kUuid, QStringLiteral("product_uuid")},
        {field::kName, QStringLiteral("product_name")},
    });
    snapshot.components[component::kMac] = collectMacAddresses();
    collectInventory(snapshot);

    snapshot.extra = nlohmann::json{
        {"hostname", QSysInfo::machineHostName().toStdString()},
        {"kernel", QSysInfo::kernelVersion().toStdString()},
        {"os", QSysInfo::prettyProductName().toStdString()},
        {"architecture", QSysInfo::currentCpuArchitecture().toStdString()}
    };

    int identifying = 0;
    int degradedIdentifying = 0;
    for (const auto &entry : snapshot.components) {
        if (!isIdentifyingComponent(entry.first)) {
            continue;
        }
        ++identifying;
        if (!entry.second.isStructured()) {
            ++degradedIdentifying;
        }
    }

    if (degradedIdentifying == identifying) {
        HWLOG_ERROR(QStringLiteral("LinuxHardwareCollector"),
                    QStringLiteral("collect"),
                    QStringLiteral("hardware_collection_failed"),
                    QStringLiteral("all_sources_unreadable"),
                    QStringLiteral("sysfs_lsblk"),
                    QString(),
                    QString(),
                    nlohmann::json::object());
        return std::nullopt;
    }

    HWLOG_INFO(QStringLiteral("LinuxHardwareCollector"),
               QStringLiteral("collect"),
               QStringLiteral("hardware_collected"),
               QStringLiteral("collect_request"),
               QStringLiteral("sysfs_lsblk"),
               QString(),
               QString(),
               (nlohmann::json{{"components", snapshot.components.size()},
                               {"degradedIdentifying", degradedIdentifying}}));
    return snapshot;
}

} // namespace hwidwatch
