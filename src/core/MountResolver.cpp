#include "MountResolver.hpp"
#include "DeviceCatalog.hpp"
#include "Logger.hpp"
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QtGlobal>

namespace sampler_monitor {

namespace {

void appendSubdirectories(const QString& parent, std::vector<std::string>& roots) {
    QDir dir(parent);
    if (!dir.exists()) {
        return;
    }
    const auto entries = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const auto& entry : entries) {
        roots.push_back(entry.absoluteFilePath().toStdString());
    }
}

bool isDirectory(const QString& path) {
    QFileInfo info(path);
    return info.exists() && info.isDir();
}

} // namespace

class MountResolver::Private {
public:
    RootEnumerator enumerator;
};

MountResolver::MountResolver()
    : d(std::make_unique<Private>()) {
    d->enumerator = &MountResolver::platformRoots;
}

MountResolver::MountResolver(RootEnumerator enumerator)
    : d(std::make_unique<Private>()) {
    d->enumerator = std::move(enumerator);
}

MountResolver::~MountResolver() = default;

std::vector<std::string> MountResolver::platformRoots() {
    std::vector<std::string> roots;
#if defined(Q_OS_MACOS)
    appendSubdirectories(QStringLiteral("/Volumes"), roots);
#elif defined(Q_OS_WIN)
    for (char letter = 'A'; letter <= 'Z'; ++letter) {
        QString drive = QString(QChar(letter)) + QStringLiteral(":\\");
        if (QFileInfo::exists(drive)) {
            roots.push_back(drive.toStdString());
        }
    }
#elif defined(Q_OS_LINUX)
    QString user = qEnvironmentVariable("USER");
    if (!user.isEmpty()) {
        appendSubdirectories(QStringLiteral("/media/") + user, roots);
        appendSubdirectories(QStringLiteral("/run/media/") + user, roots);
    }
#endif
    return roots;
}

bool MountResolver::hasUpgradeMarker(const DeviceKind& kind, const std::string& root) {
    if (root.empty()) {
        return false;
    }
    QDir dir(QString::fromStdString(root));
    if (!dir.exists()) {
        return false;
    }
    for (const auto& marker : kind.upgradeModeMarkers) {
        if (QFileInfo::exists(dir.filePath(QString::fromStdString(marker)))) {
            return true;
        }
    }
    return false;
}

std::string MountResolver::validateStructure(const DeviceKind& kind, const std::string& root) {
    if (root.empty()) {
        return "no mount path given";
    }

    QDir dir(QString::fromStdString(root));
    if (!dir.exists()) {
        return kind.name + " mount path does not exist: " + root;
    }

    for (const auto& required : kind.requiredDirectories) {
        if (!isDirectory(dir.filePath(QString::fromStdString(required)))) {
            return "Invalid " + kind.name + " folder: '" + required + "' directory not found.";
        }
    }

    if (!kind.categoryDirectories.empty() && !kind.requiredDirectories.empty()) {
        QDir parent(dir.filePath(QString::fromStdString(kind.requiredDirectories.front())));
        bool anyPresent = false;
        for (const auto& category : kind.categoryDirectories) {
            if (QFileInfo::exists(parent.filePath(QString::fromStdString(category)))) {
                anyPresent = true;
                break;
            }
        }
        if (!anyPresent) {
            return "Invalid " + kind.name + " folder: No sample category folders found.";
        }
    }

    return {};
}

MountResult MountResolver::findMount(const DeviceKind& kind) const {
    if (!d->enumerator) {
        return {};
    }

    for (const auto& root : d->enumerator()) {
        // An upgrade-mode volume lacks the normal layout on purpose
        if (!kind.upgradeModeMarkers.empty() && hasUpgradeMarker(kind, root)) {
            return {root, DeviceMode::Upgrade};
        }

        std::string reason = validateStructure(kind, root);
        if (reason.empty()) {
            return {root, DeviceMode::Storage};
        }
        LOG_DEBUG("Skipping " + root + " for " + kind.id + ": " + reason);
    }

    return {};
}

}
