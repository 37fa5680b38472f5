#include "posecast/core/MetadataLoader.h"
#include <posecast/logging.hpp>
#include <filesystem>
#include <fstream>

namespace posecast {

static MetaMap loadJsonObject(const std::string& path, const char* what) {
    const QString qpath = QString::fromStdString(path);
    if (!std::filesystem::exists(path)) {
        qCWarning(lcCapture) << what << "file" << qpath << "does not exist; ignoring";
        return MetaMap::object();
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        qCCritical(lcCapture) << "Failed to open" << what << "file" << qpath;
        return MetaMap::object();
    }

    MetaMap root;
    try {
        ifs >> root;
    } catch (const nlohmann::json::exception& e) {
        qCCritical(lcCapture) << "Failed to parse" << what << "JSON from" << qpath << ":" << e.what();
        return MetaMap::object();
    }
    if (!root.is_object()) {
        qCCritical(lcCapture) << what << "file" << qpath << "must contain a JSON object";
        return MetaMap::object();
    }
    qCDebug(lcCapture) << "Loaded" << what << "from" << qpath << ":" << root.size() << "keys";
    return root;
}

MetaMap loadCalibration(const std::string& path) {
    return loadJsonObject(path, "Calibration");
}

MetaMap loadStaticMetadata(const std::string& path) {
    return loadJsonObject(path, "Metadata");
}

} // namespace posecast
