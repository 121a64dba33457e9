#include "AppConfig.hpp"
#include "debug_log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& doc, const char* key, T& out, const std::string& path) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Config " + path + ": bad value for '" + key + "': " + e.what());
    }
}

} // namespace

AppConfig LoadAppConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Config " + path + " is not valid JSON: " + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Config " + path + " must be a JSON object");
    }

    AppConfig config;
    ReadKey(doc, "store_root", config.storeRoot, path);
    ReadKey(doc, "document_id", config.documentId, path);
    ReadKey(doc, "preferred_sample_rates", config.preferredSampleRates, path);
    ReadKey(doc, "frames_per_block", config.framesPerBlock, path);
    ReadKey(doc, "ring_capacity_blocks", config.ringCapacityBlocks, path);
    ReadKey(doc, "render_path", config.renderPath, path);
    ReadKey(doc, "export_path", config.exportPath, path);
    ReadKey(doc, "snapshot_interval", config.snapshotInterval, path);

    if (config.preferredSampleRates.empty()) {
        throw std::runtime_error("Config " + path + ": preferred_sample_rates is empty");
    }
    if (config.framesPerBlock == 0 || config.ringCapacityBlocks == 0) {
        throw std::runtime_error("Config " + path + ": frames_per_block and ring_capacity_blocks must be positive");
    }

    DEBUG_LOG("Loaded config from " << path << DEBUG_LOG_ENDL);
    return config;
}

AppConfig ParseCommandLine(int argc, char* argv[]) {
    AppConfig config;
    std::string store;
    std::string doc;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            config = LoadAppConfig(value);
        } else if (arg == "--store") {
            store = value;
        } else if (arg == "--doc") {
            doc = value;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    // Command line wins over the config file regardless of argument order.
    if (!store.empty()) {
        config.storeRoot = store;
    }
    if (!doc.empty()) {
        config.documentId = doc;
    }
    return config;
}
