#include <fstream>
#include <stdexcept>
#include "config.hpp"
#include "constants.hpp"
#include "helpers.hpp"
#include "logger.hpp"
using namespace std;

json defaultConfig() {
    json config;
    config["dataPath"] = DEFAULT_DATA_PATH;
    config["settlementTtl"] = DEFAULT_SETTLEMENT_TTL_SEC;
    config["maxParticipants"] = MAX_SPLIT_PARTICIPANTS;
    config["transferTimeoutMs"] = TIMEOUT_TRANSFER_MS;
    config["transferRetries"] = TRANSFER_RETRIES;
    config["retryBackoffMs"] = RETRY_BACKOFF_MS;
    config["groups"] = json::object();
    config["accounts"] = json::object();
    config["quiet"] = false;
    config["command"] = json::array();
    return config;
}

json getConfig(int argc, char** argv) {
    json config = defaultConfig();
    json overrides = json::object();
    json command = json::array();

    int i = 1;
    while (i < argc) {
        string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            string path = argv[i + 1];
            ifstream f(path);
            if (!f.is_open()) throw std::runtime_error("Could not open config file: " + path);
            json fileConfig = readJsonFromFile(path);
            if (!fileConfig.is_object()) throw std::runtime_error("Config file must hold a JSON object: " + path);
            config.update(fileConfig);
            i += 2;
        } else if (arg == "--data-path" && i + 1 < argc) {
            overrides["dataPath"] = string(argv[i + 1]);
            i += 2;
        } else if (arg == "--ttl" && i + 1 < argc) {
            overrides["settlementTtl"] = std::stoull(argv[i + 1]);
            i += 2;
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            overrides["transferTimeoutMs"] = std::stoull(argv[i + 1]);
            i += 2;
        } else if (arg == "--retries" && i + 1 < argc) {
            overrides["transferRetries"] = std::stoull(argv[i + 1]);
            i += 2;
        } else if (arg == "--quiet" || arg == "-q") {
            overrides["quiet"] = true;
            i++;
        } else {
            command.push_back(arg);
            i++;
        }
    }
    config.update(overrides);
    config["command"] = command;
    return config;
}
