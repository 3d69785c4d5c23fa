#pragma once

#include "search_service.hpp"

#include <functional>
#include <string>
#include <vector>

namespace prodsearch {

struct Config {
    std::string command;  // "ingest" or "search"

    std::string qdrantUrl      = "http://localhost:6333";
    std::string qdrantApiKey;
    std::string collection     = "products";
    int         storeTimeoutMs = 5000;
    int         storeAttempts  = 1;

    std::string embedderUrl    = "http://localhost:8000";
    std::string modelName      = "openai/clip-vit-base-patch32";
    int         embedTimeoutMs = 30000;

    std::string datasetPath    = "data/products.json";
    std::string checkpointPath = "checkpoints/checkpoint.txt";
    int         batchSize      = 10;
    int         pollSeconds    = 60;
    bool        once           = false;

    SearchQuery query;
    bool        verbose        = false;
    bool        help           = false;
};

/// Lookup used for environment variables; returns "" when unset.
using EnvLookup = std::function<std::string(const std::string&)>;

/// Reads the process environment.
std::string processEnv(const std::string& name);

/// Overlay PRODSEARCH_* environment variables onto @p cfg.
void applyEnvironment(Config& cfg, const EnvLookup& env = processEnv);

/// Overlay command-line arguments onto @p cfg.  argv[1] is the command.
/// Throws std::invalid_argument on unknown flags, missing or bad values.
void applyArgs(Config& cfg, const std::vector<std::string>& args);

/// Defaults, then environment, then command line.
Config loadConfig(int argc, char* argv[]);

std::string usageText();

} // namespace prodsearch
