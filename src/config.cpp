#include "config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace prodsearch {

namespace {

int toInt(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
}

double toDouble(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        const double parsed = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
}

} // namespace

std::string processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? value : "";
}

void applyEnvironment(Config& cfg, const EnvLookup& env) {
    auto overlay = [&env](const char* name, std::string& target) {
        const std::string value = env(name);
        if (!value.empty()) target = value;
    };

    overlay("PRODSEARCH_QDRANT_URL", cfg.qdrantUrl);
    overlay("PRODSEARCH_QDRANT_API_KEY", cfg.qdrantApiKey);
    overlay("PRODSEARCH_COLLECTION", cfg.collection);
    overlay("PRODSEARCH_EMBEDDER_URL", cfg.embedderUrl);
    overlay("PRODSEARCH_CLIP_MODEL", cfg.modelName);
    overlay("PRODSEARCH_DATASET_PATH", cfg.datasetPath);

    // The checkpoint variable names a directory, as deployments mount one.
    const std::string checkpointDir = env("PRODSEARCH_CHECKPOINT_PATH");
    if (!checkpointDir.empty()) {
        cfg.checkpointPath = checkpointDir + "/checkpoint.txt";
    }
}

void applyArgs(Config& cfg, const std::vector<std::string>& args) {
    std::size_t i = 1;
    if (i < args.size() && !args[i].empty() && args[i][0] != '-') {
        cfg.command = args[i++];
    }

    auto next = [&args, &i](const std::string& flag) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(flag + " needs a value");
        }
        return args[++i];
    };

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--qdrant-url") {
            cfg.qdrantUrl = next(arg);
        } else if (arg == "--collection") {
            cfg.collection = next(arg);
        } else if (arg == "--store-attempts") {
            cfg.storeAttempts = toInt(arg, next(arg));
        } else if (arg == "--embedder-url") {
            cfg.embedderUrl = next(arg);
        } else if (arg == "--model") {
            cfg.modelName = next(arg);
        } else if (arg == "--dataset") {
            cfg.datasetPath = next(arg);
        } else if (arg == "--checkpoint") {
            cfg.checkpointPath = next(arg);
        } else if (arg == "--batch-size") {
            cfg.batchSize = toInt(arg, next(arg));
        } else if (arg == "--poll-seconds") {
            cfg.pollSeconds = toInt(arg, next(arg));
        } else if (arg == "--once") {
            cfg.once = true;
        } else if (arg == "--query") {
            cfg.query.text = next(arg);
        } else if (arg == "--filter") {
            cfg.query.filters.push_back(next(arg));
        } else if (arg == "--min-price") {
            cfg.query.minPrice = toDouble(arg, next(arg));
        } else if (arg == "--max-price") {
            cfg.query.maxPrice = toDouble(arg, next(arg));
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            cfg.help = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (cfg.help) return;
    if (cfg.command != "ingest" && cfg.command != "search") {
        throw std::invalid_argument(cfg.command.empty()
                                        ? "Missing command (ingest or search)"
                                        : "Unknown command: " + cfg.command);
    }
    if (cfg.batchSize <= 0) {
        throw std::invalid_argument("--batch-size must be positive");
    }
    if (cfg.pollSeconds < 0) {
        throw std::invalid_argument("--poll-seconds must not be negative");
    }
    if (cfg.storeAttempts < 1) {
        throw std::invalid_argument("--store-attempts must be at least 1");
    }
    if (cfg.command == "search" && cfg.query.text.empty()) {
        throw std::invalid_argument("search needs --query");
    }
}

Config loadConfig(int argc, char* argv[]) {
    Config cfg;
    applyEnvironment(cfg);
    applyArgs(cfg, std::vector<std::string>(argv, argv + argc));
    return cfg;
}

std::string usageText() {
    std::ostringstream out;
    out << "Usage: prodsearch <ingest|search> [options]\n\n"
        << "Common options:\n"
        << "  --qdrant-url URL      Vector store endpoint     (default: http://localhost:6333)\n"
        << "  --collection NAME     Collection name           (default: products)\n"
        << "  --store-attempts N    Attempts per store call   (default: 1, no retry)\n"
        << "  --embedder-url URL    CLIP service endpoint     (default: http://localhost:8000)\n"
        << "  --model NAME          CLIP model name\n"
        << "  --verbose             Enable verbose diagnostics\n"
        << "  --help, -h            Show this message\n\n"
        << "ingest:\n"
        << "  --dataset PATH        Catalog JSON file         (default: data/products.json)\n"
        << "  --checkpoint PATH     Checkpoint file           (default: checkpoints/checkpoint.txt)\n"
        << "  --batch-size N        Products per batch        (default: 10)\n"
        << "  --poll-seconds N      Wait between passes       (default: 60)\n"
        << "  --once                Run a single pass and exit\n\n"
        << "search:\n"
        << "  --query TEXT          Free-text query (required)\n"
        << "  --filter F:OP:V       Attribute filter, OP in eq|gt|gte|lt|lte (repeatable)\n"
        << "  --min-price X         Lower price bound\n"
        << "  --max-price Y         Upper price bound\n\n"
        << "Environment: PRODSEARCH_QDRANT_URL, PRODSEARCH_QDRANT_API_KEY,\n"
        << "  PRODSEARCH_COLLECTION, PRODSEARCH_EMBEDDER_URL, PRODSEARCH_CLIP_MODEL,\n"
        << "  PRODSEARCH_DATASET_PATH, PRODSEARCH_CHECKPOINT_PATH (directory)\n";
    return out.str();
}

} // namespace prodsearch
