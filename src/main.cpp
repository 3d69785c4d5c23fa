#include "catalog.hpp"
#include "checkpoint.hpp"
#include "clip_client.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "ingest_pipeline.hpp"
#include "mapping.hpp"
#include "qdrant_store.hpp"
#include "search_service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> gShutdownRequested{false};

void onSignal(int) {
    gShutdownRequested.store(true);
}

std::unique_ptr<prodsearch::EmbeddingProvider> makeEmbedder(const prodsearch::Config& cfg) {
    auto model = std::make_unique<prodsearch::ClipServiceModel>(
        cfg.embedderUrl, cfg.modelName, cfg.embedTimeoutMs);
    model->setVerbose(cfg.verbose);

    auto embedder = std::make_unique<prodsearch::EmbeddingProvider>(
        std::move(model), std::make_unique<prodsearch::HttpImageFetcher>());
    embedder->setVerbose(cfg.verbose);
    return embedder;
}

int runIngest(const prodsearch::Config& cfg, prodsearch::VectorStore& store) {
    auto embedder = makeEmbedder(cfg);
    prodsearch::JsonFileCatalog catalog(cfg.datasetPath);
    prodsearch::CheckpointFile checkpoint(cfg.checkpointPath);

    prodsearch::IngestionPipeline::Options options;
    options.collection   = cfg.collection;
    options.batchSize    = static_cast<std::size_t>(cfg.batchSize);
    options.pollInterval = std::chrono::seconds(cfg.pollSeconds);
    options.verbose      = cfg.verbose;

    prodsearch::IngestionPipeline pipeline(catalog, *embedder, store, checkpoint, options);

    if (cfg.once) {
        pipeline.prepare();
        const auto pass = pipeline.runPass();
        std::cout
            << "\n=== Ingestion Pass ===\n"
            << "Catalog size:        " << pass.catalogSize    << "\n"
            << "Started at offset:   " << pass.startOffset    << "\n"
            << "Batches ok:          " << pass.batchesOk      << "\n"
            << "Batches failed:      " << pass.batchesFailed  << "\n"
            << "Points upserted:     " << pass.pointsUpserted << "\n"
            << "Checkpoint:          " << pass.checkpoint     << "\n"
            << "======================\n";
        return pass.batchesFailed == 0 ? 0 : 2;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    pipeline.start();
    while (!gShutdownRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cerr << "[main] Shutdown requested, stopping pipeline...\n";
    pipeline.stop();

    const auto stats = pipeline.getStats();
    std::cout
        << "\n=== Summary Report ===\n"
        << "Passes:              " << stats.passes              << "\n"
        << "Batches ok:          " << stats.totalBatchesOk      << "\n"
        << "Batches failed:      " << stats.totalBatchesFailed  << "\n"
        << "Points upserted:     " << stats.totalPointsUpserted << "\n"
        << "Checkpoint:          " << stats.lastPass.checkpoint << "\n"
        << "======================\n";
    return 0;
}

int runSearch(const prodsearch::Config& cfg, prodsearch::VectorStore& store) {
    auto embedder = makeEmbedder(cfg);
    prodsearch::SearchService service(*embedder, store, cfg.collection, cfg.verbose);

    const auto results = service.findSimilar(cfg.query);

    nlohmann::json out = nlohmann::json::array();
    for (const auto& point : results) {
        out.push_back({
            {"id", point.id},
            {"score", point.score ? nlohmann::json(*point.score) : nlohmann::json()},
            {"payload", prodsearch::payloadToJson(point.payload)}
        });
    }
    std::cout << nlohmann::json{{"points", out}}.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    prodsearch::Config cfg;
    try {
        cfg = prodsearch::loadConfig(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << prodsearch::usageText();
        return 1;
    }
    if (cfg.help) {
        std::cout << prodsearch::usageText();
        return 0;
    }

    try {
        prodsearch::QdrantStore::Options storeOptions;
        storeOptions.apiKey      = cfg.qdrantApiKey;
        storeOptions.timeoutMs   = cfg.storeTimeoutMs;
        storeOptions.maxAttempts = cfg.storeAttempts;
        storeOptions.verbose     = cfg.verbose;
        prodsearch::QdrantStore store(cfg.qdrantUrl, storeOptions);

        if (cfg.verbose) {
            std::cerr
                << "=== prodsearch " << cfg.command << " ===\n"
                << "Qdrant:      " << cfg.qdrantUrl   << "\n"
                << "Collection:  " << cfg.collection  << "\n"
                << "Embedder:    " << cfg.embedderUrl << " (" << cfg.modelName << ")\n"
                << "====================\n\n";
        }

        return cfg.command == "ingest" ? runIngest(cfg, store)
                                       : runSearch(cfg, store);

    } catch (const prodsearch::UnsupportedOperationError& e) {
        std::cerr << "Invalid filter: " << e.what() << "\n";
        return 1;
    } catch (const prodsearch::InvalidFilterError& e) {
        std::cerr << "Invalid filter: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
