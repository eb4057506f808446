/**
 * @file readsync_cli.cpp
 * @brief Read documents through the chunk cache and sync reading progress
 *
 * The "remote" is a directory holding the documents and one
 * <id>_progress.json record per document (a synced or network folder works).
 * Local progress lives in <state>/progress.json.
 */

#include <boost/program_options.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "readsync/core/types/DirectoryObjectStore.hpp"
#include "readsync/core/types/JsonFileStore.hpp"
#include "readsync/core/types/MemoryChunkStore.hpp"
#include "readsync/core/types/ProgressLedger.hpp"
#include "readsync/core/util/ChunkCache.hpp"
#include "readsync/core/util/Errors.hpp"
#include "readsync/core/util/LoadJson.hpp"
#include "readsync/core/util/Logging.hpp"
#include "readsync/core/util/Synchronizer.hpp"
#include "readsync/core/util/TimeUtils.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;
using namespace readsync;

namespace {

struct Settings {
    CacheConfig cache;
    SyncConfig sync;
};

Settings loadSettings(const po::variables_map& vm)
{
    Settings s;
    if (!vm.count("config")) return s;

    auto j = json::load_json_file(vm["config"].as<std::string>());
    if (auto it = j.find("cache"); it != j.end()) s.cache = s.cache.merged(*it);
    if (auto it = j.find("sync"); it != j.end()) s.sync = s.sync.merged(*it);
    return s;
}

int runRead(const std::string& documentId,
            const po::variables_map& vm,
            ChunkCache& cache,
            DirectoryObjectStore& remote,
            Synchronizer& sync)
{
    const int64_t size = remote.documentSize(documentId);
    if (size == 0) {
        std::cerr << documentId << " is empty" << "\n";
        return EXIT_FAILURE;
    }

    int64_t position = 0;
    if (vm.count("position")) {
        position = vm["position"].as<int64_t>();
    } else {
        // Adopts the remote record if it is newer; the ledger then holds the
        // position to resume from
        sync.pullLatest(documentId);
        if (auto latest = sync.getProgress(documentId)) {
            position = latest->position;
            Logger()->info("Resuming {} at {} ({}%)", documentId, latest->position, latest->percentage);
        }
    }

    std::optional<int64_t> view;
    if (vm.count("view")) view = vm["view"].as<int64_t>();

    auto progress = ReadingProgress::at(documentId, position, size, util::now_ms());
    auto window = cache.readWithContext(documentId, size, progress.position, view);
    std::cout << window.content;
    if (!window.content.empty() && window.content.back() != '\n') std::cout << "\n";

    // Read straight from the remote so the chunk cache does not fill with the prefix
    if (vm["line"].as<bool>()) {
        progress.lineNumber = lineNumberOf(remote, documentId, progress.position, cache.config().chunkSize);
    }

    sync.recordProgress(progress);
    auto flushed = sync.flushPending();

    auto c = cache.counters();
    Logger()->debug("cache: {} hits, {} misses, {} evictions, {} bytes fetched",
                    c.hits, c.misses, c.evictions, c.bytesFetched);

    std::cerr << documentId << ": " << progress.position << "/" << size
              << " (" << progress.percentage << "%)";
    if (progress.lineNumber) std::cerr << " line " << *progress.lineNumber;
    std::cerr << (flushed.failed > 0 ? ", sync pending" : ", synced") << "\n";
    return EXIT_SUCCESS;
}

int runSync(std::vector<std::string> documents, ProgressLedger& ledger, Synchronizer& sync)
{
    if (documents.empty()) {
        for (const auto& [id, progress] : ledger.all()) {
            documents.push_back(id);
        }
    }
    if (documents.empty()) {
        std::cout << "Nothing to sync" << "\n";
        return EXIT_SUCCESS;
    }

    auto summary = sync.reconcileAll(documents);
    for (const auto& id : documents) {
        if (auto p = sync.getProgress(id)) {
            std::cout << id << ": " << p->position << " (" << p->percentage << "%) at "
                      << util::iso8601_utc(p->lastUpdated) << "\n";
        }
    }
    std::cout << summary.succeeded << " synced, " << summary.failed << " failed" << "\n";
    return summary.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int runStats(const Settings& settings, const ProgressLedger& ledger)
{
    nlohmann::json config = {
        {"cache", toJson(settings.cache)},
        {"sync", {{"flushIntervalMs", settings.sync.flushIntervalMs}}},
    };
    std::cout << config.dump(2) << "\n";

    for (const auto& [id, p] : ledger.all()) {
        std::cout << id << ": " << p.position << " (" << p.percentage << "%)";
        if (p.lineNumber) std::cout << " line " << *p.lineNumber;
        std::cout << " at " << util::iso8601_utc(p.lastUpdated) << "\n";
    }
    return EXIT_SUCCESS;
}

int runForget(const std::vector<std::string>& documents, Synchronizer& sync)
{
    if (documents.empty()) {
        sync.forgetAll();
        std::cout << "Forgot all local progress" << "\n";
        return EXIT_SUCCESS;
    }
    for (const auto& id : documents) {
        sync.forget(id);
    }
    std::cout << "Forgot " << documents.size() << " document(s)" << "\n";
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[])
{
    po::options_description required("Required arguments");
    required.add_options()
        ("mode", po::value<std::string>()->required(),
            "One of: read, sync, stats, forget")
        ("remote,r", po::value<std::string>()->required(),
            "Directory holding the documents and their progress records");

    po::options_description optional("Optional arguments");
    optional.add_options()
        ("help,h", "Show this message")
        ("state,s", po::value<std::string>()->default_value(".readsync"),
            "Directory for local state")
        ("config,c", po::value<std::string>(),
            "JSON file with \"cache\" and \"sync\" overrides")
        ("position,p", po::value<int64_t>(),
            "read: byte offset to show (default: last synced position)")
        ("view,v", po::value<int64_t>(),
            "read: view size in bytes (default: chunk size)")
        ("line", po::bool_switch()->default_value(false),
            "read: store the line number with the progress")
        ("log-level", po::value<std::string>()->default_value("warn"),
            "debug, info, warn, error or off")
        ("log-file", po::value<std::string>(),
            "Also write the log to this file");

    po::options_description hidden;
    hidden.add_options()
        ("documents", po::value<std::vector<std::string>>()->multitoken(), "Document ids");

    po::options_description all("Usage");
    all.add(required).add(optional).add(hidden);

    po::options_description visible("readsync_cli - cached reading with progress sync\n\nUsage");
    visible.add(required).add(optional);

    po::positional_options_description pos;
    pos.add("mode", 1);
    pos.add("documents", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(all)
            .positional(pos)
            .run(), vm);

        if (vm.count("help") || argc < 2) {
            std::cout << visible << "\n";
            std::cout << "\nExamples:" << "\n";
            std::cout << "  readsync_cli read book.txt -r ~/Sync/books -p 120000" << "\n";
            std::cout << "  readsync_cli sync -r ~/Sync/books" << "\n";
            std::cout << "  readsync_cli stats -r ~/Sync/books -c readsync.json" << "\n";
            return EXIT_SUCCESS;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return EXIT_FAILURE;
    }

    SetLogLevel(vm["log-level"].as<std::string>());
    if (vm.count("log-file")) {
        AddLogFile(vm["log-file"].as<std::string>());
    }

    const auto mode = vm["mode"].as<std::string>();
    std::vector<std::string> documents;
    if (vm.count("documents")) {
        documents = vm["documents"].as<std::vector<std::string>>();
    }

    try {
        const auto settings = loadSettings(vm);

        DirectoryObjectStore remote(vm["remote"].as<std::string>());
        JsonFileStore kv(fs::path(vm["state"].as<std::string>()) / "progress.json");
        ProgressLedger ledger(kv);
        Synchronizer sync(ledger, remote, settings.sync);

        if (mode == "read") {
            if (documents.size() != 1) {
                std::cerr << "Error: read takes exactly one document" << "\n";
                return EXIT_FAILURE;
            }
            MemoryChunkStore chunks;
            ChunkCache cache(chunks, remote, settings.cache);
            cache.initialize();
            return runRead(documents.front(), vm, cache, remote, sync);
        }
        if (mode == "sync") {
            return runSync(documents, ledger, sync);
        }
        if (mode == "stats") {
            return runStats(settings, ledger);
        }
        if (mode == "forget") {
            return runForget(documents, sync);
        }

        std::cerr << "Error: unknown mode '" << mode << "'" << "\n";
        std::cerr << "Use --help for usage information." << "\n";
        return EXIT_FAILURE;
    } catch (const ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        Logger()->error("{}", e.what());
        return EXIT_FAILURE;
    }
}
