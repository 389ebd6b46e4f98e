#include "datastore_client.hpp"
#include "fetch_options.hpp"
#include "models.hpp"
#include "pagination.hpp"
#include "query_result_iterator.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

struct Config {
    query_stream::ClientConfig client;
    std::string kind      = "Task";
    int         offset    = 0;
    int         limit     = 250;
    int         chunkSize = 0;     // 0 = not set
    int         prefetch  = 0;     // 0 = not set
    std::string startCursor;
};

static void printUsage() {
    std::cout
        << "Usage: query_stream [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL        runQuery endpoint          "
           "(default: http://localhost:4000/v1/runQuery)\n"
        << "  --kind NAME           Entity kind to query        (default: Task)\n"
        << "  --offset N            Results to skip first       (default: 0)\n"
        << "  --limit N             Results to print            (default: 250)\n"
        << "  --chunk-size N        Records per continuation    (default: unset)\n"
        << "  --prefetch-size N     Records in the first batch  (default: unset)\n"
        << "  --start-cursor TOKEN  Resume from a cursor\n"
        << "  --timeout-ms N        HTTP timeout in ms          (default: 5000)\n"
        << "  --threads N           Request worker threads      (default: 2)\n"
        << "  --verbose             Enable verbose diagnostics\n"
        << "  --help, -h            Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--endpoint") && i + 1 < argc) {
            cfg.client.endpoint = argv[++i];
        } else if ((arg == "--kind") && i + 1 < argc) {
            cfg.kind = argv[++i];
        } else if ((arg == "--offset") && i + 1 < argc) {
            cfg.offset = std::stoi(argv[++i]);
        } else if ((arg == "--limit") && i + 1 < argc) {
            cfg.limit = std::stoi(argv[++i]);
        } else if ((arg == "--chunk-size") && i + 1 < argc) {
            cfg.chunkSize = std::stoi(argv[++i]);
        } else if ((arg == "--prefetch-size") && i + 1 < argc) {
            cfg.prefetch = std::stoi(argv[++i]);
        } else if ((arg == "--start-cursor") && i + 1 < argc) {
            cfg.startCursor = argv[++i];
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.client.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--threads") && i + 1 < argc) {
            cfg.client.threads = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.client.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

static query_stream::FetchOptions toFetchOptions(const Config& cfg) {
    query_stream::FetchOptions options;
    options.offset = cfg.offset;
    options.limit  = cfg.limit;
    if (cfg.chunkSize > 0) options.chunkSize    = cfg.chunkSize;
    if (cfg.prefetch > 0)  options.prefetchSize = cfg.prefetch;
    if (!cfg.startCursor.empty()) {
        options.startCursor = query_stream::Cursor{cfg.startCursor};
    }
    return options;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);
        const auto options = toFetchOptions(cfg);
        options.validate();

        std::cout
            << "=== query_stream ===\n"
            << "Endpoint:   " << cfg.client.endpoint  << "\n"
            << "Kind:       " << cfg.kind             << "\n"
            << "Offset:     " << cfg.offset           << "\n"
            << "Limit:      " << cfg.limit            << "\n"
            << "Chunk size: " << (cfg.chunkSize > 0 ? std::to_string(cfg.chunkSize) : "unset") << "\n"
            << "Timeout:    " << cfg.client.timeoutMs << " ms\n"
            << "Verbose:    " << (cfg.client.verbose ? "yes" : "no") << "\n"
            << "====================\n\n";

        query_stream::DatastoreQueryClient client(cfg.client);
        query_stream::QuerySpec query;
        query.kind = cfg.kind;

        query_stream::QueryPager pager(client,
                                       client.runQuery(query, options),
                                       options,
                                       query,
                                       {},
                                       cfg.client.verbose);
        query_stream::QueryResultIterator results(pager, options);

        std::cout << "--- Results ---\n";
        while (results.hasNext()) {
            const auto e = results.next();
            std::cout << std::setw(5) << results.returned() << "  "
                      << std::left << std::setw(32) << e.key << std::right << "  "
                      << e.properties.dump() << "\n";
        }

        const auto resume = results.cursor();
        const auto stats  = pager.getStats();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Records returned:    " << results.returned()        << "\n"
            << "Records skipped:     " << results.numSkipped()      << "\n"
            << "Pages consumed:      " << stats.pagesConsumed       << "\n"
            << "Sync continuations:  " << stats.syncContinuations   << "\n"
            << "Async prefetches:    " << stats.asyncPrefetches     << "\n"
            << "Requests issued:     " << client.requestsIssued()   << "\n"
            << "Resume cursor:       " << (resume ? resume->token : "(start)") << "\n"
            << "======================\n";

        // The last prefetch may still be in flight; nobody needs it now.
        pager.cancel();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
