// Star catalog -> binary LOD octree exporter
//
// Usage:
//   ./star_octree_export --input catalog.bin [--output-dir data/octree]
//                        [--max-depth 5] [--max-points 50000] [--lod-fraction 0.1]
//                        [--provenance-filter OBSERVED|INFERRED|SIMULATED]
//                        [--threads N] [--seq] [--quiet]
//
// .bin input is streamed from disk on every node query, .csv input is loaded
// into memory first (x,y,z,magnitude,provenance).

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "catalog_loader.hpp"
#include "octree_export.hpp"
#include "point_source.hpp"

using Clock = std::chrono::high_resolution_clock;

static void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " --input <catalog.bin|catalog.csv> [options]\n"
              << "Options:\n"
              << "  --output-dir <dir>          output directory (default data/octree)\n"
              << "  --max-depth <n>             maximum octree depth (default 5)\n"
              << "  --max-points <n>            split nodes with more stars (default 50000)\n"
              << "  --lod-fraction <f>          brightest share kept in parents (default 0.1)\n"
              << "  --provenance-filter <name>  OBSERVED, INFERRED or SIMULATED\n"
              << "  --threads <n>               worker threads, 0 = all (default 0)\n"
              << "  --seq                       sequential depth-first build\n"
              << "  --quiet                     no per-node log\n";
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// whole token or nothing, "3abc" is an error not 3
static int intFlag(const std::string& flag, const std::string& text) {
    auto v = parseIntToken(text);
    if (!v) throw InvalidConfiguration("bad integer for " + flag + ": '" + text + "'");
    return *v;
}

static double doubleFlag(const std::string& flag, const std::string& text) {
    auto v = parseDoubleToken(text);
    if (!v) throw InvalidConfiguration("bad number for " + flag + ": '" + text + "'");
    return *v;
}

int main(int argc, char** argv) {
    ExportConfig cfg;
    std::string input;

    // ---- parse args ----
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // every option except the two switches takes a value
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw InvalidConfiguration("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--input")                  input = value();
            else if (arg == "--output-dir")        cfg.outputDir = value();
            else if (arg == "--max-depth")         cfg.maxDepth = intFlag(arg, value());
            else if (arg == "--max-points")        cfg.maxPointsPerNode = intFlag(arg, value());
            else if (arg == "--lod-fraction")      cfg.lodFraction = doubleFlag(arg, value());
            else if (arg == "--threads")           cfg.numThreads = intFlag(arg, value());
            else if (arg == "--seq")               cfg.parallel = false;
            else if (arg == "--quiet")             cfg.verbose = false;
            else if (arg == "--provenance-filter") {
                std::string name = value();
                auto prov = parseProvenance(name);
                if (!prov) throw InvalidConfiguration("unknown provenance class: " + name);
                cfg.provenanceFilter = *prov;
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else {
                throw InvalidConfiguration("unknown option: " + arg);
            }
        }
        if (input.empty()) throw InvalidConfiguration("--input is required");
        validateConfig(cfg);
    } catch (const InvalidConfiguration& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    std::cout << "============================================================\n"
              << "BINARY OCTREE EXPORT\n"
              << "============================================================\n"
              << "Input: " << input << "\n"
              << "Max depth: " << cfg.maxDepth << "\n"
              << "Max stars per node: " << cfg.maxPointsPerNode << "\n"
              << "LOD parent fraction: " << cfg.lodFraction * 100.0 << "%\n"
              << "Mode: " << (cfg.parallel ? "parallel" : "sequential") << "\n";
    if (cfg.provenanceFilter) {
        std::cout << "Provenance filter: " << provenanceLabel(*cfg.provenanceFilter) << "\n";
    }
    std::cout << "\n";

    // ---- source ----
    std::unique_ptr<PointSource> source;
    try {
        if (endsWith(input, ".csv")) {
            std::vector<StarPoint> stars = loadCatalogCsv(input);
            std::cout << "Loaded " << stars.size() << " stars from " << input << "\n";
            source = std::make_unique<MemoryPointSource>(std::move(stars));
        } else {
            source = std::make_unique<CatalogFileSource>(input);
        }
    } catch (const OctreeError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    // ---- build ----
    std::cout << "Building octree...\n";
    auto t0 = Clock::now();
    BuildStats stats;
    try {
        stats = runOctreeExport(*source, cfg);
    } catch (const BuildAborted& e) {
        std::cerr << "\nERROR: " << e.what() << "\n"
                  << "  failed node:   " << nodeName(e.node) << "\n"
                  << "  deepest depth: " << e.deepestDepth << "\n"
                  << "  the octree in " << cfg.outputDir << " is INCOMPLETE, files written"
                  << " before the failure were left in place\n";
        return 1;
    }
    std::chrono::duration<double, std::milli> ms = Clock::now() - t0;

    std::cout << "\n============================================================\n"
              << "EXPORT COMPLETE\n"
              << "============================================================\n";
    if (stats.emptyDataset) {
        std::cout << "Dataset was empty, wrote a single empty root node\n";
    }
    std::cout << "Total nodes: " << stats.nodes
              << " (" << stats.internalNodes << " internal, " << stats.leaves << " leaves)\n"
              << "Total stars exported: " << stats.starsWritten << "\n"
              << "Deepest level: " << stats.deepest << "\n"
              << "Build time: " << ms.count() << " ms\n"
              << "Output directory: " << cfg.outputDir << "\n";
    return 0;
}
