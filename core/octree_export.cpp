// LOD octree export implementation
#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#define TBB_PREVIEW_GLOBAL_CONTROL 1  // needed for TBB thread control
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include "octree_export.hpp"
#include "record_codec.hpp"

// stdout is shared between the builder threads, one line at a time
static std::mutex g_logMutex;

// ---- policy ----

void validateConfig(const ExportConfig& cfg) {
    if (cfg.maxPointsPerNode <= 0) {
        throw InvalidConfiguration("max points per node must be > 0, got "
                                   + std::to_string(cfg.maxPointsPerNode));
    }
    if (cfg.maxDepth < 0) {
        throw InvalidConfiguration("max depth must be >= 0, got " + std::to_string(cfg.maxDepth));
    }
    // written so NaN fails too
    if (!(cfg.lodFraction > 0.0 && cfg.lodFraction <= 1.0)) {
        throw InvalidConfiguration("lod fraction must be in (0, 1], got "
                                   + std::to_string(cfg.lodFraction));
    }
    if (cfg.outputDir.empty()) {
        throw InvalidConfiguration("output directory is empty");
    }
    if (cfg.numThreads < 0) {
        throw InvalidConfiguration("thread count must be >= 0, got "
                                   + std::to_string(cfg.numThreads));
    }
}

bool shouldSplit(size_t numStars, uint32_t depth, const ExportConfig& cfg) {
    return numStars > (size_t)cfg.maxPointsPerNode && depth < (uint32_t)cfg.maxDepth;
}

size_t lodKeepCount(size_t numStars, double fraction) {
    if (numStars == 0) return 0;
    size_t keep = (size_t)std::floor((double)numStars * fraction);
    return std::min(numStars, std::max<size_t>(1, keep));
}

std::vector<StarPoint> selectLodSubset(const std::vector<StarPoint>& stars, double fraction) {
    std::vector<StarPoint> sorted = stars;

    // lower magnitude = brighter. NaN goes after every real number so the
    // comparator stays a strict weak order
    std::stable_sort(sorted.begin(), sorted.end(), [](const StarPoint& a, const StarPoint& b) {
        bool aNan = std::isnan(a.magnitude);
        bool bNan = std::isnan(b.magnitude);
        if (aNan || bNan) return !aNan && bNan;
        return a.magnitude < b.magnitude;
    });

    sorted.resize(lodKeepCount(sorted.size(), fraction));
    return sorted;
}

BuildStats& BuildStats::operator+=(const BuildStats& o) {
    nodes += o.nodes;
    leaves += o.leaves;
    internalNodes += o.internalNodes;
    starsWritten += o.starsWritten;
    deepest = std::max(deepest, o.deepest);
    emptyDataset = emptyDataset || o.emptyDataset;
    return *this;
}

BuildAborted::BuildAborted(NodeKey node_, uint32_t deepestDepth_, const std::string& reason_)
    : OctreeError("build aborted at node " + nodeName(node_)
                  + " (depth " + std::to_string(node_.depth)
                  + ", deepest reached " + std::to_string(deepestDepth_) + "): " + reason_),
      node(std::move(node_)),
      deepestDepth(deepestDepth_),
      reason(reason_) {}

std::string nodeOutputPath(const ExportConfig& cfg, const NodeKey& key) {
    return (std::filesystem::path(cfg.outputDir) / nodeFileName(key)).string();
}

// ---- recursion ----

namespace {

// everything one run shares. per node stats flow back up through return
// values, only the deepest depth is shared
struct ExportContext {
    const PointSource& source;
    const ExportConfig& cfg;
    bool parallel;
    std::atomic<uint32_t> deepest{0};  // for the abort report only

    ExportContext(const PointSource& s, const ExportConfig& c, bool par)
        : source(s), cfg(c), parallel(par) {}

    void reached(uint32_t depth) {
        uint32_t cur = deepest.load();
        while (depth > cur && !deepest.compare_exchange_weak(cur, depth)) {
        }
    }
};

} // namespace

static void logNode(const ExportContext& ctx, const NodeKey& key, size_t numStars,
                    size_t written, bool split)
{
    if (!ctx.cfg.verbose) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cout << "  Depth " << key.depth << ", node " << nodeName(key) << ": "
              << numStars << " stars";
    if (split) {
        std::cout << " -> split, kept brightest " << written << "\n";
    } else {
        std::cout << " (leaf)\n";
    }
}

static void writeNodeOrAbort(ExportContext& ctx, const NodeKey& key,
                             const std::vector<StarPoint>& stars)
{
    try {
        writeNodeFile(nodeOutputPath(ctx.cfg, key), stars);
    } catch (const std::exception& e) {
        throw BuildAborted(key, ctx.deepest.load(), e.what());
    }
}

// recursive function that exports one node and (maybe) its subtree
static BuildStats exportNode(ExportContext& ctx, const BoundingBox& box, const NodeKey& key)
{
    ctx.reached(key.depth);

    // query this node's volume. no retry, one failure kills the whole build
    std::vector<StarPoint> stars;
    try {
        stars = ctx.source.pointsIn(box, ctx.cfg.provenanceFilter);
    } catch (const std::exception& e) {
        throw BuildAborted(key, ctx.deepest.load(), e.what());
    }

    BuildStats stats;
    stats.nodes = 1;
    stats.deepest = key.depth;

    // base case: few enough stars or too deep -> leaf with everything
    if (!shouldSplit(stars.size(), key.depth, ctx.cfg)) {
        writeNodeOrAbort(ctx, key, stars);
        logNode(ctx, key, stars.size(), stars.size(), false);
        stats.leaves = 1;
        stats.starsWritten = stars.size();
        return stats;
    }

    // internal node: brightest fraction goes in this file for distant
    // viewing, and it's on disk before any child starts
    {
        std::vector<StarPoint> lod = selectLodSubset(stars, ctx.cfg.lodFraction);
        writeNodeOrAbort(ctx, key, lod);
        logNode(ctx, key, stars.size(), lod.size(), true);
        stats.internalNodes = 1;
        stats.starsWritten = lod.size();
    }
    // children re-query the source themselves, don't hold the list through them
    stars.clear();
    stars.shrink_to_fit();

    std::array<BuildStats, 8> childStats;
    if (ctx.parallel) {
        // sibling octants are independent and write to different files.
        // an exception in one child cancels the rest and is rethrown here
        tbb::parallel_for(0, 8, [&](int b) {
            childStats[b] = exportNode(ctx, box.octant(b), childKey(key, b));
        });
    } else {
        for (int b = 0; b < 8; ++b) {
            childStats[b] = exportNode(ctx, box.octant(b), childKey(key, b));
        }
    }

    for (const BuildStats& c : childStats) stats += c;
    return stats;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// node files (and their temps) left by an earlier export into the same dir.
// loaders rebuild the tree from file names alone, so they'd mix into this one.
// anything that isn't a node name is left alone
static size_t removeStaleNodeFiles(const std::string& dir)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    std::vector<fs::path> stale;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw NodeWriteError("cannot list " + dir + ": " + ec.message());
    }
    for (const fs::directory_entry& entry : it) {
        std::string name = entry.path().filename().string();
        if (endsWith(name, ".tmp")) name.resize(name.size() - 4);
        if (endsWith(name, ".bin") && parseNodeName(name)) stale.push_back(entry.path());
    }

    for (const fs::path& p : stale) {
        fs::remove(p, ec);
        if (ec) {
            throw NodeWriteError("cannot remove stale node file " + p.string() + ": " + ec.message());
        }
    }
    return stale.size();
}

static BuildStats exportFromRoot(const PointSource& source, const ExportConfig& cfg, bool parallel)
{
    validateConfig(cfg);

    ExportContext ctx(source, cfg, parallel);
    const NodeKey root;

    try {
        size_t removed = removeStaleNodeFiles(cfg.outputDir);
        if (removed > 0 && cfg.verbose) {
            std::lock_guard<std::mutex> lock(g_logMutex);
            std::cout << "  Removed " << removed << " node files of a previous export\n";
        }
    } catch (const std::exception& e) {
        throw BuildAborted(root, 0, std::string("cannot clear output directory: ") + e.what());
    }

    BoundingBox global;
    try {
        global = source.globalBounds(cfg.provenanceFilter);
    } catch (const EmptyDataset& e) {
        // nothing to export: a single empty root so loaders still find a tree
        if (cfg.verbose) {
            std::lock_guard<std::mutex> lock(g_logMutex);
            std::cout << "  Empty dataset (" << e.what() << "), writing empty root\n";
        }
        writeNodeOrAbort(ctx, root, {});
        BuildStats stats;
        stats.nodes = 1;
        stats.leaves = 1;
        stats.emptyDataset = true;
        return stats;
    } catch (const std::exception& e) {
        throw BuildAborted(root, 0, std::string("global bounds query failed: ") + e.what());
    }
    // a non-finite star in the source gives a NaN center, every child would come back empty
    if (!global.isValid()) {
        throw BuildAborted(root, 0, "global bounds are not finite");
    }

    return exportNode(ctx, global, root);
}

// ---- public entry points ----

// Sequential export (reference order, one node at a time)
BuildStats buildOctreeExport_seq(const PointSource& source, const ExportConfig& cfg)
{
    return exportFromRoot(source, cfg, /*parallel=*/false);
}

// Parallel export - every internal node fans its 8 children out to TBB
BuildStats buildOctreeExport(const PointSource& source, const ExportConfig& cfg)
{
    validateConfig(cfg);

    // cap the pool if asked, otherwise TBB uses every hardware thread
    std::unique_ptr<tbb::global_control> limit;
    if (cfg.numThreads > 0) {
        limit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, (size_t)cfg.numThreads);
    }
    return exportFromRoot(source, cfg, /*parallel=*/true);
}

BuildStats runOctreeExport(const PointSource& source, const ExportConfig& cfg)
{
    return cfg.parallel ? buildOctreeExport(source, cfg) : buildOctreeExport_seq(source, cfg);
}
