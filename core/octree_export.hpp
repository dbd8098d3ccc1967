#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "node_naming.hpp"
#include "point_source.hpp"
#include "utils.hpp"

// knobs for one export run. passed in explicitly so two builds with
// different policies can run side by side
struct ExportConfig {
    int maxPointsPerNode = 50000;   // split if a node holds more than this
    int maxDepth = 5;               // never split at or below this depth
    double lodFraction = 0.10;      // brightest share kept in internal nodes, (0, 1]
    std::optional<Provenance> provenanceFilter;  // only export this class
    std::string outputDir = "data/octree";
    int numThreads = 0;             // 0 = let TBB pick (hardware concurrency)
    bool parallel = true;           // false -> strict depth-first, one thread
    bool verbose = true;            // one log line per node on stdout
};

// throws InvalidConfiguration. runs before any I/O
void validateConfig(const ExportConfig& cfg);

// split iff strictly more than maxPointsPerNode stars AND depth < maxDepth
bool shouldSplit(size_t numStars, uint32_t depth, const ExportConfig& cfg);

// max(1, floor(numStars * fraction)), 0 for an empty node
size_t lodKeepCount(size_t numStars, double fraction);

// brightest lodKeepCount() stars (lowest magnitude first). stable, so equal
// magnitudes keep their query order. NaN magnitudes sort as dimmest
std::vector<StarPoint> selectLodSubset(const std::vector<StarPoint>& stars, double fraction);

// per subtree totals, each recursive call returns its own and the parent sums
struct BuildStats {
    size_t nodes = 0;
    size_t leaves = 0;
    size_t internalNodes = 0;
    size_t starsWritten = 0;
    uint32_t deepest = 0;        // deepest depth written
    bool emptyDataset = false;   // source had nothing, only the empty root was written

    BuildStats& operator+=(const BuildStats& o);
};

// A query or write failed somewhere in the tree. Files written before the
// failure stay on disk, the tree is NOT complete.
struct BuildAborted : OctreeError {
    BuildAborted(NodeKey node, uint32_t deepestDepth, const std::string& reason);

    NodeKey node;              // node whose query / write failed
    uint32_t deepestDepth;     // deepest depth any node reached before the abort
    std::string reason;        // message of the underlying error
};

/////export octree(source, config)
//get global bounds (padded)
//query stars in node box
//split -> write brightest subset, recurse into 8 octants
//leaf -> write everything
////SEQUENTIAL EXPORT (strict depth first)
BuildStats buildOctreeExport_seq(const PointSource& source, const ExportConfig& cfg);

///PARALLEL EXPORT, the 8 children of every internal node run as TBB tasks
BuildStats buildOctreeExport(const PointSource& source, const ExportConfig& cfg);

// picks one of the two above from cfg.parallel
BuildStats runOctreeExport(const PointSource& source, const ExportConfig& cfg);

// <outputDir>/<node file name>
std::string nodeOutputPath(const ExportConfig& cfg, const NodeKey& key);
