#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "node_naming.hpp"

struct DepthSummary {
    size_t nodes = 0;
    size_t stars = 0;
};

// what an exported directory looks like when read back through file names only
struct InspectReport {
    std::map<uint32_t, DepthSummary> perDepth;
    size_t totalNodes = 0;
    size_t totalStars = 0;
    bool hasRoot = false;

    std::vector<std::string> badNames;       // *.bin files whose name doesn't parse
    std::vector<std::string> corruptFiles;   // "file: reason"
    std::vector<std::string> orphans;        // nodes whose parent file is missing
    std::vector<std::string> unsortedParents; // internal nodes not in brightness order
    std::vector<std::string> leftoverTemps;  // *.tmp from an interrupted write

    // structurally sound tree (stray temp files don't count against it)
    bool ok() const {
        return hasRoot && badNames.empty() && corruptFiles.empty()
            && orphans.empty() && unsortedParents.empty();
    }
};

// throws SourceUnavailable if dir isn't a readable directory
InspectReport inspectOctreeDir(const std::string& dir);

void printInspectReport(const InspectReport& report, std::ostream& out);
