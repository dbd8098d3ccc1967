// Reads an exported octree directory back and checks it
#include <algorithm>
#include <filesystem>
#include <ostream>
#include <set>
#include <system_error>

#include "errors.hpp"
#include "octree_inspect.hpp"
#include "record_codec.hpp"

namespace fs = std::filesystem;

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

InspectReport inspectOctreeDir(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw SourceUnavailable("not a directory: " + dir);
    }

    InspectReport report;

    // first pass: names only, that's all a downstream loader gets
    std::map<NodeKey, std::string> nodes;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw SourceUnavailable("cannot list " + dir + ": " + ec.message());
    }
    for (const fs::directory_entry& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();

        if (endsWith(name, ".tmp")) {
            report.leftoverTemps.push_back(name);
            continue;
        }
        if (!endsWith(name, ".bin")) continue;

        auto key = parseNodeName(name);
        if (!key) {
            report.badNames.push_back(name);
            continue;
        }
        nodes.emplace(*key, entry.path().string());
    }

    std::set<NodeKey> parents;
    for (const auto& kv : nodes) {
        if (!kv.first.isRoot()) parents.insert(parentKey(kv.first));
    }

    // second pass: decode every node
    for (const auto& kv : nodes) {
        const NodeKey& key = kv.first;
        const std::string name = nodeFileName(key);

        if (key.isRoot()) {
            report.hasRoot = true;
        } else if (nodes.find(parentKey(key)) == nodes.end()) {
            report.orphans.push_back(name);
        }

        std::vector<StarPoint> stars;
        try {
            stars = readNodeFile(kv.second);
        } catch (const CorruptRecord& e) {
            report.corruptFiles.push_back(name + ": " + e.what());
            continue;
        }

        // an internal node holds the brightest subset, brightest first
        if (parents.count(key)) {
            bool sorted = std::is_sorted(stars.begin(), stars.end(),
                [](const StarPoint& a, const StarPoint& b) { return a.magnitude < b.magnitude; });
            if (!sorted) report.unsortedParents.push_back(name);
        }

        DepthSummary& d = report.perDepth[key.depth];
        d.nodes += 1;
        d.stars += stars.size();
        report.totalNodes += 1;
        report.totalStars += stars.size();
    }

    std::sort(report.badNames.begin(), report.badNames.end());
    std::sort(report.leftoverTemps.begin(), report.leftoverTemps.end());
    return report;
}

static void printList(std::ostream& out, const char* title, const std::vector<std::string>& items) {
    if (items.empty()) return;
    out << title << " (" << items.size() << "):\n";
    for (const std::string& s : items) out << "  " << s << "\n";
}

void printInspectReport(const InspectReport& report, std::ostream& out) {
    out << "depth,nodes,stars\n";
    for (const auto& kv : report.perDepth) {
        out << kv.first << "," << kv.second.nodes << "," << kv.second.stars << "\n";
    }
    out << "Total nodes: " << report.totalNodes << "\n";
    out << "Total stars (all levels): " << report.totalStars << "\n";
    out << "Root present: " << (report.hasRoot ? "yes" : "NO") << "\n";

    printList(out, "Unparseable file names", report.badNames);
    printList(out, "Corrupt files", report.corruptFiles);
    printList(out, "Orphan nodes (parent missing)", report.orphans);
    printList(out, "Internal nodes out of brightness order", report.unsortedParents);
    printList(out, "Leftover temp files", report.leftoverTemps);

    out << (report.ok() ? "Tree OK\n" : "Tree has problems\n");
}
