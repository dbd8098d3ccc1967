#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bounding_box.hpp"

// position of a node in the export octree: depth + octant taken at each level
// (path.size() == depth). root is {0, {}}
struct NodeKey {
    uint32_t depth = 0;
    std::vector<uint8_t> path;

    bool isRoot() const { return depth == 0; }

    bool operator==(const NodeKey& o) const { return depth == o.depth && path == o.path; }
    bool operator!=(const NodeKey& o) const { return !(*this == o); }
    bool operator<(const NodeKey& o) const {
        if (depth != o.depth) return depth < o.depth;
        return path < o.path;
    }
};

NodeKey childKey(const NodeKey& parent, int octant);

// parent of a non-root key (root maps to itself)
NodeKey parentKey(const NodeKey& key);

// File naming contract (downstream loaders parse this, do not change it):
//   root          -> "0-0-0-0"           (legacy 4-token form)
//   depth d >= 1  -> "d-p1-p2-...-pd"    (one token per octant index 0..7)
// e.g. {1,{0}} -> "1-0", {3,{1,2,7}} -> "3-1-2-7"
std::string nodeName(const NodeKey& key);

// nodeName + ".bin"
std::string nodeFileName(const NodeKey& key);

// inverse of nodeName (with or without ".bin"). empty for names that
// nodeName can't produce
std::optional<NodeKey> parseNodeName(const std::string& name);

// walk octant() down the path starting from the global box
BoundingBox boxForKey(const BoundingBox& global, const NodeKey& key);
