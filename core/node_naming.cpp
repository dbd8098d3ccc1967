// Node key <-> file name mapping
#include <sstream>

#include "node_naming.hpp"

static const char* kRootName = "0-0-0-0";
static const std::string kFileSuffix = ".bin";

NodeKey childKey(const NodeKey& parent, int octant) {
    NodeKey child = parent;
    child.depth = parent.depth + 1;
    child.path.push_back((uint8_t)octant);
    return child;
}

NodeKey parentKey(const NodeKey& key) {
    if (key.isRoot()) return key;
    NodeKey parent = key;
    parent.depth = key.depth - 1;
    parent.path.pop_back();
    return parent;
}

std::string nodeName(const NodeKey& key) {
    if (key.isRoot()) return kRootName;

    std::string name = std::to_string(key.depth);
    for (uint8_t oct : key.path) {
        name.push_back('-');
        name.push_back(char('0' + oct));
    }
    return name;
}

std::string nodeFileName(const NodeKey& key) {
    return nodeName(key) + kFileSuffix;
}

std::optional<NodeKey> parseNodeName(const std::string& fileOrName) {
    std::string name = fileOrName;
    if (name.size() >= kFileSuffix.size() &&
        name.compare(name.size() - kFileSuffix.size(), kFileSuffix.size(), kFileSuffix) == 0) {
        name.resize(name.size() - kFileSuffix.size());
    }

    if (name == kRootName) return NodeKey{};

    // split on '-'
    std::vector<std::string> tokens;
    std::stringstream ss(name);
    std::string tok;
    while (std::getline(ss, tok, '-')) tokens.push_back(tok);
    if (!name.empty() && name.back() == '-') return std::nullopt;  // getline drops the trailing empty token
    if (tokens.size() < 2) return std::nullopt;

    // depth token: plain decimal, no sign, no leading zeros
    const std::string& d = tokens[0];
    if (d.empty() || d.size() > 9 || (d.size() > 1 && d[0] == '0')) return std::nullopt;
    for (char c : d) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    uint32_t depth = (uint32_t)std::stoul(d);

    // depth 0 only has the legacy root spelling, handled above
    if (depth == 0 || tokens.size() != (size_t)depth + 1) return std::nullopt;

    NodeKey key;
    key.depth = depth;
    key.path.reserve(depth);
    for (size_t i = 1; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];
        if (t.size() != 1 || t[0] < '0' || t[0] > '7') return std::nullopt;
        key.path.push_back((uint8_t)(t[0] - '0'));
    }
    return key;
}

BoundingBox boxForKey(const BoundingBox& global, const NodeKey& key) {
    BoundingBox box = global;
    for (uint8_t oct : key.path) {
        box = box.octant(oct);
    }
    return box;
}
