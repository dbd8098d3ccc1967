#include <utility>

#include "errors.hpp"
#include "point_source.hpp"

MemoryPointSource::MemoryPointSource(std::vector<StarPoint> stars)
    : stars_(std::move(stars)) {}

BoundingBox MemoryPointSource::globalBounds(const std::optional<Provenance>& filter) const {
    std::vector<StarPoint> matching;
    matching.reserve(stars_.size());
    for (const StarPoint& s : stars_) {
        if (matchesFilter(s, filter)) matching.push_back(s);
    }

    if (matching.empty()) {
        throw EmptyDataset(filter ? std::string("no ") + provenanceLabel(*filter) + " stars in source"
                                  : std::string("no stars in source"));
    }
    return padBoundingBox(computeBoundingBox(matching), kBoundsPadding);
}

std::vector<StarPoint> MemoryPointSource::pointsIn(const BoundingBox& box,
                                                   const std::optional<Provenance>& filter) const {
    std::vector<StarPoint> out;
    for (const StarPoint& s : stars_) {
        if (matchesFilter(s, filter) && box.contains(s.position)) {
            out.push_back(s);
        }
    }
    return out;
}
