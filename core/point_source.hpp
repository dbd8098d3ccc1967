#pragma once
#include <optional>
#include <vector>

#include "bounding_box.hpp"
#include "utils.hpp"

// global bounds grow by this fraction of the extent on every axis so stars
// sitting right on the data's edge don't get clipped
constexpr double kBoundsPadding = 0.10;

// Where the builder gets its stars from. Both queries take the provenance
// filter so the source applies it itself, the builder never post-filters.
//
// Implementations must be safe to query from several threads at once, the
// parallel builder fans out over octants.
class PointSource {
public:
    virtual ~PointSource() = default;

    // smallest box around every matching star, padded by kBoundsPadding.
    // throws EmptyDataset if nothing matches, SourceUnavailable if the
    // backing store can't be reached
    virtual BoundingBox globalBounds(const std::optional<Provenance>& filter) const = 0;

    // every matching star with bb_min <= p <= bb_max (inclusive on both sides,
    // so a star on a shared face shows up in each sibling that touches it).
    // throws SourceUnavailable
    virtual std::vector<StarPoint> pointsIn(const BoundingBox& box,
                                            const std::optional<Provenance>& filter) const = 0;
};

// stars held in memory. read only after construction so concurrent
// queries are fine
class MemoryPointSource : public PointSource {
public:
    explicit MemoryPointSource(std::vector<StarPoint> stars);

    BoundingBox globalBounds(const std::optional<Provenance>& filter) const override;
    std::vector<StarPoint> pointsIn(const BoundingBox& box,
                                    const std::optional<Provenance>& filter) const override;

private:
    std::vector<StarPoint> stars_;
};
