#pragma once
#include <vector>
#include "utils.hpp"

// axis aligned box, inclusive on both ends. invariant: bb_min <= bb_max per axis
struct BoundingBox {
    Vec3d bb_min; // min corner
    Vec3d bb_max; // max corner

    Vec3d center() const {
        return { 0.5 * (bb_min.x + bb_max.x),
                 0.5 * (bb_min.y + bb_max.y),
                 0.5 * (bb_min.z + bb_max.z) };
    }

    bool contains(const Vec3d& p) const {
        return p.x >= bb_min.x && p.x <= bb_max.x
            && p.y >= bb_min.y && p.y <= bb_max.y
            && p.z >= bb_min.z && p.z <= bb_max.z;
    }

    // one of the 8 children about center().
    // bit 2 (4) -> x, bit 1 (2) -> y, bit 0 (1) -> z. bit set = upper half
    BoundingBox octant(int index) const;

    // min <= max on every axis and nothing is nan/inf
    bool isValid() const;
};

// tight box around a point set. empty input gives an all-zero box
BoundingBox computeBoundingBox(const std::vector<StarPoint>& pts);

// grows every axis by fraction * extent on both sides
BoundingBox padBoundingBox(const BoundingBox& box, double fraction);
