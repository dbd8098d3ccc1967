// Bounding box geometry for the export octree
#include <cmath>
#include <limits>

#include "bounding_box.hpp"

BoundingBox BoundingBox::octant(int index) const {
    // both halves use the same center value, so lower.max == upper.min
    // bit for bit and the 8 children tile the parent with no gap
    const Vec3d c = center();
    BoundingBox child = *this;

    if (index & 4) child.bb_min.x = c.x; else child.bb_max.x = c.x;
    if (index & 2) child.bb_min.y = c.y; else child.bb_max.y = c.y;
    if (index & 1) child.bb_min.z = c.z; else child.bb_max.z = c.z;

    return child;
}

bool BoundingBox::isValid() const {
    const double v[6] = { bb_min.x, bb_min.y, bb_min.z, bb_max.x, bb_max.y, bb_max.z };
    for (double d : v) {
        if (!std::isfinite(d)) return false;
    }
    return bb_min.x <= bb_max.x && bb_min.y <= bb_max.y && bb_min.z <= bb_max.z;
}

// same min/max sweep as the point cloud builder, just in double
BoundingBox computeBoundingBox(const std::vector<StarPoint>& pts) {
    if (pts.empty()) {
        return { {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0} };
    }

    double inf = std::numeric_limits<double>::infinity();
    BoundingBox box{ { inf,  inf,  inf},
                     {-inf, -inf, -inf} };

    for (const StarPoint& s : pts) {
        const Vec3d& p = s.position;
        // update mins
        if (p.x < box.bb_min.x) box.bb_min.x = p.x;
        if (p.y < box.bb_min.y) box.bb_min.y = p.y;
        if (p.z < box.bb_min.z) box.bb_min.z = p.z;
        // update maxs
        if (p.x > box.bb_max.x) box.bb_max.x = p.x;
        if (p.y > box.bb_max.y) box.bb_max.y = p.y;
        if (p.z > box.bb_max.z) box.bb_max.z = p.z;
    }
    return box;
}

BoundingBox padBoundingBox(const BoundingBox& box, double fraction) {
    // padding is relative to the extent, not to the coordinate value, so
    // boxes straddling zero or sitting on negative axes grow the right way
    double px = (box.bb_max.x - box.bb_min.x) * fraction;
    double py = (box.bb_max.y - box.bb_min.y) * fraction;
    double pz = (box.bb_max.z - box.bb_min.z) * fraction;

    return { { box.bb_min.x - px, box.bb_min.y - py, box.bb_min.z - pz },
             { box.bb_max.x + px, box.bb_max.y + py, box.bb_max.z + pz } };
}
