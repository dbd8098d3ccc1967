// catalog_loader.hpp
#pragma once
#include <string>
#include <vector>

#include "point_source.hpp"
#include "utils.hpp"

// Binary star catalog: raw little endian records, no header
//   float64 x, y, z   (meters)
//   float32 magnitude
//   int32   provenance code
constexpr size_t kCatalogRecordBytes = 32;

// magnitude used when a catalog row leaves it blank
constexpr float kDefaultMagnitude = 15.0f;

// maxStars == 0 -> load all; otherwise stop once we hit maxStars.
// throws SourceUnavailable if the file can't be opened, CorruptRecord on a
// partial record or bad provenance code
std::vector<StarPoint> loadCatalogBin(const std::string& filename, size_t maxStars = 0);

// throws NodeWriteError
void writeCatalogBin(const std::string& filename, const std::vector<StarPoint>& stars);

// x,y,z,magnitude,provenance per line. an optional header line and '#'
// comments are skipped; provenance is a label or a 0..2 code.
// throws SourceUnavailable / CorruptRecord (with the line number)
std::vector<StarPoint> loadCatalogCsv(const std::string& filename);

// Scans a binary catalog file on every query instead of holding it in memory,
// one stream per query so it can be shared between builder threads.
// Deleting or truncating the file mid build surfaces as SourceUnavailable /
// CorruptRecord from the next query.
class CatalogFileSource : public PointSource {
public:
    explicit CatalogFileSource(std::string filename);

    BoundingBox globalBounds(const std::optional<Provenance>& filter) const override;
    std::vector<StarPoint> pointsIn(const BoundingBox& box,
                                    const std::optional<Provenance>& filter) const override;

    const std::string& filename() const { return filename_; }

private:
    template <typename F>
    void scan(F&& visit) const;

    std::string filename_;
};
