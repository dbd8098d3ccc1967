// Star catalog readers / writer and the file backed point source
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

#include "catalog_loader.hpp"
#include "errors.hpp"
#include "record_codec.hpp"

// records read per chunk when streaming a catalog
static const size_t kChunkRecords = 4096;

static StarPoint decodeCatalogRecord(const char* rec, size_t index) {
    int32_t code = getInt32LE(rec + 28);
    auto prov = provenanceFromCode(code);
    if (!prov) {
        throw CorruptRecord("catalog record " + std::to_string(index)
                            + " has unknown provenance code " + std::to_string(code));
    }
    StarPoint s;
    s.position.x = getFloat64LE(rec + 0);
    s.position.y = getFloat64LE(rec + 8);
    s.position.z = getFloat64LE(rec + 16);
    s.magnitude  = getFloat32LE(rec + 24);
    s.provenance = *prov;

    // one inf coordinate would blow the global bounds up to [-inf, inf]
    if (!std::isfinite(s.position.x) || !std::isfinite(s.position.y)
        || !std::isfinite(s.position.z)) {
        throw CorruptRecord("catalog record " + std::to_string(index) + " has a non-finite position");
    }
    return s;
}

// streams every record of a binary catalog through visit(const StarPoint&).
// visit returns false to stop early
template <typename F>
static void scanCatalogBin(const std::string& filename, F&& visit) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw SourceUnavailable("cannot open star catalog: " + filename);
    }

    std::vector<char> buf(kChunkRecords * kCatalogRecordBytes);
    size_t index = 0;
    while (true) {
        in.read(buf.data(), (std::streamsize)buf.size());
        size_t got = (size_t)in.gcount();
        if (in.bad()) {
            throw SourceUnavailable("read error in star catalog: " + filename);
        }
        if (got % kCatalogRecordBytes != 0) {
            throw CorruptRecord(filename + ": trailing partial record ("
                                + std::to_string(got % kCatalogRecordBytes) + " bytes)");
        }

        for (size_t off = 0; off < got; off += kCatalogRecordBytes) {
            if (!visit(decodeCatalogRecord(buf.data() + off, index++))) return;
        }
        if (got < buf.size()) break;  // hit eof
    }
}

std::vector<StarPoint> loadCatalogBin(const std::string& filename, size_t maxStars) {
    std::vector<StarPoint> stars;
    scanCatalogBin(filename, [&](const StarPoint& s) {
        stars.push_back(s);
        return maxStars == 0 || stars.size() < maxStars;
    });
    return stars;
}

void writeCatalogBin(const std::string& filename, const std::vector<StarPoint>& stars) {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw NodeWriteError("cannot open " + filename + " for writing");
    }

    char rec[kCatalogRecordBytes];
    for (const StarPoint& s : stars) {
        putFloat64LE(rec + 0,  s.position.x);
        putFloat64LE(rec + 8,  s.position.y);
        putFloat64LE(rec + 16, s.position.z);
        putFloat32LE(rec + 24, s.magnitude);
        putInt32LE(rec + 28,   provenanceCode(s.provenance));
        out.write(rec, sizeof(rec));
    }
    out.flush();
    if (!out) {
        throw NodeWriteError("write failed for " + filename);
    }
}

// ---- csv ----

static bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace((unsigned char)c)) return false;
    }
    return true;
}

std::vector<StarPoint> loadCatalogCsv(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw SourceUnavailable("cannot open star catalog: " + filename);
    }

    std::vector<StarPoint> stars;
    std::string line;
    size_t lineNo = 0;
    bool sawData = false;

    while (std::getline(in, line)) {
        ++lineNo;
        if (isBlank(line) || line[0] == '#') continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string f;
        while (std::getline(ss, f, ',')) fields.push_back(f);
        if (!line.empty() && line.back() == ',') fields.push_back("");

        std::optional<double> pos[3];
        bool anyNumeric = false;
        for (size_t i = 0; i < 3 && i < fields.size(); ++i) {
            pos[i] = parseDoubleToken(fields[i]);
            anyNumeric = anyNumeric || pos[i].has_value();
        }

        // header: the first non comment line with no number in x, y or z.
        // a data row with only some of them broken is an error below
        if (!sawData && !anyNumeric) {
            sawData = true;
            continue;
        }
        sawData = true;

        std::string where = filename + ":" + std::to_string(lineNo);
        if (fields.size() != 5) {
            throw CorruptRecord(where + ": expected 5 columns (x,y,z,magnitude,provenance), got "
                                + std::to_string(fields.size()));
        }
        if (!pos[0] || !pos[1] || !pos[2]) {
            throw CorruptRecord(where + ": bad position");
        }
        if (!std::isfinite(*pos[0]) || !std::isfinite(*pos[1]) || !std::isfinite(*pos[2])) {
            throw CorruptRecord(where + ": position is not finite");
        }

        double mag = kDefaultMagnitude;
        if (!isBlank(fields[3])) {
            auto parsed = parseDoubleToken(fields[3]);
            if (!parsed) {
                throw CorruptRecord(where + ": bad magnitude '" + fields[3] + "'");
            }
            mag = *parsed;
        }

        auto prov = parseProvenance(fields[4]);
        if (!prov) {
            throw CorruptRecord(where + ": unknown provenance '" + fields[4] + "'");
        }

        stars.push_back(StarPoint{ {*pos[0], *pos[1], *pos[2]}, (float)mag, *prov });
    }

    if (in.bad()) {
        throw SourceUnavailable("read error in star catalog: " + filename);
    }
    return stars;
}

// ---- file backed source ----

CatalogFileSource::CatalogFileSource(std::string filename)
    : filename_(std::move(filename)) {}

template <typename F>
void CatalogFileSource::scan(F&& visit) const {
    scanCatalogBin(filename_, [&](const StarPoint& s) {
        visit(s);
        return true;
    });
}

BoundingBox CatalogFileSource::globalBounds(const std::optional<Provenance>& filter) const {
    double inf = std::numeric_limits<double>::infinity();
    BoundingBox box{ { inf,  inf,  inf},
                     {-inf, -inf, -inf} };
    size_t matched = 0;

    // same min/max sweep as computeBoundingBox, without holding the catalog
    scan([&](const StarPoint& s) {
        if (!matchesFilter(s, filter)) return;
        const Vec3d& p = s.position;
        if (p.x < box.bb_min.x) box.bb_min.x = p.x;
        if (p.y < box.bb_min.y) box.bb_min.y = p.y;
        if (p.z < box.bb_min.z) box.bb_min.z = p.z;
        if (p.x > box.bb_max.x) box.bb_max.x = p.x;
        if (p.y > box.bb_max.y) box.bb_max.y = p.y;
        if (p.z > box.bb_max.z) box.bb_max.z = p.z;
        ++matched;
    });

    if (matched == 0) {
        throw EmptyDataset(filter ? std::string("no ") + provenanceLabel(*filter) + " stars in " + filename_
                                  : "no stars in " + filename_);
    }
    return padBoundingBox(box, kBoundsPadding);
}

std::vector<StarPoint> CatalogFileSource::pointsIn(const BoundingBox& box,
                                                   const std::optional<Provenance>& filter) const {
    std::vector<StarPoint> out;
    scan([&](const StarPoint& s) {
        if (matchesFilter(s, filter) && box.contains(s.position)) out.push_back(s);
    });
    return out;
}
