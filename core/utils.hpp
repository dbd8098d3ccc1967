#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct Vec3d {
    double x, y, z;
};

// how a star's data was obtained. closed set, the int codes are part of the
// node file format so never renumber these
enum class Provenance {
    Observed,
    Inferred,
    Simulated
};

// total mapping, no default branch on purpose so a new enumerator
// shows up as a compiler warning here
inline int32_t provenanceCode(Provenance p) {
    switch (p) {
        case Provenance::Observed:  return 0;
        case Provenance::Inferred:  return 1;
        case Provenance::Simulated: return 2;
    }
    return 0; // unreachable
}

// reverse of provenanceCode, empty for anything outside 0..2
inline std::optional<Provenance> provenanceFromCode(int32_t code) {
    switch (code) {
        case 0: return Provenance::Observed;
        case 1: return Provenance::Inferred;
        case 2: return Provenance::Simulated;
        default: return std::nullopt;
    }
}

inline const char* provenanceLabel(Provenance p) {
    switch (p) {
        case Provenance::Observed:  return "OBSERVED";
        case Provenance::Inferred:  return "INFERRED";
        case Provenance::Simulated: return "SIMULATED";
    }
    return "OBSERVED"; // unreachable
}

// accepts the labels above (any case) or a numeric code "0".."2"
std::optional<Provenance> parseProvenance(const std::string& text);

// whole token must be a number, trailing blanks allowed ("3abc" is rejected).
// empty on garbage or overflow
std::optional<int> parseIntToken(const std::string& text);
std::optional<double> parseDoubleToken(const std::string& text);
std::optional<size_t> parseSizeToken(const std::string& text);  // no sign

struct StarPoint {
    Vec3d position;        // meters
    float magnitude;       // apparent magnitude, lower = brighter
    Provenance provenance;
};

inline bool matchesFilter(const StarPoint& s, const std::optional<Provenance>& filter) {
    return !filter || s.provenance == *filter;
}
