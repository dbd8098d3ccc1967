// generate_synth_catalog.cpp
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/catalog_loader.hpp"
#include "core/errors.hpp"

/// Single catalog:
///   ./gen_catalog data/catalog.bin 1000000 123
///   ./gen_catalog data/catalog.csv 5000 7 500
///                 ^ output        N    seed radius_pc
///
/// Stars are spread over a thin disk around the origin (think solar
/// neighbourhood), positions in meters. Apparent magnitude comes from a
/// random absolute magnitude plus the distance modulus, so far stars come out
/// dim the way a real catalog does. Provenance is ~80% OBSERVED,
/// ~15% INFERRED, ~5% SIMULATED.

static const double kMetersPerParsec = 3.0856775814913673e16;

static std::vector<StarPoint> makeDiskCatalog(size_t N, double radiusPc, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist_angle(0.0, 6.283185307179586);
    std::uniform_real_distribution<double> dist_u(0.0, 1.0);
    std::normal_distribution<double> dist_height(0.0, 0.05 * radiusPc);  // thin disk
    std::normal_distribution<double> dist_absmag(4.8, 2.5);              // sun-ish on average
    std::discrete_distribution<int> dist_prov({80.0, 15.0, 5.0});

    std::vector<StarPoint> stars;
    stars.reserve(N);

    for (size_t i = 0; i < N; ++i) {
        // sqrt so the density is uniform over the disk area
        double r = radiusPc * std::sqrt(dist_u(rng));
        double angle = dist_angle(rng);

        double xPc = r * std::cos(angle);
        double yPc = r * std::sin(angle);
        double zPc = dist_height(rng);

        // distance modulus, clamp at 1 pc so nothing ends up absurdly bright
        double d = std::max(1.0, std::sqrt(xPc * xPc + yPc * yPc + zPc * zPc));
        double appMag = dist_absmag(rng) + 5.0 * std::log10(d / 10.0);

        StarPoint s;
        s.position = { xPc * kMetersPerParsec, yPc * kMetersPerParsec, zPc * kMetersPerParsec };
        s.magnitude = (float)appMag;
        s.provenance = *provenanceFromCode(dist_prov(rng));
        stars.push_back(s);
    }
    return stars;
}

static bool writeCsv(const std::string& path, const std::vector<StarPoint>& stars) {
    std::ofstream out(path);
    if (!out) return false;
    out << "x,y,z,magnitude,provenance\n";
    out << std::setprecision(17);
    for (const StarPoint& s : stars) {
        out << s.position.x << "," << s.position.y << "," << s.position.z << ","
            << std::setprecision(9) << s.magnitude << std::setprecision(17) << ","
            << provenanceLabel(s.provenance) << "\n";
    }
    return (bool)out;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0]
                  << " <output.bin|output.csv> <num_stars> [seed] [radius_pc]\n";
        return 1;
    }

    std::string outPath = argv[1];
    auto numStars = parseSizeToken(argv[2]);
    auto seed = (argc > 3) ? parseSizeToken(argv[3]) : std::optional<size_t>(123);
    auto radiusPc = (argc > 4) ? parseDoubleToken(argv[4]) : std::optional<double>(1000.0);
    if (!numStars || !seed || !radiusPc || !(*radiusPc > 0.0)) {
        std::cerr << "ERROR: num_stars and seed must be non-negative integers, "
                  << "radius_pc a positive number\n";
        return 1;
    }

    std::mt19937 rng((unsigned)*seed);
    auto stars = makeDiskCatalog(*numStars, *radiusPc, rng);

    bool csv = outPath.size() > 4 && outPath.substr(outPath.size() - 4) == ".csv";
    if (csv) {
        if (!writeCsv(outPath, stars)) {
            std::cerr << "ERROR: cannot write " << outPath << "\n";
            return 1;
        }
    } else {
        try {
            writeCatalogBin(outPath, stars);
        } catch (const OctreeError& e) {
            std::cerr << "ERROR: " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << "Wrote " << stars.size() << " stars to " << outPath << "\n";
    return 0;
}
