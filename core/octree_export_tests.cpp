#include <algorithm>
#include <atomic>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "errors.hpp"
#include "node_naming.hpp"
#include "octree_export.hpp"
#include "octree_inspect.hpp"
#include "point_source.hpp"
#include "record_codec.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;

static std::vector<StarPoint> randomStars(int N, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> pos(-1.0e18, 1.0e18);
    std::uniform_real_distribution<float> mag(-1.0f, 20.0f);
    std::uniform_int_distribution<int> prov(0, 2);

    std::vector<StarPoint> stars(N);
    for (auto& s : stars) {
        s.position = { pos(rng), pos(rng), pos(rng) };
        s.magnitude = mag(rng);
        s.provenance = *provenanceFromCode(prov(rng));
    }
    return stars;
}

static ExportConfig testConfig(const fs::path& dir) {
    ExportConfig cfg;
    cfg.outputDir = dir.string();
    cfg.verbose = false;
    return cfg;
}

// file name -> decoded stars for every node file in dir
static std::map<NodeKey, std::vector<StarPoint>> readTree(const fs::path& dir) {
    std::map<NodeKey, std::vector<StarPoint>> tree;
    for (const auto& entry : fs::directory_iterator(dir)) {
        auto key = parseNodeName(entry.path().filename().string());
        assert(key);
        tree[*key] = readNodeFile(entry.path().string());
    }
    return tree;
}

static size_t countFiles(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++n;
    }
    return n;
}

void test_should_split() {
    ExportConfig cfg;  // defaults: 50000 / depth 5
    assert(shouldSplit(60000, 0, cfg) == true);
    assert(shouldSplit(50001, 3, cfg) == true);
    assert(shouldSplit(50000, 0, cfg) == false);  // strict >
    assert(shouldSplit(40000, 0, cfg) == false);
    assert(shouldSplit(60000, 5, cfg) == false);  // depth ceiling
    assert(shouldSplit(60000, 6, cfg) == false);
    assert(shouldSplit(60000, 4, cfg) == true);
    std::cout << "test_should_split PASSED\n";
}

void test_lod_subset_brightest() {
    const float mags[] = {5, 3, 8, 4, 10, 6, 7, 9, 2, 11};
    std::vector<StarPoint> stars;
    for (float m : mags) stars.push_back({ {0.0, 0.0, 0.0}, m, Provenance::Observed });

    std::vector<StarPoint> lod = selectLodSubset(stars, 0.10);
    assert(lod.size() == 1);
    assert(lod[0].magnitude == 2.0f);

    // bigger fraction: brightest first, in order
    std::vector<StarPoint> lod3 = selectLodSubset(stars, 0.3);
    assert(lod3.size() == 3);
    assert(lod3[0].magnitude == 2.0f && lod3[1].magnitude == 3.0f && lod3[2].magnitude == 4.0f);

    std::cout << "test_lod_subset_brightest PASSED\n";
}

void test_lod_keep_count() {
    assert(lodKeepCount(0, 0.1) == 0);
    assert(lodKeepCount(5, 0.1) == 1);      // floor(0.5) -> at least 1
    assert(lodKeepCount(10, 0.1) == 1);
    assert(lodKeepCount(100, 0.1) == 10);
    assert(lodKeepCount(1009, 0.1) == 100);
    assert(lodKeepCount(60000, 0.1) == 6000);
    assert(lodKeepCount(100, 1.0) == 100);
    std::cout << "test_lod_keep_count PASSED\n";
}

void test_lod_ties_are_stable() {
    // equal magnitudes keep query order, x tags the original position
    std::vector<StarPoint> stars;
    for (int i = 0; i < 20; ++i) {
        stars.push_back({ {(double)i, 0.0, 0.0}, (i % 2) ? 3.0f : 1.0f, Provenance::Observed });
    }
    std::vector<StarPoint> lod = selectLodSubset(stars, 0.25);  // keep 5
    assert(lod.size() == 5);
    for (size_t i = 0; i < lod.size(); ++i) {
        assert(lod[i].magnitude == 1.0f);
        assert(lod[i].position.x == (double)(2 * i));
    }

    // NaN magnitude never beats a real one
    std::vector<StarPoint> withNan = {
        { {0, 0, 0}, NAN, Provenance::Observed },
        { {1, 0, 0}, 18.0f, Provenance::Observed }
    };
    std::vector<StarPoint> one = selectLodSubset(withNan, 0.5);
    assert(one.size() == 1 && one[0].magnitude == 18.0f);

    std::cout << "test_lod_ties_are_stable PASSED\n";
}

void test_validate_config() {
    fs::path dir = makeTempDir("export_config");
    fs::path out = dir / "octree";
    MemoryPointSource source(randomStars(10, 1));

    std::vector<ExportConfig> bad;
    { ExportConfig c = testConfig(out); c.maxPointsPerNode = 0;  bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.maxPointsPerNode = -5; bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.maxDepth = -1;         bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.lodFraction = 0.0;     bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.lodFraction = 1.5;     bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.lodFraction = -0.1;    bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.lodFraction = NAN;     bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.outputDir = "";        bad.push_back(c); }
    { ExportConfig c = testConfig(out); c.numThreads = -2;       bad.push_back(c); }

    for (const ExportConfig& c : bad) {
        assert(throwsType<InvalidConfiguration>([&] { validateConfig(c); }));
        assert(throwsType<InvalidConfiguration>([&] { buildOctreeExport_seq(source, c); }));
        assert(throwsType<InvalidConfiguration>([&] { buildOctreeExport(source, c); }));
    }
    // rejected before any I/O, the output dir was never created
    assert(!fs::exists(out));

    // the edges of the valid range are fine
    ExportConfig ok = testConfig(out);
    ok.lodFraction = 1.0;
    ok.maxDepth = 0;
    validateConfig(ok);

    fs::remove_all(dir);
    std::cout << "test_validate_config PASSED\n";
}

void test_small_dataset_is_single_leaf() {
    fs::path dir = makeTempDir("export_small");
    std::vector<StarPoint> stars = {
        { {1.0e20, 2.0e20, 3.0e20}, 5.0f, Provenance::Observed },
        { {4.0e20, 5.0e20, 6.0e20}, 7.0f, Provenance::Inferred },
        { {7.0e20, 8.0e20, 9.0e20}, 9.0f, Provenance::Simulated }
    };
    MemoryPointSource source(stars);

    BuildStats stats = buildOctreeExport_seq(source, testConfig(dir));
    assert(stats.nodes == 1 && stats.leaves == 1 && stats.internalNodes == 0);
    assert(stats.starsWritten == 3);
    assert(!stats.emptyDataset);

    // only the root, and it holds everything in source order
    assert(countFiles(dir) == 1);
    fs::path root = dir / "0-0-0-0.bin";
    assert(fs::file_size(root) == 4 + 20 * 3);

    std::vector<StarPoint> back = readNodeFile(root.string());
    assert(back.size() == 3);
    for (size_t i = 0; i < 3; ++i) {
        assert(back[i].position.x == (double)(float)stars[i].position.x);
        assert(back[i].position.y == (double)(float)stars[i].position.y);
        assert(back[i].position.z == (double)(float)stars[i].position.z);
        assert(back[i].magnitude == stars[i].magnitude);
        assert(provenanceCode(back[i].provenance) == (int32_t)i);
    }

    fs::remove_all(dir);
    std::cout << "test_small_dataset_is_single_leaf PASSED\n";
}

void test_empty_dataset_writes_empty_root() {
    fs::path dir = makeTempDir("export_empty");
    MemoryPointSource empty(std::vector<StarPoint>{});

    BuildStats stats = buildOctreeExport(empty, testConfig(dir));
    assert(stats.emptyDataset);
    assert(stats.nodes == 1 && stats.starsWritten == 0);
    assert(countFiles(dir) == 1);
    assert(fs::file_size(dir / "0-0-0-0.bin") == 4);
    assert(readNodeFile((dir / "0-0-0-0.bin").string()).empty());

    // a filter that matches nothing is the same thing
    fs::path dir2 = makeTempDir("export_empty_filter");
    std::vector<StarPoint> onlyObserved = { { {0, 0, 0}, 1.0f, Provenance::Observed } };
    MemoryPointSource source(onlyObserved);
    ExportConfig cfg = testConfig(dir2);
    cfg.provenanceFilter = Provenance::Simulated;
    BuildStats stats2 = buildOctreeExport_seq(source, cfg);
    assert(stats2.emptyDataset);
    assert(countFiles(dir2) == 1 && fs::file_size(dir2 / "0-0-0-0.bin") == 4);

    fs::remove_all(dir);
    fs::remove_all(dir2);
    std::cout << "test_empty_dataset_writes_empty_root PASSED\n";
}

void test_split_tree_invariants() {
    fs::path dir = makeTempDir("export_split");
    const int N = 3000;
    std::vector<StarPoint> stars = randomStars(N, 42);
    MemoryPointSource source(stars);

    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 100;
    cfg.maxDepth = 3;
    cfg.lodFraction = 0.10;

    BuildStats stats = buildOctreeExport_seq(source, cfg);
    std::map<NodeKey, std::vector<StarPoint>> tree = readTree(dir);
    assert(tree.size() == stats.nodes);
    assert(stats.nodes == stats.leaves + stats.internalNodes);
    assert(stats.deepest <= 3);

    // a node is internal iff its children are on disk, and then all 8 are
    std::set<NodeKey> internal;
    for (const auto& kv : tree) {
        if (!kv.first.isRoot()) internal.insert(parentKey(kv.first));
    }
    for (const NodeKey& k : internal) {
        for (int b = 0; b < 8; ++b) assert(tree.count(childKey(k, b)) == 1);
    }
    assert(internal.size() == stats.internalNodes);

    // root: exactly the brightest 10% of everything, brightest first
    const std::vector<StarPoint>& root = tree.at(NodeKey{});
    assert(root.size() == lodKeepCount(N, 0.10));
    std::vector<float> mags;
    for (const StarPoint& s : stars) mags.push_back(s.magnitude);
    std::sort(mags.begin(), mags.end());
    for (size_t i = 0; i < root.size(); ++i) assert(root[i].magnitude == mags[i]);

    BoundingBox global = source.globalBounds(std::nullopt);
    size_t leafStars = 0;
    size_t written = 0;
    for (const auto& kv : tree) {
        const NodeKey& k = kv.first;
        const std::vector<StarPoint>& node = kv.second;
        written += node.size();

        std::vector<StarPoint> truth = source.pointsIn(boxForKey(global, k), std::nullopt);

        if (internal.count(k)) {
            // internal: non-empty strict subset, sorted by brightness
            assert(truth.size() > (size_t)cfg.maxPointsPerNode);
            assert(k.depth < (uint32_t)cfg.maxDepth);
            assert(!node.empty() && node.size() < truth.size());
            assert(node.size() == lodKeepCount(truth.size(), cfg.lodFraction));
            for (size_t i = 1; i < node.size(); ++i) {
                assert(node[i - 1].magnitude <= node[i].magnitude);
            }
        } else {
            // leaf: every star in the volume
            assert(node.size() == truth.size());
            assert(truth.size() <= (size_t)cfg.maxPointsPerNode || k.depth == (uint32_t)cfg.maxDepth);
            leafStars += node.size();
        }
    }
    assert(written == stats.starsWritten);

    // random doubles never land exactly on a split plane, so leaves partition the set
    assert(leafStars == (size_t)N);

    fs::remove_all(dir);
    std::cout << "test_split_tree_invariants PASSED\n";
}

void test_depth_ceiling() {
    fs::path dir = makeTempDir("export_depth");
    MemoryPointSource source(randomStars(500, 9));

    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 10;
    cfg.maxDepth = 0;  // root can't split however full it is

    BuildStats stats = buildOctreeExport(source, cfg);
    assert(stats.nodes == 1 && stats.starsWritten == 500);
    assert(fs::file_size(dir / "0-0-0-0.bin") == nodeFileSize(500));

    fs::remove_all(dir);
    std::cout << "test_depth_ceiling PASSED\n";
}

void test_parallel_matches_sequential() {
    fs::path seqDir = makeTempDir("export_seq");
    fs::path parDir = makeTempDir("export_par");
    MemoryPointSource source(randomStars(5000, 1234));

    ExportConfig cfg = testConfig(seqDir);
    cfg.maxPointsPerNode = 60;
    cfg.maxDepth = 4;
    BuildStats seq = buildOctreeExport_seq(source, cfg);

    cfg.outputDir = parDir.string();
    cfg.numThreads = 4;
    BuildStats par = buildOctreeExport(source, cfg);

    assert(seq.nodes == par.nodes);
    assert(seq.leaves == par.leaves);
    assert(seq.starsWritten == par.starsWritten);
    assert(seq.deepest == par.deepest);

    // same file names, same bytes
    std::set<std::string> names;
    for (const auto& entry : fs::directory_iterator(seqDir)) {
        names.insert(entry.path().filename().string());
    }
    assert(names.size() == seq.nodes);
    assert(countFiles(parDir) == names.size());
    for (const std::string& name : names) {
        assert(fs::exists(parDir / name));
        assert(readAllBytes(seqDir / name) == readAllBytes(parDir / name));
    }

    // runOctreeExport goes through the same paths
    fs::path runDir = makeTempDir("export_run");
    cfg.outputDir = runDir.string();
    cfg.parallel = false;
    assert(runOctreeExport(source, cfg).nodes == seq.nodes);

    fs::remove_all(seqDir);
    fs::remove_all(parDir);
    fs::remove_all(runDir);
    std::cout << "test_parallel_matches_sequential PASSED\n";
}

void test_provenance_filter() {
    fs::path dir = makeTempDir("export_filter");
    std::vector<StarPoint> stars = randomStars(2000, 77);
    size_t inferred = 0;
    for (const StarPoint& s : stars) inferred += (s.provenance == Provenance::Inferred) ? 1 : 0;

    MemoryPointSource source(stars);
    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 100;
    cfg.maxDepth = 2;
    cfg.provenanceFilter = Provenance::Inferred;

    BuildStats stats = buildOctreeExport(source, cfg);
    std::map<NodeKey, std::vector<StarPoint>> tree = readTree(dir);

    size_t leafStars = 0;
    for (const auto& kv : tree) {
        for (const StarPoint& s : kv.second) assert(s.provenance == Provenance::Inferred);
        bool isInternal = tree.count(childKey(kv.first, 0)) > 0;
        if (!isInternal) leafStars += kv.second.size();
    }
    assert(leafStars == inferred);
    assert(stats.nodes == tree.size());

    fs::remove_all(dir);
    std::cout << "test_provenance_filter PASSED\n";
}

// wraps a real source and starts failing on the Nth pointsIn call
class FailingSource : public PointSource {
public:
    FailingSource(const PointSource& inner, int failOnCall)
        : inner_(inner), failOnCall_(failOnCall) {}

    BoundingBox globalBounds(const std::optional<Provenance>& filter) const override {
        if (failOnCall_ == 0) throw SourceUnavailable("connection refused");
        return inner_.globalBounds(filter);
    }

    std::vector<StarPoint> pointsIn(const BoundingBox& box,
                                    const std::optional<Provenance>& filter) const override {
        if (++calls_ >= failOnCall_) throw SourceUnavailable("connection reset by peer");
        return inner_.pointsIn(box, filter);
    }

private:
    const PointSource& inner_;
    int failOnCall_;
    mutable std::atomic<int> calls_{0};
};

void test_query_failure_aborts_build() {
    // two stars per octant of the root, root splits, children are leaves
    std::vector<StarPoint> stars;
    for (int b = 0; b < 8; ++b) {
        double sx = (b & 4) ? 1.0 : -1.0;
        double sy = (b & 2) ? 1.0 : -1.0;
        double sz = (b & 1) ? 1.0 : -1.0;
        stars.push_back({ {sx * 10.0, sy * 10.0, sz * 10.0}, 1.0f, Provenance::Observed });
        stars.push_back({ {sx * 5.0,  sy * 5.0,  sz * 5.0},  2.0f, Provenance::Observed });
    }
    MemoryPointSource inner(stars);

    fs::path dir = makeTempDir("export_fail");
    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 4;
    cfg.maxDepth = 1;

    // call 1 = root, 2 = 1-0, 3 = 1-1 -> fails
    FailingSource failing(inner, 3);
    bool aborted = false;
    try {
        buildOctreeExport_seq(failing, cfg);
    } catch (const BuildAborted& e) {
        aborted = true;
        assert(e.node == childKey(NodeKey{}, 1));
        assert(e.deepestDepth == 1);
        assert(e.reason == "connection reset by peer");
        assert(std::string(e.what()).find("1-1") != std::string::npos);
    }
    assert(aborted);

    // what got written before the failure stays, nothing after it
    assert(fs::exists(dir / "0-0-0-0.bin"));
    assert(fs::exists(dir / "1-0.bin"));
    assert(!fs::exists(dir / "1-1.bin"));
    assert(!fs::exists(dir / "1-2.bin"));

    // parallel build fails the same way (which node depends on scheduling)
    fs::path dir2 = makeTempDir("export_fail_par");
    cfg.outputDir = dir2.string();
    FailingSource failingPar(inner, 5);
    assert(throwsType<BuildAborted>([&] { buildOctreeExport(failingPar, cfg); }));

    // global bounds failure: aborted at the root, nothing written
    fs::path dir3 = makeTempDir("export_fail_bounds");
    cfg.outputDir = dir3.string();
    FailingSource noBounds(inner, 0);
    bool rootAbort = false;
    try {
        buildOctreeExport(noBounds, cfg);
    } catch (const BuildAborted& e) {
        rootAbort = true;
        assert(e.node.isRoot());
        assert(e.deepestDepth == 0);
    }
    assert(rootAbort);
    assert(countFiles(dir3) == 0);

    fs::remove_all(dir);
    fs::remove_all(dir2);
    fs::remove_all(dir3);
    std::cout << "test_query_failure_aborts_build PASSED\n";
}

void test_write_failure_aborts_build() {
    fs::path dir = makeTempDir("export_write_fail");
    fs::path blocker = dir / "not_a_dir";
    writeAllBytes(blocker, {'x'});

    MemoryPointSource source(randomStars(10, 5));
    ExportConfig cfg = testConfig(blocker / "octree");

    bool aborted = false;
    try {
        buildOctreeExport_seq(source, cfg);
    } catch (const BuildAborted& e) {
        aborted = true;
        assert(e.node.isRoot());
    }
    assert(aborted);

    fs::remove_all(dir);
    std::cout << "test_write_failure_aborts_build PASSED\n";
}

void test_reexport_replaces_old_tree() {
    fs::path dir = makeTempDir("export_twice");
    MemoryPointSource source(randomStars(3000, 17));

    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 100;
    cfg.maxDepth = 3;
    BuildStats first = buildOctreeExport_seq(source, cfg);
    assert(first.nodes > 9);

    // leftovers a crashed run could leave, plus a file that isn't ours
    writeAllBytes(dir / "1-3.bin.tmp", std::vector<char>(2, 0));
    writeAllBytes(dir / "notes.txt", std::vector<char>{'h', 'i'});

    // coarser settings: the whole catalog now fits in the root
    cfg.maxPointsPerNode = 5000;
    BuildStats second = buildOctreeExport(source, cfg);
    assert(second.nodes == 1 && second.leaves == 1);
    assert(second.starsWritten == 3000);

    // only the new root and the foreign file are left
    assert(countFiles(dir) == 2);
    assert(fs::exists(dir / "notes.txt"));
    assert(fs::file_size(dir / "0-0-0-0.bin") == nodeFileSize(3000));

    InspectReport report = inspectOctreeDir(dir.string());
    assert(report.ok());
    assert(report.totalNodes == 1);
    assert(report.leftoverTemps.empty());

    fs::remove_all(dir);
    std::cout << "test_reexport_replaces_old_tree PASSED\n";
}

void test_non_finite_bounds_abort_build() {
    fs::path dir = makeTempDir("export_inf");
    std::vector<StarPoint> stars = randomStars(300, 21);
    stars[150].position.x = INFINITY;
    MemoryPointSource source(stars);

    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 100;
    cfg.maxDepth = 2;

    bool aborted = false;
    try {
        buildOctreeExport(source, cfg);
    } catch (const BuildAborted& e) {
        aborted = true;
        assert(e.node.isRoot());
        assert(e.deepestDepth == 0);
        assert(e.reason == "global bounds are not finite");
    }
    assert(aborted);
    // nothing written, not even a root
    assert(countFiles(dir) == 0);

    fs::remove_all(dir);
    std::cout << "test_non_finite_bounds_abort_build PASSED\n";
}

void test_inspect_exported_tree() {
    fs::path dir = makeTempDir("export_inspect");
    MemoryPointSource source(randomStars(3000, 99));
    ExportConfig cfg = testConfig(dir);
    cfg.maxPointsPerNode = 200;
    cfg.maxDepth = 3;

    BuildStats stats = buildOctreeExport(source, cfg);

    InspectReport report = inspectOctreeDir(dir.string());
    assert(report.ok());
    assert(report.hasRoot);
    assert(report.totalNodes == stats.nodes);
    assert(report.totalStars == stats.starsWritten);
    assert(report.perDepth.at(0).nodes == 1);
    assert(report.perDepth.at(1).nodes == 8);

    // now break it in every way the inspector knows about
    writeAllBytes(dir / "4-0-0-0-0.bin", std::vector<char>(4, 0));  // no depth 3 nodes, parent missing
    writeAllBytes(dir / "junk.bin", std::vector<char>(4, 0));
    writeAllBytes(dir / "1-0.bin", std::vector<char>{ (char)0xF6, (char)0xFF, (char)0xFF, (char)0xFF });  // -10
    writeAllBytes(dir / "1-1.bin.tmp", std::vector<char>(2, 0));

    InspectReport broken = inspectOctreeDir(dir.string());
    assert(!broken.ok());
    assert(broken.orphans.size() == 1 && broken.orphans[0] == "4-0-0-0-0.bin");
    assert(broken.badNames.size() == 1 && broken.badNames[0] == "junk.bin");
    assert(broken.corruptFiles.size() == 1);
    assert(broken.corruptFiles[0].find("1-0.bin") == 0);
    assert(broken.leftoverTemps.size() == 1);

    assert(throwsType<SourceUnavailable>([&] { inspectOctreeDir((dir / "nope").string()); }));

    fs::remove_all(dir);
    std::cout << "test_inspect_exported_tree PASSED\n";
}

int main() {
    test_should_split();
    test_lod_subset_brightest();
    test_lod_keep_count();
    test_lod_ties_are_stable();
    test_validate_config();
    test_small_dataset_is_single_leaf();
    test_empty_dataset_writes_empty_root();
    test_split_tree_invariants();
    test_depth_ceiling();
    test_parallel_matches_sequential();
    test_provenance_filter();
    test_query_failure_aborts_build();
    test_write_failure_aborts_build();
    test_reexport_replaces_old_tree();
    test_non_finite_bounds_abort_build();
    test_inspect_exported_tree();
    std::cout << "All octree export tests PASSED\n";
    return 0;
}
