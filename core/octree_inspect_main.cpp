// Checks an exported octree directory the way a loader would see it
// Usage: ./octree_inspect <octree_dir>
#include <filesystem>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "octree_inspect.hpp"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <octree_dir>\n";
        return 1;
    }

    std::string dir = argv[1];
    try {
        InspectReport report = inspectOctreeDir(dir);
        std::cout << "Octree directory: " << dir << "\n";
        printInspectReport(report, std::cout);
        return report.ok() ? 0 : 1;
    } catch (const OctreeError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
