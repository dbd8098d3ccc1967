#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "utils.hpp"

// Node file format, little endian, no padding:
//
//   header   int32    num_stars            (>= 0)
//   body     num_stars records of 20 bytes:
//              float32  x, y, z            (meters)
//              float32  magnitude
//              int32    provenance code    (0=OBSERVED 1=INFERRED 2=SIMULATED)
//
// so a valid file is always exactly 4 + 20 * num_stars bytes. an empty
// region is just the 4 byte header.
constexpr size_t kNodeHeaderBytes = 4;
constexpr size_t kNodeRecordBytes = 20;

inline size_t nodeFileSize(size_t numStars) {
    return kNodeHeaderBytes + kNodeRecordBytes * numStars;
}

// positions are narrowed to float32 here, that's the format
std::vector<char> encodeNode(const std::vector<StarPoint>& stars);

// throws CorruptRecord on negative count, bad size or unknown provenance code
std::vector<StarPoint> decodeNode(const char* data, size_t size);

// reads the whole stream, same checks as decodeNode
std::vector<StarPoint> readNode(std::istream& in);

// writes <path>.tmp then renames it over path, creating parent dirs.
// throws NodeWriteError
void writeNodeFile(const std::string& path, const std::vector<StarPoint>& stars);

// throws CorruptRecord (also when the file can't be opened)
std::vector<StarPoint> readNodeFile(const std::string& path);

// little endian helpers, shared with the catalog reader
void putInt32LE(char* dst, int32_t v);
void putFloat32LE(char* dst, float v);
void putFloat64LE(char* dst, double v);
int32_t getInt32LE(const char* src);
float getFloat32LE(const char* src);
double getFloat64LE(const char* src);
