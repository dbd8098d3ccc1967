// Binary node file encode / decode
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "errors.hpp"
#include "record_codec.hpp"

namespace fs = std::filesystem;

// ---- byte order helpers ----
// always go through unsigned ints and shift so the file layout doesn't depend
// on the host being little endian

static void putUint32LE(char* dst, uint32_t v) {
    dst[0] = (char)(v & 0xFF);
    dst[1] = (char)((v >> 8) & 0xFF);
    dst[2] = (char)((v >> 16) & 0xFF);
    dst[3] = (char)((v >> 24) & 0xFF);
}

static uint32_t getUint32LE(const char* src) {
    const unsigned char* s = reinterpret_cast<const unsigned char*>(src);
    return (uint32_t)s[0]
         | ((uint32_t)s[1] << 8)
         | ((uint32_t)s[2] << 16)
         | ((uint32_t)s[3] << 24);
}

void putInt32LE(char* dst, int32_t v) {
    putUint32LE(dst, (uint32_t)v);
}

void putFloat32LE(char* dst, float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    putUint32LE(dst, bits);
}

void putFloat64LE(char* dst, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    putUint32LE(dst, (uint32_t)(bits & 0xFFFFFFFFu));
    putUint32LE(dst + 4, (uint32_t)(bits >> 32));
}

int32_t getInt32LE(const char* src) {
    return (int32_t)getUint32LE(src);
}

float getFloat32LE(const char* src) {
    uint32_t bits = getUint32LE(src);
    float v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

double getFloat64LE(const char* src) {
    uint64_t bits = (uint64_t)getUint32LE(src) | ((uint64_t)getUint32LE(src + 4) << 32);
    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

// ---- node encode / decode ----

std::vector<char> encodeNode(const std::vector<StarPoint>& stars) {
    if (stars.size() > (size_t)INT32_MAX) {
        throw NodeWriteError("node has " + std::to_string(stars.size())
                             + " stars, more than an int32 header can hold");
    }

    std::vector<char> buf(nodeFileSize(stars.size()));
    putInt32LE(buf.data(), (int32_t)stars.size());

    char* rec = buf.data() + kNodeHeaderBytes;
    for (const StarPoint& s : stars) {
        putFloat32LE(rec + 0,  (float)s.position.x);
        putFloat32LE(rec + 4,  (float)s.position.y);
        putFloat32LE(rec + 8,  (float)s.position.z);
        putFloat32LE(rec + 12, s.magnitude);
        putInt32LE(rec + 16,   provenanceCode(s.provenance));
        rec += kNodeRecordBytes;
    }
    return buf;
}

std::vector<StarPoint> decodeNode(const char* data, size_t size) {
    if (size < kNodeHeaderBytes) {
        throw CorruptRecord("node data is " + std::to_string(size)
                            + " bytes, shorter than the 4 byte header");
    }

    int32_t n = getInt32LE(data);
    if (n < 0) {
        throw CorruptRecord("invalid star count: " + std::to_string(n));
    }

    size_t expected = nodeFileSize((size_t)n);
    if (size != expected) {
        throw CorruptRecord("header says " + std::to_string(n) + " stars ("
                            + std::to_string(expected) + " bytes) but got "
                            + std::to_string(size) + " bytes");
    }

    std::vector<StarPoint> stars;
    stars.reserve((size_t)n);

    const char* rec = data + kNodeHeaderBytes;
    for (int32_t i = 0; i < n; ++i) {
        int32_t code = getInt32LE(rec + 16);
        auto prov = provenanceFromCode(code);
        if (!prov) {
            throw CorruptRecord("record " + std::to_string(i)
                                + " has unknown provenance code " + std::to_string(code));
        }

        StarPoint s;
        s.position.x = getFloat32LE(rec + 0);
        s.position.y = getFloat32LE(rec + 4);
        s.position.z = getFloat32LE(rec + 8);
        s.magnitude  = getFloat32LE(rec + 12);
        s.provenance = *prov;
        stars.push_back(s);

        rec += kNodeRecordBytes;
    }
    return stars;
}

std::vector<StarPoint> readNode(std::istream& in) {
    std::vector<char> buf((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
    return decodeNode(buf.data(), buf.size());
}

// ---- files ----

void writeNodeFile(const std::string& path, const std::vector<StarPoint>& stars) {
    std::vector<char> buf = encodeNode(stars);

    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw NodeWriteError("cannot create directory " + target.parent_path().string()
                                 + ": " + ec.message());
        }
    }

    // write next to the target then rename, so readers never see half a file
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw NodeWriteError("cannot open " + tmp.string() + " for writing");
        }
        out.write(buf.data(), (std::streamsize)buf.size());
        out.flush();
        if (!out) {
            throw NodeWriteError("write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw NodeWriteError("cannot rename " + tmp.string() + " to " + target.string()
                             + ": " + reason);
    }
}

std::vector<StarPoint> readNodeFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CorruptRecord("cannot open node file: " + path);
    }
    try {
        return readNode(in);
    } catch (const CorruptRecord& e) {
        throw CorruptRecord(path + ": " + e.what());
    }
}
