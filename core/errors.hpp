#pragma once
#include <stdexcept>
#include <string>

// base for everything the exporter throws on purpose
struct OctreeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// point store can't be reached (file missing, read failed mid-scan...)
// fatal for the whole build
struct SourceUnavailable : OctreeError {
    using OctreeError::OctreeError;
};

// no point matched the query for global bounds. the builder turns this
// into a single empty root file instead of failing
struct EmptyDataset : OctreeError {
    using OctreeError::OctreeError;
};

// node file or catalog that doesn't decode (negative count, bad size, unknown
// provenance code). only fatal to the read that hit it
struct CorruptRecord : OctreeError {
    using OctreeError::OctreeError;
};

// rejected before any I/O happens
struct InvalidConfiguration : OctreeError {
    using OctreeError::OctreeError;
};

// couldn't create / write / rename a node file
struct NodeWriteError : OctreeError {
    using OctreeError::OctreeError;
};
