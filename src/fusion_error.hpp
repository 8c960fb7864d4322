#pragma once

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// FusionError — base for fatal per-instrument failures
// ---------------------------------------------------------------------------
class FusionError : public std::runtime_error {
public:
    explicit FusionError(const std::string& what) : std::runtime_error(what) {}
};

// A timeline cannot host a series (series is finer than the timeline).
// Configuration-time error.
class GranularityMismatch : public FusionError {
public:
    explicit GranularityMismatch(const std::string& what)
        : FusionError("GranularityMismatch: " + what) {}
};

// Two blocks disagree on the timeline they are indexed by. Indicates a build
// defect rather than a data defect.
class IncompatibleIndex : public FusionError {
public:
    explicit IncompatibleIndex(const std::string& what)
        : FusionError("IncompatibleIndex: " + what) {}
};
