#pragma once

#include <stdexcept>
#include <string>

namespace Papercut {

// Base for pipeline failures. stage() names the step that raised it.
class PapercutError : public std::runtime_error {
public:
    PapercutError(const std::string& stage, const std::string& message)
        : std::runtime_error("[" + stage + "] " + message), m_stage(stage) {}

    const std::string& stage() const noexcept { return m_stage; }

private:
    std::string m_stage;
};

// Source cannot be decoded or has zero area
class InvalidImageError : public PapercutError {
public:
    explicit InvalidImageError(const std::string& message)
        : PapercutError("normalize", message) {}
};

// Nothing left to cut after extraction
class EmptyMaskError : public PapercutError {
public:
    explicit EmptyMaskError(const std::string& message)
        : PapercutError("extract", message) {}
};

// A contour collapsed during tracing or smoothing
class DegenerateGeometryError : public PapercutError {
public:
    explicit DegenerateGeometryError(const std::string& message)
        : PapercutError("vectorize", message) {}
};

// An artifact could not be written
class ExportIOError : public PapercutError {
public:
    ExportIOError(const std::string& path, const std::string& message)
        : PapercutError("export", path + ": " + message), m_path(path) {}

    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
};

} // namespace Papercut
