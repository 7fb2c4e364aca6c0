#pragma once

#include <memory>
#include <string>
#include <vector>

namespace Papercut {

// In-memory ZIP container backed by miniz, enough for OOXML packages.
// Errors are reported as std::runtime_error.
class ZipArchive {
public:
    ZipArchive();
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    void addFile(const std::string& name, const std::string& content, bool compress = true);

    // Writes the central directory and returns the archive bytes.
    // No entries can be added afterwards.
    std::vector<unsigned char> finish();

    size_t entryCount() const { return m_entryCount; }

private:
    struct Writer;
    std::unique_ptr<Writer> m_writer;
    size_t m_entryCount = 0;
    bool m_finished = false;
};

} // namespace Papercut
