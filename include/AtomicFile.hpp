#pragma once

#include <string>
#include <vector>

namespace Papercut {

// Writes go to "<path>.tmp" and are renamed into place, so a failed or
// interrupted export never leaves a partial file at the final path.
class AtomicFile {
public:
    static std::string temporaryPath(const std::string& finalPath);

    // Throws ExportIOError on failure; the temporary file is removed
    static void write(const std::string& finalPath, const std::vector<unsigned char>& data);
    static void write(const std::string& finalPath, const std::string& data);

    // Renames an already written temporary file into place
    static void commit(const std::string& tempPath, const std::string& finalPath);
    static void discard(const std::string& tempPath);
};

} // namespace Papercut
