#include "AtomicFile.hpp"
#include "PapercutErrors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

using namespace std;
namespace fs = std::filesystem;

namespace Papercut {

namespace {

void writeBytes(const string& finalPath, const char* data, size_t size) {
    const string tmp = AtomicFile::temporaryPath(finalPath);
    {
        ofstream f(tmp, ios::binary | ios::trunc);
        if (!f) {
            throw ExportIOError(finalPath, string("cannot open for writing: ") + strerror(errno));
        }
        f.write(data, static_cast<streamsize>(size));
        f.flush();
        if (!f) {
            f.close();
            AtomicFile::discard(tmp);
            throw ExportIOError(finalPath, "write failed (disk full?)");
        }
    }
    AtomicFile::commit(tmp, finalPath);
}

} // namespace

string AtomicFile::temporaryPath(const string& finalPath) {
    return finalPath + ".tmp";
}

void AtomicFile::write(const string& finalPath, const vector<unsigned char>& data) {
    writeBytes(finalPath, reinterpret_cast<const char*>(data.data()), data.size());
}

void AtomicFile::write(const string& finalPath, const string& data) {
    writeBytes(finalPath, data.data(), data.size());
}

void AtomicFile::commit(const string& tempPath, const string& finalPath) {
    error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        discard(tempPath);
        throw ExportIOError(finalPath, "cannot move into place: " + ec.message());
    }
}

void AtomicFile::discard(const string& tempPath) {
    error_code ec;
    fs::remove(tempPath, ec);
}

} // namespace Papercut
