#include "ZipArchive.hpp"
#include <cstring>
#include <stdexcept>

#define MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#include <miniz.h>

using namespace std;

namespace Papercut {

struct ZipArchive::Writer {
    mz_zip_archive zip;
    bool open = false;
};

ZipArchive::ZipArchive()
    : m_writer(new Writer) {
    memset(&m_writer->zip, 0, sizeof(m_writer->zip));
    if (!mz_zip_writer_init_heap(&m_writer->zip, 0, 64 * 1024)) {
        throw runtime_error(string("Failed to create ZIP archive: ") +
                            mz_zip_get_error_string(mz_zip_get_last_error(&m_writer->zip)));
    }
    m_writer->open = true;
}

ZipArchive::~ZipArchive() {
    if (m_writer && m_writer->open) {
        mz_zip_writer_end(&m_writer->zip);
    }
}

void ZipArchive::addFile(const string& name, const string& content, bool compress) {
    if (m_finished) {
        throw runtime_error("ZIP archive already finished, cannot add " + name);
    }

    const mz_uint level = compress ? MZ_BEST_COMPRESSION : MZ_NO_COMPRESSION;
    if (!mz_zip_writer_add_mem(&m_writer->zip, name.c_str(), content.data(), content.size(), level)) {
        throw runtime_error("Failed to add " + name + " to ZIP archive: " +
                            mz_zip_get_error_string(mz_zip_get_last_error(&m_writer->zip)));
    }
    m_entryCount++;
}

vector<unsigned char> ZipArchive::finish() {
    if (m_finished) {
        throw runtime_error("ZIP archive already finished");
    }
    m_finished = true;

    void* buffer = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&m_writer->zip, &buffer, &size)) {
        string error = mz_zip_get_error_string(mz_zip_get_last_error(&m_writer->zip));
        mz_zip_writer_end(&m_writer->zip);
        m_writer->open = false;
        throw runtime_error("Failed to finalize ZIP archive: " + error);
    }

    const unsigned char* bytes = static_cast<const unsigned char*>(buffer);
    vector<unsigned char> archive(bytes, bytes + size);
    mz_free(buffer);

    mz_zip_writer_end(&m_writer->zip);
    m_writer->open = false;
    return archive;
}

} // namespace Papercut
