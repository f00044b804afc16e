// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_FILESYSTEMADAPTER_H
#define MC_FILESYSTEMADAPTER_H

#include <memory>
#include <functional>
#include <string>

#include <MicroCsms/Platform.h>

#ifndef MC_MAX_PATH_SIZE
#define MC_MAX_PATH_SIZE 256
#endif

namespace MicroCsms {

class FileAdapter {
public:
    virtual ~FileAdapter() = default;
    virtual size_t read(char *buf, size_t len) = 0;
    virtual size_t write(const char *buf, size_t len) = 0;
    virtual size_t seek(size_t offset) = 0;

    virtual int read() = 0;

    virtual bool close() = 0; //flushes and closes the file. Returns false if the data could not be written
};

/*
 * File access relative to the store directory of the server. All file names passed to the adapter are
 * plain names without directory (e.g. "csms-config.jsn"), the adapter prepends its path prefix.
 */
class FilesystemAdapter {
public:
    virtual ~FilesystemAdapter() = default;
    virtual int stat(const char *fn, size_t *size) = 0;
    virtual std::unique_ptr<FileAdapter> open(const char *fn, const char *mode) = 0;
    virtual bool remove(const char *fn) = 0;
    virtual int ftw_root(std::function<int(const char *fname)> fn) = 0; //enumerate the files in the store folder
};

/*
 * POSIX implementation. Creates the store directory if it doesn't exist yet.
 *
 * Returns null if the store directory is not accessible
 */
std::shared_ptr<FilesystemAdapter> makeDefaultFilesystemAdapter(const char *pathPrefix = MC_FILENAME_PREFIX);

} //namespace MicroCsms

#endif
