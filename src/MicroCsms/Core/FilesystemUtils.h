// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_FILESYSTEMUTILS_H
#define MC_FILESYSTEMUTILS_H

#include <memory>

#include <MicroCsms/Core/Json.h>
#include <MicroCsms/Core/FilesystemAdapter.h>

namespace MicroCsms {

class ArduinoJsonFileAdapter {
private:
    FileAdapter *file;
public:
    ArduinoJsonFileAdapter(FileAdapter *file) : file(file) { }

    size_t readBytes(char *buf, size_t len) {
        return file->read(buf, len);
    }

    int read() {
        return file->read();
    }

    size_t write(const uint8_t *buf, size_t len) {
        return file->write((const char*) buf, len);
    }

    size_t write(uint8_t c) {
        return file->write((const char*) &c, 1);
    }
};

namespace FilesystemUtils {

/*
 * Returns the deserialized file content or nullptr if the file does not exist or cannot be parsed
 */
std::unique_ptr<JsonDoc> loadJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn);

bool storeJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, const JsonDoc& doc);

/*
 * Appends the serialized JSON value as a single line. Creates the file if it doesn't exist yet
 */
bool appendJsonLine(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, const JsonDoc& doc);

/*
 * Removes the files in the store folder for which `pred` returns true
 */
bool remove_if(std::shared_ptr<FilesystemAdapter> filesystem, std::function<bool(const char*)> pred);

} //namespace FilesystemUtils
} //namespace MicroCsms

#endif
