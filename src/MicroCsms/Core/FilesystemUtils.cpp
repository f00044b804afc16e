// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <vector>
#include <string>

#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

std::unique_ptr<JsonDoc> FilesystemUtils::loadJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn) {
    if (!filesystem || !fn || *fn == '\0') {
        return nullptr;
    }

    size_t fsize = 0;
    if (filesystem->stat(fn, &fsize) != 0) {
        MC_DBG_DEBUG("cannot find file: %s", fn);
        return nullptr;
    }

    if (fsize < 2) {
        MC_DBG_ERR("cannot load empty file: %s", fn);
        return nullptr;
    }

    auto file = filesystem->open(fn, "r");
    if (!file) {
        MC_DBG_ERR("could not open file %s", fn);
        return nullptr;
    }

    size_t capacity_init = (3 * fsize) / 2;

    //capacity = ceil capacity_init to the next power of two; should be at least 128

    size_t capacity = 128;
    while (capacity < capacity_init && capacity < MC_MAX_JSON_CAPACITY) {
        capacity *= 2;
    }
    if (capacity > MC_MAX_JSON_CAPACITY) {
        capacity = MC_MAX_JSON_CAPACITY;
    }

    std::unique_ptr<JsonDoc> doc;
    DeserializationError err = DeserializationError::NoMemory;
    ArduinoJsonFileAdapter fileReader {file.get()};

    while (err == DeserializationError::NoMemory && capacity <= MC_MAX_JSON_CAPACITY) {

        doc = makeJsonDoc(capacity);
        err = deserializeJson(*doc, fileReader);

        capacity *= 2;

        file->seek(0); //rewind file to beginning
    }

    if (err) {
        MC_DBG_ERR("Error deserializing file %s: %s", fn, err.c_str());
        //skip this file
        return nullptr;
    }

    MC_DBG_DEBUG("Loaded JSON file: %s", fn);

    return doc;
}

bool FilesystemUtils::storeJson(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, const JsonDoc& doc) {
    if (!filesystem || !fn || *fn == '\0') {
        return false;
    }

    if (doc.isNull() || doc.overflowed()) {
        MC_DBG_ERR("Invalid JSON %s", fn);
        return false;
    }

    auto file = filesystem->open(fn, "w");
    if (!file) {
        MC_DBG_ERR("could not open file %s", fn);
        return false;
    }

    ArduinoJsonFileAdapter fileWriter {file.get()};

    size_t written = serializeJson(doc, fileWriter);

    if (written < 2) {
        MC_DBG_ERR("Error writing file %s", fn);
        (void)file->close();
        return false;
    }

    if (!file->close()) {
        MC_DBG_ERR("Error writing file %s", fn);
        return false;
    }

    MC_DBG_DEBUG("Wrote JSON file: %s", fn);

    return true;
}

bool FilesystemUtils::appendJsonLine(std::shared_ptr<FilesystemAdapter> filesystem, const char *fn, const JsonDoc& doc) {
    if (!filesystem || !fn || *fn == '\0') {
        return false;
    }

    if (doc.isNull() || doc.overflowed()) {
        MC_DBG_ERR("Invalid JSON %s", fn);
        return false;
    }

    auto file = filesystem->open(fn, "a");
    if (!file) {
        MC_DBG_ERR("could not open file %s", fn);
        return false;
    }

    ArduinoJsonFileAdapter fileWriter {file.get()};

    size_t written = serializeJson(doc, fileWriter);
    written += file->write("\n", 1);

    if (written < 3) {
        MC_DBG_ERR("Error writing file %s", fn);
        (void)file->close();
        return false;
    }

    return file->close();
}

bool FilesystemUtils::remove_if(std::shared_ptr<FilesystemAdapter> filesystem, std::function<bool(const char*)> pred) {
    if (!filesystem) {
        return false;
    }

    std::vector<std::string> fnames;
    auto ret = filesystem->ftw_root([&fnames, &pred] (const char *fname) -> int {
        if (pred(fname)) {
            fnames.push_back(fname);
        }
        return 0;
    });

    if (ret != 0) {
        return false;
    }

    bool success = true;
    for (auto& fname : fnames) {
        if (!filesystem->remove(fname.c_str())) {
            MC_DBG_ERR("could not remove %s", fname.c_str());
            success = false;
        }
    }

    return success;
}
