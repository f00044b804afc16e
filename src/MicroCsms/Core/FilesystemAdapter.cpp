// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <cstdio>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>

#include <MicroCsms/Core/FilesystemAdapter.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

class PosixFileAdapter : public FileAdapter {
    FILE *file {nullptr};
public:
    PosixFileAdapter(FILE *file) : file(file) {}

    ~PosixFileAdapter() {
        if (file) {
            fclose(file);
        }
    }

    size_t read(char *buf, size_t len) override {
        return fread(buf, 1, len, file);
    }

    size_t write(const char *buf, size_t len) override {
        return fwrite(buf, 1, len, file);
    }

    size_t seek(size_t offset) override {
        return fseek(file, offset, SEEK_SET);
    }

    int read() override {
        return fgetc(file);
    }

    bool close() override {
        if (!file) {
            return false;
        }
        auto ret = fclose(file);
        file = nullptr;
        return ret == 0;
    }
};

class PosixFilesystemAdapter : public FilesystemAdapter {
private:
    std::string prefix;

    bool printPath(char *path, size_t size, const char *fn) {
        auto ret = snprintf(path, size, "%s%s", prefix.c_str(), fn);
        if (ret < 0 || (size_t)ret >= size) {
            MC_DBG_ERR("fn too long: %s", fn);
            return false;
        }
        return true;
    }
public:
    PosixFilesystemAdapter(const char *pathPrefix) : prefix(pathPrefix) { }

    ~PosixFilesystemAdapter() = default;

    int stat(const char *fn, size_t *size) override {
        char path [MC_MAX_PATH_SIZE];
        if (!printPath(path, sizeof(path), fn)) {
            return -1;
        }
        struct ::stat st;
        auto ret = ::stat(path, &st);
        if (ret == 0) {
            *size = st.st_size;
        }
        return ret;
    }

    std::unique_ptr<FileAdapter> open(const char *fn, const char *mode) override {
        char path [MC_MAX_PATH_SIZE];
        if (!printPath(path, sizeof(path), fn)) {
            return nullptr;
        }
        auto file = fopen(path, mode);
        if (file) {
            return std::unique_ptr<FileAdapter>(new PosixFileAdapter(file));
        } else {
            MC_DBG_DEBUG("Failed to open file path %s", path);
            return nullptr;
        }
    }

    bool remove(const char *fn) override {
        char path [MC_MAX_PATH_SIZE];
        if (!printPath(path, sizeof(path), fn)) {
            return false;
        }
        return ::remove(path) == 0;
    }

    int ftw_root(std::function<int(const char *fname)> fn) override {
        auto dir = opendir(prefix.c_str());
        if (!dir) {
            MC_DBG_ERR("cannot open root directory: %s", prefix.c_str());
            return -1;
        }

        int err = 0;
        while (auto entry = readdir(dir)) {
            if (entry->d_name[0] == '.') {
                continue; //skip ".", ".." and hidden files
            }
            err = fn(entry->d_name);
            if (err) {
                break;
            }
        }

        closedir(dir);
        return err;
    }
};

std::shared_ptr<FilesystemAdapter> makeDefaultFilesystemAdapter(const char *pathPrefix) {

    if (!pathPrefix || !*pathPrefix) {
        MC_DBG_ERR("invalid path prefix");
        return nullptr;
    }

    std::string dirPath = pathPrefix;
    if (dirPath.back() == '/' && dirPath.length() > 1) {
        dirPath.pop_back();
    }

    struct ::stat st;
    if (::stat(dirPath.c_str(), &st) != 0) {
        if (mkdir(dirPath.c_str(), 0755) != 0) {
            MC_DBG_ERR("cannot create store directory %s: %s", dirPath.c_str(), strerror(errno));
            return nullptr;
        }
        MC_DBG_INFO("created store directory %s", dirPath.c_str());
    } else if (!S_ISDIR(st.st_mode)) {
        MC_DBG_ERR("%s is not a directory", dirPath.c_str());
        return nullptr;
    }

    std::string prefix = pathPrefix;
    if (prefix.back() != '/') {
        prefix.push_back('/');
    }

    return std::make_shared<PosixFilesystemAdapter>(prefix.c_str());
}

} //namespace MicroCsms
