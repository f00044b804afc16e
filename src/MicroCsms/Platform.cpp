// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Platform.h>

#if MC_PLATFORM == MC_PLATFORM_UNIX
#include <stdio.h>
#include <time.h>

namespace MicroCsms {

void defaultDebugCbImpl(const char *msg) {
    printf("%s", msg);
}

int32_t defaultUnixTimeCbImpl() {
    return (int32_t) ::time(nullptr);
}

} //namespace MicroCsms
#else
namespace MicroCsms {
void (*defaultDebugCbImpl)(const char*) = nullptr;
int32_t (*defaultUnixTimeCbImpl)() = nullptr;
} //namespace MicroCsms
#endif

namespace MicroCsms {

void (*getDefaultDebugCb())(const char*) {
    return defaultDebugCbImpl;
}

int32_t (*getDefaultUnixTimeCb())() {
    return defaultUnixTimeCbImpl;
}

} //namespace MicroCsms
