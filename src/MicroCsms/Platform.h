// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_PLATFORM_H
#define MC_PLATFORM_H

#include <stdint.h>

#define MC_PLATFORM_NONE    0
#define MC_PLATFORM_UNIX    3

#ifndef MC_PLATFORM
#define MC_PLATFORM MC_PLATFORM_UNIX
#endif

namespace MicroCsms {

void (*getDefaultDebugCb())(const char*);
int32_t (*getDefaultUnixTimeCb())();

} //namespace MicroCsms

#ifndef MC_MAX_JSON_CAPACITY
#define MC_MAX_JSON_CAPACITY 65536
#endif

#ifndef MC_FILENAME_PREFIX
#define MC_FILENAME_PREFIX "./csms_store/"
#endif

#endif
