// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_DEBUG_H
#define MC_DEBUG_H

#include <mutex>

#include <MicroCsms/Platform.h>

#define MC_DL_NONE 0x00     //suppress all output to the console
#define MC_DL_ERROR 0x01    //report failures
#define MC_DL_WARN 0x02     //report observed or assumed inconsistent state
#define MC_DL_INFO 0x03     //inform about internal state changes
#define MC_DL_DEBUG 0x04    //relevant info for debugging
#define MC_DL_VERBOSE 0x05  //all output

#ifndef MC_DBG_LEVEL
#define MC_DBG_LEVEL MC_DL_INFO  //default
#endif

#ifndef MC_DBG_ENDL
#define MC_DBG_ENDL "\n"
#endif

#ifndef MC_DBG_MAXMSGSIZE
#define MC_DBG_MAXMSGSIZE 512
#endif

namespace MicroCsms {

/*
 * Console output of the server. Sessions run on their own threads, so every print is serialized by
 * a mutex and the message buffer is shared between the threads.
 */
class Debug {
private:
    void (*debugCb)(const char *msg) = nullptr;
    void (*debugCb2)(int lvl, const char *fn, int line, const char *msg) = nullptr;

    std::mutex mutex;
    char buf [MC_DBG_MAXMSGSIZE] = {'\0'};
    int dbgLevel = MC_DBG_LEVEL;
public:
    Debug() = default;

    void setDebugCb(void (*debugCb)(const char *msg));
    void setDebugCb2(void (*debugCb2)(int lvl, const char *fn, int line, const char *msg));

    void setDebugLevel(int dbgLevel);
    int getDebugLevel();

    bool setup();

    void operator()(int lvl, const char *fn, int line, const char *format, ...);
};

extern Debug debug;
} //namespace MicroCsms

#if MC_DBG_LEVEL >= MC_DL_ERROR
#define MC_DBG_ERR(...) MicroCsms::debug(MC_DL_ERROR, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_ERR(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_WARN
#define MC_DBG_WARN(...) MicroCsms::debug(MC_DL_WARN, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_WARN(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_INFO
#define MC_DBG_INFO(...) MicroCsms::debug(MC_DL_INFO, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_INFO(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_DEBUG
#define MC_DBG_DEBUG(...) MicroCsms::debug(MC_DL_DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_DEBUG(...) (void)0
#endif

#if MC_DBG_LEVEL >= MC_DL_VERBOSE
#define MC_DBG_VERBOSE(...) MicroCsms::debug(MC_DL_VERBOSE, __FILE__, __LINE__, __VA_ARGS__)
#else
#define MC_DBG_VERBOSE(...) (void)0
#endif

#endif
