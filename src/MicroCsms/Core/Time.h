// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_TIME_H
#define MC_TIME_H

#include <stdint.h>
#include <stddef.h>

#include <MicroCsms/Platform.h>

#define JSONDATE_LENGTH 20   //ISO 8601 date length, excluding the terminating zero
#define MC_JSONDATE_SIZE (JSONDATE_LENGTH + 1)

#define MC_MIN_TIME (((2010 - 1970) * 365 + 10) * 24 * 3600) // unix time for 2010-01-01Z00:00:00T (= 40 years + 10 leap days, in seconds)
#define MC_MAX_TIME (((2037 - 1970) * 365 + 17) * 24 * 3600) // unix time for 2037-01-01Z00:00:00T (= 67 years + 17 leap days, in seconds)

namespace MicroCsms {

class Clock;

/*
 * Point in time with second resolution. A default-constructed Timestamp is undefined, e.g. a charger
 * which has never sent a Heartbeat
 */
class Timestamp {
private:
    int32_t time = 0; //Unix time (number of seconds since Jan 1, 1970 UTC, not counting leap seconds). 0 = undefined
public:
    Timestamp() = default;

    bool isDefined() const;
    int32_t toUnixTime() const;

    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const;
    bool operator<(const Timestamp& other) const;

friend class Clock;
};

class Clock {
private:
    int32_t (*unixTimeCb)() = nullptr;
public:
    Clock();

    void setUnixTimeCb(int32_t (*unixTimeCb)());

    Timestamp now() const;

    /*
     * Time delta between two timestamps. Calculates t2 - t1, writes the result in seconds into dt and
     * returns true, if successful and false if one of the timestamps is undefined.
     */
    bool delta(const Timestamp& t2, const Timestamp& t1, int32_t& dt) const;

    /*
     * Add secs seconds to `t`. Returns false if t is undefined or if the result would leave the range
     * of valid unix times
     */
    bool add(Timestamp& t, int32_t secs) const;

    bool fromUnixTime(Timestamp& dst, int32_t unixTimeInt) const;

    /*
     * Print the ISO8601 represenation of t into dst, having `size` bytes. Fails if t is undefined.
     * `size` must be at least MC_JSONDATE_SIZE
     */
    bool toJsonString(const Timestamp& t, char *dst, size_t size) const;

    /*
     * Expects a date string like
     * 2020-10-01T20:53:32.486Z
     *
     * Fractional seconds and a trailing 'Z' are tolerated and dropped. Returns true on success and
     * false if the string is not a JSON date
     */
    bool parseString(const char *src, Timestamp& dst) const;
};

} //namespace MicroCsms

#endif
