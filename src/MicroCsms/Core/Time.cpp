// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>
#include <stdio.h>
#include <ctype.h>

#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
int noDays(int month, int year) {
    return (month == 0 || month == 2 || month == 4 || month == 6 || month == 7 || month == 9 || month == 11) ? 31 :
            ((month == 3 || month == 5 || month == 8 || month == 10) ? 30 :
            ((year % 4 == 0 && (year % 100 != 0 || year % 400 == 0)) ? 29 : 28));
}
} //namespace MicroCsms

using namespace MicroCsms;

bool Timestamp::isDefined() const {
    return time != 0;
}

int32_t Timestamp::toUnixTime() const {
    return time;
}

bool Timestamp::operator==(const Timestamp& other) const {
    return time == other.time;
}

bool Timestamp::operator!=(const Timestamp& other) const {
    return time != other.time;
}

bool Timestamp::operator<(const Timestamp& other) const {
    return time < other.time;
}

Clock::Clock() : unixTimeCb(getDefaultUnixTimeCb()) {

}

void Clock::setUnixTimeCb(int32_t (*unixTimeCb)()) {
    this->unixTimeCb = unixTimeCb;
}

Timestamp Clock::now() const {
    Timestamp t;
    if (!unixTimeCb) {
        MC_DBG_ERR("no time source");
        return t;
    }
    if (!fromUnixTime(t, unixTimeCb())) {
        MC_DBG_ERR("time source out of range");
    }
    return t;
}

bool Clock::delta(const Timestamp& t2, const Timestamp& t1, int32_t& dt) const {
    //dt = t2 - t1
    if (!t1.isDefined() || !t2.isDefined()) {
        return false;
    }

    dt = t2.time - t1.time;
    return true;
}

bool Clock::add(Timestamp& t, int32_t secs) const {
    if (!t.isDefined()) {
        return false;
    }

    if ((secs > 0 && t.time > MC_MAX_TIME - secs) ||
            (secs < 0 && t.time < MC_MIN_TIME - secs)) {
        MC_DBG_ERR("timestamp out of range");
        return false;
    }

    t.time += secs;
    return true;
}

bool Clock::fromUnixTime(Timestamp& dst, int32_t unixTimeInt) const {
    if (unixTimeInt < MC_MIN_TIME || unixTimeInt > MC_MAX_TIME) {
        return false;
    }
    dst.time = unixTimeInt;
    return true;
}

bool Clock::toJsonString(const Timestamp& src, char *dst, size_t size) const {

    if (!src.isDefined()) {
        return false;
    }

    if (size < MC_JSONDATE_SIZE) {
        return false;
    }

    int32_t time = src.time;

    int year = 1970;
    int month = 0;
    while (time - (noDays(month, year) * 24 * 3600) >= 0) {
        time -= noDays(month, year) * 24 * 3600;
        month++;
        if (month >= 12) {
            year++;
            month = 0;
        }
    }

    int day = time / (24 * 3600);
    time %= 24 * 3600;
    int hour = time / 3600;
    time %= 3600;
    int minute = time / 60;
    time %= 60;
    int second = time;

    // first month of the year is '1' and first day of the month is '1'
    month++;
    day++;

    auto ret = snprintf(dst, size, "%04i-%02i-%02iT%02i:%02i:%02iZ",
            year, month, day, hour, minute, second);

    if (ret < 0 || (size_t)ret >= size) {
        return false;
    }

    return true;
}

bool Clock::parseString(const char *src, Timestamp& dst) const {

    const size_t JSONDATE_MINLENGTH = 19;

    if (!src || strlen(src) < JSONDATE_MINLENGTH) {
        return false;
    }

    if (!isdigit((unsigned char) src[0]) ||  //2
        !isdigit((unsigned char) src[1]) ||    //0
        !isdigit((unsigned char) src[2]) ||    //1
        !isdigit((unsigned char) src[3]) ||    //3
        src[4] != '-' ||       //-
        !isdigit((unsigned char) src[5]) ||    //0
        !isdigit((unsigned char) src[6]) ||    //2
        src[7] != '-' ||       //-
        !isdigit((unsigned char) src[8]) ||    //0
        !isdigit((unsigned char) src[9]) ||    //1
        src[10] != 'T' ||      //T
        !isdigit((unsigned char) src[11]) ||   //2
        !isdigit((unsigned char) src[12]) ||   //0
        src[13] != ':' ||      //:
        !isdigit((unsigned char) src[14]) ||   //5
        !isdigit((unsigned char) src[15]) ||   //3
        src[16] != ':' ||      //:
        !isdigit((unsigned char) src[17]) ||   //3
        !isdigit((unsigned char) src[18])) {   //2
                                        //ignore subsequent characters
        return false;
    }

    int year  =  (src[0] - '0') * 1000 +
                (src[1] - '0') * 100 +
                (src[2] - '0') * 10 +
                (src[3] - '0');
    int month =  (src[5] - '0') * 10 +
                (src[6] - '0') - 1;
    int day   =  (src[8] - '0') * 10 +
                (src[9] - '0') - 1;
    int hour  =  (src[11] - '0') * 10 +
                (src[12] - '0');
    int minute = (src[14] - '0') * 10 +
                (src[15] - '0');
    int second = (src[17] - '0') * 10 +
                (src[18] - '0');

    if (year < 1970 || year >= 2038 ||
        month < 0 || month >= 12 ||
        day < 0 || day >= noDays(month, year) ||
        hour < 0 || hour >= 24 ||
        minute < 0 || minute >= 60 ||
        second < 0 || second > 60) { //tolerate leap seconds -- (23:59:60) can be a valid time
        return false;
    }

    int32_t time = 0;

    for (int y = 1970; y < year; y++) {
        for (int m = 0; m < 12; m++) {
            time += noDays(m, y) * 24 * 3600;
        }
    }

    for (int m = 0; m < month; m++) {
        time += noDays(m, year) * 24 * 3600;
    }

    time += day * 24 * 3600;
    time += hour * 3600;
    time += minute * 60;
    time += second;

    if (time < MC_MIN_TIME || time > MC_MAX_TIME) {
        MC_DBG_ERR("only accept time range from year 2010 to 2037");
        return false;
    }

    dst.time = time;
    return true;
}
