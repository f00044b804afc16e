// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <chrono>

#include <MicroCsms/Core/ScheduledTask.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

ScheduledTask::ScheduledTask(const char *name, std::function<void()> job) : name(name), job(job) {

}

ScheduledTask::~ScheduledTask() {
    stop();
}

bool ScheduledTask::start(std::function<unsigned long()> periodFn, unsigned long initialDelayMs) {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) {
        MC_DBG_WARN("%s already running", name.c_str());
        return false;
    }
    if (!job || !periodFn) {
        MC_DBG_ERR("invalid args");
        return false;
    }

    running = true;
    stopRequested = false;

    worker = std::thread([this, periodFn, initialDelayMs] () {
        MC_DBG_DEBUG("%s started", name.c_str());
        unsigned long delayMs = initialDelayMs;
        while (waitFor(delayMs)) {
            job();
            delayMs = periodFn();
        }
        MC_DBG_DEBUG("%s stopped", name.c_str());
    });

    return true;
}

void ScheduledTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return;
        }
        stopRequested = true;
    }
    cv.notify_all();

    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            MC_DBG_ERR("%s cannot stop itself", name.c_str());
            worker.detach();
        } else {
            worker.join();
        }
    }

    std::lock_guard<std::mutex> lock(mutex);
    running = false;
}

bool ScheduledTask::isRunning() {
    std::lock_guard<std::mutex> lock(mutex);
    return running && !stopRequested;
}

bool ScheduledTask::waitFor(unsigned long ms) {
    std::unique_lock<std::mutex> lock(mutex);
    if (ms == 0) {
        return !stopRequested;
    }
    cv.wait_for(lock, std::chrono::milliseconds(ms), [this] () {
        return stopRequested;
    });
    return !stopRequested;
}
