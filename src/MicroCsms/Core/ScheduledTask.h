// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_SCHEDULEDTASK_H
#define MC_SCHEDULEDTASK_H

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace MicroCsms {

/*
 * Runs a job periodically on a worker thread until stop() is called. stop() interrupts the waiting
 * period between two runs immediately and joins the worker
 */
class ScheduledTask {
private:
    std::string name;
    std::function<void()> job;

    std::thread worker;
    std::mutex mutex;
    std::condition_variable cv;
    bool running = false;
    bool stopRequested = false;
public:
    ScheduledTask(const char *name, std::function<void()> job);
    ~ScheduledTask();

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    /*
     * Starts the worker. The first run takes place after `initialDelayMs`, then every `periodMs`.
     * `periodFn` is evaluated before each waiting period, so that configuration changes take effect
     * without restart
     */
    bool start(std::function<unsigned long()> periodFn, unsigned long initialDelayMs);

    void stop();

    bool isRunning();

    /*
     * Sleeps `ms` unless the task is stopped in the meantime. Returns false if it was stopped. Can be
     * used by the job for pausing between work items
     */
    bool waitFor(unsigned long ms);
};

} //namespace MicroCsms

#endif
