#include "os/rtos.hpp"
#include <pthread.h>
#include <semaphore.h>
#include <time.h>
#include <errno.h>
#include <iostream>   // for std::cerr

namespace Rtos {

// =======================
// Time
// =======================

uint64_t NowUs() {
    timespec ts{};
    ::clock_gettime(CLOCK_MONOTONIC, &ts);
    return uint64_t(ts.tv_sec) * 1000000ull + uint64_t(ts.tv_nsec) / 1000ull;
}

uint32_t NowMs() {
    return static_cast<uint32_t>(NowUs() / 1000ull);
}

void SleepUs(uint64_t us) {
    timespec req{};
    req.tv_sec  = static_cast<time_t>(us / 1000000ull);
    req.tv_nsec = static_cast<long>((us % 1000000ull) * 1000ull);
    // Resume after signal interruption with the remaining time.
    while (::nanosleep(&req, &req) == -1 && errno == EINTR) {}
}

void SleepMs(int ms) {
    if (ms <= 0) return;
    SleepUs(static_cast<uint64_t>(ms) * 1000ull);
}

void SleepUntilUs(uint64_t deadline_us) {
    timespec ts{};
    ts.tv_sec  = static_cast<time_t>(deadline_us / 1000000ull);
    ts.tv_nsec = static_cast<long>((deadline_us % 1000000ull) * 1000ull);
    // Absolute sleep on the same clock NowUs() reads, so no drift accumulates.
    while (::clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &ts, nullptr) == EINTR) {}
}

// =======================
// Task Implementation
// =======================

// Wrapper to convert function pointer to pthread-style
struct ThreadArgs {
    void (*fn)(void*);
    void* arg;
};

// Static thread entry point
static void* threadEntryPoint(void* ptr) {
    ThreadArgs* args = static_cast<ThreadArgs*>(ptr);
    args->fn(args->arg);
    delete args;
    return nullptr;
}

// Platform-specific handle
struct Task::TaskHandle {
    pthread_t thread;
    bool created = false;
    bool joined = false;
};

Task::Task() {
    handle_ = new TaskHandle{};
}

Task::~Task() {
    if (handle_ && !handle_->joined && handle_->created) {
        pthread_detach(handle_->thread);  // detach if not joined
    }
    delete handle_;
}

bool Task::Create(const char* name, void (*fn)(void*), void* arg) {
    if (handle_->created) {
        std::cerr << "[OSAL] task '" << m_name << "' already created\n";
        return false;
    }
    if (name) m_name = name;

    auto* args = new ThreadArgs{fn, arg};

    const int rc = pthread_create(&handle_->thread, nullptr, threadEntryPoint, args);
    if (rc != 0) {
        std::cerr << "[OSAL] failed to create task '" << m_name << "' rc=" << rc << "\n";
        delete args;
        return false;
    }
    handle_->created = true;
    return true;
}

void Task::Join() {
    if (handle_ && handle_->created && !handle_->joined) {
        pthread_join(handle_->thread, nullptr);
        handle_->joined = true;
    }
}

bool Task::Running() const {
    return handle_ && handle_->created && !handle_->joined;
}

// =======================
// Mutex Implementation
// =======================

struct Mutex::MutexHandle {
    pthread_mutex_t native;
};

Mutex::Mutex() {
    handle_ = new MutexHandle;
    if (pthread_mutex_init(&handle_->native, nullptr) != 0) {
        std::cerr << "[OSAL] mutex init failed\n";
    }
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&handle_->native);
    delete handle_;
}

void Mutex::lock() {
    pthread_mutex_lock(&handle_->native);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&handle_->native);
}

// =======================
// Counting Semaphore Implementation
// =======================

struct CountingSemaphore::CountingSemHandle {
    sem_t sem;
    unsigned maxCount;
};

CountingSemaphore::CountingSemaphore(size_t maxCount, size_t initialCount) {
    handle_ = new CountingSemHandle;
    handle_->maxCount = static_cast<unsigned>(maxCount);

    if (initialCount > maxCount) {
        std::cerr << "[OSAL] CountingSemaphore initial count > max count\n";
        initialCount = maxCount;  // clamp
    }

    if (sem_init(&handle_->sem, 0, static_cast<unsigned>(initialCount)) != 0) {
        std::cerr << "[OSAL] sem_init failed errno=" << errno << "\n";
    }
}

CountingSemaphore::~CountingSemaphore() {
    sem_destroy(&handle_->sem);
    delete handle_;
}

void CountingSemaphore::take() {
    while (sem_wait(&handle_->sem) != 0) {
        if (errno != EINTR) {
            std::cerr << "[OSAL] sem_wait failed errno=" << errno << "\n";
            return;
        }
    }
}

bool CountingSemaphore::try_take() {
    return (sem_trywait(&handle_->sem) == 0);
}

void CountingSemaphore::give() {
    int val = 0;
    sem_getvalue(&handle_->sem, &val);

    if (static_cast<unsigned>(val) < handle_->maxCount) {
        sem_post(&handle_->sem);
    } else {
        std::cerr << "[OSAL] CountingSemaphore give() called when full\n";
    }
}

} // namespace Rtos
