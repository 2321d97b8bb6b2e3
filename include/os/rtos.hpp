#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

//== Time ==//
// All timestamps are CLOCK_MONOTONIC based.
uint64_t NowUs();
uint32_t NowMs();

void SleepMs(int ms);
void SleepUs(uint64_t us);

// Sleep until an absolute NowUs() deadline. Returns immediately if the
// deadline has already passed.
void SleepUntilUs(uint64_t deadline_us);

//== Task abstraction ==//
// Thin wrapper over a native thread. A task that is never joined is
// detached on destruction. Owners whose task touches their members must
// stop and Join() it before those members go away.
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

    bool Running() const;
    const char* Name() const { return m_name; }

private:
    struct TaskHandle;
    TaskHandle* handle_;
    const char* m_name = "task";
};

//== Mutex abstraction ==//
class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

//== Counting Semaphore abstraction ==//
class CountingSemaphore {
public:
    /**
     * @param maxCount      Maximum count (e.g. queue capacity)
     * @param initialCount  Starting count
     */
    CountingSemaphore(size_t maxCount, size_t initialCount);
    ~CountingSemaphore();

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    void take();      // block until count>0, then --count
    bool try_take();  // non-blocking: if count>0 then --count, else false
    void give();      // ++count, wake one waiter if present

private:
    struct CountingSemHandle;
    CountingSemHandle* handle_;
};

//== Queue abstraction ==//
// Fixed-capacity message queue over a circular buffer, synchronised with the
// OSAL Mutex and two CountingSemaphores (free slots / filled slots).
//
// Producers on a side task call send() and block while the queue is full.
// The streaming loop only ever calls try_receive(): it drains what is
// already present and never waits on a producer.
template <typename T, size_t Capacity>
class Queue {
public:
    Queue() : head(0), tail(0) {}

    void send(const T& item) {
        spaceAvailable.take();  // Wait for space
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();   // Signal data is available
    }

    bool try_send(const T& item) {
        if (!spaceAvailable.try_take()) return false;
        lock.lock();
        buffer[head] = item;
        head = (head + 1) % Capacity;
        lock.unlock();
        dataAvailable.give();
        return true;
    }

    void receive(T& item) {
        dataAvailable.take();  // Wait for data
        lock.lock();
        item = buffer[tail];
        buffer[tail] = T{};    // drop payload storage early (strings)
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give(); // Signal space is available
    }

    bool try_receive(T& item) {
        if (!dataAvailable.try_take()) return false;
        lock.lock();
        item = buffer[tail];
        buffer[tail] = T{};
        tail = (tail + 1) % Capacity;
        lock.unlock();
        spaceAvailable.give();
        return true;
    }

    static constexpr size_t capacity() { return Capacity; }

private:
    T buffer[Capacity];
    size_t head, tail;

    Mutex lock;
    CountingSemaphore spaceAvailable{Capacity, Capacity};  // Initially full space
    CountingSemaphore dataAvailable{Capacity, 0};          // Initially no data
};

} // namespace Rtos
