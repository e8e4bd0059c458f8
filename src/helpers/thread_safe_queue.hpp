#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <exception>

struct interrupted_exception : public std::exception
{
    const char* what() const noexcept override { return "queue wait interrupted"; }
};

/**
 * Unbounded multi-producer queue. Consumers block in `wait_and_pop` until an
 * element arrives or `interrupt` is called.
 */
template<class T>
class ThreadSafeQueue
{
    std::deque<T> queue;
    std::mutex m;
    std::condition_variable cond;
    bool interrupted = false;

public:
    ThreadSafeQueue() = default;

    void interrupt()
    {
        {
            std::lock_guard<std::mutex> lock(m);
            interrupted = true;
        }
        cond.notify_all();
    }

    void push(T val)
    {
        {
            std::lock_guard<std::mutex> lock(m);
            queue.push_back(std::move(val));
        }
        cond.notify_one();
    }

    T wait_and_pop()
    {
        std::unique_lock<std::mutex> lock(m);
        cond.wait(lock, [this] { return interrupted || !queue.empty(); });
        if (interrupted)
        {
            interrupted = false;
            throw interrupted_exception();
        }

        T val = std::move(queue.front());
        queue.pop_front();
        return val;
    }
};
