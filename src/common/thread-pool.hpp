#pragma once

// standard
#include <condition_variable>
#include <functional>
#include <cstddef>
#include <optional>
#include <vector>
#include <thread>
#include <memory>
#include <mutex>
#include <queue>

// rubus
#include <common/exceptions.hpp>


namespace rubus {

    // Fixed size pool of workers. Tasks queried after terminate() are dropped,
    // tasks bound to expired lifetime are skipped.
    class ThreadPool
        : public std::enable_shared_from_this<ThreadPool>
    {
    private: struct Private { };
    public:

        struct Settings {
            std::size_t size = 2;
            std::size_t maxSize = 1024;
        };

        static std::shared_ptr<ThreadPool> configure(Settings settings);
        ThreadPool(Settings settings, Private access);
        ~ThreadPool();

        void init();
        // Returns false if task was rejected: pool is terminated or queue is full.
        bool query(std::function<void()> task, std::weak_ptr<void> lifetime);
        bool query(std::function<void()> task);
        // Drops queued tasks and joins workers, running tasks are completed.
        // Safe to call more than once, must not be called from worker thread.
        void terminate();

        std::size_t pending();
        std::size_t size() const;
        // limit of queued tasks
        std::size_t capacity() const;
        bool terminated();

    private:
        struct Task {
            std::function<void()> callback;
            std::optional<std::weak_ptr<void>> lifetime;
        };

        void run(); 
        bool query(Task task);
        void handleTask(Task task);

    private:
        bool abort_;
        bool initiated_;
        Settings settings_;

        std::vector<std::thread> threads_;
        std::queue<Task> tasks_;
        std::condition_variable cv_;
        std::mutex queueMutex_;
        std::mutex joinMutex_;
    };

} // namespace rubus
