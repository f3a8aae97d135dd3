// standard
#include <functional>
#include <cstddef>
#include <memory>
#include <thread>
#include <mutex>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>

// local
#include "thread-pool.hpp"

using namespace rubus;


std::shared_ptr<ThreadPool> ThreadPool::configure(Settings settings) {
    return std::make_shared<ThreadPool>(std::move(settings), Private());
}

ThreadPool::ThreadPool(Settings settings, Private access)
: abort_(false)
, initiated_(false)
, settings_(std::move(settings))
{}

ThreadPool::~ThreadPool() {
    terminate();
}

void ThreadPool::init() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    if (initiated_) {
        throw RubusBadInit();
    }
    for (std::size_t thread = 0; thread < settings_.size; ++thread) {
        threads_.emplace_back(std::thread(&ThreadPool::run, this));
    }

    initiated_ = true;
}

void ThreadPool::terminate() {
    std::size_t dropped = 0;
    { 
        std::unique_lock<std::mutex> lock(queueMutex_); 
        abort_ = true; 
        dropped = tasks_.size();
        tasks_ = {};
    }
    cv_.notify_all(); 

    std::unique_lock<std::mutex> lock(joinMutex_);
    if (dropped) {
        PLOG(plog::debug) << "[pool] terminating, dropped " << dropped << " queued tasks";
    }
    for (auto& thread : threads_) { 
        if (thread.joinable()) {
            thread.join(); 
        }
    }
    threads_.clear();
}

void ThreadPool::run() {
    while (true) {
        Task currentTask;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            cv_.wait(lock, [this]() {
                return !tasks_.empty() || abort_;
            });

            if (abort_) {
                return;
            }

            currentTask = std::move(tasks_.front());
            tasks_.pop();
        }
        handleTask(std::move(currentTask));
    }
}

bool ThreadPool::query(std::function<void()> task, std::weak_ptr<void> lifetime) {
    return query(Task{.callback = std::move(task), .lifetime = std::move(lifetime)});
}

bool ThreadPool::query(std::function<void()> task) {
    return query(Task{.callback = std::move(task), .lifetime = std::nullopt});
}

bool ThreadPool::query(Task task) {
    {
        std::unique_lock<std::mutex> lock (queueMutex_);
        if (abort_ || tasks_.size() >= settings_.maxSize) return false;
        tasks_.emplace(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::handleTask(Task task) {
    if (task.lifetime.has_value()) {
        // keep owner alive while callback is running
        if (auto owner = task.lifetime->lock()) {
            task.callback();
        }
        return;
    }
    task.callback();
}

std::size_t ThreadPool::pending() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

std::size_t ThreadPool::size() const {
    return settings_.size;
}

std::size_t ThreadPool::capacity() const {
    return settings_.maxSize;
}

bool ThreadPool::terminated() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return abort_;
}
