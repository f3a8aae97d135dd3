#pragma once

// standard
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <memory>
#include <deque>
#include <mutex>

// rubus
#include <common/exceptions.hpp>
#include <rubus/transport/interfaces/i-socket.hpp>


namespace rubus {

    // Listener handing out sockets pushed by test, counts successful accepts.
    class QueueServerSocket : public IServerSocket {
    public:

        void push(std::shared_ptr<ISocket> socket) {
            {
                std::unique_lock<std::mutex> locked(lock_);
                pending_.push_back(std::move(socket));
            }
            cv_.notify_all();
        }

        std::shared_ptr<ISocket> accept(std::chrono::milliseconds timeout) override {
            std::unique_lock<std::mutex> locked(lock_);
            auto ready = [this]() {
                return !pending_.empty() || closed_;
            };

            if (timeout.count() > 0) {
                cv_.wait_for(locked, timeout, ready);
            } else {
                cv_.wait(locked, ready);
            }

            if (closed_) {
                throw RubusSocketError("accept on closed server socket");
            }
            if (pending_.empty()) {
                throw RubusTimeout();
            }

            auto socket = std::move(pending_.front());
            pending_.pop_front();
            ++accepted_;
            return socket;
        }

        void close() override {
            {
                std::unique_lock<std::mutex> locked(lock_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool isClosed() const override {
            return closed_;
        }

        int accepted() const {
            return accepted_;
        }

        std::size_t waiting() {
            std::unique_lock<std::mutex> locked(lock_);
            return pending_.size();
        }

    private:
        std::mutex lock_;
        std::condition_variable cv_;
        std::deque<std::shared_ptr<ISocket>> pending_;
        std::atomic<bool> closed_ = false;
        std::atomic<int> accepted_ = 0;
    };

}
