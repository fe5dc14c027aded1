#pragma once

#include "network/connection.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <thread>

/// In-memory connection: bytes delivered by the test come out of
/// receive(), bytes sent are recorded.
class FakeConnection : public Connection {
public:
    explicit FakeConnection(std::string address = "10.0.0.1") : address_(std::move(address)) {}

    bool send(const char* data, std::size_t len) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_sends_ || closed_) return false;
        sent_.append(data, len);
        return true;
    }

    std::size_t receive(char* buffer, std::size_t capacity) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !inbound_.empty() || closed_ || finished_; });
        if (inbound_.empty() || closed_) return 0;
        std::size_t n = std::min(capacity, inbound_.size());
        inbound_.copy(buffer, n);
        inbound_.erase(0, n);
        return n;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::string remote_address() const override { return address_; }

    void deliver(const std::string& bytes) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_ += bytes;
        }
        cv_.notify_all();
    }

    /// The remote side closed after the delivered bytes.
    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    void fail_sends(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = fail;
    }

    std::string sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::string address_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string inbound_;
    std::string sent_;
    bool closed_ = false;
    bool finished_ = false;
    bool fail_sends_ = false;
};

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("p2p_sharer_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Poll `condition` until it holds or `timeout` passes.
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}
