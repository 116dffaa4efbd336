#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace portprobe::infra {

AsioContext::AsioContext(size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext created with {} threads", threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::trace("Asio worker thread {} started", i);
            ioContext_.run();
            spdlog::trace("Asio worker thread {} stopped", i);
        });
    }

    spdlog::debug("AsioContext started with {} worker threads", threadCount_);
}

void AsioContext::join() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    joinThreads();
    spdlog::debug("AsioContext drained");
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();
    joinThreads();
    spdlog::debug("AsioContext stopped");
}

void AsioContext::joinThreads() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
}

} // namespace portprobe::infra
