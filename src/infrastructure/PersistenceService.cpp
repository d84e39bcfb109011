/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace regionwalker::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_accepting) {
            std::cerr << "[PersistenceService] Refusing write after stop: " << filename << std::endl;
            ++m_failedWrites;
            return;
        }
        if (m_pending.insert_or_assign(filename, content).second) {
            m_order.push_back(filename);
        }
    }
    m_wake.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_drained.wait(lock, [this] { return m_order.empty() && !m_writing; });
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_accepting = false;
    }
    m_wake.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::workerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    for (;;) {
        m_wake.wait(lock, [this] { return !m_order.empty() || !m_accepting; });
        if (m_order.empty()) {
            // Stopped with nothing left to write.
            m_drained.notify_all();
            return;
        }

        std::string filename = std::move(m_order.front());
        m_order.pop_front();
        auto node = m_pending.extract(filename);
        m_writing = true;

        lock.unlock();
        const bool ok = writeAtomic(filename, node.mapped());
        lock.lock();

        if (!ok) {
            ++m_failedWrites;
        }
        m_writing = false;
        if (m_order.empty()) {
            m_drained.notify_all();
        }
    }
}

bool PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    const fs::path target = filename;
    fs::path staging = target;
    staging += "." + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Cannot create " << target.parent_path() << ": " << ec.message()
                      << std::endl;
            return false;
        }
    }

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[PersistenceService] Cannot open " << staging << std::endl;
            return false;
        }
        out << content;
        out.flush();
        if (!out) {
            std::cerr << "[PersistenceService] Short write to " << staging << std::endl;
            out.close();
            fs::remove(staging, ec);
            return false;
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename to " << target << " failed: " << ec.message() << std::endl;
        std::error_code ignored;
        fs::remove(staging, ignored);
        return false;
    }
    return true;
}

} // namespace regionwalker::infrastructure
