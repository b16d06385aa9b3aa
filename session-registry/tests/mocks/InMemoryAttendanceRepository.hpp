#pragma once

#include "ports/output/IAttendanceRepository.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace registry::tests::mocks {

/**
 * @brief In-Memory реализация хранилища отметок для unit-тестов
 */
class InMemoryAttendanceRepository : public ports::output::IAttendanceRepository {
public:
    bool insertIfAbsent(const domain::AttendanceRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::make_pair(record.sessionToken.value(), record.memberId);
        return records_.emplace(key, record).second;
    }

    int countBySession(const proximity::domain::SessionToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& [key, record] : records_) {
            if (key.first == token.value()) {
                ++count;
            }
        }
        return count;
    }

    std::vector<domain::AttendanceRecord> findBySession(const proximity::domain::SessionToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::AttendanceRecord> result;
        for (const auto& [key, record] : records_) {
            if (key.first == token.value()) {
                result.push_back(record);
            }
        }
        return result;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, domain::AttendanceRecord> records_;
};

} // namespace registry::tests::mocks
