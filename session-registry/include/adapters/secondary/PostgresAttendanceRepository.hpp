#pragma once

#include "ports/output/IAttendanceRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace registry::adapters::secondary {

/**
 * @brief Отметки посещения в PostgreSQL (таблица attendance_records)
 *
 * PRIMARY KEY (session_token, member_id): из параллельных отметок
 * одного участника вставится ровно одна.
 */
class PostgresAttendanceRepository : public ports::output::IAttendanceRepository {
public:
    explicit PostgresAttendanceRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAttendanceRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAttendanceRepository] Connected to " << settings_->describe() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAttendanceRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresAttendanceRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    bool insertIfAbsent(const domain::AttendanceRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    INSERT INTO attendance_records (session_token, member_id, org_id, recorded_at)
                    VALUES ($1, $2, $3, to_timestamp($4))
                    ON CONFLICT (session_token, member_id) DO NOTHING
                )",
                record.sessionToken.value(),
                record.memberId,
                record.orgId,
                proximity::domain::Timestamp::toEpochSeconds(record.recordedAt)
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAttendanceRepository] insertIfAbsent() failed: " << e.what() << std::endl;
            throw;
        }
    }

    int countBySession(const proximity::domain::SessionToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT COUNT(*) AS cnt FROM attendance_records WHERE session_token = $1",
                token.value()
            );

            txn.commit();
            return result[0]["cnt"].as<int>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAttendanceRepository] countBySession() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::AttendanceRecord> findBySession(const proximity::domain::SessionToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT session_token, member_id, org_id,
                          EXTRACT(EPOCH FROM recorded_at)::bigint AS recorded_epoch
                   FROM attendance_records
                   WHERE session_token = $1
                   ORDER BY recorded_at, member_id)",
                token.value()
            );

            txn.commit();

            std::vector<domain::AttendanceRecord> records;
            for (const auto& row : result) {
                records.push_back(domain::AttendanceRecord{
                    proximity::domain::SessionToken(row["session_token"].as<std::string>()),
                    row["member_id"].as<std::string>(),
                    row["org_id"].as<std::string>(),
                    proximity::domain::Timestamp::fromEpochSeconds(row["recorded_epoch"].as<int64_t>())
                });
            }
            return records;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAttendanceRepository] findBySession() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace registry::adapters::secondary
