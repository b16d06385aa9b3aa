#pragma once

#include "ports/output/ISessionRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace registry::adapters::secondary {

/**
 * @brief Сессии в PostgreSQL (таблица sessions)
 *
 * Уникальность токена обеспечивает PRIMARY KEY (session_token):
 * insertIfAbsent опирается на ON CONFLICT DO NOTHING, а не на SELECT.
 * Ошибки БД логируются и пробрасываются.
 */
class PostgresSessionRepository : public ports::output::ISessionRepository {
public:
    explicit PostgresSessionRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSessionRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresSessionRepository] Connected to " << settings_->describe() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresSessionRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    bool insertIfAbsent(const domain::SessionRecord& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    INSERT INTO sessions (session_token, org_id, title, starts_at, ends_at, created_at)
                    VALUES ($1, $2, $3, to_timestamp($4), to_timestamp($5), to_timestamp($6))
                    ON CONFLICT (session_token) DO NOTHING
                )",
                session.token.value(),
                session.orgId,
                session.title,
                epoch(session.startsAt),
                epoch(session.endsAt),
                epoch(session.createdAt)
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] insertIfAbsent() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::SessionRecord> findByToken(const domain::SessionToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + " FROM sessions WHERE session_token = $1",
                token.value()
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToSession(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] findByToken() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::SessionRecord> findActiveByOrg(
        const std::string& orgId,
        domain::TimePoint now
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + R"(
                    FROM sessions
                    WHERE org_id = $1
                      AND starts_at <= to_timestamp($2)
                      AND ends_at > to_timestamp($2)
                      AND stopped_at IS NULL
                    ORDER BY starts_at DESC, title, session_token
                )",
                orgId,
                epoch(now)
            );

            txn.commit();

            std::vector<domain::SessionRecord> sessions;
            for (const auto& row : result) {
                sessions.push_back(rowToSession(row));
            }
            return sessions;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] findActiveByOrg() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool markStopped(const domain::SessionToken& token, domain::TimePoint stoppedAt) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // Повторная остановка не сдвигает время первой
            auto result = txn.exec_params(
                R"(
                    UPDATE sessions
                    SET stopped_at = COALESCE(stopped_at, to_timestamp($2))
                    WHERE session_token = $1
                )",
                token.value(),
                epoch(stoppedAt)
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionRepository] markStopped() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT session_token, org_id, title,
               EXTRACT(EPOCH FROM starts_at)::bigint AS starts_epoch,
               EXTRACT(EPOCH FROM ends_at)::bigint AS ends_epoch,
               EXTRACT(EPOCH FROM stopped_at)::bigint AS stopped_epoch,
               EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch
    )";

    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static int64_t epoch(domain::TimePoint tp) {
        return proximity::domain::Timestamp::toEpochSeconds(tp);
    }

    static domain::SessionRecord rowToSession(const pqxx::row& row) {
        using proximity::domain::Timestamp;

        domain::SessionRecord session{
            domain::SessionToken(row["session_token"].as<std::string>()),
            row["org_id"].as<std::string>(),
            row["title"].as<std::string>(),
            Timestamp::fromEpochSeconds(row["starts_epoch"].as<int64_t>()),
            Timestamp::fromEpochSeconds(row["ends_epoch"].as<int64_t>()),
            std::nullopt,
            Timestamp::fromEpochSeconds(row["created_epoch"].as<int64_t>())
        };
        if (!row["stopped_epoch"].is_null()) {
            session.stoppedAt = Timestamp::fromEpochSeconds(row["stopped_epoch"].as<int64_t>());
        }
        return session;
    }
};

} // namespace registry::adapters::secondary
