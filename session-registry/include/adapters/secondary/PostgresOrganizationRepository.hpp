#pragma once

#include "ports/output/IOrganizationRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace registry::adapters::secondary {

class PostgresOrganizationRepository : public ports::output::IOrganizationRepository {
public:
    explicit PostgresOrganizationRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresOrganizationRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresOrganizationRepository] Connected to " << settings_->describe() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrganizationRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresOrganizationRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Organization> findById(const std::string& orgId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT org_id, slug, name FROM organizations WHERE org_id = $1",
                orgId
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return domain::Organization{
                result[0]["org_id"].as<std::string>(),
                result[0]["slug"].as<std::string>(),
                result[0]["name"].as<std::string>()
            };

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOrganizationRepository] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace registry::adapters::secondary
