#pragma once

#include "domain/ActiveSession.hpp"
#include "domain/BeaconDetection.hpp"
#include "domain/enums/ResolutionStatus.hpp"
#include <string>
#include <vector>

namespace proximity::domain {

/**
 * @brief Результат разрешения обнаруженного маяка в токены
 *
 * candidates упорядочены: сначала недавно начавшиеся сессии (startsAt DESC),
 * затем по title и токену. Порядок только для отображения.
 */
struct ResolutionResult {
    ResolutionStatus status = ResolutionStatus::NO_ACTIVE_SESSION;
    BeaconDetection detection;
    std::string orgId;
    std::string orgSlug;
    std::vector<ActiveSession> candidates;
    std::string message;

    bool hasCandidates() const { return !candidates.empty(); }
};

} // namespace proximity::domain
