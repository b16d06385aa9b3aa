#pragma once

#include "domain/BeaconDetection.hpp"
#include "domain/Membership.hpp"
#include "domain/ResolutionResult.hpp"
#include "domain/enums/ScannerState.hpp"
#include <memory>
#include <string>

namespace proximity::ports::input {

/**
 * @brief Получатель результатов разрешения (UI участника)
 *
 * Вызывается из рабочего потока сканера в порядке поступления обнаружений.
 */
class IResolutionListener {
public:
    virtual ~IResolutionListener() = default;
    virtual void onResolution(const domain::ResolutionResult& result) = 0;
};

/**
 * @brief Роль участника: слушает маяки и разрешает их в токены сессий
 */
class IScanner {
public:
    virtual ~IScanner() = default;

    /**
     * @return false, если радио недоступно (состояние ERROR)
     */
    virtual bool start(const domain::MemberContext& member,
                       std::shared_ptr<IResolutionListener> listener) = 0;

    /**
     * @brief Отписаться от радио, выбросить необработанные обнаружения
     */
    virtual void stop() = 0;

    /**
     * @brief Поставить обнаружение в очередь на разрешение
     */
    virtual void onDetected(const domain::BeaconDetection& detection) = 0;

    virtual domain::ScannerState state() const = 0;

    virtual std::string lastError() const = 0;
};

} // namespace proximity::ports::input
