#pragma once

#include "ports/output/ISessionRegistry.hpp"

namespace registry::ports::input {

/**
 * @brief Входной порт реестра
 *
 * Сервис реализует тот же контракт, через который к нему обращаются
 * устройства: HTTP клиент на устройстве и handlers здесь говорят
 * на одних и тех же закрытых enum'ах.
 */
using ISessionRegistry = proximity::ports::output::ISessionRegistry;
using CreateSessionResult = proximity::ports::output::CreateSessionResult;

} // namespace registry::ports::input
