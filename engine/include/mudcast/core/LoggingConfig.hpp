#pragma once

#include <mudcast/core/GlobalConfig.hpp>

namespace mudcast::core
{

/// NodeConfig의 logLevel/logFilePath를 프로세스 전역 Logger에 반영합니다.
void applyLoggingConfig(const NodeConfig &cfg);

} // namespace mudcast::core
