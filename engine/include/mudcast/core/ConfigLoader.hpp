#pragma once

#include <mudcast/core/GlobalConfig.hpp>

#include <string>
#include <string_view>

namespace mudcast::core
{

class ConfigLoader
{
  public:
    // Apps는 오직 이 한 줄만 호출하면 됩니다. (--config <path.toml>)
    static GlobalConfig load(int argc, char **argv);

    static GlobalConfig loadFile(const std::string &path);

    /// TOML 텍스트를 바로 파싱합니다. (테스트/임베드용)
    static GlobalConfig parse(std::string_view tomlText);
};

} // namespace mudcast::core
