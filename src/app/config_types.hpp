#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "iolat/core/types.hpp"

namespace iolat::app {

struct Config {
  DriverConfig driver{};
  StoreConfig store{};

  bool charts{true};
  std::filesystem::path chart_dir{"/tmp/images"};
  std::optional<std::filesystem::path> json_output;
  std::string executable_path;
};

}  // namespace iolat::app
