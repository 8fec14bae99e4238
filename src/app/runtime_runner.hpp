#pragma once

#include <span>
#include <string>
#include <vector>

#include "app/config_types.hpp"
#include "iolat/bench/driver.hpp"
#include "iolat/core/expected.hpp"

int run_cli_impl(int argc, char** argv);

namespace iolat::app {

// args[0] is the program name.
iolat::Expected<Config> parse_args(const std::vector<std::string>& args);

iolat::Expected<StoreKind> parse_store_kind(const std::string& s);

iolat::Expected<void> write_json_summary(const Config& cfg,
                                         std::span<const CampaignResult> results);

}  // namespace iolat::app
