/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string_view>

#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson {
  using SizeType = ::std::size_t;
}
#include <rapidjson/document.h>
#undef RAPIDJSON_NO_SIZETYPEDEFINE

#include "application/statement_distribution_config.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace attesta::application {

  enum class ConfigError {
    FILE_NOT_FOUND = 1,
    PARSE_FAILED,
    INVALID_VALUE,
  };

  /**
   * Reads the "statement-distribution" segment of a JSON config file.
   * Absent keys keep their defaults, keys of a wrong type or range fail the
   * whole load.
   */
  class StatementDistributionConfigLoader {
   public:
    static constexpr const char *kSegmentName = "statement-distribution";

    outcome::result<StatementDistributionConfig> loadFile(
        const std::filesystem::path &path) const;

    outcome::result<StatementDistributionConfig> loadString(
        std::string_view json) const;

   private:
    using Value = rapidjson::Value;

    outcome::result<void> loadSegment(const Value &val,
                                      StatementDistributionConfig &config) const;
    outcome::result<void> loadReputation(
        const Value &val,
        parachain::statement_distribution::ReputationTable &table) const;

    static outcome::result<bool> load_u32(const Value &val,
                                          const char *name,
                                          uint32_t &target);
    static outcome::result<bool> load_bool(const Value &val,
                                           const char *name,
                                           bool &target);

    log::Logger logger_ =
        log::createLogger("StatementDistributionConfig", "application");
  };

}  // namespace attesta::application

OUTCOME_HPP_DECLARE_ERROR(attesta::application, ConfigError);
