/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/statement_distribution_config_loader.hpp"

#include <array>
#include <cstdio>
#include <memory>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

OUTCOME_CPP_DEFINE_CATEGORY(attesta::application, ConfigError, e) {
  using E = attesta::application::ConfigError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "Configuration file can't be opened";
    case E::PARSE_FAILED:
      return "Configuration is not valid JSON";
    case E::INVALID_VALUE:
      return "Configuration value has wrong type or range";
  }
  return "Unknown configuration error";
}

namespace attesta::application {
  using parachain::statement_distribution::reputationEventFromString;
  using parachain::statement_distribution::ReputationTable;

  namespace {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

    outcome::result<StatementDistributionConfig> fromDocument(
        const rapidjson::Document &document,
        const log::Logger &logger,
        auto &&load_segment) {
      StatementDistributionConfig config;
      if (not document.IsObject()) {
        SL_ERROR(logger, "Configuration root is not an object");
        return ConfigError::PARSE_FAILED;
      }
      auto it =
          document.FindMember(StatementDistributionConfigLoader::kSegmentName);
      if (document.MemberEnd() != it) {
        OUTCOME_TRY(load_segment(it->value, config));
      }
      return config;
    }
  }  // namespace

  outcome::result<StatementDistributionConfig>
  StatementDistributionConfigLoader::loadFile(
      const std::filesystem::path &path) const {
    FilePtr file(std::fopen(path.c_str(), "r"), &std::fclose);
    if (!file) {
      SL_ERROR(logger_, "Configuration file path is invalid: {}", path.string());
      return ConfigError::FILE_NOT_FOUND;
    }

    std::array<char, 1024> buffer{};
    rapidjson::FileReadStream input_stream(
        file.get(), buffer.data(), buffer.size());

    rapidjson::Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               path.string(),
               GetParseError_En(document.GetParseError()));
      return ConfigError::PARSE_FAILED;
    }
    return fromDocument(
        document, logger_, [this](const Value &val, auto &config) {
          return loadSegment(val, config);
        });
  }

  outcome::result<StatementDistributionConfig>
  StatementDistributionConfigLoader::loadString(std::string_view json) const {
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration parse failed with error {}",
               GetParseError_En(document.GetParseError()));
      return ConfigError::PARSE_FAILED;
    }
    return fromDocument(
        document, logger_, [this](const Value &val, auto &config) {
          return loadSegment(val, config);
        });
  }

  outcome::result<void> StatementDistributionConfigLoader::loadSegment(
      const Value &val, StatementDistributionConfig &config) const {
    if (not val.IsObject()) {
      SL_ERROR(logger_, "Segment '{}' is not an object", kSegmentName);
      return ConfigError::INVALID_VALUE;
    }

    uint32_t timeout_ms = 0;
    OUTCOME_TRY(has_timeout, load_u32(val, "request-timeout-ms", timeout_ms));
    if (has_timeout) {
      if (timeout_ms == 0) {
        SL_ERROR(logger_, "request-timeout-ms must be positive");
        return ConfigError::INVALID_VALUE;
      }
      config.request_timeout = std::chrono::milliseconds{timeout_ms};
    }
    OUTCOME_TRY(
        load_u32(val, "max-request-retries", config.max_request_retries));
    OUTCOME_TRY(
        load_bool(val, "retry-with-other-peer", config.retry_with_other_peer));
    OUTCOME_TRY(load_bool(val,
                          "punish-invalid-signature-provider",
                          config.punish_invalid_signature_provider));
    OUTCOME_TRY(load_bool(val,
                          "first-benefit-in-responses",
                          config.first_benefit_in_responses));
    OUTCOME_TRY(load_bool(val,
                          "grant-response-benefit-when-all-rejected",
                          config.grant_response_benefit_when_all_rejected));
    OUTCOME_TRY(load_bool(
        val, "punish-withheld-statements", config.punish_withheld_statements));

    if (auto it = val.FindMember("reputation"); it != val.MemberEnd()) {
      OUTCOME_TRY(loadReputation(it->value, config.reputation));
    }
    return outcome::success();
  }

  outcome::result<void> StatementDistributionConfigLoader::loadReputation(
      const Value &val, ReputationTable &table) const {
    if (not val.IsObject()) {
      SL_ERROR(logger_, "'reputation' is not an object");
      return ConfigError::INVALID_VALUE;
    }
    for (auto it = val.MemberBegin(); it != val.MemberEnd(); ++it) {
      std::string_view name{it->name.GetString(),
                            it->name.GetStringLength()};
      auto event = reputationEventFromString(name);
      if (not event) {
        SL_ERROR(logger_, "Unknown reputation event '{}'", name);
        return ConfigError::INVALID_VALUE;
      }
      if (not it->value.IsInt()) {
        SL_ERROR(logger_, "Reputation of '{}' is not an integer", name);
        return ConfigError::INVALID_VALUE;
      }
      const auto value = it->value.GetInt();
      const auto default_value = table.get(*event).value;
      // zero disables the change, otherwise costs stay costs
      if ((default_value < 0 and value > 0)
          or (default_value > 0 and value < 0)) {
        SL_ERROR(logger_,
                 "Reputation of '{}' must keep the sign of {}",
                 name,
                 default_value);
        return ConfigError::INVALID_VALUE;
      }
      table.set_value(*event, value);
    }
    return outcome::success();
  }

  outcome::result<bool> StatementDistributionConfigLoader::load_u32(
      const Value &val, const char *name, uint32_t &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsInt()) {
      const auto v = m->value.GetInt();
      if ((v & (1u << 31u)) == 0) {
        target = static_cast<uint32_t>(v);
        return true;
      }
    }
    return ConfigError::INVALID_VALUE;
  }

  outcome::result<bool> StatementDistributionConfigLoader::load_bool(
      const Value &val, const char *name, bool &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsBool()) {
      target = m->value.GetBool();
      return true;
    }
    return ConfigError::INVALID_VALUE;
  }

}  // namespace attesta::application
