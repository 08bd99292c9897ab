/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace attesta::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  /// Installs the logging system, libp2p loggers included. Must happen
  /// before the first logger is created.
  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  static const std::string defaultGroupName("attesta");

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace attesta::log
