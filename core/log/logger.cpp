/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <boost/assert.hpp>
#include <libp2p/log/logger.hpp>

namespace attesta::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "attesta::log::setLoggingSystem() was not called");
      return logging_system;
    }
  }  // namespace

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = logging_system;
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace attesta::log
