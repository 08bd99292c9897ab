/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <soralog/impl/configurator_from_yaml.hpp>

namespace attesta::log {

  /// Group tree of the node on top of `previous` configuration.
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    explicit Configurator(std::shared_ptr<soralog::Configurator> previous);
  };

}  // namespace attesta::log
