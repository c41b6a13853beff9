/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_MERKLEDAG_CORE_CONFIG_CONFIG_HPP
#define CPP_MERKLEDAG_CORE_CONFIG_CONFIG_HPP

#include <boost/property_tree/ptree.hpp>
#include <string>

#include "common/outcome.hpp"
#include "config/config_error.hpp"

namespace mdag::config {

  /** @brief Configuration key, dot separated path */
  using ConfigKey = std::string;

  /**
   * @brief JSON configuration file
   */
  class Config {
   public:
    /**
     * @brief Save config to file
     * @param filename - path to a file to store config
     * @return nothing or error occurred
     */
    outcome::result<void> save(const std::string &filename) const;

    /**
     * @brief Load config from file
     * @param filename - path to a file with config
     * @return nothing or error occurred
     */
    outcome::result<void> load(const std::string &filename);

    /**
     * Set config value
     * @tparam T - parameter of a configuration value
     * @param key - configuration key
     * @param value - configuration value
     */
    template <typename T>
    void set(const ConfigKey &key, const T &value) {
      ptree_.put<T>(key, value);
    }

    /**
     * Get config value by key
     * @tparam T - expected parameter of a configuration value
     * @param key - configuration key
     * @return value or error occurred
     */
    template <typename T>
    outcome::result<T> get(const ConfigKey &key) const {
      try {
        return ptree_.get<T>(key);
      } catch (const boost::property_tree::ptree_bad_path &) {
        return ConfigError::kBadPath;
      } catch (const boost::property_tree::ptree_bad_data &) {
        return ConfigError::kBadValue;
      }
    }

   private:
    boost::property_tree::ptree ptree_;
  };

}  // namespace mdag::config

#endif  // CPP_MERKLEDAG_CORE_CONFIG_CONFIG_HPP
