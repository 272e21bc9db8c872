/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/courier_conf_loader.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <limits>
#include <string_view>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/rapidjson.h>
#include <boost/range/adaptor/map.hpp>
#include <boost/throw_exception.hpp>
#include "common/files.hpp"
#include "common/result.hpp"
#include "logger/logger.hpp"
#include "logger/logger_spdlog.hpp"
#include "main/courier_conf_literals.hpp"

/// The length of the string around the error place to print in case of JSON
/// syntax error.
static constexpr size_t kBadJsonPrintLength = 15;

/// The offset of printed chunk towards file start from the error position.
static constexpr size_t kBadJsonPrintOffsset = 5;

static_assert(kBadJsonPrintOffsset <= kBadJsonPrintLength,
              "The place of error is out of the printed string boundaries!");

using ConstJsonValRef = std::reference_wrapper<rapidjson::Value const>;

class ConfigParsingException : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * Throws a runtime exception if the given condition is false.
 * @param condition
 * @param error - error message
 */
inline void assert_fatal(bool condition,
                         std::string_view printable_path,
                         std::string error) {
  if (!condition) {
    throw ConfigParsingException(fmt::format("{}: {}", printable_path, error));
  }
}

inline logger::LogLevel getLogLevel(std::string level_str,
                                    std::string_view printable_path) {
  const auto it = config_members::LogLevels.find(level_str);
  assert_fatal(it != config_members::LogLevels.end(),
               printable_path,
               fmt::format("wrong log level `{}': must be one of `{}'",
                           level_str,
                           fmt::join(config_members::LogLevels
                                         | boost::adaptors::map_keys,
                                     "', `")));
  return it->second;
}

/**
 * A class for reading a structure from a JSON node.
 */
class JsonDeserializerImpl {
 public:
  JsonDeserializerImpl(std::optional<ConstJsonValRef> json,
                       std::optional<logger::LoggerPtr> log)
      : json_(json), printable_path_(""), log_(std::move(log)) {}

  /**
   * Load the data from the JSON node. Throws if the node is absent or has a
   * wrong type.
   * @tparam TDest - the type of data to read from JSON
   * @return the deserialized data
   */
  template <typename TDest>
  TDest deserialize() {
    TDest dest;
    assert_fatal(loadInto(dest), "missing mandatory value");
    return dest;
  }

 private:
  JsonDeserializerImpl(std::optional<ConstJsonValRef> json,
                       std::string printable_path,
                       std::optional<logger::LoggerPtr> log)
      : json_(json),
        printable_path_(std::move(printable_path)),
        log_(std::move(log)) {}

  JsonDeserializerImpl getDictChild(std::string const &key) {
    std::optional<ConstJsonValRef> child;
    if (json_) {
      assert_fatal(json_->get().IsObject(), "must be a JSON object.");
      auto const json_obj = json_->get().GetObject();
      const auto it = json_obj.FindMember(key.c_str());
      if (it != json_obj.MemberEnd()) {
        child = it->value;
      }
    }
    if (log_) {
      log_.value()->trace("lookup {}{}",
                          makePrintableDictChildKey(key),
                          child ? "" : ": not set");
    }
    return JsonDeserializerImpl{child, makePrintableDictChildKey(key), log_};
  }

  template <typename T>
  std::string makePrintableDictChildKey(T const &child_key) {
    return fmt::format("{}/{}", printable_path_, child_key);
  }

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  std::string makePrintableArrayElemPath(T const &index) {
    return fmt::format("{}[{}]", printable_path_, index);
  }

  template <typename F>
  bool iterateDictChildren(F f) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsObject(), "must be a JSON object.");
    auto const json_obj = json_->get().GetObject();
    for (const auto &child_json : json_obj) {
      auto const key = child_json.name.GetString();
      f(key,
        JsonDeserializerImpl{
            child_json.value, makePrintableDictChildKey(key), log_});
    }
    return true;
  }

  inline void assert_fatal(bool condition, std::string error) {
    ::assert_fatal(condition, printable_path_, error);
  }

  // ------------ loadInto(dst) ------------
  // loadInto is a set of functions that load the value from the JSON node to
  // a given destination variable. They return false if the node is absent and
  // throw if it has a wrong type.

  template <typename T>
  static constexpr bool IsIntegerLike =
      std::numeric_limits<T>::is_integer or std::is_enum<T>::value;

  template <typename T>
  static constexpr bool IsInt64Like =
      IsIntegerLike<T> and sizeof(T) == sizeof(int64_t);

  template <typename T>
  static constexpr bool fitsType(int64_t i) {
    return static_cast<int64_t>(std::numeric_limits<T>::min()) <= i
        and i <= static_cast<int64_t>(std::numeric_limits<T>::max());
  }

  template <typename TDest>
  typename std::enable_if_t<IsInt64Like<TDest> and std::is_unsigned_v<TDest>,
                            bool>
  loadInto(TDest &dest) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsUint64(), "must be an unsigned integer");
    dest = json_->get().GetUint64();
    return true;
  }

  template <typename TDest>
  typename std::enable_if_t<
      IsIntegerLike<TDest> and sizeof(TDest) < sizeof(int64_t),
      bool>
  loadInto(TDest &dest) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsInt64(), "must be an integer");
    const int64_t val = json_->get().GetInt64();
    assert_fatal(fitsType<TDest>(val), "integer value out of range");
    dest = static_cast<TDest>(val);
    return true;
  }

  template <typename Elem>
  bool loadInto(std::vector<Elem> &dest) {
    if (not json_) {
      return false;
    }
    assert_fatal(json_->get().IsArray(), "must be an array.");
    const auto arr = json_->get().GetArray();
    for (size_t i = 0; i < arr.Size(); ++i) {
      dest.emplace_back(
          JsonDeserializerImpl{arr[i], makePrintableArrayElemPath(i), log_}
              .deserialize<Elem>());
    }
    return true;  // empty vector in JSON is loaded
  }

  template <typename T>
  inline bool loadInto(boost::optional<T> &dest) {
    T val;
    if (loadInto(val)) {
      dest = std::move(val);
    }
    return true;
  }

  // This is the fallback template function specialization that is overriden by
  // multiple specializations below.
  template <typename TDest>
  typename std::enable_if_t<not IsIntegerLike<TDest>, bool> loadInto(TDest &) {
    BOOST_THROW_EXCEPTION(
        ConfigParsingException("Wrong type. Should never reach here."));
    return false;
  }

  // ------------ end of loadInto(dst) ------------

  bool addChildrenLoggerConfigs(logger::LoggerManagerTree &parent_config);

  void updateLoggerConfig(logger::LoggerConfig &cfg);

  /**
   * Gets an optional value by a key from a JSON object.
   * @param key - the key for the requested value
   * @return the value if present in the JSON object, otherwise boost::none.
   */
  template <typename TDest, typename TKey>
  boost::optional<TDest> getOptValByKey(const TKey &key) {
    TDest val;
    return boost::make_optional(getDictChild(key).loadInto(val), val);
  }

  std::optional<ConstJsonValRef> json_;
  std::string printable_path_;
  std::optional<logger::LoggerPtr> log_;
};

// ------------ loadInto(dst) specializations ------------

template <>
inline bool JsonDeserializerImpl::loadInto(std::string &dest) {
  if (not json_) {
    return false;
  }
  assert_fatal(json_->get().IsString(), "must be a string");
  dest = json_->get().GetString();
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(logger::LogLevel &dest) {
  std::string level_str;
  if (not loadInto(level_str)) {
    return false;
  }
  dest = getLogLevel(level_str, printable_path_);
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(logger::LogPatterns &dest) {
  return iterateDictChildren(
      [&](std::string_view level, JsonDeserializerImpl pattern_raw) {
        dest.setPattern(getLogLevel(std::string{level}, printable_path_),
                        pattern_raw.deserialize<std::string>());
      });
}

template <>
inline bool JsonDeserializerImpl::loadInto(
    logger::LoggerManagerTreePtr &dest) {
  if (not json_) {
    return false;
  }
  logger::LoggerConfig root_config{logger::kDefaultLogLevel,
                                   logger::getDefaultLogPatterns()};
  updateLoggerConfig(root_config);
  dest = std::make_shared<logger::LoggerManagerTree>(
      std::make_shared<const logger::LoggerConfig>(std::move(root_config)));
  addChildrenLoggerConfigs(*dest);
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(CourierConfig::MessageGas &dest) {
  if (not json_) {
    return false;
  }
  getDictChild(config_members::DefaultGas).loadInto(dest.default_gas);
  getDictChild(config_members::GasByTag)
      .iterateDictChildren(
          [&](std::string_view tag_str, JsonDeserializerImpl gas_raw) {
            unsigned long tag = 0;
            size_t parsed = 0;
            try {
              tag = std::stoul(std::string{tag_str}, &parsed);
            } catch (const std::logic_error &) {
              parsed = 0;
            }
            assert_fatal(parsed != 0 and parsed == tag_str.size(),
                         fmt::format("tag `{}' is not a number", tag_str));
            assert_fatal(tag <= std::numeric_limits<uint8_t>::max(),
                         fmt::format("tag `{}' does not fit a byte", tag_str));
            dest.by_tag[static_cast<uint8_t>(tag)] =
                gas_raw.deserialize<courier::types::GasLimit>();
          });
  return true;
}

template <>
inline bool JsonDeserializerImpl::loadInto(CourierConfig::Adapter &dest) {
  dest.base_fee = 0;
  dest.gas_price = 0;
  return getDictChild(config_members::Name).loadInto(dest.name)
      and (getDictChild(config_members::BaseFee).loadInto(dest.base_fee)
           or true)
      and (getDictChild(config_members::GasPrice).loadInto(dest.gas_price)
           or true);
}

template <>
inline bool JsonDeserializerImpl::loadInto(CourierConfig::Route &dest) {
  dest.tenant = courier::types::kGlobalTenant;
  return getDictChild(config_members::Remote).loadInto(dest.remote)
      and (getDictChild(config_members::Tenant).loadInto(dest.tenant) or true)
      and getDictChild(config_members::Adapters).loadInto(dest.adapters)
      and getDictChild(config_members::Threshold).loadInto(dest.threshold)
      and getDictChild(config_members::Primary).loadInto(dest.primary)
      and getDictChild(config_members::RecoveryIndex)
              .loadInto(dest.recovery_index);
}

template <>
inline bool JsonDeserializerImpl::loadInto(CourierConfig::Subsidy &dest) {
  return getDictChild(config_members::Tenant).loadInto(dest.tenant)
      and getDictChild(config_members::Amount).loadInto(dest.amount)
      and getDictChild(config_members::Refund).loadInto(dest.refund);
}

template <>
inline bool JsonDeserializerImpl::loadInto(CourierConfig &dest) {
  using namespace config_members;
  dest.message_gas.default_gas = 0;
  return getDictChild(LocalNetwork).loadInto(dest.local_network)
      and getDictChild(Configurators).loadInto(dest.configurators)
      and getDictChild(Operators).loadInto(dest.operators)
      and getDictChild(MaxBatchGasLimit).loadInto(dest.max_batch_gas_limit)
      and (getDictChild(MessageGas).loadInto(dest.message_gas) or true)
      and getDictChild(Adapters).loadInto(dest.adapters)
      and (getDictChild(Routes).loadInto(dest.routes) or true)
      and getDictChild(Subsidies).loadInto(dest.subsidies)
      and getDictChild(LogSection).loadInto(dest.logger_manager);
}

// ------------ end of loadInto(dst) specializations ------------

/**
 * Adds the children logger configs from parent logger JSON object to parent
 * logger config.
 * @param parent_config - the parent logger config
 */
bool JsonDeserializerImpl::addChildrenLoggerConfigs(
    logger::LoggerManagerTree &parent_config) {
  return getDictChild(config_members::LogChildrenSection)
      .iterateDictChildren([&](std::string_view child_name,
                               JsonDeserializerImpl child_conf_raw) {
        auto child_conf = parent_config.registerChild(
            std::string{child_name},
            child_conf_raw.getOptValByKey<logger::LogLevel>(
                config_members::LogLevel),
            child_conf_raw.getOptValByKey<logger::LogPatterns>(
                config_members::LogPatternsSection));
        child_conf_raw.addChildrenLoggerConfigs(*child_conf);
      });
}

/**
 * Overrides the logger configuration with the values from JSON object.
 * @param cfg - the configuration to use as base
 */
void JsonDeserializerImpl::updateLoggerConfig(logger::LoggerConfig &cfg) {
  getDictChild(config_members::LogLevel).loadInto(cfg.log_level);
  getDictChild(config_members::LogPatternsSection).loadInto(cfg.patterns);
}

void reportJsonParsingError(const rapidjson::Document &doc,
                            const std::string &text) {
  if (doc.HasParseError()) {
    const size_t error_offset = doc.GetErrorOffset();
    // This ensures the unsigned string beginning position does not cross zero:
    const size_t print_offset =
        std::max(error_offset, kBadJsonPrintOffsset) - kBadJsonPrintOffsset;
    std::string json_error_buf = text.substr(print_offset, kBadJsonPrintLength);
    throw ConfigParsingException{fmt::format(
        "JSON parse error (near `{}'): {}",
        json_error_buf,
        std::string(rapidjson::GetParseError_En(doc.GetParseError())))};
  }
}

courier::expected::Result<CourierConfig, std::string>
parse_courier_config_text(const std::string &conf_text,
                          std::optional<logger::LoggerPtr> log) {
  try {
    rapidjson::Document doc;
    doc.Parse(conf_text.data(), conf_text.size());
    reportJsonParsingError(doc, conf_text);

    JsonDeserializerImpl parser(ConstJsonValRef{doc}, std::move(log));
    return courier::expected::makeValue(parser.deserialize<CourierConfig>());
  } catch (ConfigParsingException const &e) {
    return courier::expected::makeError(std::string{e.what()});
  }
}

courier::expected::Result<CourierConfig, std::string> parse_courier_config(
    const std::string &conf_path, std::optional<logger::LoggerPtr> log) {
  auto config_text = courier::readTextFile(conf_path);
  if (courier::expected::hasError(config_text)) {
    return courier::expected::makeError(
        std::move(config_text).assumeError());
  }
  return parse_courier_config_text(config_text.assumeValue(), std::move(log));
}
