/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <json/value.h>

#include "Debug.h"
#include "JsonWrapper.h"

// clang-format off
/**
 * HOWTO Use Configurable
 *
 * class MyConfig : public Configurable {
 *  public:
 *   std::string get_config_name() override { return "MyConfig"; }
 *
 *   std::string get_config_doc() override {
 *     return "What the options below control";
 *   };
 *
 *   void bind_config() override {
 *     // Bind the parameter named "param_name" to m_param, with a default
 *     // value used when the parameter is absent from the config. The 4th
 *     // argument documents the parameter for --reflect-config.
 *     bind("param_name", default_param_value, m_param,
 *          "Help doc explaining param");
 *   }
 *
 *  private:
 *    param_type_t m_param;
 * };
 */
// clang-format on
class Configurable {
 public:
  struct ReflectionParam {
    ReflectionParam() {}

    ReflectionParam(const std::string& name,
                    const std::string& doc,
                    const bool is_required,
                    const std::string& type,
                    const Json::Value& default_value = Json::nullValue)
        : name(name),
          doc(doc),
          is_required(is_required),
          type(type),
          default_value(default_value) {}

    std::string name;
    std::string doc;
    bool is_required{false};
    std::string type;
    Json::Value default_value;
  };

  struct Reflection {
    std::string name;
    std::string doc;
    std::map<std::string, ReflectionParam> params;
  };

 public:
  virtual ~Configurable() {}

  /**
   * Returns the human readable name of this Configurable, as used in
   * reflection. */
  virtual std::string get_config_name() = 0;

  /** Returns help text explaining this Configurable's purpose. */
  virtual std::string get_config_doc() { return default_doc(); };

  /**
   * Declares the bindings. Called both when reflecting and when parsing, so
   * it must not assume a configuration is being consumed. Imperative work
   * that needs the parsed values goes in after_configuration().
   */
  virtual void bind_config() {}

  /**
   * Returns the schema of this Configurable.
   */
  virtual Reflection reflect();

  /**
   * Apply the declared bindings in order to consume json at configuration
   * time. Throws tighten::InvalidConfigException on ill-typed values.
   */
  void parse_config(const JsonWrapper& json);

  using MapOfVectorOfStrings =
      std::unordered_map<std::string, std::vector<std::string>>;
  using MapOfStrings = std::unordered_map<std::string, std::string>;

  static constexpr const char* default_doc() { return "(undocumented)"; }

 protected:
  /**
   * The provided function will be called immediately after bind_config() when
   * a configuration is consumed (never when reflecting).
   */
  void after_configuration(std::function<void()> after_configuration_fn) {
    always_assert_log(!m_after_configuration,
                      "after_configuration may only be called once");
    m_after_configuration = std::move(after_configuration_fn);
  }

  /**
   * json -> data type coercions for composites (Configurables). Primitives
   * have specializations in Configurable.cpp.
   */
  template <typename T>
  static T as(const Json::Value& value) {
    static_assert(
        std::is_base_of<Configurable, T>::value,
        "T must be a supported primitive or derive from Configurable");
    T t;
    t.parse_config(JsonWrapper{value});
    return t;
  }

  template <typename T>
  struct DefaultValueType {
    using type = typename std::conditional<std::is_pointer<T>::value ||
                                               std::is_arithmetic<T>::value,
                                           T,
                                           const T&>::type;
  };

  using ReflectorParamFunc = std::function<void(const ReflectionParam&)>;

  /**
   * Reflection of composites. Primitives have specializations in
   * Configurable.cpp.
   */
  template <typename T>
  void reflect(ReflectorParamFunc& reflector,
               const std::string& param_name,
               const std::string& param_doc,
               const bool param_is_required,
               T& /* param */,
               typename DefaultValueType<T>::type /* default_val */) {
    static_assert(
        std::is_base_of<Configurable, T>::value,
        "T must be a supported primitive or derive from Configurable");
    reflector(ReflectionParam(param_name, param_doc, param_is_required,
                              "composite"));
  }

  template <typename T>
  struct IdentityType {
    using type = T;
  };

  template <typename T>
  void bind(const std::string& name,
            typename IdentityType<T>::type defaultValue,
            T& dest,
            const std::string& doc = default_doc()) {
    if (m_reflecting) {
      reflect(m_param_reflector, name, doc, false /* param_is_required */,
              dest, defaultValue);
    } else {
      parse(name, defaultValue, dest);
    }
  }

  template <typename T>
  void bind_required(const std::string& name,
                     T& dest,
                     const std::string& doc = default_doc()) {
    if (m_reflecting) {
      reflect(m_param_reflector, name, doc, true /* param_is_required */, dest,
              T());
    } else {
      parse_required(name, dest);
    }
  }

 private:
  template <typename T>
  void parse(const std::string& name, T defaultValue, T& dest) {
    boost::optional<const Json::Value&> value = m_parser(name);
    if (value) {
      dest = parse_value<T>(name, *value);
    } else {
      dest = defaultValue;
    }
  }

  template <typename T>
  void parse_required(const std::string& name, T& dest) {
    boost::optional<const Json::Value&> value = m_parser(name);
    assert_or_throw(!!value, TightenError::INVALID_CONFIG,
                    "Missing required parameter",
                    {{"config", get_config_name()}, {"param", name}});
    dest = parse_value<T>(name, *value);
  }

  template <typename T>
  T parse_value(const std::string& name, const Json::Value& value) {
    try {
      return Configurable::as<T>(value);
    } catch (const Json::Exception& e) {
      throw tighten::InvalidConfigException(
          e.what(), {{"config", get_config_name()}, {"param", name}});
    } catch (const std::runtime_error& e) {
      throw tighten::InvalidConfigException(
          e.what(), {{"config", get_config_name()}, {"param", name}});
    }
  }

  std::function<void()> m_after_configuration;
  std::function<boost::optional<const Json::Value&>(const std::string& name)>
      m_parser;
  ReflectorParamFunc m_param_reflector;
  bool m_reflecting{false};
};

// Specializations for primitives

#define DEFINE_CONFIGURABLE_PRIMITIVE(T)                             \
  template <>                                                        \
  T Configurable::as<T>(const Json::Value& value);                   \
  template <>                                                        \
  void Configurable::reflect<T>(                                     \
      ReflectorParamFunc & reflector, const std::string& param_name, \
      const std::string& param_doc, const bool param_is_required,    \
      T& param, typename DefaultValueType<T>::type default_value);

DEFINE_CONFIGURABLE_PRIMITIVE(bool)
DEFINE_CONFIGURABLE_PRIMITIVE(unsigned int)
DEFINE_CONFIGURABLE_PRIMITIVE(std::vector<std::string>)
DEFINE_CONFIGURABLE_PRIMITIVE(Configurable::MapOfVectorOfStrings)
DEFINE_CONFIGURABLE_PRIMITIVE(Configurable::MapOfStrings)

#undef DEFINE_CONFIGURABLE_PRIMITIVE
