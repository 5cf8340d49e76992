//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#ifndef CPP_CONFIG_RESULT_HPP
#define CPP_CONFIG_RESULT_HPP

#include <iostream>
#include <string>
#include <utility>


// outcome of a setter: on failure the previous configuration is retained
class ConfigResult {
  public:
  static ConfigResult Ok() { return ConfigResult(true, ""); }
  static ConfigResult Error(std::string _reason) { return ConfigResult(false, std::move(_reason)); }
  bool ok;
  std::string reason;

  explicit operator bool() const { return ok; }

  // print the reason as a warning. returns `ok` so that it can be chained.
  bool Warn(const std::string& prefix = "") const {
    if (!ok) {
      std::cerr << "[Warning] " << prefix << reason << std::endl;
    }
    return ok;
  }
  private:
  ConfigResult(bool _ok, std::string _reason) : ok(_ok), reason(std::move(_reason)) {};
};

template <typename T>
class Result {
  public:
  static Result Ok(T v) { return Result(true, std::move(v), ""); }
  static Result Error(std::string _reason) { return Result(false, T(), std::move(_reason)); }
  bool ok;
  T value;
  std::string reason;

  explicit operator bool() const { return ok; }
  private:
  Result(bool _ok, T v, std::string _reason) : ok(_ok), value(std::move(v)), reason(std::move(_reason)) {};
};

#endif //CPP_CONFIG_RESULT_HPP
