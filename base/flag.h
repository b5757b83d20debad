// base/flag.h - Command-line flag parsing
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_FLAG_H
#define BASE_FLAG_H

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "base/chars.h"
#include "base/concat.h"
#include "base/result.h"

namespace base {

class FlagSet;  // forward declaration

// Whether a flag spelling consumes a value ("--name=value" or "--name value").
enum class FlagArgument : unsigned char {
  none = 0,
  required = 1,
  optional = 2,
};

using FlagSetter = std::function<base::Result(FlagSet*, bool, base::Chars)>;

// FlagHook binds one command-line spelling to the flag that owns it.
// A BoolFlag named "debug" owns two hooks: "debug" and "nodebug".
struct FlagHook {
  std::string name;
  FlagArgument arg;
  FlagSetter setter;

  FlagHook(std::string name, FlagArgument arg, FlagSetter setter)
      : name(std::move(name)), arg(arg), setter(std::move(setter)) {}
};

class Flag {
 protected:
  Flag(base::Chars name, base::Chars help)
      : name_(name), help_(help), required_(false) {}

  void hook(std::string name, FlagArgument arg, FlagSetter setter);

 public:
  virtual ~Flag() noexcept = default;
  virtual bool is_set() const noexcept = 0;
  virtual std::string get_default() const = 0;
  virtual base::Result set(base::Chars value) = 0;

  base::Chars name() const noexcept { return name_; }
  base::Chars help() const noexcept { return help_; }
  bool is_required() const noexcept { return required_; }

  Flag& mark_required() noexcept {
    required_ = true;
    return *this;
  }

 private:
  friend class FlagSet;

  std::string name_;
  std::string help_;
  std::vector<std::unique_ptr<FlagHook>> hooks_;
  bool required_;
};

// ActionFlag runs an action as soon as it is parsed, e.g. --help.
class ActionFlag : public Flag {
 public:
  using Action = std::function<void(FlagSet*)>;

  ActionFlag(base::Chars name, base::Chars help, Action action,
             std::vector<base::Chars> aliases);
  bool is_set() const noexcept override { return false; }
  std::string get_default() const override { return std::string(); }
  base::Result set(base::Chars value) override;

 private:
  Action action_;
};

class BoolFlag : public Flag {
 public:
  BoolFlag(base::Chars name, bool default_value, base::Chars help);
  bool is_set() const noexcept override { return isset_; }
  std::string get_default() const override;
  base::Result set(base::Chars value) override;

  bool value() const noexcept { return value_; }

 private:
  bool default_;
  bool value_;
  bool isset_;
};

class StringFlag : public Flag {
 public:
  StringFlag(base::Chars name, base::Chars default_value, base::Chars help);
  bool is_set() const noexcept override { return isset_; }
  std::string get_default() const override { return default_; }
  base::Result set(base::Chars value) override;

  base::Chars value() const noexcept { return value_; }

 private:
  std::string default_;
  std::string value_;
  bool isset_;
};

// UintFlag accepts a decimal integer within [min, max].
class UintFlag : public Flag {
 public:
  UintFlag(base::Chars name, uint64_t default_value, uint64_t min,
           uint64_t max, base::Chars help);
  bool is_set() const noexcept override { return isset_; }
  std::string get_default() const override;
  base::Result set(base::Chars value) override;

  uint64_t value() const noexcept { return value_; }

 private:
  uint64_t default_;
  uint64_t min_;
  uint64_t max_;
  uint64_t value_;
  bool isset_;
};

// ChoiceFlag is a StringFlag restricted to a fixed list of values.
class ChoiceFlag : public StringFlag {
 public:
  ChoiceFlag(base::Chars name, std::vector<base::Chars> choices,
             base::Chars default_value, base::Chars help);
  base::Result set(base::Chars value) override;

  const std::vector<std::string>& choices() const noexcept { return choices_; }

 private:
  std::vector<std::string> choices_;
};

class FlagSet {
 public:
  FlagSet();

  Flag& add(std::unique_ptr<Flag> flag);
  Flag& add_help();
  Flag& add_version();
  Flag& add_bool(base::Chars name, bool default_value, base::Chars help);
  Flag& add_string(base::Chars name, base::Chars default_value,
                   base::Chars help);
  Flag& add_uint(base::Chars name, uint64_t default_value, uint64_t min,
                 uint64_t max, base::Chars help);
  Flag& add_choice(base::Chars name, std::vector<base::Chars> choices,
                   base::Chars default_value, base::Chars help);

  void set_version(base::Chars version) { version_ = version; }
  void set_description(base::Chars description) { description_ = description; }
  void set_usage(base::Chars usage) { usage_ = usage; }

  template <typename T>
  T* get_as(base::Chars name) const noexcept {
    auto it = names_.find(name);
    if (it == names_.end()) return nullptr;
    return dynamic_cast<T*>(it->second);
  }

  BoolFlag* get_bool(base::Chars name) const noexcept {
    return get_as<BoolFlag>(name);
  }
  StringFlag* get_string(base::Chars name) const noexcept {
    return get_as<StringFlag>(name);
  }
  UintFlag* get_uint(base::Chars name) const noexcept {
    return get_as<UintFlag>(name);
  }
  ChoiceFlag* get_choice(base::Chars name) const noexcept {
    return get_as<ChoiceFlag>(name);
  }

  // Positional arguments, plus everything after "--".
  const std::vector<base::Chars>& args() const noexcept { return args_; }

  void show_help(std::ostream& o) const;
  void show_version(std::ostream& o) const;

  // Parses the command line.  Usage errors are reported as
  // INVALID_ARGUMENT; --help and --version exit the process with status 0.
  base::Result try_parse(int argc, const char* const* argv);

  // Like try_parse, but dies with exit status 2 on any usage error.
  void parse(int argc, const char* const* argv);

  __attribute__((noreturn)) void die(base::Chars msg) const;

  template <typename... Args>
  __attribute__((noreturn)) void die(Args&&... args) const {
    std::string msg = concat(std::forward<Args>(args)...);
    die(base::Chars(msg));
  }

 private:
  std::string progname_;
  std::string version_;
  std::string description_;
  std::string usage_;
  std::vector<std::unique_ptr<Flag>> flags_;
  std::map<base::Chars, Flag*> names_;
  std::map<base::Chars, FlagHook*> hooks_;
  std::vector<base::Chars> args_;
};

}  // namespace base

#endif  // BASE_FLAG_H
