// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/flag.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>

#include "base/backport.h"
#include "base/logging.h"

namespace base {

static base::Result parse_bool(bool* out, base::Chars in) {
  static const std::map<base::Chars, bool>& map =
      *new std::map<base::Chars, bool>{
          {"0", false}, {"1", true},     {"f", false},     {"t", true},
          {"n", false}, {"y", true},     {"no", false},    {"yes", true},
          {"false", false}, {"true", true},
      };
  auto it = map.find(in);
  if (it == map.end())
    return base::Result::invalid_argument("invalid boolean value \"", in,
                                          "\"");
  *out = it->second;
  return base::Result();
}

static base::Result parse_uint64(uint64_t* out, base::Chars in) {
  CHECK_NOTNULL(out);
  if (in.empty()) return base::Result::invalid_argument("empty string");
  uint64_t value = 0;
  for (char ch : in) {
    if (ch < '0' || ch > '9')
      return base::Result::invalid_argument("invalid character");
    uint64_t digit = ch - '0';
    if (value > (UINT64_MAX - digit) / 10)
      return base::Result::out_of_range("overflow");
    value = value * 10 + digit;
  }
  *out = value;
  return base::Result();
}

void Flag::hook(std::string name, FlagArgument arg, FlagSetter setter) {
  hooks_.push_back(base::backport::make_unique<FlagHook>(std::move(name), arg,
                                                         std::move(setter)));
}

ActionFlag::ActionFlag(base::Chars name, base::Chars help, Action action,
                       std::vector<base::Chars> aliases)
    : Flag(name, help), action_(std::move(action)) {
  auto f = [this](FlagSet* flagset, bool, base::Chars) {
    action_(flagset);
    return base::Result();
  };
  hook(name, FlagArgument::none, f);
  for (base::Chars alias : aliases) hook(alias, FlagArgument::none, f);
}

base::Result ActionFlag::set(base::Chars) {
  return base::Result::invalid_argument("--", name(),
                                        " does not take a value");
}

BoolFlag::BoolFlag(base::Chars name, bool default_value, base::Chars help)
    : Flag(name, help),
      default_(default_value),
      value_(default_value),
      isset_(false) {
  hook(name, FlagArgument::optional,
       [this](FlagSet*, bool have_value, base::Chars value) {
         return set(have_value ? value : base::Chars("true"));
       });
  hook(concat("no", name), FlagArgument::none,
       [this](FlagSet*, bool, base::Chars) { return set("false"); });
}

std::string BoolFlag::get_default() const {
  return default_ ? "true" : "false";
}

base::Result BoolFlag::set(base::Chars value) {
  bool b = false;
  auto result = parse_bool(&b, value);
  if (!result) return result;
  value_ = b;
  isset_ = true;
  return base::Result();
}

StringFlag::StringFlag(base::Chars name, base::Chars default_value,
                       base::Chars help)
    : Flag(name, help),
      default_(default_value),
      value_(default_value),
      isset_(false) {
  hook(name, FlagArgument::required,
       [this](FlagSet*, bool, base::Chars value) { return set(value); });
}

base::Result StringFlag::set(base::Chars value) {
  value_ = value;
  isset_ = true;
  return base::Result();
}

UintFlag::UintFlag(base::Chars name, uint64_t default_value, uint64_t min,
                   uint64_t max, base::Chars help)
    : Flag(name, help),
      default_(default_value),
      min_(min),
      max_(max),
      value_(default_value),
      isset_(false) {
  hook(name, FlagArgument::required,
       [this](FlagSet*, bool, base::Chars value) { return set(value); });
}

std::string UintFlag::get_default() const { return std::to_string(default_); }

base::Result UintFlag::set(base::Chars value) {
  uint64_t n = 0;
  auto result = parse_uint64(&n, value);
  if (!result) return result;
  if (n < min_ || n > max_)
    return base::Result::out_of_range("value ", n, " is outside [", min_, ", ",
                                      max_, "]");
  value_ = n;
  isset_ = true;
  return base::Result();
}

ChoiceFlag::ChoiceFlag(base::Chars name, std::vector<base::Chars> choices,
                       base::Chars default_value, base::Chars help)
    : StringFlag(name, default_value, help) {
  choices_.reserve(choices.size());
  for (base::Chars choice : choices) choices_.push_back(choice.as_string());
}

base::Result ChoiceFlag::set(base::Chars value) {
  for (const auto& choice : choices_) {
    if (value == choice) return StringFlag::set(value);
  }
  return base::Result::invalid_argument("invalid choice value \"", value, "\"");
}

FlagSet::FlagSet() : version_("unknown"), usage_("<flags>") {}

Flag& FlagSet::add(std::unique_ptr<Flag> flag) {
  Flag* ptr = CHECK_NOTNULL(flag.get());
  flags_.push_back(std::move(flag));
  names_[ptr->name()] = ptr;
  for (const auto& hook : ptr->hooks_) {
    hooks_[hook->name] = hook.get();
  }
  return *ptr;
}

Flag& FlagSet::add_help() {
  return add(base::backport::make_unique<ActionFlag>(
      "help", "Shows this usage information",
      [](FlagSet* flagset) {
        flagset->show_help(std::cout);
        std::exit(0);
      },
      std::vector<base::Chars>{"h", "?"}));
}

Flag& FlagSet::add_version() {
  return add(base::backport::make_unique<ActionFlag>(
      "version", "Shows version information",
      [](FlagSet* flagset) {
        flagset->show_version(std::cout);
        std::exit(0);
      },
      std::vector<base::Chars>{"V"}));
}

Flag& FlagSet::add_bool(base::Chars name, bool default_value,
                        base::Chars help) {
  return add(base::backport::make_unique<BoolFlag>(name, default_value, help));
}

Flag& FlagSet::add_string(base::Chars name, base::Chars default_value,
                          base::Chars help) {
  return add(
      base::backport::make_unique<StringFlag>(name, default_value, help));
}

Flag& FlagSet::add_uint(base::Chars name, uint64_t default_value,
                        uint64_t min, uint64_t max, base::Chars help) {
  return add(base::backport::make_unique<UintFlag>(name, default_value, min,
                                                   max, help));
}

Flag& FlagSet::add_choice(base::Chars name, std::vector<base::Chars> choices,
                          base::Chars default_value, base::Chars help) {
  return add(base::backport::make_unique<ChoiceFlag>(name, std::move(choices),
                                                     default_value, help));
}

void FlagSet::show_help(std::ostream& o) const {
  if (!description_.empty()) o << description_ << "\n";
  o << "Usage: " << (progname_.empty() ? "<program>" : progname_) << " "
    << usage_ << "\n\n"
    << "Flags:\n";

  std::size_t width = 0;
  for (const auto& flag : flags_) {
    if (width < flag->name().size()) width = flag->name().size();
  }

  for (const auto& flag : flags_) {
    o << "  --" << std::left << std::setw(width) << flag->name().as_string()
      << "  " << flag->help();

    auto* choice = dynamic_cast<const ChoiceFlag*>(flag.get());
    if (choice) {
      o << " [choices:";
      char sep = ' ';
      for (const auto& item : choice->choices()) {
        o << sep << item;
        sep = ',';
      }
      o << "]";
    }

    std::string def = flag->get_default();
    if (flag->is_required())
      o << " [required]";
    else if (!def.empty())
      o << " [default: " << def << "]";
    o << "\n";
  }
  o << std::endl;
}

void FlagSet::show_version(std::ostream& o) const { o << version_ << std::endl; }

void FlagSet::die(base::Chars msg) const {
  std::cerr << "ERROR: " << msg << std::endl;
  std::exit(2);
}

void FlagSet::parse(int argc, const char* const* argv) {
  auto result = try_parse(argc, argv);
  if (!result) die(result.message());
}

base::Result FlagSet::try_parse(int argc, const char* const* argv) {
  if (argc > 0 && progname_.empty()) progname_ = argv[0];

  int i = 1;
  for (; i < argc; ++i) {
    base::Chars arg(argv[i]);
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg == "-" || !arg.has_prefix("-")) {
      args_.push_back(arg);
      continue;
    }

    // Both "-name" and "--name" are accepted.
    arg.remove_prefix(base::Chars("-"));
    arg.remove_prefix(base::Chars("-"));

    base::Chars name = arg;
    base::Chars value;
    bool have_value = false;
    auto eq = arg.find('=');
    if (eq != base::Chars::npos) {
      name = arg.substring(0, eq);
      value = arg.substring(eq + 1);
      have_value = true;
    }

    auto it = hooks_.find(name);
    if (it == hooks_.end())
      return base::Result::invalid_argument("unknown flag: --", name);
    const FlagHook& hook = *it->second;

    switch (hook.arg) {
      case FlagArgument::none:
        if (have_value)
          return base::Result::invalid_argument(
              "flag --", name, " does not take an argument");
        break;

      case FlagArgument::required:
        if (!have_value) {
          if (i + 1 >= argc)
            return base::Result::invalid_argument(
                "missing required argument for flag --", name);
          value = argv[++i];
          have_value = true;
        }
        break;

      case FlagArgument::optional:
        break;
    }

    auto result = hook.setter(this, have_value, value);
    if (!result)
      return base::Result::invalid_argument("--", name, ": ", result);
  }
  for (; i < argc; ++i) args_.push_back(argv[i]);

  for (const auto& flag : flags_) {
    if (flag->is_required() && !flag->is_set())
      return base::Result::invalid_argument("missing required flag --",
                                            flag->name());
  }
  return base::Result();
}

}  // namespace base
