#include "argparser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace treeup {

argparser::argparser() {}

void argparser::parse(int argc, char** argv) {
  if (argc > 0) _command = argv[0];

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg.size() > 1 && arg[0] == '-') {
      // --option=value
      size_t pos = arg.find('=');
      if (pos != std::string::npos) {
        std::string name = arg.substr(0, pos);
        std::string value = arg.substr(pos + 1);
        if (_options.find(name) == _options.end()) {
          throw std::invalid_argument("unknown option: " + name);
        }
        if (!_options[name]->has_value) {
          throw std::invalid_argument("option does not take a value: " + name);
        }
        _options[name]->value = value;
        continue;
      }

      // --option value
      if (_options.find(arg) == _options.end()) {
        throw std::invalid_argument("unknown option: " + arg);
      }

      if (_options[arg]->has_value) {
        if (i + 1 >= argc) {
          throw std::invalid_argument("missing value for option: " + arg);
        }
        _options[arg]->value = argv[++i];
      }
      else {
        _options[arg]->value = "true";
      }
    }
    else {
      _values.push_back(arg);
    }
  }
}

void argparser::set_env_prefix(const std::string& prefix) { _env_prefix = prefix; }

void argparser::add_option(const std::string& name, const std::string& default_value) {
  _options[name] = std::make_shared<option>(option{"", default_value, true});

  // Check if the option is set in the environment
  if (!_env_prefix.empty()) {
    // Replace - with _
    std::string env_name = _env_prefix + "_" + name.substr(2);
    std::replace(env_name.begin(), env_name.end(), '-', '_');

    // Convert to uppercase
    std::transform(env_name.begin(), env_name.end(), env_name.begin(), ::toupper);

    if (const char* env_value = std::getenv(env_name.c_str())) {
      _options[name]->value = env_value;
    }
  }
}

void argparser::add_option_alias(const std::string& name, const std::string& alias) {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  _options[alias] = _options[name];
}

void argparser::add_bool_option(const std::string& name) {
  _options[name] = std::make_shared<option>(option{"", "", false});
}

const argparser::option& argparser::find(const std::string& name) const {
  auto it = _options.find(name);
  if (it == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  return *it->second;
}

std::string argparser::get_option(const std::string& name) const {
  const option& opt = find(name);
  if (opt.value.empty()) {
    return opt.default_value;
  }
  return opt.value;
}

std::filesystem::path argparser::get_option_path(const std::string& name, bool absolute) const {
  std::string value = get_option(name);
  if (value.empty()) return {};
  if (absolute) {
    return std::filesystem::absolute(value).lexically_normal();
  }
  return std::filesystem::path(value).lexically_normal();
}

long long argparser::get_option_int(const std::string& name) const {
  std::string value = get_option(name);
  size_t pos = 0;
  long long number = 0;
  try {
    number = std::stoll(value, &pos);
  }
  catch (const std::exception&) {
    throw std::invalid_argument("invalid value for option " + name + ": " + value);
  }
  if (pos != value.size()) {
    throw std::invalid_argument("invalid value for option " + name + ": " + value);
  }
  return number;
}

bool argparser::has_option(const std::string& name) const { return !find(name).value.empty(); }

std::string argparser::get_value(size_t index) const {
  if (index >= _values.size()) {
    throw std::invalid_argument("index out of range");
  }
  return _values[index];
}

std::filesystem::path argparser::get_value_path(size_t index) const {
  return std::filesystem::absolute(get_value(index)).lexically_normal();
}

size_t argparser::size() const { return _values.size(); }

std::string argparser::operator[](size_t index) const { return get_value(index); }

std::string argparser::command() const { return _command; }

}  // namespace treeup
