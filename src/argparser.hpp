#ifndef TREEUP_ARGPARSER_HPP
#define TREEUP_ARGPARSER_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace treeup {

// Command line parser for "--option value", "--option=value" and boolean flags.
// Options with a value may also be set from the environment as
// <PREFIX>_<OPTION>, e.g. TREEUP_REMOTE for --remote.
class argparser {
  struct option {
    std::string value;
    std::string default_value;
    bool has_value;
  };

  std::map<std::string, std::shared_ptr<option>> _options;
  std::vector<std::string> _values;
  std::string _env_prefix;
  std::string _command;

 public:
  argparser();

  void parse(int argc, char** argv);

  // Must be called before options are added.
  void set_env_prefix(const std::string& prefix);

  void add_option(const std::string& name, const std::string& default_value);
  void add_option_alias(const std::string& name, const std::string& alias);
  void add_bool_option(const std::string& name);

  std::string get_option(const std::string& name) const;
  std::filesystem::path get_option_path(const std::string& name, bool absolute = true) const;

  // Returns the option as an integer. Throws std::invalid_argument for non-numeric values.
  long long get_option_int(const std::string& name) const;

  // Check if the option is present on command line or in the environment
  bool has_option(const std::string& name) const;

  std::string get_value(size_t index) const;
  std::filesystem::path get_value_path(size_t index) const;

  // Returns the number of values
  size_t size() const;

  // Returns the value at the given index
  std::string operator[](size_t index) const;

  // Program name as invoked
  std::string command() const;

 private:
  const option& find(const std::string& name) const;
};

}  // namespace treeup

#endif  // TREEUP_ARGPARSER_HPP
