// Copyright (c) 2025 tlsbatch contributors

// This file is part of tlsbatch

// tlsbatch is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. tlsbatch is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with tlsbatch. If not, see
// <https://www.gnu.org/licenses/>.

#pragma once

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fmt/format.h"
#include <toml++/toml.hpp>
#include <tlsbatch/logger/logger.h>

#include "validators.hpp"
#include "parameter.hpp"

#ifndef TB_VERSION
#define TB_VERSION "unknown"
#endif

namespace fs = std::filesystem;
namespace check = tlsbatch::validators;

struct CLIArgs {
  std::string program_name;
  std::list<std::string> args;

  CLIArgs(int argc, const char* argv[]) {
    program_name = argv[0];
    // get the name of the binary
    auto pos = program_name.find_last_of("/\\");
    if (pos != std::string::npos) {
      program_name = program_name.substr(pos + 1);
    }
    for (int i = 1; i < argc; i++) {
      args.push_back(argv[i]);
    }
  }
};

/**
 * @brief Command line and config file handling shared by the batch tools.
 *
 * Parameters are bound by reference to the fields of the tool's
 * configuration. Values are taken from the defaults, then from the TOML
 * config file and finally from the command line. The only positional
 * argument is the RISCAN project directory.
 */
struct ConfigHandler {
  using param_group_map = std::vector<std::pair<std::string, ParameterVector>>;

  param_group_map app_param_groups_;
  param_group_map param_groups_;
  std::unordered_map<std::string, ConfigParameter*> param_index_;
  std::unordered_map<std::string, ConfigParameter*> app_param_index_;

  // flags
  bool _print_help = false;
  bool _print_version = false;
  tlsbatch::logger::LogLevel _loglevel = tlsbatch::logger::LogLevel::info;
  std::string _config_path;
  size_t _jobs = 1;

  std::string project_path;

  ConfigHandler() {
    ParameterVector general;
    general.add("help", 'h', "Show help message", _print_help);
    general.add("version", 'v', "Show version", _print_version);
    general.add("jobs", 'j',
                "Number of scan positions to process in parallel", _jobs);
    general.add("config", 'c', "Configuration file", _config_path);
    general.add("loglevel", "Specify loglevel", _loglevel);
    app_param_groups_.emplace_back("General", std::move(general));
  }
  virtual ~ConfigHandler() = default;

  ConfigHandler(const ConfigHandler&) = delete;
  ConfigHandler& operator=(const ConfigHandler&) = delete;

  // One line description for the help message.
  virtual std::string summary() const = 0;

  // Checks that involve more than a single parameter.
  virtual void validate_combinations() {}

  // Call after all parameter groups are added to param_groups_.
  void build_index() {
    for (auto& [group_name, group] : param_groups_) {
      group.add_to_index(param_index_);
    }
    for (auto& [group_name, group] : app_param_groups_) {
      group.add_to_index(app_param_index_);
    }
  }

  void validate() {
    for (auto& [group_name, group] : param_groups_) {
      for (auto& param : group) {
        if (auto error_msg = param->validate()) {
          throw std::runtime_error(
              fmt::format("Validation error for {} parameter {}. {}",
                          group_name, param->longname_, *error_msg));
        }
      }
    }
    if (auto error_msg = check::HigherThan<size_t>(0)(_jobs)) {
      throw std::runtime_error(
          fmt::format("Invalid argument for -j or --jobs. {}", *error_msg));
    }
    if (project_path.empty()) {
      throw std::runtime_error("No RISCAN project specified.");
    }
    if (auto error_msg = check::PathExists(project_path)) {
      throw std::runtime_error(
          fmt::format("Invalid RISCAN project. {}", *error_msg));
    }
    validate_combinations();
  }

  void print_help(const std::string& program_name) {
    // see http://docopt.org/
    std::cout << summary() << "\n\n";
    std::cout << "\033[1mUsage\033[0m:" << "\n";
    std::cout << "  " << program_name << " [options] <riscan-project>\n";
    std::cout << "  " << program_name
              << " [options] (-c | --config) <config-file> [<riscan-project>]\n";
    std::cout << "  " << program_name << " -h | --help" << "\n";
    std::cout << "  " << program_name << " -v | --version" << "\n";
    std::cout << "\n";
    std::cout << "\033[1mPositional arguments:\033[0m" << "\n";
    std::cout << "  <riscan-project>             Path to the RISCAN project "
                 "directory (*.RiSCAN).\n";

    print_params(app_param_groups_);
    print_params(param_groups_);
  }

  // Utility function to wrap text to a specified width with proper indentation
  std::vector<std::string> wrap_text(const std::string& text, size_t max_width,
                                     size_t indent = 0) {
    std::vector<std::string> lines;
    std::string indent_str(indent, ' ');
    std::string current_line = indent_str;
    size_t current_width = indent;

    std::istringstream iss(text);
    std::string word;

    while (iss >> word) {
      if (current_width + word.length() + 1 > max_width &&
          current_line != indent_str) {
        lines.push_back(current_line);
        current_line = indent_str;
        current_width = indent;
      }
      if (current_line != indent_str) {
        current_line += " ";
        current_width += 1;
      }
      current_line += word;
      current_width += word.length();
    }
    if (current_line != indent_str) {
      lines.push_back(current_line);
    }
    return lines;
  }

  void print_params(param_group_map& params) {
    const size_t param_column_width = 35;
    const size_t desc_column_width = 65;

    for (auto& [group_name, group] : params) {
      if (group.empty()) continue;
      std::cout << "\n";
      std::cout << "\033[1m" << group_name << " options:\033[0m\n";
      for (auto& param : group) {
        std::string param_text =
            param->cli_flag() + " " + param->type_description();
        std::string default_text = "Default: " + param->default_to_string();

        auto wrapped_desc =
            wrap_text(param->description(),
                      param_column_width + desc_column_width,
                      param_column_width + 2);
        auto wrapped_default =
            wrap_text(default_text, param_column_width + desc_column_width,
                      param_column_width + 2);

        if (param_text.size() <= param_column_width - 2) {
          std::cout << "  " << std::setw(param_column_width) << std::left
                    << param_text;
          if (!wrapped_desc.empty()) {
            std::cout << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          } else {
            std::cout << "\n";
          }
        } else {
          // If parameter text is too long, print it on its own line
          std::cout << "  " << param_text << "\n";
          if (!wrapped_desc.empty()) {
            std::cout << std::string(param_column_width + 2, ' ')
                      << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          }
        }
        for (size_t i = 1; i < wrapped_desc.size(); ++i) {
          std::cout << wrapped_desc[i] << "\n";
        }
        for (const auto& line : wrapped_default) {
          std::cout << "\033[34m" << line << "\033[0m" << "\n";
        }
      }
    }
  }

  void print_version(const std::string& program_name) {
    std::cout << fmt::format("{} {}\n", program_name, TB_VERSION);
  }

  void parse_cli_first_pass(CLIArgs& c) {
    // parse program control arguments (not in config file)
    auto it = c.args.begin();
    while (it != c.args.end()) {
      const std::string& arg = *it;
      std::string argname;
      if (arg.starts_with("--")) {
        argname = arg.substr(2);
      } else if (arg.starts_with("-") && arg.size() > 1) {
        argname = arg.substr(1);
      }
      if (auto p = app_param_index_.find(argname);
          !argname.empty() && p != app_param_index_.end()) {
        it = c.args.erase(it);
        it = p->second->set(c.args, it);
      } else {
        ++it;
      }
    }
    if (_config_path.size()) {
      if (auto error_msg = check::PathExists(_config_path)) {
        throw std::runtime_error(fmt::format(
            "Invalid argument for -c or --config. {}", *error_msg));
      }
    }
  }

  ConfigParameter* find_param(const std::string& argname) {
    if (auto p = param_index_.find(argname); p != param_index_.end()) {
      return p->second;
    }
    return nullptr;
  }

  void parse_cli_second_pass(CLIArgs& c) {
    auto it = c.args.begin();
    while (it != c.args.end()) {
      std::string arg = *it;

      try {
        if (arg.starts_with("--no-") && find_param(arg.substr(5)) &&
            find_param(arg.substr(5))->type_description().empty()) {
          it = c.args.erase(it);
          find_param(arg.substr(5))->unset();
        } else if (arg.starts_with("--")) {
          if (auto p = find_param(arg.substr(2))) {
            it = c.args.erase(it);
            it = p->set(c.args, it);
          } else {
            throw std::runtime_error(fmt::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("-") && arg.size() > 1) {
          if (auto p = find_param(arg.substr(1))) {
            it = c.args.erase(it);
            it = p->set(c.args, it);
          } else {
            throw std::runtime_error(fmt::format("Unknown argument: {}.", arg));
          }
        } else {
          ++it;
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            fmt::format("Error parsing argument: {}. {}.", arg, e.what()));
      }
    }

    // now c.args should only contain the positional argument
    if (c.args.size() == 1) {
      project_path = c.args.back();
    } else if (c.args.size() > 1) {
      throw std::runtime_error(
          "Too many positional arguments, expected only <riscan-project>.");
    } else if (project_path.empty()) {
      throw std::runtime_error(
          "No RISCAN project given on the command line or in the config "
          "file.");
    }
  };

  void parse_config_file() {
    toml::table config;
    try {
      config = toml::parse_file(_config_path);
    } catch (const toml::parse_error& e) {
      throw std::runtime_error(
          fmt::format("Syntax error. {}", e.description()));
    }

    for (const auto& [key, value] : config) {
      try {
        if (key == "riscan-project") {
          if (auto v = config["riscan-project"].value<std::string>()) {
            project_path = *v;
          } else {
            throw std::runtime_error("Expected a string.");
          }
        } else if (auto p = param_index_.find(std::string(key.str()));
                   p != param_index_.end()) {
          p->second->set_from_toml(config, std::string(key.str()));
        } else {
          throw std::runtime_error(
              fmt::format("Unknown parameter in config file: {}.", key.str()));
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            fmt::format("Failed to read value for {} from config file. {}",
                        key.str(), e.what()));
      }
    }
  }
};

/**
 * @brief Runs the parse phases of handler and reports errors.
 *
 * Returns an exit code when the program should stop, eg. after printing the
 * help message or on invalid arguments.
 */
inline std::optional<int> handle_cli(ConfigHandler& handler, CLIArgs& cli_args) {
  auto& logger = tlsbatch::logger::Logger::get_logger();

  // Parse basic command line arguments (not yet the configuration parameters)
  try {
    handler.parse_cli_first_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error("Failed to parse command line arguments.");
    logger.error("{} Use '-h' to print usage information.", e.what());
    return EXIT_FAILURE;
  }
  if (handler._print_help) {
    handler.print_help(cli_args.program_name);
    return EXIT_SUCCESS;
  }
  if (handler._print_version) {
    handler.print_version(cli_args.program_name);
    return EXIT_SUCCESS;
  }

  // Read configuration file, config path has already been checked for existence
  if (handler._config_path.size()) {
    logger.info("Reading configuration from file {}", handler._config_path);
    try {
      handler.parse_config_file();
    } catch (const std::exception& e) {
      logger.error(
          "Unable to parse config file {}. {} Use '-h' to print usage "
          "information.",
          handler._config_path, e.what());
      return EXIT_FAILURE;
    }
  }

  // Parse further command line arguments, those will override values from
  // config file
  try {
    handler.parse_cli_second_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error(
        "Failed to parse command line arguments. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  try {
    handler.validate();
  } catch (const std::exception& e) {
    logger.error(
        "Failed to validate parameter values. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  logger.set_level(handler._loglevel);
  return std::nullopt;
}
