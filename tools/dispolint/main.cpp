/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <json/json.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <vector>

#include "Debug.h"
#include "FindingCollector.h"
#include "LintConfig.h"
#include "ModuleLoader.h"
#include "Rule.h"
#include "RuleRegistry.h"
#include "RuleRunner.h"
#include "Timer.h"
#include "Trace.h"

namespace {

constexpr int EXIT_NO_FINDINGS = 0;
constexpr int EXIT_FINDINGS = 1;
constexpr int EXIT_BAD_INPUT = 2;

struct Arguments {
  std::string module_file;
  std::string config_file;
  std::string output_file;
  boost::optional<size_t> jobs;
  std::vector<std::string> rule_names;
  std::vector<std::string> s_args;
  std::vector<std::string> j_args;
  bool list_rules{false};
};

void print_usage(const boost::program_options::options_description& desc) {
  std::cerr << "usage: dispolint --module FILE [options]" << std::endl
            << desc << std::endl;
}

Arguments parse_args(int argc, char* argv[]) {
  namespace po = boost::program_options;
  po::options_description desc("Check a decoded module for disposal bugs");
  desc.add_options()("help,h", "produce help message");
  desc.add_options()("module,m", po::value<std::string>(),
                     "the JSON module to check");
  desc.add_options()("config,c", po::value<std::string>(),
                     "a JSON-formatted config file");
  desc.add_options()("output,o", po::value<std::string>(),
                     "where to write the JSON report (default: stdout)");
  desc.add_options()("jobs,j", po::value<size_t>(),
                     "number of worker threads (0: one per hardware thread)");
  desc.add_options()("rule,r", po::value<std::vector<std::string>>(),
                     "enable only this rule; may be repeated");
  desc.add_options()("list-rules", "list the available rules and exit");
  desc.add_options()(",S",
                     po::value<std::vector<std::string>>(), // Accumulation
                     "-Skey=string\n"
                     "  \tSet a string value in the config\n"
                     "-SRuleName.key=string\n"
                     "  \tSet a string value in a rule's config section\n"
                     "    \te.g. -SDisposalGuard.guard_exception=My.Closed");
  desc.add_options()(",J",
                     po::value<std::vector<std::string>>(), // Accumulation
                     "-Jkey=<json value>\n"
                     "  \tSet a json value in the config\n"
                     "-JRuleName.key=<json value>\n"
                     "  \tSet a json value in a rule's config section\n"
                     "    \te.g. -Jjobs=4");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << std::endl;
    print_usage(desc);
    exit(EXIT_BAD_INPUT);
  }

  if (vm.count("help")) {
    desc.print(std::cout);
    exit(EXIT_SUCCESS);
  }

  Arguments args;
  args.list_rules = vm.count("list-rules") != 0;
  if (vm.count("module")) {
    args.module_file = vm["module"].as<std::string>();
  }
  if (args.module_file.empty() && !args.list_rules) {
    std::cerr << "No module given" << std::endl << std::endl;
    print_usage(desc);
    exit(EXIT_BAD_INPUT);
  }
  if (vm.count("config")) {
    args.config_file =
        boost::filesystem::absolute(vm["config"].as<std::string>()).string();
  }
  if (vm.count("output")) {
    args.output_file = vm["output"].as<std::string>();
  }
  if (vm.count("jobs")) {
    args.jobs = vm["jobs"].as<size_t>();
  }
  if (vm.count("rule")) {
    args.rule_names = vm["rule"].as<std::vector<std::string>>();
  }
  if (vm.count("-S")) {
    args.s_args = vm["-S"].as<std::vector<std::string>>();
  }
  if (vm.count("-J")) {
    args.j_args = vm["-J"].as<std::vector<std::string>>();
  }
  return args;
}

Json::Value parse_json_value(const std::string& value_string) {
  std::istringstream temp_stream(value_string);
  Json::Reader reader;
  Json::Value temp_json;
  bool parsing_succeeded = reader.parse(temp_stream, temp_json);
  always_assert_type_log(parsing_succeeded, DispolintError::INVALID_CONFIG,
                         "Cannot parse %s as JSON\n%s", value_string.c_str(),
                         reader.getFormattedErrorMessages().c_str());
  return temp_json;
}

/*
 * Applies "key=value" or "RuleName.key=value" to `config`. Returns false if
 * there is no '='.
 */
bool add_value_to_config(Json::Value& config,
                         const std::string& key_value,
                         bool is_json) {
  const size_t equals_idx = key_value.find('=');
  if (equals_idx == std::string::npos) {
    return false;
  }
  std::string value_string = key_value.substr(equals_idx + 1);
  Json::Value value =
      is_json ? parse_json_value(value_string) : Json::Value(value_string);

  const size_t dot_idx = key_value.find('.');
  if (dot_idx != std::string::npos && dot_idx < equals_idx) {
    std::string rule = key_value.substr(0, dot_idx);
    std::string key = key_value.substr(dot_idx + 1, equals_idx - dot_idx - 1);
    config[rule][key] = value;
  } else {
    config[key_value.substr(0, equals_idx)] = value;
  }
  return true;
}

Json::Value load_config_json(const Arguments& args) {
  Json::Value config_json(Json::objectValue);
  if (!args.config_file.empty()) {
    config_json = LintConfig::load(args.config_file).get_json_config().unwrap();
  }
  for (const auto& key_value : args.s_args) {
    if (!add_value_to_config(config_json, key_value, false)) {
      std::cerr << "warning: cannot parse -S" << key_value << std::endl;
    }
  }
  for (const auto& key_value : args.j_args) {
    if (!add_value_to_config(config_json, key_value, true)) {
      std::cerr << "warning: cannot parse -J" << key_value << std::endl;
    }
  }
  return config_json;
}

void list_rules() {
  for (const auto* rule : RuleRegistry::get().get_rules()) {
    std::cout << rule->name() << ": " << rule->problem() << std::endl;
  }
}

void write_report(const Json::Value& report, const std::string& output_file) {
  if (output_file.empty()) {
    std::cout << report.toStyledString();
    return;
  }
  boost::filesystem::path path(output_file);
  if (path.has_parent_path()) {
    boost::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(output_file);
  always_assert_log(out.good(), "Cannot write to %s", output_file.c_str());
  out << report.toStyledString();
}

int run(const Arguments& args) {
  Timer t("dispolint");

  LintConfig config(load_config_json(args));
  if (!args.rule_names.empty()) {
    config.set_rule_names(args.rule_names);
  }
  if (args.jobs) {
    config.set_jobs(*args.jobs);
  }

  if (args.list_rules) {
    list_rules();
    return EXIT_NO_FINDINGS;
  }

  auto rules = config.configure_rules();
  auto module = module_loader::load_module(args.module_file);

  FindingCollector collector;
  RuleRunner runner(std::move(rules), collector);
  auto stats = runner.run(*module, config.get_jobs());

  Json::Value report = collector.to_json();
  report["stats"] = stats.to_json();
  write_report(report, args.output_file);

  TRACE(MAIN, 1, "%zu findings", collector.size());
  return collector.size() == 0 ? EXIT_NO_FINDINGS : EXIT_FINDINGS;
}

} // namespace

int main(int argc, char* argv[]) {
  signal(SIGSEGV, crash_backtrace_handler);
  signal(SIGABRT, crash_backtrace_handler);
  signal(SIGBUS, crash_backtrace_handler);

  Arguments args = parse_args(argc, argv);
  try {
    return run(args);
  } catch (const dispolint::InvalidModuleException& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_BAD_INPUT;
  } catch (const dispolint::InvalidConfigException& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_BAD_INPUT;
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return EXIT_BAD_INPUT;
  }
}
