/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "AgentConfig.h"
#include "AgentEngine.h"
#include "Debug.h"
#include "JarLoader.h"
#include "OfflineInstrumentation.h"
#include "Timer.h"
#include "Trace.h"

namespace {

constexpr const char* k_usage_header = R"(agentguard: disarm class file transformers

Usage:
  agentguard [options] --outdir <dir> <jar or directory>...

Every class of the inputs is run through the configured rules. In "load" mode
each class goes through the pre-load hook, as if it were being defined; in
"sweep" mode the inputs are treated as the already loaded classes and swept
for redefinition. Rewritten classes are written under the output directory.

Options)";

struct Arguments {
  std::string config_file;
  std::string classpath;
  std::string out_dir;
  std::string mode{"load"};
  std::vector<std::string> inputs;
};

struct InputClass {
  std::string name;
  const ClassSource* source;
};

void print_usage() {
  std::cerr << "usage: agentguard [--config cfg.json] [--classpath cp] "
               "--outdir dir [--mode load|sweep] inputs..."
            << std::endl;
}

Arguments parse_args(int argc, char* argv[]) {
  Arguments args;

  namespace po = boost::program_options;
  po::options_description od(k_usage_header);
  od.add_options()("help,h", "print this help message");
  od.add_options()("config,c", po::value<std::string>(&args.config_file),
                   "JSON rule configuration; defaults to the built-in rules");
  od.add_options()("classpath,p", po::value<std::string>(&args.classpath),
                   "':' separated jars and directories used to resolve "
                   "supertypes");
  od.add_options()("outdir,o", po::value<std::string>(&args.out_dir),
                   "output directory for rewritten classes");
  od.add_options()("mode,m",
                   po::value<std::string>(&args.mode)->default_value("load"),
                   "\"load\" or \"sweep\"");
  od.add_options()("inputs", po::value<std::vector<std::string>>(),
                   "input jars and class directories");
  po::positional_options_description pod;
  pod.add("inputs", -1);
  po::variables_map vm;

  try {
    po::store(
        po::command_line_parser(argc, argv).options(od).positional(pod).run(),
        vm);
    po::notify(vm);
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl << std::endl;
    print_usage();
    exit(EXIT_FAILURE);
  }

  if (vm.count("help")) {
    od.print(std::cout);
    exit(EXIT_SUCCESS);
  }

  if (vm.count("inputs")) {
    args.inputs = vm["inputs"].as<std::vector<std::string>>();
  }
  if (args.out_dir.empty() || args.inputs.empty()) {
    std::cerr << "error: an output directory and inputs are required"
              << std::endl
              << std::endl;
    print_usage();
    exit(EXIT_FAILURE);
  }
  if (args.mode != "load" && args.mode != "sweep") {
    std::cerr << "error: unknown mode " << args.mode << std::endl;
    print_usage();
    exit(EXIT_FAILURE);
  }
  return args;
}

/*
 * Opens every input and lists its classes. The sources are added to
 * `classpath` in input order, after the user's class path.
 */
std::vector<InputClass> open_inputs(const std::vector<std::string>& inputs,
                                    ClassPath& classpath) {
  std::vector<InputClass> classes;
  for (const auto& input : inputs) {
    std::vector<std::string> names;
    std::unique_ptr<ClassSource> source;
    if (boost::filesystem::is_directory(input)) {
      auto dir = std::make_unique<DirectoryClassSource>(input);
      names = dir->class_names();
      source = std::move(dir);
    } else if (boost::algorithm::ends_with(input, ".jar") ||
               boost::algorithm::ends_with(input, ".zip")) {
      auto jar = std::make_unique<JarClassSource>(input);
      names = jar->class_names();
      source = std::move(jar);
    } else {
      throw_typed(AgentGuardError::INVALID_CONFIG,
                  "Input is neither a directory nor a jar: " + input);
    }
    TRACE(MAIN, 1, "%s: %zu classes", input.c_str(), names.size());
    const auto* raw = source.get();
    classpath.add(std::move(source));
    for (auto& name : names) {
      classes.push_back(InputClass{std::move(name), raw});
    }
  }
  return classes;
}

void write_output(const std::string& out_dir,
                  const std::string& name,
                  const std::vector<uint8_t>& bytes) {
  boost::filesystem::path path(out_dir);
  path /= name + ".class";
  boost::filesystem::create_directories(path.parent_path());
  std::ofstream out(path.string(), std::ofstream::binary);
  always_assert_log(out.good(), "Cannot write %s", path.string().c_str());
  out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void run_load(AgentEngine& engine,
              const std::vector<InputClass>& classes,
              const std::string& out_dir) {
  Timer t("Pre-load pass");
  engine.arm();
  for (const auto& input : classes) {
    auto bytes = input.source->load(input.name);
    auto result = engine.transform("agentguard", input.name.c_str(), nullptr,
                                   bytes.data(), bytes.size());
    switch (result.status) {
    case LoadHookResult::NO_CHANGE:
      break;
    case LoadHookResult::REPLACED:
      write_output(out_dir, input.name, result.bytes);
      break;
    case LoadHookResult::FAILED:
      std::cerr << "warning: " << input.name << ": " << result.error
                << std::endl;
      break;
    }
  }
}

void run_sweep(AgentEngine& engine,
               const std::vector<InputClass>& classes,
               const ClassSource& classpath,
               const std::string& out_dir) {
  Timer t("Sweep pass");
  OfflineInstrumentation inst;
  for (const auto& input : classes) {
    inst.add_loaded_class(std::make_unique<RuntimeClass>(
        input.name, collect_assignable_types(input.name, classpath)));
  }
  engine.start(inst);
  for (const auto& definition : inst.get_redefined()) {
    write_output(out_dir, definition.cls->name(), definition.bytes);
  }
}

} // namespace

int main(int argc, char* argv[]) {
  auto args = parse_args(argc, argv);
  try {
    Timer main_timer("agentguard main()");
    auto config = args.config_file.empty()
                      ? AgentConfig()
                      : AgentConfig::load(args.config_file);

    auto classpath = args.classpath.empty()
                         ? std::make_unique<ClassPath>()
                         : ClassPath::parse(args.classpath);
    auto classes = open_inputs(args.inputs, *classpath);
    std::shared_ptr<const ClassSource> source(std::move(classpath));

    AgentEngine engine(source);
    config.apply(engine);

    if (args.mode == "load") {
      run_load(engine, classes, args.out_dir);
    } else {
      run_sweep(engine, classes, *source, args.out_dir);
    }

    auto stats = engine.get_stats();
    std::cout << "agentguard: " << stats.classes_seen << " classes seen, "
              << stats.classes_rewritten << " rewritten, "
              << stats.classes_unreadable << " unreadable, "
              << stats.classes_failed << " failed" << std::endl;
    return stats.classes_failed == 0 ? EXIT_SUCCESS : 2;
  } catch (const AgentGuardException& e) {
    std::cerr << "error: " << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return EXIT_FAILURE;
  }
}
