#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/catalog/file.hpp"
#include "behave/expr/stdlib.hpp"
#include "behave/registry/registry.hpp"
#include "behave/schema/behavior.hpp"

struct options {
  std::string catalog;
  std::vector<std::string> use_cases;
  std::vector<std::string> lookups;
  bool stats = false;
  bool strict = false;
};

bool parse_options(int argc, char ** argv, options & out) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--stats") {
      out.stats = true;
      continue;
    }
    if (arg == "--strict") {
      out.strict = true;
      continue;
    }
    if (arg == "--catalog" && i + 1 < argc) {
      out.catalog = argv[++i];
      continue;
    }
    if (arg == "--use-case" && i + 1 < argc) {
      out.use_cases.emplace_back(argv[++i]);
      continue;
    }
    if (arg == "--lookup" && i + 1 < argc) {
      out.lookups.emplace_back(argv[++i]);
      continue;
    }
    std::fprintf(stderr,
                 "usage: behave_check --catalog <path> [--stats] [--strict] "
                 "[--use-case <text>]... [--lookup <name>]...\n");
    return false;
  }

  if (out.catalog.empty()) {
    std::fprintf(stderr, "error: --catalog is required\n");
    return false;
  }
  return true;
}

void print_report(const behave::catalog::load_report & report) {
  std::fprintf(stdout, "loaded %zu behavior(s)\n", report.loaded.size());
  for (const auto & rejected : report.rejected) {
    const char * name = rejected.name.empty() ? "<unnamed>" : rejected.name.c_str();
    std::fprintf(stdout, "rejected #%zu %s\n", rejected.index, name);
    for (const std::string & error : rejected.errors) {
      std::fprintf(stdout, "  - %s\n", error.c_str());
    }
  }
  for (const std::string & warning : report.warnings) {
    std::fprintf(stdout, "warning: %s\n", warning.c_str());
  }
}

void print_stats(const behave::registry::registry & reg) {
  const behave::registry::library_stats stats = reg.stats();
  std::fprintf(stdout, "behaviors:   %zu\n", stats.total_behaviors);
  for (size_t i = 0; i < stats.by_category.size(); ++i) {
    if (stats.by_category[i] == 0) {
      continue;
    }
    const auto name = behave::schema::k_category_names[i];
    std::fprintf(stdout, "  %-16.*s %zu\n", static_cast<int>(name.size()), name.data(),
                 stats.by_category[i]);
  }
  std::fprintf(stdout, "states:      %zu\n", stats.total_states);
  std::fprintf(stdout, "events:      %zu\n", stats.total_events);
  std::fprintf(stdout, "transitions: %zu\n", stats.total_transitions);
  std::fprintf(stdout, "ticks:       %zu\n", stats.total_ticks);
}

void print_use_case(const behave::registry::registry & reg, const std::string & use_case) {
  const auto matches = reg.find_behaviors_for_use_case(use_case);
  std::fprintf(stdout, "use case \"%s\": %zu match(es)\n", use_case.c_str(), matches.size());
  for (const auto * def : matches) {
    std::fprintf(stdout, "  %s - %s\n", def->name.c_str(), def->description.c_str());
  }
}

bool print_lookup(const behave::registry::registry & reg, const std::string & name) {
  const std::optional<std::string> problem = reg.validate_behavior_reference(name);
  if (problem) {
    std::fprintf(stdout, "%s\n", problem->c_str());
    return false;
  }
  const auto meta = reg.metadata(name);
  std::fprintf(stdout, "%s [%.*s]: %zu state(s), %zu event(s), %zu transition(s), %zu tick(s)\n",
               meta->name.c_str(), static_cast<int>(behave::schema::category_name(meta->kind).size()),
               behave::schema::category_name(meta->kind).data(), meta->states.size(),
               meta->events.size(), meta->transition_count, meta->tick_count);
  return true;
}

int main(int argc, char ** argv) {
  options opts;
  if (!parse_options(argc, argv, opts)) {
    return 1;
  }

  behave::registry::builder builder;
  behave::catalog::load_report report;
  const int32_t err = behave::catalog::load_file(opts.catalog, behave::expr::standard_operators(),
                                                 builder, report);
  if (err != BEHAVE_OK) {
    std::fprintf(stderr, "error: unable to load %s (%s)\n", opts.catalog.c_str(),
                 behave::status_name(err));
    return 1;
  }
  print_report(report);

  const behave::registry::registry reg = std::move(builder).build();
  if (opts.stats) {
    print_stats(reg);
  }
  for (const std::string & use_case : opts.use_cases) {
    print_use_case(reg, use_case);
  }
  bool lookups_ok = true;
  for (const std::string & name : opts.lookups) {
    lookups_ok = print_lookup(reg, name) && lookups_ok;
  }

  if (!lookups_ok) {
    return 1;
  }
  if (opts.strict && (!report.rejected.empty() || !report.warnings.empty())) {
    return 1;
  }
  return 0;
}
