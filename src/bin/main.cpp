#include <dtparse/iso_parser.hpp>
#include <dtparse/parse_error.hpp>
#include <dtparse/parser.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_parse = 3;

enum class parse_mode { heuristic, iso, iso_date, iso_time, time };

struct cli_options {
  std::vector<std::string> inputs;
  dtparse::parser_options parser;
  parse_mode mode = parse_mode::heuristic;
  char separator = 'T';
  bool json = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: dtparse [options] <text> [text ...]\n"
     << "\n"
     << "Options:\n"
     << "  --dayfirst        Read 01/05/09 as day before month\n"
     << "  --yearfirst       Read 01/05/09 with the year first\n"
     << "  --fuzzy           Ignore text that is not part of a date\n"
     << "  --tokens          Like --fuzzy, and print the ignored tokens\n"
     << "  --iso             Strict ISO-8601 date and optional time\n"
     << "  --iso-date        Strict ISO-8601 date only\n"
     << "  --iso-time        Strict ISO-8601 time only\n"
     << "  --time            Time of day only\n"
     << "  --sep <c>         Date/time separator for --iso (default: T)\n"
     << "  --json            Print one JSON object per input\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "dtparse " << DTPARSE_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;
  int mode_flags = 0;

  auto set_mode = [&](parse_mode mode) {
    opts.mode = mode;
    ++mode_flags;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--dayfirst") {
      opts.parser.dayfirst = true;
      continue;
    }

    if (arg == "--yearfirst") {
      opts.parser.yearfirst = true;
      continue;
    }

    if (arg == "--fuzzy") {
      opts.parser.fuzzy = true;
      continue;
    }

    if (arg == "--tokens") {
      opts.parser.fuzzy = true;
      opts.parser.fuzzy_with_tokens = true;
      continue;
    }

    if (arg == "--iso") {
      set_mode(parse_mode::iso);
      continue;
    }

    if (arg == "--iso-date") {
      set_mode(parse_mode::iso_date);
      continue;
    }

    if (arg == "--iso-time") {
      set_mode(parse_mode::iso_time);
      continue;
    }

    if (arg == "--time") {
      set_mode(parse_mode::time);
      continue;
    }

    if (arg == "--json") {
      opts.json = true;
      continue;
    }

    if (arg == "--sep") {
      if (i + 1 >= argc) {
        std::cerr << "dtparse: --sep requires an argument\n";
        std::exit(exit_usage);
      }
      std::string sep = argv[++i];
      if (sep.size() != 1) {
        std::cerr << "dtparse: --sep takes a single character\n";
        std::exit(exit_usage);
      }
      opts.separator = sep[0];
      continue;
    }

    // "--" ends option processing; inputs may start with '-'.
    if (arg == "--") {
      for (++i; i < argc; ++i) {
        opts.inputs.push_back(argv[i]);
      }
      break;
    }

    bool numeric = arg.size() > 1 &&
                   std::isdigit(static_cast<unsigned char>(arg[1]));
    if (arg[0] == '-' && !numeric) {
      std::cerr << "dtparse: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.inputs.push_back(arg);
  }

  if (mode_flags > 1) {
    std::cerr << "dtparse: --iso, --iso-date, --iso-time and --time are "
                 "mutually exclusive\n";
    std::exit(exit_usage);
  }

  return opts;
}

static nlohmann::json
to_json(const std::string& input, const dtparse::parse_result& r) {
  nlohmann::json j;
  j["input"] = input;
  if (r.year) j["year"] = *r.year;
  if (r.month) j["month"] = *r.month;
  if (r.day) j["day"] = *r.day;
  if (r.hour) j["hour"] = *r.hour;
  if (r.minute) j["minute"] = *r.minute;
  if (r.second) j["second"] = *r.second;
  if (r.microsecond) j["microsecond"] = *r.microsecond;
  if (r.weekday) j["weekday"] = *r.weekday;
  if (r.tzoffset) j["tzoffset"] = *r.tzoffset;
  if (r.tzname) j["tzname"] = *r.tzname;
  return j;
}

static void
report(const cli_options& opts, const std::string& input,
       const dtparse::parse_result& result,
       const std::vector<std::string>* skipped) {
  if (opts.json) {
    auto j = to_json(input, result);
    if (skipped) j["skipped_tokens"] = *skipped;
    // Skipped tokens may hold partial UTF-8 sequences.
    std::cout << j.dump(-1, ' ', false,
                        nlohmann::json::error_handler_t::replace)
              << "\n";
    return;
  }

  std::cout << result;
  if (skipped) {
    std::cout << " skipped=[";
    for (std::size_t i = 0; i < skipped->size(); ++i) {
      if (i > 0) std::cout << ", ";
      std::cout << '"' << (*skipped)[i] << '"';
    }
    std::cout << "]";
  }
  std::cout << "\n";
}

static int
run(const cli_options& opts) {
  // Built once so a bad separator or option set is a usage error.
  std::optional<dtparse::parser> heuristic;
  std::optional<dtparse::iso_parser> iso;
  try {
    heuristic.emplace(opts.parser);
    iso.emplace(opts.separator);
  } catch (const std::invalid_argument& e) {
    std::cerr << "dtparse: " << e.what() << "\n";
    return exit_usage;
  }

  int status = exit_success;
  for (const auto& input : opts.inputs) {
    try {
      switch (opts.mode) {
        case parse_mode::heuristic:
          if (opts.parser.fuzzy_with_tokens) {
            auto found = heuristic->parse_fuzzy_with_tokens(input);
            report(opts, input, found.result, &found.skipped_tokens);
          } else {
            report(opts, input, heuristic->parse(input), nullptr);
          }
          break;
        case parse_mode::iso:
          report(opts, input, iso->isoparse(input), nullptr);
          break;
        case parse_mode::iso_date:
          report(opts, input, iso->parse_isodate(input), nullptr);
          break;
        case parse_mode::iso_time:
          report(opts, input, iso->parse_isotime(input), nullptr);
          break;
        case parse_mode::time:
          report(opts, input, dtparse::parse_time(input), nullptr);
          break;
      }
    } catch (const dtparse::parse_error& e) {
      std::cerr << "dtparse: " << input << ": " << e.what() << " ("
                << dtparse::to_string(e.code()) << ")\n";
      status = exit_parse;
    }
  }
  return status;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.inputs.empty()) {
    std::cerr << "dtparse: no input\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
