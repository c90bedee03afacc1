#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/format.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include "poster_generator.hpp"
#include "request.hpp"
#include "settings.hpp"
#include "theme.hpp"
#include "cache.hpp"
#include "fetch/http.hpp"
#include "error.hpp"
#include "config.h"

namespace bpo = boost::program_options;
namespace bpt = boost::property_tree;

namespace {

/**
 * options shared by every command: where the settings come from and how
 * much to log.
 */
struct common_options {
  std::string config_file;
  std::string log_level;

  void add(bpo::options_description &options) {
    options.add_options()
      ("help,h", "Print this help message.")
      ("config-file,c", bpo::value<std::string>(&config_file),
       "JSON settings file: directories, service URLs, rate limits and "
       "post-processing parameters.")
      ("log-level,l", bpo::value<std::string>(&log_level)->default_value("info"),
       "Logging level: trace, debug, info, warn, err, critical or off.")
      ;
  }

  // sets up logging and loads the settings. returns false, having
  // reported why, if either fails.
  bool apply(cartoposter::settings &s) const {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    const spdlog::level::level_enum level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
      std::cerr << "The string \"" << log_level << "\" was not recognised as a log level.\n";
      return false;
    }
    spdlog::set_level(level);

    try {
      s = cartoposter::settings::from_file(config_file);

    } catch (const bpt::ptree_error &e) {
      std::cerr << "Error while parsing config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return false;

    } catch (const std::exception &e) {
      std::cerr << "Error while loading config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return false;
    }
    return true;
  }
};

bool parse_command_line(int argc, char *argv[], const bpo::options_description &options,
                        const bpo::positional_options_description &pos_options,
                        bpo::variables_map &vm) {
  try {
    bpo::store(bpo::command_line_parser(argc,argv)
               .options(options)
               .positional(pos_options)
               .run(),
               vm);
    bpo::notify(vm);

  } catch (std::exception & e) {
    std::cerr << "Unable to parse command line options because: " << e.what() << "\n"
              << "This is a bug, please report it at " PACKAGE_BUGREPORT << "\n";
    return false;
  }
  return true;
}

int generate(int argc, char *argv[]) {
  common_options common;
  std::string request_file, overrides_file, output_dir;
  bool no_cache = false;

  bpo::options_description options(
    "cartoposter " VERSION "\n"
    "\n"
    "  Usage: cartoposter generate [options] <city> <country>\n"
    "\n");

  common.add(options);

  options.add_options()
    ("request,r", bpo::value<std::string>(&request_file),
     "JSON request file. Options given on the command line take precedence over it.")
    ("theme,t", bpo::value<std::string>(), "Theme name.")
    ("distance,d", bpo::value<double>(), "Radius shown around the center, in meters.")
    ("width,W", bpo::value<double>(), "Poster width in inches.")
    ("height,H", bpo::value<double>(), "Poster height in inches.")
    ("format,f", bpo::value<std::string>(), "Output format: png, jpg, svg or pdf.")
    ("dpi", bpo::value<unsigned int>(), "Output resolution, overriding the configured one.")
    ("font", bpo::value<std::string>(), "Font family for the title block.")
    ("texture", bpo::value<std::string>(), "Paper texture name, or none.")
    ("shape,s", bpo::value<std::string>(), "Map shape: rectangle, circle or triangle.")
    ("effect,e", bpo::value<std::string>(), "Artistic effect, or none.")
    ("enhancement,E", bpo::value<std::string>(), "Color enhancement, or none.")
    ("season", bpo::value<std::string>(), "Season for theme variants.")
    ("state", bpo::value<std::string>(), "State or region, to disambiguate the city.")
    ("country-label", bpo::value<std::string>(), "Text shown in place of the country.")
    ("overrides", bpo::value<std::string>(&overrides_file),
     "JSON file of per-layer style overrides.")
    ("output-dir,o", bpo::value<std::string>(&output_dir),
     "Directory to write the poster to, overriding the configured one.")
    ("no-cache", bpo::bool_switch(&no_cache), "Don't read or write the on-disk cache.")
    // positional arguments
    ("city", bpo::value<std::string>(), "City to draw.")
    ("country", bpo::value<std::string>(), "Country the city is in.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("city", 1)
    .add("country", 1)
    ;

  bpo::variables_map vm;
  if (!parse_command_line(argc, argv, options, pos_options, vm)) {
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  cartoposter::settings conf;
  if (!common.apply(conf)) {
    return EXIT_FAILURE;
  }
  if (!output_dir.empty()) {
    conf.output_dir = output_dir;
  }

  bpt::ptree doc;
  try {
    if (!request_file.empty()) {
      bpt::read_json(request_file, doc);
    }
    if (!overrides_file.empty()) {
      bpt::ptree overrides;
      bpt::read_json(overrides_file, overrides);
      doc.put_child("perLayerStyleOverrides", overrides);
    }

  } catch (const bpt::ptree_error &e) {
    std::cerr << "Error while reading request: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  // command line option -> request key.
  const std::pair<const char *, const char *> keys[] = {
    { "city", "location.city" }, { "country", "location.country" }, { "state", "location.state" },
    { "theme", "theme" }, { "format", "outputFormat" }, { "font", "font" },
    { "texture", "texture" }, { "shape", "mapShape" }, { "effect", "artisticEffect" },
    { "enhancement", "colorEnhancement" }, { "season", "season" }, { "country-label", "countryLabel" }
  };
  for (const auto &k : keys) {
    if (vm.count(k.first)) {
      doc.put(k.second, vm[k.first].as<std::string>());
    }
  }
  if (vm.count("distance")) { doc.put("distanceRadius", vm["distance"].as<double>()); }
  if (vm.count("width")) { doc.put("posterWidth", vm["width"].as<double>()); }
  if (vm.count("height")) { doc.put("posterHeight", vm["height"].as<double>()); }
  if (vm.count("dpi")) { doc.put("dpi", vm["dpi"].as<unsigned int>()); }

  if (doc.get<std::string>("location.city", "").empty()) {
    std::cerr << "The <city> argument was not provided, but is mandatory\n\n";
    std::cerr << options << "\n";
    return EXIT_FAILURE;
  }

  try {
    std::unique_ptr<cartoposter::poster_generator> generator = cartoposter::make_generator(conf, no_cache);
    cartoposter::generation_result result = generator->generate(cartoposter::parse_request(doc));

    for (const cartoposter::warning &w : result.warnings) {
      std::cerr << "Warning [" << w.kind << "]: " << w.message << "\n";
    }

    if (result.outcome.is_left()) {
      std::cout << result.outcome.left().string() << "\n";
      return EXIT_SUCCESS;
    }

    const cartoposter::failure &f = result.outcome.right();
    std::cerr << "Error [" << f.kind << "]: " << f.message << "\n";

  } catch (const std::exception &e) {
    std::cerr << "Unable to make poster: " << e.what() << "\n";
  }

  return EXIT_FAILURE;
}

int themes(int argc, char *argv[]) {
  common_options common;
  bool detail = false;

  bpo::options_description options(
    "cartoposter " VERSION "\n"
    "\n"
    "  Usage: cartoposter themes [options]\n"
    "\n");

  common.add(options);

  options.add_options()
    ("long", bpo::bool_switch(&detail), "Show each theme's name and description too.")
    ;

  bpo::positional_options_description pos_options;
  bpo::variables_map vm;
  if (!parse_command_line(argc, argv, options, pos_options, vm)) {
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  cartoposter::settings conf;
  if (!common.apply(conf)) {
    return EXIT_FAILURE;
  }

  cartoposter::theme_engine engine(conf.theme_dir);
  int status = EXIT_SUCCESS;
  for (const std::string &name : engine.available()) {
    if (!detail) {
      std::cout << name << "\n";
      continue;
    }

    try {
      const cartoposter::theme t = engine.load(name);
      std::cout << name << ": " << t.name << "\n    " << t.description << "\n";

    } catch (const cartoposter::poster_error &e) {
      std::cerr << name << ": " << e.what() << "\n";
      status = EXIT_FAILURE;
    }
  }

  return status;
}

int clear_cache(int argc, char *argv[]) {
  common_options common;

  bpo::options_description options(
    "cartoposter " VERSION "\n"
    "\n"
    "  Usage: cartoposter clear-cache [options]\n"
    "\n");

  common.add(options);

  bpo::positional_options_description pos_options;
  bpo::variables_map vm;
  if (!parse_command_line(argc, argv, options, pos_options, vm)) {
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  cartoposter::settings conf;
  if (!common.apply(conf)) {
    return EXIT_FAILURE;
  }

  try {
    cartoposter::sqlite_cache cache(conf.cache_path);
    cache.clear();
    std::cout << "Cleared " << conf.cache_path << "\n";

  } catch (const cartoposter::poster_error &e) {
    std::cerr << e.kind() << ": " << e.what() << "\n";
    return EXIT_FAILURE;

  } catch (const std::exception &e) {
    std::cerr << "Unable to clear the cache: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

/* curl must be set up once, before any thread uses it, and released
 * on the way out.
 */
struct curl_global {
  curl_global() { cartoposter::fetch::http_global_init(); }
  ~curl_global() { curl_global_cleanup(); }
};

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc > 1) {
    std::string command = argv[1];

    // drop the command, keeping the program name in argv[0].
    std::vector<char *> new_argv;
    new_argv.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
      new_argv.push_back(argv[i]);
    }
    const int new_argc = static_cast<int>(new_argv.size());

    try {
      curl_global curl;

      if (command == "generate") {
        return generate(new_argc, new_argv.data());

      } else if (command == "themes") {
        return themes(new_argc, new_argv.data());

      } else if (command == "clear-cache") {
        return clear_cache(new_argc, new_argv.data());

      } else {
        std::cerr << "Unknown command \"" << command << "\".\n";
      }

    } catch (const std::exception &e) {
      std::cerr << "ERROR: " << e.what() << "\n";
      return EXIT_FAILURE;
    }
  }

  std::cerr <<
    "cartoposter <command> [command-options]\n"
    "\n"
    "Where command is:\n"
    "  generate: Resolve a city, fetch its map data and draw a\n"
    "            themed poster of it.\n"
    "  themes: List the themes available to draw with.\n"
    "  clear-cache: Forget every cached location and dataset.\n"
    "\n"
    "To get more information on the options available for a\n"
    "particular command, run `cartoposter <command> --help`.\n";
  return EXIT_FAILURE;
}
