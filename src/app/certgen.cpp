// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "CertificateGenerator.hpp"
#include "FontManager.hpp"
#include "GeneratorConfig.hpp"
#include "Logging.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string_view>

#include <getopt.h>

namespace cg {
struct ProgramOptions {
  GeneratorConfig config;
  bool show_help = false;
};

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions;

void print_usage(std::ostream& out, char const* program);

void print_summary(RunSummary const& summary, std::ostream& out);

} // namespace cg

int main(int argc, char** argv) {
  cg::ProgramOptions options;
  try {
    options = cg::parse_command_line_args(argc, argv);
  } catch (cg::ConfigError const& ex) {
    std::cerr << "ERROR: " << ex.what() << "\n";
    cg::print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (options.show_help) {
    cg::print_usage(std::cout, argv[0]);
    return 0;
  }
  cg::Log::set_level(options.config.log_level);

  try {
    cg::FontManager fonts;
    cg::CertificateGenerator generator(fonts);
    cg::RunSummary summary = generator.generate(options.config);
    cg::print_summary(summary, std::cout);
  } catch (std::exception const& ex) {
    cg::Log::e("{}", ex.what());
    return 1;
  }
  return 0;
}

namespace cg {

namespace {
enum LongOption : int {
  kOptX = 256,
  kOptY,
  kOptFontSize,
  kOptColor,
  kOptAlign,
  kOptOutline,
  kOptOutlineWidth,
  kOptDpi,
  kOptWidth,
  kOptHeight,
  kOptLogLevel,
  kOptFontFamily,
};

template <typename Int> auto parse_number(std::string_view text, std::string_view option) -> Int {
  Int value{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    throw ConfigError("Invalid value for --" + std::string(option) + ": '" + std::string(text) +
                      "'");
  }
  return value;
}
} // namespace

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions {
  ProgramOptions result{};
  GeneratorConfig& config = result.config;
  static ::option long_options[] = {
      ::option{"template", required_argument, nullptr, 't'},
      ::option{"names", required_argument, nullptr, 'n'},
      ::option{"font", required_argument, nullptr, 'f'},
      ::option{"out", required_argument, nullptr, 'o'},
      ::option{"x", required_argument, nullptr, kOptX},
      ::option{"y", required_argument, nullptr, kOptY},
      ::option{"fontsize", required_argument, nullptr, kOptFontSize},
      ::option{"font-family", required_argument, nullptr, kOptFontFamily},
      ::option{"color", required_argument, nullptr, kOptColor},
      ::option{"align", required_argument, nullptr, kOptAlign},
      ::option{"outline", no_argument, nullptr, kOptOutline},
      ::option{"outline-width", required_argument, nullptr, kOptOutlineWidth},
      ::option{"dpi", required_argument, nullptr, kOptDpi},
      ::option{"width", required_argument, nullptr, kOptWidth},
      ::option{"height", required_argument, nullptr, kOptHeight},
      ::option{"log-level", required_argument, nullptr, kOptLogLevel},
      ::option{"help", no_argument, nullptr, 'h'},
      ::option{}};
  const char* short_options = "t:n:f:o:h";
  int option_index = 0;
  int parsedOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  while (parsedOpt != -1) {
    std::string_view arg = optarg ? std::string_view(optarg) : std::string_view{};
    switch (parsedOpt) {
    case 't':
      config.template_path = arg;
      break;
    case 'n':
      config.names_path = arg;
      break;
    case 'f':
      config.font_path = std::filesystem::path(arg);
      break;
    case 'o':
      config.output_path = arg;
      break;
    case kOptX:
      config.anchor_x = parse_number<int>(arg, "x");
      break;
    case kOptY:
      config.anchor_y = parse_number<int>(arg, "y");
      break;
    case kOptFontSize:
      config.font_size = parse_number<std::uint32_t>(arg, "fontsize");
      break;
    case kOptFontFamily:
      config.default_font_family = arg;
      break;
    case kOptColor:
      config.color = arg;
      break;
    case kOptAlign:
      if (std::optional<Align> align = parse_align(arg)) {
        config.align = *align;
      } else {
        throw ConfigError("Invalid value for --align: '" + std::string(arg) + "'");
      }
      break;
    case kOptOutline:
      config.outline.enabled = true;
      break;
    case kOptOutlineWidth:
      config.outline.width = parse_number<int>(arg, "outline-width");
      break;
    case kOptDpi:
      config.dpi = parse_number<std::uint32_t>(arg, "dpi");
      break;
    case kOptWidth:
      config.template_width = parse_number<std::uint32_t>(arg, "width");
      break;
    case kOptHeight:
      config.template_height = parse_number<std::uint32_t>(arg, "height");
      break;
    case kOptLogLevel:
      if (std::optional<Log::Level> level = Log::parse_level(arg)) {
        config.log_level = *level;
      } else {
        throw ConfigError("Invalid value for --log-level: '" + std::string(arg) + "'");
      }
      break;
    case 'h':
      result.show_help = true;
      break;
    default:
      throw ConfigError("Unknown option");
    }
    parsedOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  }
  if (optind < argc) {
    throw ConfigError("Unexpected argument '" + std::string(argv[optind]) + "'");
  }
  validate(config);
  return result;
}

void print_usage(std::ostream& out, char const* program) {
  out << "Usage: " << program << " [options]\n"
      << "  -t, --template PATH      template image, .png or .svg (template.png)\n"
      << "  -n, --names PATH         participant list, CSV or one name per line "
         "(participants.csv)\n"
      << "  -f, --font PATH          font file (default family, then built-in font)\n"
      << "      --font-family NAME   default font family (DejaVu Sans)\n"
      << "  -o, --out PATH           output archive (certificates.zip)\n"
      << "      --x N, --y N         anchor of the name (template centre)\n"
      << "      --fontsize N         font size in pixels (90)\n"
      << "      --color COLOR        #rgb, #rrggbb, #rrggbbaa or a colour name (#000000)\n"
      << "      --align MODE         left, center or right (center)\n"
      << "      --outline            draw a black outline around the name\n"
      << "      --outline-width N    outline width in pixels (2)\n"
      << "      --dpi N              resolution stored in the PNG files (600)\n"
      << "      --width N            output width for SVG templates\n"
      << "      --height N           output height for SVG templates\n"
      << "      --log-level LEVEL    debug, info, warning or error (info)\n"
      << "  -h, --help               show this help\n";
}

void print_summary(RunSummary const& summary, std::ostream& out) {
  out << "Template: " << summary.template_width << " x " << summary.template_height
      << " pixels\n"
      << "Anchor:   " << summary.anchor.x << ", " << summary.anchor.y << "\n"
      << "Font:     " << summary.font << "\n";
  for (BatchOutcome const& outcome : summary.outcomes) {
    if (!outcome.succeeded) {
      out << "  failed: " << outcome.name << " (" << outcome.error << ")\n";
    }
  }
  out << "Done. Generated " << summary.succeeded << "/" << summary.names << " certificates\n"
      << "Archive:  " << summary.archive_path.string() << " (" << summary.archive_bytes
      << " bytes)\n";
}

} // namespace cg
