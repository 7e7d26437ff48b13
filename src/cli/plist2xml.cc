#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#include "plistkit.hpp"

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

void print_usage() {
  std::cerr
      << "usage: plist2xml [-i|--in-place] [-f|--fragment] [-q|--quiet] "
         "input [output]\n\n"
      << "Converts a binary or XML property list to canonical XML.\n\n"
      << "Options:\n"
      << "  -i, --in-place   Overwrite the input file with the output\n"
      << "  -f, --fragment   Write only the nodes inside <plist>\n"
      << "  -q, --quiet      Do not print decoder warnings\n"
      << "  -h, --help       Show this help message\n\n"
      << "Input can be '-' to use stdin, and output can be '-' to use "
         "stdout.\n";
}

static bool read_all(std::istream &in, std::string &out) {
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  out = buffer.str();
  return true;
}

int main(int argc, char *argv[]) {
  bool in_place = false;
  bool fragment = false;
  bool quiet = false;
  std::string input_path;
  std::string output_path;

  int arg_idx = 1;
  while (arg_idx < argc) {
    const char *arg = argv[arg_idx];

    // combined short flags, e.g. -iq
    if (arg[0] == '-' && arg[1] != '-' && arg[1] != '\0' && arg[2] != '\0') {
      bool valid_combo = true;
      for (int i = 1; arg[i] != '\0'; i++) {
        if (arg[i] == 'i') {
          in_place = true;
        } else if (arg[i] == 'f') {
          fragment = true;
        } else if (arg[i] == 'q') {
          quiet = true;
        } else if (arg[i] == 'h') {
          print_usage();
          return 0;
        } else {
          valid_combo = false;
          break;
        }
      }
      if (valid_combo) {
        arg_idx++;
        continue;
      }
    }

    if (strcmp(arg, "-i") == 0 || strcmp(arg, "--in-place") == 0) {
      in_place = true;
      arg_idx++;
    } else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fragment") == 0) {
      fragment = true;
      arg_idx++;
    } else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
      quiet = true;
      arg_idx++;
    } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
      print_usage();
      return 0;
    } else {
      break;
    }
  }

  if (arg_idx >= argc) {
    if (!isatty(fileno(stdin))) {
      input_path = "-";
      output_path = "-";
    } else {
      std::cerr << "Error: Missing input file\n\n";
      print_usage();
      return 1;
    }
  } else {
    input_path = argv[arg_idx++];

    if (in_place) {
      if (input_path == "-") {
        std::cerr << "Error: Cannot use -i/--in-place flag with stdin\n";
        return 1;
      }
      if (arg_idx < argc) {
        std::cerr
            << "Error: Cannot specify output file with -i/--in-place flag\n";
        return 1;
      }
      output_path = input_path;
    } else {
      output_path = arg_idx < argc ? argv[arg_idx++] : "-";
    }
  }

  if (arg_idx < argc) {
    std::cerr << "Error: Unexpected argument: " << argv[arg_idx] << "\n";
    return 1;
  }

  try {
    std::string buffer;
    if (input_path == "-") {
      if (!read_all(std::cin, buffer)) {
        std::cerr << "Error: Cannot read stdin\n";
        return 1;
      }
    } else {
      std::ifstream input_file(input_path, std::ios::binary);
      if (!input_file || !read_all(input_file, buffer)) {
        std::cerr << "Error: Cannot open input file: " << input_path << "\n";
        return 1;
      }
    }

    plistkit::PlistOptions options;
    if (!quiet) {
      options.warning_callback = [](const std::string &category,
                                    const std::string &message) {
        std::cerr << "[" << category << "] " << message << "\n";
      };
    }

    plistkit::PlistDocument document(std::move(buffer), options);
    document.parse();
    std::string xml =
        fragment ? document.toXmlFragment() + "\n" : document.toXml();

    // the whole input is in memory, so in-place writes are safe
    if (output_path == "-") {
      std::cout << xml;
    } else {
      std::ofstream output_file(output_path, std::ios::binary);
      if (!output_file) {
        std::cerr << "Error: Cannot open output file: " << output_path
                  << "\n";
        return 1;
      }
      output_file << xml;
      if (!output_file) {
        std::cerr << "Error: Cannot write output file: " << output_path
                  << "\n";
        return 1;
      }
    }

    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
