// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// main.cpp
// configdiff example - compare two JSON configuration files
//
// Usage:
//   configdiff_example <old.json> <new.json> [format] [options.json]
//
// format is one of: report (default), stat, git, side-by-side, patch.
// The optional options file uses the DiffOptions document layout, e.g.
//   {"ignore_paths": ["/status/*"], "array_keys": {"/spec/containers": "name"}}
//
// Exit status: 0 = no differences, 1 = differences found, 2 = error

#include <configdiff/configdiff.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace configdiff;

namespace {

std::string read_file(const std::string& filename)
{
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw Error("cannot open " + filename);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

Format format_for(const std::string& filename)
{
    auto format = format_from_extension(filename);
    if (!format) {
        throw Error("cannot determine document format of " + filename);
    }
    return *format;
}

void print_usage(const char* program)
{
    std::cerr << "usage: " << program << " <old> <new> [report|stat|git|side-by-side|patch] [options.json]\n";
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    if (argc < 3 || argc > 5) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string old_file = argv[1];
    const std::string new_file = argv[2];

    ReportFormat format = ReportFormat::Report;
    if (argc >= 4) {
        auto parsed = report_format_from_name(argv[3]);
        if (!parsed) {
            std::cerr << "unknown output format '" << argv[3] << "'\n";
            print_usage(argv[0]);
            return 2;
        }
        format = *parsed;
    }

    try {
        DiffOptions options;
        if (argc == 5) {
            options = options_from_json(read_file(argv[4]));
        }

        auto result = diff_documents(read_file(old_file), format_for(old_file),
                                     read_file(new_file), format_for(new_file),
                                     options);

        ReportOptions report_options;
        report_options.old_file = old_file;
        report_options.new_file = new_file;
        std::cout << render(result.changes, format, report_options);

        return result.has_changes() ? 1 : 0;
    } catch (const ParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
    } catch (const OptionsError& e) {
        std::cerr << "invalid options: " << e.what() << "\n";
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << "\n";
    }
    return 2;
}
