#include <cxxopts.hpp>
#include <glog/logging.h>
#include <fstream>
#include <iostream>
#include <string>
#include "treepath/Errors.hpp"
#include "treepath/Query.hpp"

using namespace treepath;

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    try {
        cxxopts::Options options("treepath", "Look up values in JSON/TOML documents via path expressions");
        options.positional_help("PATH");

        options.add_options()
            ("i,input", "Input file (default: standard input)", cxxopts::value<std::string>())
            ("o,output", "Output file (default: standard output)", cxxopts::value<std::string>())
            ("l,lines", "Input holds one JSON document per line")
            ("f,format", "Input format: auto, json, jsonl, toml", cxxopts::value<std::string>()->default_value("auto"))
            ("s,strict", "Fail when the path does not resolve")
            ("indent", "Output indentation, -1 for compact", cxxopts::value<int>()->default_value("2"))
            ("validate", "Only check the path syntax")
            ("v,verbose", "Diagnostic log level", cxxopts::value<int>()->default_value("0"))
            ("h,help", "Show help");

        options.add_options()
            ("path", "Path expression", cxxopts::value<std::string>());

        options.parse_positional({"path"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Path syntax: key.key2.@first.@-1.*.key$ (suffixes $ # % {} [] (); escape with \\)\n";
            return 0;
        }
        if (!result.count("path")) {
            std::cerr << "Error: missing PATH\n" << options.help() << "\n";
            return 1;
        }

        FLAGS_v = result["verbose"].as<int>();

        QueryOptions query;
        query.path = result["path"].as<std::string>();
        if (result.count("input")) query.input = result["input"].as<std::string>();
        query.format = result.count("lines") ? Format::JsonLines
                                             : parse_format(result["format"].as<std::string>());
        query.strict = result.count("strict") > 0;
        query.validate_only = result.count("validate") > 0;
        query.indent = result["indent"].as<int>();

        if (!result.count("output")) {
            run_query(query, std::cin, std::cout);
            return 0;
        }

        const std::string output = result["output"].as<std::string>();
        std::ofstream out(output);
        if (!out) {
            std::cerr << "Error: cannot write to " << output << "\n";
            return 1;
        }
        run_query(query, std::cin, out);
        return 0;

    } catch (const Error& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
