#include "cli/options.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <boost/program_options.hpp>

namespace kestrel
{

std::expected<Options, std::string> parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    Options opts;
    std::string output_dir_value;

    // clang-format off
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("input-file,i", po::value<std::vector<std::string>>(&opts.input_files)->value_name("FILE")->required(),
            "Thrift IDL input file. May be given several times. Includes are resolved relative to the including file.")
        ("output-dir,o", po::value<std::string>(&output_dir_value)->value_name("DIR"),
            "Output directory. If not specified, use the directory of the first input file.")
        ("module,m", po::value<std::string>(&opts.module)->value_name("MODULE"),
            "Go module of the generated code. Imports from this module are not repeated in generated files.")
        ("package-prefix,p", po::value<std::string>(&opts.package_prefix)->value_name("PREFIX"),
            "Import path prefix of generated packages. Defaults to the module.")
        ("no-fast-api", po::bool_switch(&opts.no_fast_api), "Do not generate fast encode/decode functions")
        ("copy-idl", po::bool_switch(&opts.copy_idl), "Copy IDL files next to the generated files")
        ("check-only,c", po::bool_switch(&opts.check_only), "Only check the input IDL for errors")
        ("print-ast,a", po::bool_switch(&opts.print_ast), "Emit parsed AST as JSON")
        ("list-outputs,l", po::bool_switch(&opts.list_outputs), "Print generated files as JSON instead of writing them")
        ("verbose,v", po::bool_switch(&opts.verbose), "Enable debug logging");
    // clang-format on

    po::positional_options_description positional;
    positional.add("input-file", -1);

    po::variables_map vm;

    try {
        auto parser = po::command_line_parser(argc, argv).options(desc).positional(positional).run();
        po::store(parser, vm);

        if (vm.count("help")) {
            // if help is specified, return the options object with help set to true, ignore other options
            std::string prog_name = argc > 0 ? argv[0] : "kestrel";
            opts.help_message = fmt::format("Usage: {} <Options>:\n{}\n", prog_name, fmt::streamed(desc));
            return opts;
        }

        po::notify(vm);

        if (!output_dir_value.empty()) {
            opts.output_dir = std::move(output_dir_value);
        }
        return opts;
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

}  // namespace kestrel
