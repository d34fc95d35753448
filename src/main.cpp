#include "lens.hpp"

static std::optional<std::string> _loadParameters(const lens::cmd::ArgParser & arg_parser)
{
    if(const auto params_arg = arg_parser.getArg<std::vector<std::string>>("--params"))
    {
        return lens::file::loadParameters(params_arg->at(0), lens::file::PayloadFormat::PARAMETERS);
    }

    if(const auto abi_arg = arg_parser.getArg<std::vector<std::string>>("--abi"))
    {
        return lens::file::loadParameters(abi_arg->at(0), lens::file::PayloadFormat::RAW_ABI);
    }

    return std::nullopt;
}

int main(int argc, char* argv[])
{
    lens::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", lens::cmd::CommandLineArgDef::NArgs::Zero, lens::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", lens::cmd::CommandLineArgDef::NArgs::Zero, lens::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", lens::cmd::CommandLineArgDef::NArgs::Zero, lens::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--verbose", lens::cmd::CommandLineArgDef::NArgs::Zero, lens::cmd::CommandLineArgDef::Type::Bool, "Log debug messages to the console");
    arg_parser.addArg("--abi", lens::cmd::CommandLineArgDef::NArgs::One, lens::cmd::CommandLineArgDef::Type::String, "Path to the contract ABI (JSON)");
    arg_parser.addArg("--params", lens::cmd::CommandLineArgDef::NArgs::One, lens::cmd::CommandLineArgDef::Type::String, "Path to module parameters {\"abi\": \"...\"}, overrides --abi");
    arg_parser.addArg("--input", lens::cmd::CommandLineArgDef::NArgs::One, lens::cmd::CommandLineArgDef::Type::String, "Path to logs, one JSON object per line (default: stdin)");
    arg_parser.addArg("--logs", lens::cmd::CommandLineArgDef::NArgs::One, lens::cmd::CommandLineArgDef::Type::String, "Directory for log files");

    const bool args_valid = arg_parser.parse(argc, argv);

    lens::config::Config cfg;
    cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    if(const auto logs_arg = arg_parser.getArg<std::vector<std::string>>("--logs"))
    {
        cfg.logs_path = logs_arg->at(0);
    }

    lens::utils::configureLogger(cfg.logs_path, arg_parser.getArg<bool>("--verbose").value_or(false));

    if(!args_valid)
    {
        spdlog::info(arg_parser.constructHelpMessage());
        return 1;
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("Version: {}.{}.{}", lens::MAJOR_VERSION, lens::MINOR_VERSION, lens::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        spdlog::info(arg_parser.constructHelpMessage());
        return 0;
    }

    spdlog::debug("Version: {}.{}.{}", lens::MAJOR_VERSION, lens::MINOR_VERSION, lens::PATCH_VERSION);
    spdlog::debug("Binary path: {}", cfg.bin_path.string());

    std::ifstream input_file;
    if(const auto input_arg = arg_parser.getArg<std::vector<std::string>>("--input"))
    {
        input_file.open(input_arg->at(0));
        if(!input_file.is_open())
        {
            spdlog::error("Failed to open input {}", input_arg->at(0));
            return 1;
        }
    }

    lens::host::JsonLinesSource source(input_file.is_open() ? static_cast<std::istream &>(input_file) : std::cin);
    lens::host::JsonLinesSink sink(std::cout);
    lens::host::Module module(source);

    const auto set_param_res = module.setParam(_loadParameters(arg_parser));
    if(!set_param_res)
    {
        spdlog::error(std::format("{}: {}", set_param_res.error().kind, set_param_res.error().message));
        return 1;
    }

    std::size_t records = 0;
    std::size_t errors = 0;
    while(true)
    {
        const auto completion = module.transform();
        if(!completion) ++errors;

        if(!sink.write(completion))
        {
            break;
        }
        ++records;
    }

    spdlog::info("Processed {} records, {} errors", records, errors);
    return 0;
}
