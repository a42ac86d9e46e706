#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "nbtcraft/nbtcraft.hpp"
#include "region_listing.hpp"

namespace po = boost::program_options;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_UNKNOWN_COMMAND = 2,
    EXIT_MISSING_FILE = 3,
    EXIT_BAD_SELECTOR = 4,
    EXIT_NBT_ERROR = 5,
};

const char* USAGE =
    "usage: nbtcraft [--log-level LEVEL] <command> [args]\n"
    "\n"
    "commands:\n"
    "  print <file> [selector]   print an NBT file, or the tag at a dot-separated path\n"
    "  region <file> [x z]       list the chunks of a region file, or print one chunk\n"
    "  world <dir>               list the region files of each dimension\n";

std::optional<int> parse_int(const std::string& text) {
    int value;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

bool require_file(const std::string& path) {
    if (std::filesystem::exists(path))
        return true;
    std::cerr << "nbtcraft: no such file: " << path << "\n";
    return false;
}

// Walks "a.b.3.c" through compounds by key and lists by index.
const nbtcraft::NBTTag* select(const nbtcraft::NBTTag& root, const std::string& selector) {
    const nbtcraft::NBTTag* current = &root;
    std::size_t start = 0;
    while (start <= selector.size()) {
        std::size_t dot = selector.find('.', start);
        std::string part = selector.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (current->type() == nbtcraft::TAG_COMPOUND) {
            current = current->get<nbtcraft::Compound>().find(part);
        } else if (current->type() == nbtcraft::TAG_LIST) {
            std::optional<int> index = parse_int(part);
            const nbtcraft::List& list = current->get<nbtcraft::List>();
            if (!index || *index < 0 || static_cast<std::size_t>(*index) >= list.size())
                return nullptr;
            current = &list[*index];
        } else {
            return nullptr;
        }
        if (!current)
            return nullptr;
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return current;
}

int cmd_print(const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }
    if (!require_file(args[0]))
        return EXIT_MISSING_FILE;
    nbtcraft::NamedTag root = nbtcraft::read_nbt_file(args[0]);
    const nbtcraft::NBTTag* tag = &root.tag;
    if (args.size() == 2) {
        tag = select(root.tag, args[1]);
        if (!tag) {
            std::cerr << "nbtcraft: selector " << args[1] << " does not match anything\n";
            return EXIT_BAD_SELECTOR;
        }
    }
    std::cout << "\"" << root.name << "\": " << nbtcraft::to_snbt(*tag) << "\n";
    return EXIT_OK;
}

int cmd_region(const std::vector<std::string>& args) {
    if (args.size() != 1 && args.size() != 3) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }
    if (!require_file(args[0]))
        return EXIT_MISSING_FILE;
    nbtcraft::RegionFile region = nbtcraft::RegionFile::from_file(args[0]);

    if (args.size() == 3) {
        std::optional<int> x = parse_int(args[1]);
        std::optional<int> z = parse_int(args[2]);
        if (!x || !z) {
            std::cerr << "nbtcraft: chunk coordinates must be integers\n";
            return EXIT_USAGE;
        }
        std::optional<nbtcraft::Chunk> chunk = region.get_chunk(*x, *z);
        if (!chunk)
            std::cout << "absent\n";
        else
            std::cout << nbtcraft::to_snbt(chunk->nbt()) << "\n";
        return EXIT_OK;
    }

    std::size_t failures = nbtcraft::cli::list_region_chunks(region, std::cout);
    return failures > 0 ? EXIT_NBT_ERROR : EXIT_OK;
}

int cmd_world(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }
    if (!std::filesystem::is_directory(args[0])) {
        std::cerr << "nbtcraft: no such directory: " << args[0] << "\n";
        return EXIT_MISSING_FILE;
    }
    for (const auto& [dimension, files] : nbtcraft::enumerate_world(args[0])) {
        std::cout << "dimension " << dimension << ": " << files.size() << " region files\n";
        for (const nbtcraft::RegionFileInfo& file : files)
            std::cout << "  " << file.x << " " << file.z << " "
                      << (file.format == nbtcraft::RegionFormat::anvil ? "anvil" : "legacy") << " " << file.path << "\n";
    }
    return EXIT_OK;
}

}

int main(int argc, char** argv) {
    std::string level;
    std::string command;
    std::vector<std::string> args;

    po::options_description visible("options");
    visible.add_options()
        ("help", "show this message")
        ("log-level", po::value<std::string>(&level)->default_value("warn"),
            "trace, debug, info, warn, error or off");
    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&command))
        ("args", po::value<std::vector<std::string>>(&args));
    po::options_description all;
    all.add(visible).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        // no short options, so negative chunk coordinates stay positional
        int style = po::command_line_style::unix_style ^ po::command_line_style::allow_short;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).style(style).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "nbtcraft: " << e.what() << "\n" << USAGE << visible;
        return EXIT_USAGE;
    }
    if (vm.count("help")) {
        std::cout << USAGE << "\n" << visible;
        return EXIT_OK;
    }
    if (command.empty()) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }
    nbtcraft::set_log_level(nbtcraft::parse_log_level(level));

    try {
        if (command == "print")
            return cmd_print(args);
        if (command == "region")
            return cmd_region(args);
        if (command == "world")
            return cmd_world(args);
    } catch (const nbtcraft::nbt_error& e) {
        NBTCRAFT_LOG_ERROR("{}", e.what());
        std::cerr << "nbtcraft: " << e.what() << "\n";
        return EXIT_NBT_ERROR;
    }
    std::cerr << "nbtcraft: unknown command " << command << "\n" << USAGE;
    return EXIT_UNKNOWN_COMMAND;
}
