#include "sep39/cli_colors.hpp"
#include "sep39/env.hpp"
#include "sep39/rowfile.hpp"
#include "sep39/sep39.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  sep39_cpp encode <file> [--type <type/subtype>] [--name <n>] [--no-checksum] [--out <rows>]\n";
    std::cout << "  sep39_cpp decode <rows> [--out <path>] [--revision <digit>]\n";
    std::cout << "  sep39_cpp info <rows> [--revision <digit>]\n";
    std::cout << "Global flags: --no-color\n";
}

void Warn(const std::string& message) {
    std::cerr << sep39::cli::Yellow("WARN: ", std::cerr) << message << "\n";
}

struct EncodeArgs {
    std::string input;
    std::string output;
    std::string type = std::string(sep39::constants::kDefaultMediaType);
    std::string name = std::string(sep39::constants::kDefaultCliName);
    bool checksum = true;
};

struct RowsArgs {
    std::string input;
    std::string output;
    std::optional<char> revision;
};

std::string NextValue(int argc, char** argv, int& idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag);
    }
    idx += 2;
    return argv[idx - 1];
}

EncodeArgs ParseEncodeArgs(int argc, char** argv, int start_index) {
    EncodeArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--type" || flag == "-t") {
            opts.type = NextValue(argc, argv, idx, flag);
        } else if (flag == "--name" || flag == "-n") {
            opts.name = NextValue(argc, argv, idx, flag);
        } else if (flag == "--out" || flag == "-o") {
            opts.output = NextValue(argc, argv, idx, flag);
        } else if (flag == "--no-checksum") {
            opts.checksum = false;
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

RowsArgs ParseRowsArgs(int argc, char** argv, int start_index) {
    RowsArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing row file path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--out" || flag == "-o") {
            opts.output = NextValue(argc, argv, idx, flag);
        } else if (flag == "--revision" || flag == "-r") {
            std::string digit = NextValue(argc, argv, idx, flag);
            if (digit.size() != 1) {
                throw std::runtime_error("Revision must be a single digit");
            }
            opts.revision = digit[0];
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

sep39::frame::Revision ResolveRevision(const RowsArgs& opts, const std::vector<sep39::Slot>& slots) {
    if (!opts.revision) {
        return sep39::DetectRevision(slots);
    }
    auto revision = sep39::frame::RevisionFromDigit(*opts.revision);
    if (!revision) {
        throw std::runtime_error(std::string("Unknown revision: ") + *opts.revision);
    }
    return *revision;
}

std::string DescribeDescriptor(const sep39::MediaDescriptor& descriptor) {
    std::string out = descriptor.type;
    for (const auto& param : descriptor.params) {
        out += " " + param.first + "=" + param.second;
    }
    return out;
}

std::string Printable(const std::vector<std::uint8_t>& value) {
    std::string out;
    for (std::uint8_t byte : value) {
        out.push_back(byte >= 0x20 && byte < 0x7F ? static_cast<char>(byte) : '.');
    }
    return out;
}

int RunEncode(const EncodeArgs& opts) {
    sep39::Bytes data = sep39::ReadFile(opts.input);
    sep39::MediaDescriptor descriptor(opts.type);
    descriptor.Set(sep39::constants::kNameParam, opts.name);
    if (opts.checksum) {
        descriptor.Set(sep39::constants::kChecksumParam, std::to_string(sep39::Crc32(data)));
    }

    std::cout << "Encoding file '" << opts.input << "' ...\n";
    auto start = std::chrono::steady_clock::now();
    std::vector<sep39::Slot> slots = sep39::Encode(data, {descriptor});
    double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    std::cout << "  " << sep39::cli::Green("done") << " (took " << std::fixed << std::setprecision(2) << elapsed_ms
              << "ms)\n";

    sep39::EncodeStats stats = sep39::ComputeStats(data.size(), slots);
    if (opts.checksum) {
        std::cout << "  checksum: " << *descriptor.Get(sep39::constants::kChecksumParam) << "\n";
    }
    std::cout << "  stats:\n";
    std::cout << "   - original size:   " << stats.original_size << "\n";
    std::cout << "   - ManageData rows: " << stats.slot_count << "\n";
    std::cout << "   - encoded size:    " << stats.encoded_size << "\n";
    std::cout << "   - ratio:           " << std::setprecision(2) << stats.ratio << "x\n";

    if (!opts.output.empty()) {
        sep39::rowfile::Write(opts.output, slots);
        std::cout << "  rows written to " << sep39::cli::Cyan(opts.output) << "\n";
    } else if (sep39::env::IsEnabled(sep39::env::kVerboseVar)) {
        std::cout << sep39::rowfile::Format(slots);
    }
    return 0;
}

int RunDecode(const RowsArgs& opts) {
    std::vector<sep39::Slot> slots = sep39::rowfile::Read(opts.input);
    sep39::Decoded decoded = sep39::Decode(slots, ResolveRevision(opts, slots));
    if (opts.output.empty()) {
        Warn("no --out given, attachments were verified but not written");
        return 0;
    }
    for (std::size_t i = 0; i < decoded.attachments.size(); ++i) {
        std::string path = decoded.attachments.size() == 1 ? opts.output : opts.output + "." + std::to_string(i);
        sep39::WriteFile(path, decoded.attachments[i]);
        std::cout << path << " (" << decoded.attachments[i].size() << " bytes)\n";
    }
    return 0;
}

int RunInfo(const RowsArgs& opts) {
    std::vector<sep39::Slot> slots = sep39::rowfile::Read(opts.input);
    sep39::frame::Revision revision = ResolveRevision(opts, slots);
    sep39::Decoded decoded = sep39::Decode(slots, revision);
    std::cout << "revision: " << revision.version << "\n";
    std::cout << "rows: " << slots.size() << "\n";
    if (decoded.descriptors.empty()) {
        std::cout << "media: <none>\n";
    }
    for (std::size_t i = 0; i < decoded.attachments.size(); ++i) {
        std::cout << "attachment " << i << ": " << decoded.attachments[i].size() << " bytes";
        if (i < decoded.descriptors.size()) {
            std::cout << ", " << sep39::cli::Bold(DescribeDescriptor(decoded.descriptors[i]));
        }
        std::cout << "\n";
    }
    if (sep39::env::IsEnabled(sep39::env::kVerboseVar)) {
        for (const auto& slot : slots) {
            std::cout << "  " << sep39::cli::Cyan(slot.key) << " | " << Printable(slot.value) << "\n";
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<char*> args;
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == "--no-color") {
            sep39::cli::SetColorsEnabled(false);
            continue;
        }
        args.push_back(argv[i]);
    }
    int count = static_cast<int>(args.size());
    if (count < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(args[1]);
    try {
        if (command == "encode") {
            return RunEncode(ParseEncodeArgs(count, args.data(), 2));
        }
        if (command == "decode") {
            return RunDecode(ParseRowsArgs(count, args.data(), 2));
        }
        if (command == "info") {
            return RunInfo(ParseRowsArgs(count, args.data(), 2));
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << sep39::cli::Red("Error: ", std::cerr) << exc.what() << "\n";
        return 1;
    }
}
