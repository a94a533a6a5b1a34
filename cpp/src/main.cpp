#include "stegbridge/cli_colors.hpp"
#include "stegbridge/config.hpp"
#include "stegbridge/constants.hpp"
#include "stegbridge/datauri.hpp"
#include "stegbridge/handlers.hpp"
#include "stegbridge/image_codec.hpp"
#include "stegbridge/log.hpp"
#include "stegbridge/server.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  stegbridge serve [--host <addr>] [--port <n>] [--index <file>] [--static <dir>] [--max-body <bytes>] [--debug] [--no-color]\n";
    std::cout << "  stegbridge process <image> [--data-uri]\n";
    std::cout << "  stegbridge download <payload-file> [--format <tag>] [--out <path>]\n";
    std::cout << "  stegbridge version\n";
}

struct ProcessArgs {
    std::string input;
    bool data_uri = false;
};

struct DownloadArgs {
    std::string input;
    std::optional<std::string> format;
    std::string output;
};

std::vector<std::uint8_t> ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw std::runtime_error("Failed to read file: " + path);
    }
    return data;
}

void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open output: " + path);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to write output: " + path);
    }
}

std::uint64_t ParseUnsigned(const std::string& flag, const std::string& raw) {
    try {
        std::size_t used = 0;
        unsigned long long value = std::stoull(raw, &used);
        if (used != raw.size()) {
            throw std::invalid_argument(raw);
        }
        return static_cast<std::uint64_t>(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + flag + ": " + raw);
    }
}

stegbridge::ServiceConfig ParseServeArgs(int argc, char** argv, int start_index) {
    stegbridge::ServiceConfig config = stegbridge::LoadConfigFromEnv();
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        auto value = [&]() -> std::string {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return argv[idx + 1];
        };
        if (flag == "--host") {
            config.host = value();
            idx += 2;
        } else if (flag == "--port" || flag == "-p") {
            std::uint64_t port = ParseUnsigned(flag, value());
            if (port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
                throw std::runtime_error("Port out of range: " + std::to_string(port));
            }
            config.port = static_cast<std::uint16_t>(port);
            idx += 2;
        } else if (flag == "--index") {
            config.index_path = value();
            idx += 2;
        } else if (flag == "--static") {
            config.static_dir = value();
            idx += 2;
        } else if (flag == "--max-body") {
            std::uint64_t limit = ParseUnsigned(flag, value());
            if (limit == 0) {
                throw std::runtime_error("--max-body must be positive");
            }
            config.max_content_length = static_cast<std::size_t>(limit);
            idx += 2;
        } else if (flag == "--debug") {
            config.debug = true;
            idx += 1;
        } else if (flag == "--no-color") {
            config.colors = false;
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return config;
}

ProcessArgs ParseProcessArgs(int argc, char** argv, int start_index) {
    ProcessArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing input path");
    }
    opts.input = argv[start_index];
    for (int idx = start_index + 1; idx < argc; ++idx) {
        std::string flag(argv[idx]);
        if (flag == "--data-uri") {
            opts.data_uri = true;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

DownloadArgs ParseDownloadArgs(int argc, char** argv, int start_index) {
    DownloadArgs opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing payload path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--format" || flag == "-f") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing format tag");
            }
            opts.format = argv[idx + 1];
            idx += 2;
        } else if (flag == "--out" || flag == "-o") {
            if (idx + 1 >= argc) {
                throw std::runtime_error("Missing output path");
            }
            opts.output = argv[idx + 1];
            idx += 2;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

void ApplyLogging(const stegbridge::ServiceConfig& config) {
    if (!config.colors) {
        stegbridge::cli::SetColorsEnabled(false);
    }
    stegbridge::log::SetLevel(config.debug ? stegbridge::log::Level::Debug : stegbridge::log::Level::Info);
}

int Fail(const stegbridge::Error& error) {
    std::cerr << stegbridge::cli::Red("Error: ") << error.message << " (" << stegbridge::ErrorKindName(error.kind)
              << ")\n";
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "serve") {
            stegbridge::ServiceConfig config = ParseServeArgs(argc, argv, 2);
            ApplyLogging(config);
            stegbridge::Server server(std::move(config));
            server.Run();
            return 0;
        }
        if (command == "process") {
            ProcessArgs opts = ParseProcessArgs(argc, argv, 2);
            ApplyLogging(stegbridge::LoadConfigFromEnv());
            stegbridge::handlers::FilePart file;
            file.filename = std::filesystem::path(opts.input).filename().string();
            file.data = ReadFile(opts.input);
            auto result = stegbridge::handlers::ProcessImage(file);
            if (!result) {
                return Fail(result.error());
            }
            const auto& payload = result.value();
            std::string image = payload.image;
            if (opts.data_uri) {
                image = stegbridge::datauri::WithPrefix(image, stegbridge::image_codec::MimeTypeFor(payload.format));
            }
            nlohmann::json body = {
                {"success", true},
                {"image", image},
                {"format", payload.format},
                {"size", payload.size},
            };
            std::cout << body.dump() << "\n";
            return 0;
        }
        if (command == "download") {
            DownloadArgs opts = ParseDownloadArgs(argc, argv, 2);
            ApplyLogging(stegbridge::LoadConfigFromEnv());
            auto text = ReadFile(opts.input);
            stegbridge::handlers::DownloadRequest request;
            request.image.assign(text.begin(), text.end());
            request.format = opts.format;
            auto result = stegbridge::handlers::DownloadImage(request);
            if (!result) {
                return Fail(result.error());
            }
            const auto& download = result.value();
            std::string output = opts.output.empty() ? download.filename : opts.output;
            WriteFile(output, download.data);
            std::cout << output << "\n";
            return 0;
        }
        if (command == "version" || command == "--version") {
            std::cout << stegbridge::constants::kServerName << " " << stegbridge::constants::kVersion << "\n";
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << stegbridge::cli::Red("Error: ") << exc.what() << "\n";
        return 1;
    }
}
