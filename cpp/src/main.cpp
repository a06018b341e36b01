#include "lexport/cache.hpp"
#include "lexport/collaborators.hpp"
#include "lexport/console.hpp"
#include "lexport/constants.hpp"
#include "lexport/pipeline.hpp"
#include "lexport/records.hpp"
#include "lexport/stream.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

namespace fs = std::filesystem;
using lexport::LogLevel;

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  lexport export [dir] [-o <out>] [-p <password>] [--no-compress] [--item <name>=<path>]...\n";
    std::cout << "                 [--kv <key>=<value>]... [--session <key>=<value>]... [--cookie <key>=<value>]...\n";
    std::cout << "  lexport import <archive> [-o <dir>] [-p <password>]\n";
    std::cout << "  lexport list <archive> [-p <password>]\n";
    std::cout << "Options:\n";
    std::cout << "  --no-color   disable coloured output (also LEXPORT_NO_COLOR=1)\n";
    std::cout << "  A password naming an existing file is read from that file.\n";
}

struct CliArgs {
    std::string command;
    std::string input;
    std::string output;
    std::string password;
    bool compress = true;
    std::vector<std::pair<std::string, std::string>> items;
    lexport::json::Fields local;
    lexport::json::Fields session;
    lexport::json::Fields cookies;
};

std::pair<std::string, std::string> SplitAssignment(const std::string& flag, const std::string& value) {
    std::size_t eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw UsageError("Expected <name>=<value> after " + flag);
    }
    return {value.substr(0, eq), value.substr(eq + 1)};
}

CliArgs ParseArgs(int argc, char** argv) {
    CliArgs args;
    args.command = argv[1];
    int idx = 2;
    auto take_value = [&](const std::string& flag) {
        if (idx + 1 >= argc) {
            throw UsageError("Missing value for " + flag);
        }
        std::string value = argv[idx + 1];
        idx += 2;
        return value;
    };
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-o" || flag == "--out") {
            args.output = take_value(flag);
        } else if (flag == "-p" || flag == "--password") {
            args.password = take_value(flag);
        } else if (flag == "--no-compress") {
            args.compress = false;
            idx += 1;
        } else if (flag == "--no-color") {
            lexport::console::SetColorsEnabled(false);
            idx += 1;
        } else if (flag == "--item") {
            args.items.push_back(SplitAssignment(flag, take_value(flag)));
        } else if (flag == "--kv") {
            args.local.push_back(SplitAssignment(flag, take_value(flag)));
        } else if (flag == "--session") {
            args.session.push_back(SplitAssignment(flag, take_value(flag)));
        } else if (flag == "--cookie") {
            args.cookies.push_back(SplitAssignment(flag, take_value(flag)));
        } else if (!flag.empty() && flag[0] == '-') {
            throw UsageError("Unknown option " + flag);
        } else if (args.input.empty()) {
            args.input = flag;
            idx += 1;
        } else {
            throw UsageError("Unexpected argument " + flag);
        }
    }
    return args;
}

std::string ResolvePassword(const std::string& input) {
    if (input.empty()) {
        return input;
    }
    std::error_code ec;
    fs::path candidate(input);
    if (fs::exists(candidate, ec) && fs::is_regular_file(candidate, ec)) {
        lexport::stream::FileSource source(candidate);
        auto data = lexport::stream::ReadAll(source);
        std::string password(data.begin(), data.end());
        while (!password.empty() && (password.back() == '\n' || password.back() == '\r')) {
            password.pop_back();
        }
        return password;
    }
    return input;
}

std::string PromptPassword() {
    std::cerr << "Enter password: " << std::flush;
    std::string password;
    std::getline(std::cin, password);
    return password;
}

// Remembers whether the pipeline already reported its own failure.
struct ReportingLogger {
    lexport::Logger base = lexport::console::MakeLogger();
    bool failure_reported = false;

    lexport::Logger Bind() {
        return [this](LogLevel level, const std::string& message) {
            if (level == LogLevel::Error
                && (message.rfind("Error: ", 0) == 0 || message.rfind("Export error: ", 0) == 0)) {
                failure_reported = true;
            }
            base(level, message);
        };
    }
};

int RunExport(const CliArgs& args, ReportingLogger& reporting) {
    lexport::Logger logger = reporting.Bind();
    std::string password = ResolvePassword(args.password);
    if (!password.empty() && !args.compress) {
        std::cerr << lexport::console::Yellow("Warning: encrypted archives are always compressed") << "\n";
    }

    lexport::collaborators::FileTreeCollaborator files(args.input, {}, logger);
    lexport::collaborators::CustomItemsCollaborator custom({}, {}, logger);
    for (const auto& item : args.items) {
        lexport::collaborators::CustomItem custom_item;
        custom_item.name = item.first;
        custom_item.file = item.second;
        custom.AddItem(std::move(custom_item));
    }
    lexport::collaborators::KeyValueCollaborator storage;
    if (!args.local.empty()) {
        storage.SetDump(std::string(lexport::constants::kLocalStorageDump), args.local);
    }
    if (!args.session.empty()) {
        storage.SetDump(std::string(lexport::constants::kSessionStorageDump), args.session);
    }
    if (!args.cookies.empty()) {
        storage.SetDump(std::string(lexport::constants::kCookieDump), args.cookies);
    }

    std::string output = args.output;
    if (output.empty()) {
        if (!password.empty()) {
            output = "lexport-backup.enc";
        } else {
            output = args.compress ? "lexport-backup.tar.gz" : "lexport-backup.tar";
        }
    }

    lexport::pipeline::ExportOptions options;
    options.password = password;
    options.compress = args.compress;
    options.logger = logger;

    lexport::stream::FileSink sink(output);
    auto report = lexport::pipeline::ExportArchive(sink, {&custom, &storage, &files}, options);
    std::cout << "Wrote " << report.entries << " entries (" << report.payload_bytes << " bytes) to "
              << lexport::console::Bold(output) << "\n";
    return 0;
}

int RunImport(const CliArgs& args, ReportingLogger& reporting) {
    if (args.input.empty()) {
        throw UsageError("Missing archive path");
    }
    lexport::Logger logger = reporting.Bind();
    fs::path out_dir = args.output.empty() ? fs::path("lexport-restore") : fs::path(args.output);
    fs::path custom_dir = out_dir / "custom";

    lexport::collaborators::FileTreeCollaborator files({}, out_dir / "files", logger);
    lexport::collaborators::CustomItemsCollaborator custom(
        {},
        [&](const std::string& name, lexport::collaborators::Bytes data) {
            if (!lexport::collaborators::IsSafePath(custom_dir, name)) {
                throw std::runtime_error("Unsafe custom item name");
            }
            fs::path target = custom_dir / fs::path(name);
            fs::create_directories(target.parent_path());
            lexport::stream::FileSink sink(target);
            sink.Write(data);
            sink.Close();
        },
        logger);
    lexport::collaborators::KeyValueCollaborator storage;
    lexport::records::RecordsCollaborator records({}, {}, logger);
    lexport::cache::CacheCollaborator cache({}, logger);

    lexport::pipeline::ImportOptions options;
    options.password = ResolvePassword(args.password);
    options.password_provider = PromptPassword;
    options.logger = logger;

    lexport::stream::FileSource source(args.input);
    auto report = lexport::pipeline::ImportArchive(source, {&custom, &storage, &records, &cache, &files}, options);
    for (const auto& dump : storage.dumps()) {
        for (const auto& field : dump.second) {
            std::cout << "[" << dump.first << "] " << field.first << "=" << field.second << "\n";
        }
    }
    for (const auto& database : records.databases()) {
        for (const auto& store : database.stores) {
            std::cout << "[idb] " << database.name << " v" << database.version << " " << store.name << ": "
                      << store.records.size() << " records\n";
        }
    }
    for (const auto& stored : cache.caches()) {
        for (const auto& response : stored.responses) {
            std::cout << "[cache] " << stored.name << " " << response.status << " " << response.url << "\n";
        }
    }
    std::cout << "Restored " << report.dispatched << " entries";
    if (report.failed > 0) {
        std::cout << ", " << lexport::console::Red(std::to_string(report.failed) + " failed", std::cout);
    }
    if (report.ignored > 0) {
        std::cout << ", " << report.ignored << " ignored";
    }
    std::cout << "\n";
    return report.failed > 0 ? 1 : 0;
}

int RunList(const CliArgs& args) {
    if (args.input.empty()) {
        throw UsageError("Missing archive path");
    }
    lexport::pipeline::ImportOptions options;
    options.password = ResolvePassword(args.password);
    options.password_provider = PromptPassword;

    lexport::stream::FileSource source(args.input);
    auto listing = lexport::pipeline::ListArchive(source, options);
    std::cout << "format: " << lexport::pipeline::FormatName(listing.format) << "\n";
    for (const auto& entry : listing.entries) {
        std::cout << (entry.is_directory ? "d " : "- ") << entry.size << "\t" << entry.path << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    ReportingLogger reporting;
    try {
        CliArgs args = ParseArgs(argc, argv);
        if (args.command == "export") {
            return RunExport(args, reporting);
        }
        if (args.command == "import") {
            return RunImport(args, reporting);
        }
        if (args.command == "list") {
            return RunList(args);
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << exc.what() << "\n";
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        if (!reporting.failure_reported) {
            std::cerr << lexport::console::Red(std::string("Error: ") + exc.what()) << "\n";
        }
        return 1;
    }
}
