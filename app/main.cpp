#include "EngineSettings.hpp"
#include "ErrorMessages.hpp"
#include "FileOperationService.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <json/json.h>

#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <locale.h>
#include <libintl.h>
#include <optional>
#include <string>
#include <vector>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

constexpr int kExitComplete = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void handle_interrupt(int)
{
    g_interrupted = 1;
}

enum class Command {Scan, Copy, Move, Conflicts};

struct ParsedArguments {
    Command command{Command::Scan};
    std::vector<std::string> sources;
    std::string destination;
    std::optional<ConflictPolicy> policy;
    std::optional<SortColumn> sort_column;
    std::optional<SortOrder> sort_order;
    std::optional<std::size_t> max_conflicts;
    bool rollback_on_cancel{false};
    bool reuse_scan{false};
    std::string error;
};

void print_usage()
{
    std::fprintf(stderr,
        "Usage:\n"
        "  twinpane-cli scan <source>... [--sort name|extension|size|modified] [--order asc|desc]\n"
        "  twinpane-cli copy <source>... --to <destination> [--policy stop|skip|overwrite]\n"
        "                    [--rollback-on-cancel] [--reuse-scan] [--sort ...] [--order ...]\n"
        "  twinpane-cli move <source>... --to <destination> [same options as copy]\n"
        "  twinpane-cli conflicts <source>... --to <destination> [--max <count>]\n");
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    if (argc < 2) {
        parsed.error = "Missing command";
        return parsed;
    }

    const std::string command = argv[1];
    if (command == "scan") {
        parsed.command = Command::Scan;
    } else if (command == "copy") {
        parsed.command = Command::Copy;
    } else if (command == "move") {
        parsed.command = Command::Move;
    } else if (command == "conflicts") {
        parsed.command = Command::Conflicts;
    } else {
        parsed.error = "Unknown command: " + command;
        return parsed;
    }

    auto take_value = [&](int& i, const char* flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            parsed.error = fmt::format("{} expects a value", flag);
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 2; i < argc && parsed.error.empty(); ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--to") == 0) {
            if (auto value = take_value(i, arg)) {
                parsed.destination = *value;
            }
        } else if (std::strcmp(arg, "--policy") == 0) {
            if (auto value = take_value(i, arg)) {
                parsed.policy = conflict_policy_from_string(*value);
                if (!parsed.policy) {
                    parsed.error = "Unknown conflict policy: " + *value;
                }
            }
        } else if (std::strcmp(arg, "--sort") == 0) {
            if (auto value = take_value(i, arg)) {
                parsed.sort_column = sort_column_from_string(*value);
                if (!parsed.sort_column) {
                    parsed.error = "Unknown sort column: " + *value;
                }
            }
        } else if (std::strcmp(arg, "--order") == 0) {
            if (auto value = take_value(i, arg)) {
                parsed.sort_order = sort_order_from_string(*value);
                if (!parsed.sort_order) {
                    parsed.error = "Unknown sort order: " + *value;
                }
            }
        } else if (std::strcmp(arg, "--max") == 0) {
            if (auto value = take_value(i, arg)) {
                try {
                    parsed.max_conflicts = static_cast<std::size_t>(std::stoul(*value));
                } catch (const std::exception&) {
                    parsed.error = "--max expects a number";
                }
            }
        } else if (std::strcmp(arg, "--rollback-on-cancel") == 0) {
            parsed.rollback_on_cancel = true;
        } else if (std::strcmp(arg, "--reuse-scan") == 0) {
            parsed.reuse_scan = true;
        } else if (std::strncmp(arg, "--", 2) == 0) {
            parsed.error = fmt::format("Unknown option: {}", arg);
        } else {
            parsed.sources.emplace_back(arg);
        }
    }

    if (parsed.error.empty() && parsed.sources.empty()) {
        parsed.error = "No source paths given";
    }
    if (parsed.error.empty() && parsed.command != Command::Scan && parsed.destination.empty()) {
        parsed.error = "--to <destination> is required";
    }
    return parsed;
}

void print_json_line(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::cout << Json::writeString(builder, value) << std::endl;
}

void print_event(const EngineEvent& event)
{
    Json::Value line(Json::objectValue);
    line["event"] = to_string(event.kind);
    line["payload"] = event.payload;
    print_json_line(line);
}

TraversalOrder order_from(const ParsedArguments& args, const EngineSettings& settings)
{
    TraversalOrder order = settings.get_default_order();
    if (args.sort_column) {
        order.column = *args.sort_column;
    }
    if (args.sort_order) {
        order.order = *args.sort_order;
    }
    return order;
}

std::optional<ConflictDecision> prompt_for_decision(const Json::Value& conflict)
{
    const std::string destination = conflict["destinationPath"].asString();
    std::fprintf(stderr, "\"%s\" already exists in %s (%s, existing %s).\n"
                         "[o]verwrite, [s]kip, overwrite [a]ll, skip a[l]l, a[b]ort: ",
                 Utils::file_name_of(destination).c_str(),
                 Utils::parent_of(destination).c_str(),
                 Utils::format_bytes(conflict["sourceSize"].asUInt64()).c_str(),
                 Utils::format_bytes(conflict["existingSize"].asUInt64()).c_str());
    std::string answer;
    if (!std::getline(std::cin, answer) || answer.empty()) {
        return ConflictDecision::Abort;
    }
    switch (answer.front()) {
        case 'o': return ConflictDecision::OverwriteThis;
        case 's': return ConflictDecision::SkipThis;
        case 'a': return ConflictDecision::OverwriteRemaining;
        case 'l': return ConflictDecision::SkipRemaining;
        case 'b': return ConflictDecision::Abort;
        default: return std::nullopt;
    }
}

/**
 * @brief Prints events until the terminal one; Ctrl-C turns into a cancel request.
 */
int follow_operation(FileOperationService& service,
                     const EventChannel::SubscriptionHandle& subscription,
                     const std::string& id,
                     std::optional<TransferKind> transfer_kind,
                     bool rollback_on_cancel)
{
    subscription->track(id);
    const bool is_transfer = transfer_kind.has_value();
    bool cancel_sent = false;
    bool title_shown = false;
    while (true) {
        if (g_interrupted && !cancel_sent) {
            cancel_sent = true;
            if (is_transfer) {
                service.cancel_transfer(id, rollback_on_cancel);
            } else {
                service.cancel_scan(id);
            }
        }

        auto event = subscription->wait_next(std::chrono::milliseconds(200));
        if (!event) {
            continue;
        }
        print_event(*event);

        if (is_transfer && !title_shown && event->kind == EventKind::TransferProgress &&
            event->payload["phase"].asString() == to_string(TransferPhase::Copying)) {
            title_shown = true;
            const std::string title = Utils::build_transfer_title(
                *transfer_kind, event->payload["filesTotal"].asUInt64(), 0,
                event->payload["bytesTotal"].asUInt64());
            std::fprintf(stderr, "%s\n", title.c_str());
        }

        if (event->kind == EventKind::TransferConflict) {
            const Json::Value& payload = event->payload;
            std::optional<ConflictDecision> decision;
            while (!decision) {
                decision = prompt_for_decision(payload["conflict"]);
            }
            service.resolve_conflict(id, payload["token"].asUInt64(), *decision);
            continue;
        }

        if (event->terminal()) {
            service.acknowledge(id);
            switch (event->kind) {
                case EventKind::ScanComplete:
                case EventKind::TransferComplete:
                    return kExitComplete;
                case EventKind::ScanCancelled:
                case EventKind::TransferCancelled:
                    return kExitCancelled;
                default:
                    return kExitFailed;
            }
        }
    }
}

int run_conflicts(FileOperationService& service, const ParsedArguments& args)
{
    std::vector<ConflictCandidate> candidates;
    for (const auto& source : args.sources) {
        ConflictCandidate candidate;
        candidate.name = Utils::file_name_of(source);
        candidate.source_path = source;
        std::error_code ec;
        const auto path = Utils::utf8_to_path(source);
        candidate.is_directory = std::filesystem::is_directory(path, ec);
        if (!candidate.is_directory) {
            const auto size = std::filesystem::file_size(path, ec);
            candidate.size = ec ? 0 : size;
        }
        candidates.push_back(std::move(candidate));
    }

    const ConflictReport report = service.detect_conflicts(candidates, args.destination, args.max_conflicts);
    Json::Value out(Json::objectValue);
    out["conflicts"] = Json::Value(Json::arrayValue);
    for (const auto& record : report.conflicts) {
        out["conflicts"].append(conflict_record_to_json(record));
    }
    out["conflictsTotal"] = Json::UInt64(report.conflicts_total);
    out["sampled"] = report.sampled;
    print_json_line(out);
    return kExitComplete;
}

int run_application(int argc, char** argv)
{
    setlocale(LC_ALL, "");
    const std::string locale_path = Utils::get_executable_path() + "/locale";
    bindtextdomain(TWINPANE_TEXT_DOMAIN, locale_path.c_str());
    textdomain(TWINPANE_TEXT_DOMAIN);

    const ParsedArguments args = parse_command_line(argc, argv);
    if (!args.error.empty()) {
        std::fprintf(stderr, "%s\n", args.error.c_str());
        print_usage();
        return kExitUsage;
    }

    EngineSettings settings;
    settings.load();
    FileOperationService service(settings);

    if (args.command == Command::Conflicts) {
        return run_conflicts(service, args);
    }

    std::signal(SIGINT, handle_interrupt);
    const TraversalOrder order = order_from(args, settings);

    std::optional<std::string> reused_scan;
    if (args.command == Command::Scan || args.reuse_scan) {
        auto scan_events = service.subscribe(scan_event_kinds());
        const std::string scan_id = service.start_scan(args.sources, order);
        const int result = follow_operation(service, scan_events, scan_id, std::nullopt, false);
        if (args.command == Command::Scan || result != kExitComplete) {
            return result;
        }
        reused_scan = scan_id;
    }

    const TransferKind kind = args.command == Command::Move ? TransferKind::Move : TransferKind::Copy;
    auto transfer_events = service.subscribe(transfer_event_kinds());
    const std::string id = service.start_transfer(kind, args.sources, args.destination,
                                                  args.policy, reused_scan, order);
    return follow_operation(service, transfer_events, id, kind, args.rollback_on_cancel);
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return kExitFailed;
    }

    try {
        return run_application(argc, argv);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return kExitFailed;
    }
}
