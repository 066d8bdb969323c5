#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "common/logging.h"
#include "common/thread_utils.h"
#include "config/audit_config.h"
#include "config/config_loader.h"
#include "report.h"
#include "source_tree.h"
#include "ui_auditor.h"

static void printUsage(const char* program) {
    const char* usage = R"(
USAGE: %s [OPTIONS]

ui_audit - UI convention compliance auditor for front-end source trees

OPTIONS:
    --root <dir>            Project root the source roots are relative to (default: .)
    --config <file>         JSON configuration overlaid on the built-in defaults
    --report <file>         Write the text report to a file
    --json <file>           Export the result as JSON
    --junit <file>          Export the result as JUnit XML for CI
    --log <file>            Log file (default: logs/ui_audit.log)
    --workers <n>           Worker threads, 0 = one per core, 1 = sequential
    --ide                   Print IDE-compatible diagnostics to stderr
    --quiet                 Do not print the text report to stdout
    --list-rules            Print the active rule set and exit
    --help                  Show this help message

EXAMPLES:
    # Audit the current project with the built-in conventions
    %s

    # CI run with a project config and JUnit output
    %s --root ../crm --config ui_audit.json --junit ui-audit.xml

SUPPRESSION:
    A line containing "ui-audit: allow" is exempt from every rule.

EXIT CODES:
    0 - All rules pass
    1 - One or more violations found
    2 - Configuration error (malformed pattern or config, missing hard canonical file, bad usage)
    3 - Internal error

)";

    fprintf(stdout, usage, program, program, program);
}

static void listRules(const UiAudit::RuleRegistry& registry) {
    for (const auto& rule : registry.rules()) {
        fprintf(stdout, "%-32s %-18s %-22s %s\n",
                rule.id.c_str(),
                UiAudit::ruleKindName(rule.kind()),
                UiAudit::categoryName(rule.category),
                rule.strictness == UiAudit::Strictness::HARD ? "hard" : "soft");
    }
    fprintf(stdout, "\n%zu rules\n", registry.size());
}

int main(int argc, char* argv[]) {
    const char* root = nullptr;
    const char* config_path = nullptr;
    const char* report_path = nullptr;
    const char* json_path = nullptr;
    const char* junit_path = nullptr;
    const char* log_path = nullptr;
    const char* workers_arg = nullptr;
    bool ide_mode = false;
    bool quiet = false;
    bool list_only = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        else if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            root = argv[++i];
        }
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--report") == 0 && i + 1 < argc) {
            report_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--json") == 0 && i + 1 < argc) {
            json_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--junit") == 0 && i + 1 < argc) {
            junit_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_path = argv[++i];
        }
        else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers_arg = argv[++i];
        }
        else if (std::strcmp(argv[i], "--ide") == 0) {
            ide_mode = true;
        }
        else if (std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        }
        else if (std::strcmp(argv[i], "--list-rules") == 0) {
            list_only = true;
        }
        else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            printUsage(argv[0]);
            return 2;
        }
    }

    // Configuration: defaults, then the JSON file, then command line overrides
    UiAudit::AuditConfig config = UiAudit::AuditConfig::defaults();
    std::string error;
    if (config_path && !UiAudit::ConfigLoader::loadFile(config_path, &config, &error)) {
        fprintf(stderr, "Configuration error: %s\n", error.c_str());
        return 2;
    }
    if (root) {
        config.project_root = root;
    }
    if (log_path) {
        config.log_file = log_path;
    }
    if (workers_arg && !Common::parseWorkerCount(workers_arg, &config.workers)) {
        fprintf(stderr, "Invalid --workers value: %s\n", workers_arg);
        return 2;
    }

    Common::Logger::Level level = Common::Logger::Level::INFO;
    if (!Common::parseLogLevel(config.log_level.c_str(), &level)) {
        fprintf(stderr, "Configuration error: unknown log_level '%s'\n", config.log_level.c_str());
        return 2;
    }
    Common::initLogging(config.log_file.c_str());
    if (Common::g_logger) {
        Common::g_logger->setMinLevel(level);
    }
    LOG_INFO("ui_audit starting: root=%s config=%s", config.project_root.c_str(),
             config_path ? config_path : "(defaults)");

    UiAudit::DiskTree tree(config.project_root);
    UiAudit::UiAuditor auditor(config, tree);

    if (!auditor.prepare()) {
        fprintf(stderr, "Configuration error: %s\n", auditor.lastError().c_str());
        Common::shutdownLogging();
        return 2;
    }

    if (list_only) {
        listRules(auditor.registry());
        Common::shutdownLogging();
        return 0;
    }

    UiAudit::AuditResult result;
    const UiAudit::AuditStatus status = auditor.run(&result);
    const int exit_code = UiAudit::UiAuditor::exitCodeFor(status, result);

    if (status == UiAudit::AuditStatus::CONFIG_ERROR) {
        fprintf(stderr, "Configuration error: %s\n", auditor.lastError().c_str());
        Common::shutdownLogging();
        return exit_code;
    }
    if (status == UiAudit::AuditStatus::INTERNAL_ERROR) {
        fprintf(stderr, "Internal error: %s\n", auditor.lastError().c_str());
        Common::shutdownLogging();
        return exit_code;
    }

    const std::string text = UiAudit::formatTextReport(result);
    if (!quiet) {
        fprintf(stdout, "%s", text.c_str());
    }
    if (ide_mode) {
        fprintf(stderr, "%s", UiAudit::formatIDEWarnings(result).c_str());
    }

    bool written = true;
    if (report_path) {
        written = UiAudit::writeReportFile(report_path, text) && written;
    }
    if (json_path) {
        written = UiAudit::writeReportFile(json_path, UiAudit::formatJSON(result)) && written;
    }
    if (junit_path) {
        written = UiAudit::writeReportFile(junit_path, UiAudit::formatJUnit(result)) && written;
    }
    if (!written) {
        fprintf(stderr, "Internal error: failed to write one or more report files\n");
        LOG_ERROR("Report output incomplete, exiting with internal error");
        Common::shutdownLogging();
        return UiAudit::UiAuditor::exitCodeFor(UiAudit::AuditStatus::INTERNAL_ERROR, result);
    }

    Common::shutdownLogging();
    return exit_code;
}
