#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>

#include "nmsync/cli/commands.hpp"
#include "nmsync/cli/config.hpp"
#include "nmsync/cli/options.hpp"
#include "nmsync/cli/tag_ops.hpp"
#include "nmsync/core/errors.hpp"
#include "nmsync/core/log.hpp"
#include "nmsync/engine/database.hpp"
#include "nmsync/engine/message.hpp"

using nmsync::core::Status;
using nmsync::core::is_ok;

namespace {

constexpr nmsync::core::u32 kMaxOptions = 16;

// ========================================================================
// Output Helpers
// ========================================================================

void print_usage(const nmsync::cli::CommandSpec* cmds, nmsync::core::u32 count) {
    printf("usage: nmsync [options] <command> [args]\n\n");
    printf("Options:\n");
    printf("  -d, --database <path>   Mail root (default: $NMSYNC_DATABASE, then ~/mail)\n");
    printf("  -r, --read-only         Open the index read-only\n");
    printf("  -l, --log-level <lvl>   error, warn, info or debug (default: $NMSYNC_LOG_LEVEL, then warn)\n");
    printf("  -h, --help              Show this help\n\n");
    printf("Commands:\n");
    for (nmsync::core::u32 i = 0; i < count; ++i) {
        printf("  %s\n", cmds[i].usage);
    }
}

void report_failure(const char* context, Status s, const nmsync::engine::Database* db = nullptr) {
    nmsync::core::log_status_error(context, s);
    if (db != nullptr && !db->last_error().empty()) {
        nmsync::core::log_error("%s", db->last_error().c_str());
    }
}

void print_tags(const std::vector<std::string>& tags, const char* sep) {
    for (size_t i = 0; i < tags.size(); ++i) {
        printf("%s%s", i == 0 ? "" : sep, tags[i].c_str());
    }
    printf("\n");
}

void print_upgrade_progress(void* closure, double progress) {
    (void)closure;
    printf("\rupgrading: %3d%%", static_cast<int>(progress * 100.0));
    fflush(stdout);
}

// ========================================================================
// Session Helpers
// ========================================================================

bool open_database(const nmsync::cli::CliConfig& cfg, bool writes, nmsync::engine::Database* db) {
    if (writes && cfg.read_only) {
        nmsync::core::log_error("this command modifies the index; drop --read-only");
        return false;
    }
    const nmsync::engine::Mode mode = writes ? nmsync::engine::Mode::ReadWrite : nmsync::engine::Mode::ReadOnly;
    const Status s = db->open(cfg.database_path.c_str(), mode);
    if (!is_ok(s)) {
        report_failure("open database", s, db);
        return false;
    }
    if (writes && db->needs_upgrade()) {
        nmsync::core::log_warn("index format is outdated; run 'nmsync upgrade'");
    }
    return true;
}

bool close_database(nmsync::engine::Database* db) {
    const Status s = db->close();
    if (!is_ok(s)) {
        report_failure("close database", s);
        return false;
    }
    return true;
}

bool lookup_message(nmsync::engine::Database* db, const char* id, nmsync::engine::Message* msg) {
    bool found = false;
    const Status s = db->find_message(id, msg, &found);
    if (!is_ok(s)) {
        report_failure("find message", s);
        return false;
    }
    if (!found) {
        nmsync::core::log_error("no message with id %s", id);
        return false;
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

int handle_create(const nmsync::cli::CliConfig& cfg) {
    nmsync::engine::Database db;
    const Status s = db.create(cfg.database_path.c_str());
    if (!is_ok(s)) {
        report_failure("create database", s, &db);
        return EXIT_FAILURE;
    }
    printf("created index under %s\n", cfg.database_path.c_str());
    return close_database(&db) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int handle_index(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    nmsync::engine::Database db;
    if (!open_database(cfg, true, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    {
        nmsync::engine::AtomicSection atomic(db);
        Status s = atomic.begin();
        if (!is_ok(s)) {
            report_failure("begin atomic section", s);
            return EXIT_FAILURE;
        }

        for (nmsync::core::u32 i = 0; i < args.argc; ++i) {
            const char* path = args.argv[i];
            nmsync::engine::Message msg;
            nmsync::engine::IndexOutcome outcome{};
            s = db.index_file(path, &msg, &outcome);
            if (!is_ok(s)) {
                nmsync::core::log_status_error(path, s);
                rc = EXIT_FAILURE;
                continue;
            }

            if (outcome == nmsync::engine::IndexOutcome::Added) {
                s = msg.maildir_flags_to_tags();
                if (!is_ok(s)) {
                    nmsync::core::log_status_error("apply maildir flags", s);
                    rc = EXIT_FAILURE;
                }
            }
            printf("%s %s\n",
                   outcome == nmsync::engine::IndexOutcome::Added ? "added" : "merged",
                   msg.id().c_str());
        }

        s = atomic.commit();
        if (!is_ok(s)) {
            report_failure("commit atomic section", s);
            rc = EXIT_FAILURE;
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_remove(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    nmsync::engine::Database db;
    if (!open_database(cfg, true, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    for (nmsync::core::u32 i = 0; i < args.argc; ++i) {
        const char* path = args.argv[i];
        nmsync::engine::RemoveOutcome outcome{};
        const Status s = db.remove_message(path, &outcome);
        if (!is_ok(s)) {
            nmsync::core::log_status_error(path, s);
            rc = EXIT_FAILURE;
            continue;
        }
        printf("%s %s\n",
               outcome == nmsync::engine::RemoveOutcome::Removed ? "removed" : "detached",
               path);
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_show(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    nmsync::engine::Database db;
    if (!open_database(cfg, false, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    {
        nmsync::engine::Message msg;
        if (lookup_message(&db, args.argv[0], &msg)) {
            rc = EXIT_SUCCESS;

            const std::time_t date = static_cast<std::time_t>(msg.date());
            char date_buf[64] = "";
            std::tm tm_buf{};
            if (gmtime_r(&date, &tm_buf) != nullptr) {
                std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%d %H:%M:%S UTC", &tm_buf);
            }

            printf("id:      %s\n", msg.id().c_str());
            printf("thread:  %s\n", msg.thread_id().c_str());
            printf("date:    %s\n", date_buf);

            for (const char* name : {"From", "Subject"}) {
                std::string value;
                const Status s = msg.header(name, &value);
                if (!is_ok(s)) {
                    nmsync::core::log_status_error(name, s);
                    rc = EXIT_FAILURE;
                    continue;
                }
                printf("%-8s %s\n", (std::string(name) + ":").c_str(), value.c_str());
            }

            std::vector<std::string> files;
            Status s = msg.filenames(&files);
            if (!is_ok(s)) {
                report_failure("list filenames", s);
                rc = EXIT_FAILURE;
            }
            for (const std::string& f : files) {
                printf("file:    %s\n", f.c_str());
            }

            std::vector<std::string> tags;
            s = msg.tags(&tags);
            if (!is_ok(s)) {
                report_failure("list tags", s);
                rc = EXIT_FAILURE;
            }
            printf("tags:    ");
            print_tags(tags, " ");
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_tags(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    nmsync::engine::Database db;
    if (!open_database(cfg, false, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    {
        nmsync::engine::Message msg;
        if (lookup_message(&db, args.argv[0], &msg)) {
            std::vector<std::string> tags;
            const Status s = msg.tags(&tags);
            if (is_ok(s)) {
                for (const std::string& t : tags) {
                    printf("%s\n", t.c_str());
                }
                rc = EXIT_SUCCESS;
            } else {
                report_failure("list tags", s);
            }
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

// tag <id> +add -remove ...; all changes land in one thaw, or none do.
int handle_tag(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    const nmsync::cli::CliArgs ops{args.argv + 1, args.argc - 1};
    nmsync::core::u32 bad = 0;
    if (!is_ok(nmsync::cli::check_tag_ops(ops, &bad))) {
        nmsync::core::log_error("tag operations look like +tag or -tag, got '%s'", ops.argv[bad]);
        return EXIT_FAILURE;
    }

    nmsync::engine::Database db;
    if (!open_database(cfg, true, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    {
        nmsync::engine::Message msg;
        if (lookup_message(&db, args.argv[0], &msg)) {
            nmsync::core::u32 failed = 0;
            const Status s = nmsync::cli::apply_tag_ops(&msg, ops, &failed);
            if (is_ok(s)) {
                rc = EXIT_SUCCESS;
            } else if (nmsync::core::is_engine_error(s) && failed < ops.argc) {
                nmsync::core::log_status_error(ops.argv[failed], s);
                nmsync::core::log_error("no tag changes were applied");
            } else {
                report_failure("tag message", s);
            }
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_untag_all(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    nmsync::engine::Database db;
    if (!open_database(cfg, true, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    {
        nmsync::engine::Message msg;
        if (lookup_message(&db, args.argv[0], &msg)) {
            const Status s = msg.remove_all_tags();
            if (is_ok(s)) {
                rc = EXIT_SUCCESS;
            } else {
                report_failure("remove all tags", s);
            }
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

// Renames the message's files so their maildir flags match its tags.
int handle_sync_flags(const nmsync::cli::CliConfig& cfg, const nmsync::cli::CliArgs& args) {
    nmsync::engine::Database db;
    if (!open_database(cfg, true, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    {
        nmsync::engine::Message msg;
        if (lookup_message(&db, args.argv[0], &msg)) {
            const Status s = msg.tags_to_maildir_flags();
            if (is_ok(s)) {
                printf("%s\n", msg.filename().c_str());
                rc = EXIT_SUCCESS;
            } else {
                report_failure("sync maildir flags", s);
            }
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

int handle_upgrade(const nmsync::cli::CliConfig& cfg) {
    nmsync::engine::Database db;
    if (!open_database(cfg, true, &db)) {
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    nmsync::core::u32 version = 0;
    Status s = db.version(&version);
    if (!is_ok(s)) {
        report_failure("read index version", s);
        rc = EXIT_FAILURE;
    } else if (!db.needs_upgrade()) {
        printf("index version %u is current\n", version);
    } else {
        s = db.upgrade(print_upgrade_progress, nullptr);
        printf("\n");
        if (!is_ok(s)) {
            report_failure("upgrade", s);
            rc = EXIT_FAILURE;
        } else if (is_ok(db.version(&version))) {
            printf("upgraded index to version %u\n", version);
        }
    }

    if (!close_database(&db)) {
        rc = EXIT_FAILURE;
    }
    return rc;
}

} // namespace

int main(int argc, char** argv) {
    if (!is_ok(nmsync::core::log_level_from_env())) {
        nmsync::core::log_warn("ignoring unrecognized %s", nmsync::core::kLogLevelEnv);
    }

    nmsync::core::u32 command_count = 0;
    const nmsync::cli::CommandSpec* commands = nmsync::cli::default_commands(&command_count);

    nmsync::core::u32 option_count = 0;
    const nmsync::cli::OptionSpec* options = nmsync::cli::default_options(&option_count);

    const nmsync::cli::CliArgs all{argv + 1, static_cast<nmsync::core::u32>(argc > 0 ? argc - 1 : 0)};

    nmsync::cli::ParsedOption opt_buf[kMaxOptions]{};
    nmsync::cli::ParsedOptions parsed{opt_buf, 0, kMaxOptions};
    nmsync::core::u32 consumed = 0;
    Status s = nmsync::cli::parse_options(all, options, option_count, &parsed, &consumed);
    if (!is_ok(s)) {
        nmsync::core::log_error("invalid options; see 'nmsync --help'");
        return EXIT_FAILURE;
    }

    nmsync::cli::CliConfig cfg;
    s = nmsync::cli::resolve_config(parsed, &cfg);
    if (!is_ok(s)) {
        if (s.code == nmsync::core::StatusCode::NotFound) {
            nmsync::core::log_error("no mail root: pass --database or set %s", nmsync::cli::kDatabaseEnv);
        } else {
            nmsync::core::log_status_error("configuration", s);
        }
        return EXIT_FAILURE;
    }
    nmsync::core::set_log_level(cfg.log_level);

    const nmsync::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (cfg.help || rest.argc == 0) {
        print_usage(commands, command_count);
        return cfg.help ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    nmsync::cli::CommandInvocation cmd;
    s = nmsync::cli::parse_command(rest, commands, command_count, &cmd, &consumed);
    if (!is_ok(s)) {
        const nmsync::cli::CommandSpec* spec = nmsync::cli::find_command(commands, command_count, cmd.id);
        if (spec != nullptr) {
            nmsync::core::log_error("usage: nmsync %s", spec->usage);
        } else {
            nmsync::core::log_error("unknown command '%s'", rest.argv[0]);
        }
        return EXIT_FAILURE;
    }

    nmsync::core::log_debug("mail root %s", cfg.database_path.c_str());

    switch (cmd.id) {
        case nmsync::cli::CommandId::Help:
            print_usage(commands, command_count);
            return EXIT_SUCCESS;
        case nmsync::cli::CommandId::Create:
            return handle_create(cfg);
        case nmsync::cli::CommandId::Index:
            return handle_index(cfg, cmd.args);
        case nmsync::cli::CommandId::Remove:
            return handle_remove(cfg, cmd.args);
        case nmsync::cli::CommandId::Show:
            return handle_show(cfg, cmd.args);
        case nmsync::cli::CommandId::Tags:
            return handle_tags(cfg, cmd.args);
        case nmsync::cli::CommandId::Tag:
            return handle_tag(cfg, cmd.args);
        case nmsync::cli::CommandId::UntagAll:
            return handle_untag_all(cfg, cmd.args);
        case nmsync::cli::CommandId::SyncFlags:
            return handle_sync_flags(cfg, cmd.args);
        case nmsync::cli::CommandId::Upgrade:
            return handle_upgrade(cfg);
        case nmsync::cli::CommandId::None:
            break;
    }
    nmsync::core::log_error("unknown command");
    return EXIT_FAILURE;
}
