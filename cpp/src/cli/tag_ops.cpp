#include "nmsync/cli/tag_ops.hpp"
#include "nmsync/core/log.hpp"

namespace nmsync::cli {

using namespace nmsync::core;

namespace {
    [[nodiscard]] bool well_formed(const char* op) noexcept {
        return op != nullptr && (op[0] == '+' || op[0] == '-') && op[1] != '\0';
    }
} // namespace

Status check_tag_ops(const CliArgs& ops, u32* bad_index) noexcept {
    if (ops.argc > 0 && ops.argv == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    for (u32 i = 0; i < ops.argc; ++i) {
        if (!well_formed(ops.argv[i])) {
            if (bad_index != nullptr) {
                *bad_index = i;
            }
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
    }
    return ok_status();
}

Status apply_tag_ops(nmsync::engine::Message* msg, const CliArgs& ops, u32* failed_index) noexcept {
    if (msg == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    Status s = check_tag_ops(ops, failed_index);
    if (!is_ok(s)) {
        return s;
    }

    nmsync::engine::FreezeGuard batch(*msg);
    s = batch.acquire();
    if (!is_ok(s)) {
        return s;
    }

    for (u32 i = 0; i < ops.argc; ++i) {
        const char* op = ops.argv[i];
        s = op[0] == '+' ? msg->add_tag(op + 1) : msg->remove_tag(op + 1);
        if (!is_ok(s)) {
            if (failed_index != nullptr) {
                *failed_index = i;
            }
            const Status dropped = batch.abandon();
            if (!is_ok(dropped)) {
                log_status_error("drop tag batch", dropped);
            }
            return s;
        }
    }
    s = batch.commit();
    if (!is_ok(s) && failed_index != nullptr) {
        *failed_index = ops.argc;
    }
    return s;
}

} // namespace nmsync::cli
