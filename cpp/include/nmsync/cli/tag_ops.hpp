#pragma once

#include "nmsync/cli/options.hpp"
#include "nmsync/core/errors.hpp"
#include "nmsync/engine/message.hpp"

namespace nmsync::cli {

    // Tag operations as given on the command line: "+tag" adds, "-tag"
    // removes. A malformed entry is {Cli, Invalid}; its index goes to
    // *bad_index when that is non-null.
    [[nodiscard]] nmsync::core::Status check_tag_ops(const CliArgs& ops, u32* bad_index) noexcept;

    // Applies every operation to msg inside one freeze/thaw batch. Either
    // all of them reach the index or none do: on the first failure the batch
    // is abandoned (msg is left empty), the failing index goes to
    // *failed_index and that operation's status is returned. A failed final
    // thaw sets *failed_index to ops.argc. Malformed operations are rejected
    // as by check_tag_ops before msg is touched.
    [[nodiscard]] nmsync::core::Status apply_tag_ops(nmsync::engine::Message* msg,
        const CliArgs& ops,
        u32* failed_index) noexcept;

} // namespace nmsync::cli
