#include "nmsync/engine/status.hpp"

#include <notmuch.h>

namespace nmsync::engine {

static_assert(kEngineSuccess == static_cast<u32>(NOTMUCH_STATUS_SUCCESS));
static_assert(kEngineDuplicateMessageId == static_cast<u32>(NOTMUCH_STATUS_DUPLICATE_MESSAGE_ID));

} // namespace nmsync::engine
