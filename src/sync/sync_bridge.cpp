#include "sync_bridge.hpp"
#include <stdexcept>
#include "../runtime/io_runner.hpp"

namespace Tether {
namespace Sync {

bool SyncBridge::can_block() {
    return !Runtime::IoRunner::on_io_thread();
}

void SyncBridge::ensure_can_block(const std::string& where) {
    if (!can_block())
        throw std::logic_error(where + " called on an I/O thread");
}

}  // namespace Sync
}  // namespace Tether
