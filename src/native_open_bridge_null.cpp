#include "native_open_bridge.h"

namespace Quire {

// Hosts without a document-open facility rely on launch arguments and drops
std::unique_ptr<NativeOpenBridge> createNativeOpenBridge() {
    return std::make_unique<NullOpenBridge>();
}

} // namespace Quire
