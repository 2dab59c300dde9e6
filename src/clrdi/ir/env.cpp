#include "clrdi/ir/context.hpp"
#include <cstdlib>
#include <string>

namespace clrdi {

// Reads process env vars and constructs a DebugEnv.
// Note: Context::setEnv stores it; DebugManager::initialize consumes it.
DebugEnv detectEnv(){
    DebugEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("CLRDI_ENABLE_DEBUG")) e.enableDebugInfo = (std::string(v) != "0");
    if (const char* v = get("CLRDI_DI_TRACE")) e.trace = (std::string(v) == "1");

    if (const char* v = get("CLRDI_DWARF_VERSION")) {
        char* end = nullptr;
        unsigned long ver = std::strtoul(v, &end, 10);
        // Unparsable or out-of-range values keep the default.
        if (end && *end == '\0' && ver >= 2 && ver <= 5) e.dwarfVersion = static_cast<unsigned>(ver);
    }

    if (const char* v = get("CLRDI_CODEVIEW")) e.codeView = (std::string(v) == "1");
    if (const char* v = get("CLRDI_PRODUCER")) e.producer = v;
    if (const char* v = get("CLRDI_TARGET_TRIPLE")) e.targetTriple = v;

    return e;
}

} // namespace clrdi
