#pragma once
#include <memory>
#include <string>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

namespace clrdi {

struct DebugEnv {
    bool enableDebugInfo = true;
    bool trace = false;          // [di] diagnostics on stderr
    unsigned dwarfVersion = 4;
    bool codeView = false;       // emit the CodeView module flag for PDB output
    std::string producer = "clrdi";
    std::string targetTriple;    // empty = default
};

class Context {
public:
    Context();
    ~Context();

    llvm::Module& module() { return *module_; }

    void newModule(const std::string& name);

    const DebugEnv& env() const { return env_; }
    void setEnv(DebugEnv e) { env_ = std::move(e); }

private:
    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;
    DebugEnv env_{};
};

// Detect debug-info configuration from process env vars:
//   CLRDI_ENABLE_DEBUG (default 1), CLRDI_DI_TRACE, CLRDI_DWARF_VERSION,
//   CLRDI_CODEVIEW, CLRDI_PRODUCER, CLRDI_TARGET_TRIPLE.
DebugEnv detectEnv();

// Apply environment configuration to a module (target triple). Safe with defaults.
void applyEnvToModule(llvm::Module& M, const DebugEnv& env);

} // namespace clrdi
