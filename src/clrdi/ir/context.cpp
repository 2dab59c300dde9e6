#include "clrdi/ir/context.hpp"

namespace clrdi {

Context::Context() : llctx_(std::make_unique<llvm::LLVMContext>()) {}
Context::~Context() = default;

void Context::newModule(const std::string& name) {
    module_ = std::make_unique<llvm::Module>(name, *llctx_);
    applyEnvToModule(*module_, env_);
}

void applyEnvToModule(llvm::Module& M, const DebugEnv& env){
    if(!env.targetTriple.empty()){
        M.setTargetTriple(env.targetTriple);
    }
}

} // namespace clrdi
