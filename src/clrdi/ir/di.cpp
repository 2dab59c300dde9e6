// di.cpp - function-level debug info implementation

#include "clrdi/ir/di.hpp"

#include <mutex>

#include <llvm/IR/DIBuilder.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

namespace clrdi::ir::di {

std::string qualified_debug_name(const std::string& typeFullName, const std::string& method){
    std::string out;
    out.reserve(typeFullName.size() + method.size() + 8);
    for(char c : typeFullName){
        if(c == '.') out += "::"; else out += c;
    }
    out += "::";
    out += method;
    return out;
}

llvm::DILocalVariable* emit_variable(debug::DebugManager& dbg,
                                     scopes::FunctionDebugState& fn,
                                     const SequencePoint* sp,
                                     llvm::DIScope* scope,
                                     const StackSlot& slot,
                                     VariableKind kind,
                                     const std::string& name,
                                     unsigned argIndex)
{
    if(!dbg.enabled() || !scope) return nullptr;
    std::lock_guard<std::recursive_mutex> lock(dbg.mutex());
    (void)dbg.diTypeOf(slot.type);
    // Process fields and other dependent debug types
    dbg.drain();
    // Read it again in case completion replaced the descriptor
    llvm::DIType* diTy = dbg.diTypeOf(slot.type);

    unsigned line = sp ? sp->line : 0;
    llvm::DILocalVariable* var = kind == VariableKind::Argument
        ? dbg.DIB->createParameterVariable(scope, name, argIndex, fn.file, line, diTy, /*AlwaysPreserve*/ true)
        : dbg.DIB->createAutoVariable(scope, name, fn.file, line, diTy, /*AlwaysPreserve*/ true);

    auto *IB = fn.builder.GetInsertBlock();
    if(!slot.value || !IB) return var;
    auto *loc = llvm::DILocation::get(scope->getContext(), line, sp ? sp->column : 0, scope);
    auto *expr = dbg.DIB->createExpression();
    // Addressable storage gets dbg.declare; SSA values (e.g. incoming args) get dbg.value.
    if(llvm::isa<llvm::AllocaInst>(slot.value)) {
        dbg.DIB->insertDeclare(slot.value, var, expr, loc, IB);
    } else {
        dbg.DIB->insertDbgValueIntrinsic(slot.value, var, expr, loc, IB);
    }
    return var;
}

llvm::DISubprogram* prepare_function(debug::DebugManager& dbg, scopes::ScopeTracker& tracker)
{
    auto& fn = tracker.state();
    const MethodBody& body = fn.body();
    // Root scope (its source may be null)
    size_t root = tracker.pushRoot(body.scope ? &*body.scope : nullptr);
    if(!dbg.enabled()) return nullptr;
    std::lock_guard<std::recursive_mutex> lock(dbg.mutex());

    auto* debugClass = dbg.diClassOf(fn.input.declaring_type);

    const SequencePoint* startPoint = nullptr;
    if(!body.instructions.empty() && body.instructions.front().sequence_point)
        startPoint = &*body.instructions.front().sequence_point;

    unsigned line = 0;
    std::string url;
    if(startPoint){
        url = startPoint->url;
        line = startPoint->line;
    } else {
        url = dbg.module().getModuleIdentifier();
    }
    fn.file = dbg.DIB->createFile(llvm::sys::path::filename(url), llvm::sys::path::parent_path(url));

    // Parameter types are not described; a generic subroutine type is enough for stepping.
    auto* functionType = dbg.DIB->createSubroutineType(dbg.DIB->getOrCreateTypeArray({}));
    std::string linkageName = qualified_debug_name(dbg.types().full_name(fn.input.declaring_type), fn.input.name);

    auto* SP = dbg.DIB->createFunction(
        /*Scope*/ debugClass,
        /*Name*/ fn.input.name,
        /*LinkageName*/ linkageName,
        /*File*/ fn.file,
        /*LineNo*/ line,
        /*Type*/ functionType,
        /*ScopeLine*/ line,
        /*Flags*/ llvm::DINode::FlagZero,
        /*SPFlags*/ llvm::DISubprogram::SPFlagDefinition);
    if(fn.input.function) fn.input.function->setSubprogram(SP);
    fn.subprogram = SP;
    tracker.scope(root).generated = SP;
    if(dbg.trace) llvm::errs() << "[di][fn] '" << linkageName << "' at " << url << ":" << line << "\n";

    fn.location.set(startPoint, SP);
    if(body.scope){
        tracker.enterScope(root);
    } else {
        // Emit locals (if no scopes)
        for(size_t index = 0; index < fn.input.locals.size(); ++index){
            std::string name = index < body.variable_names.size() ? body.variable_names[index] : std::string();
            if(name.empty()) name = "var" + std::to_string(index);
            emit_variable(dbg, fn, startPoint, SP, fn.input.locals[index], VariableKind::Auto, name);
        }
    }

    // DWARF argument indices start at 1
    for(size_t index = 0; index < fn.input.arguments.size(); ++index){
        const StackSlot& arg = fn.input.arguments[index];
        std::string argName = arg.value ? std::string(arg.value->getName()) : std::string();
        if(argName.empty()) argName = "arg" + std::to_string(index);
        emit_variable(dbg, fn, startPoint, SP, arg, VariableKind::Argument, argName, static_cast<unsigned>(index + 1));
    }
    return SP;
}

void finalize_module_debug(debug::DebugManager& dbg){
    if(!dbg.enabled()) return;
    std::lock_guard<std::recursive_mutex> lock(dbg.mutex());
    dbg.drain();
    if(dbg.trace){
        for(TypeId id : dbg.incompleteClasses())
            llvm::errs() << "[di][finalize] '" << dbg.types().full_name(id) << "' has no field layout, left without members\n";
        llvm::errs() << "[di][finalize] about to DIBuilder::finalize()\n";
    }
    dbg.sealIncomplete();
    dbg.DIB->finalize();
}

} // namespace clrdi::ir::di
