// di.hpp - function-level debug info: prologue, variables, module finalization
#pragma once

#include <string>

#include <llvm/IR/DebugInfoMetadata.h>

#include "clrdi/method_body.hpp"
#include "clrdi/ir/debug.hpp"
#include "clrdi/ir/scopes.hpp"

namespace clrdi::ir::di {

enum class VariableKind { Auto, Argument };

// Build the function's DISubprogram, root scope, initial location, locals and
// parameter variables. Runs once per function before its instructions are
// lowered. Returns nullptr (after still pushing the root scope) when debug
// info is disabled.
llvm::DISubprogram* prepare_function(debug::DebugManager& dbg, scopes::ScopeTracker& tracker);

// Describe one local or argument and bind it to its storage at the end of the
// builder's current block (dbg.declare for allocas, dbg.value otherwise).
// Drains the class worklist so the variable sees completed class types.
llvm::DILocalVariable* emit_variable(debug::DebugManager& dbg,
                                     scopes::FunctionDebugState& fn,
                                     const SequencePoint* sp,
                                     llvm::DIScope* scope,
                                     const StackSlot& slot,
                                     VariableKind kind,
                                     const std::string& name,
                                     unsigned argIndex = 0);

// "A.B.Type" + "Method" -> "A::B::Type::Method" so debuggers see namespaces.
std::string qualified_debug_name(const std::string& typeFullName, const std::string& method);

// Last drain (deferred classes included) and DIBuilder::finalize().
void finalize_module_debug(debug::DebugManager& dbg);

} // namespace clrdi::ir::di
