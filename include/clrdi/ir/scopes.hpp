#pragma once

#include <cstddef>
#include <vector>

#include <llvm/IR/DebugInfoMetadata.h>
#include <llvm/IR/IRBuilder.h>

#include "clrdi/method_body.hpp"
#include "clrdi/ir/debug.hpp"

namespace clrdi::ir::scopes {

inline constexpr int kNoParent = -1;

// One lexical scope of the function being compiled. `generated` is null when
// the scope's start instruction has no sequence point; locations inside it
// then use the nearest ancestor's descriptor.
struct Scope {
    const ScopeNode* source = nullptr; // null only for the root of a body without scope info
    llvm::DIScope* generated = nullptr;
    int parent = kNoParent;
};

// Current source position fed to the IRBuilder for subsequently emitted instructions.
class LocationEmitter {
public:
    explicit LocationEmitter(llvm::IRBuilder<>& builder) : builder_(builder) {}

    // Missing sequence point -> line/column 0, still tied to scope.
    void set(const SequencePoint* sp, llvm::DIScope* scope);

    unsigned line() const { return line_; }
    unsigned column() const { return column_; }
    llvm::DIScope* scope() const { return scope_; }

private:
    llvm::IRBuilder<>& builder_;
    unsigned line_ = 0;
    unsigned column_ = 0;
    llvm::DIScope* scope_ = nullptr;
};

// Per-function debug state. Lives for the compilation of one function.
struct FunctionDebugState {
    FunctionDebugState(const FunctionInput& in, llvm::IRBuilder<>& irb) : input(in), builder(irb), location(irb) {}

    const FunctionInput& input;
    llvm::IRBuilder<>& builder;
    llvm::DIFile* file = nullptr;
    llvm::DISubprogram* subprogram = nullptr;
    LocationEmitter location;
    std::vector<Scope> scopes;   // arena; index 0 is the function root
    std::vector<size_t> stack;   // active scopes, innermost last

    const MethodBody& body() const { return *input.body; }
};

// Walks the lexical scope tree in lockstep with the instruction cursor.
class ScopeTracker {
public:
    ScopeTracker(debug::DebugManager& dbg, FunctionDebugState& state) : dbg_(dbg), state_(state) {}

    // Creates and pushes the function root scope. Called once by the prologue.
    size_t pushRoot(const ScopeNode* source);

    // Pops scopes the cursor left, pushes (and enters) child scopes starting at
    // this instruction, then retargets the current location.
    void advance(size_t instructionIndex);

    size_t createScope(size_t parent, const ScopeNode& node);
    void enterScope(size_t scope);

    // Descriptor to attach to locations/variables of a scope.
    llvm::DIScope* effectiveScope(size_t scope) const;

    size_t top() const { return state_.stack.back(); }
    size_t depth() const { return state_.stack.size(); }
    Scope& scope(size_t index) { return state_.scopes.at(index); }
    FunctionDebugState& state() { return state_; }

private:
    const SequencePoint* startPoint(const ScopeNode& node) const;

    debug::DebugManager& dbg_;
    FunctionDebugState& state_;
};

} // namespace clrdi::ir::scopes
