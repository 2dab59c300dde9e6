#include "clrdi/ir/scopes.hpp"

#include <mutex>
#include <string>

#include <llvm/Support/raw_ostream.h>

#include "clrdi/ir/di.hpp"

namespace clrdi::ir::scopes {

void LocationEmitter::set(const SequencePoint* sp, llvm::DIScope* scope){
    line_ = sp ? sp->line : 0;
    column_ = sp ? sp->column : 0;
    scope_ = scope;
    if(!scope) return; // debug info disabled
    builder_.SetCurrentDebugLocation(llvm::DILocation::get(scope->getContext(), line_, column_, scope));
}

const SequencePoint* ScopeTracker::startPoint(const ScopeNode& node) const {
    const auto& sp = state_.body().instructions.at(node.start).sequence_point;
    return sp ? &*sp : nullptr;
}

size_t ScopeTracker::pushRoot(const ScopeNode* source){
    state_.scopes.clear();
    state_.stack.clear();
    state_.scopes.push_back(Scope{source, nullptr, kNoParent});
    state_.stack.push_back(0);
    return 0;
}

llvm::DIScope* ScopeTracker::effectiveScope(size_t index) const {
    int i = static_cast<int>(index);
    while(i != kNoParent){
        const Scope& s = state_.scopes.at(static_cast<size_t>(i));
        if(s.generated) return s.generated;
        i = s.parent;
    }
    return state_.subprogram;
}

size_t ScopeTracker::createScope(size_t parent, const ScopeNode& node){
    Scope s{&node, nullptr, static_cast<int>(parent)};
    std::lock_guard<std::recursive_mutex> lock(dbg_.mutex());
    if(dbg_.enabled()){
        if(const SequencePoint* sp = startPoint(node)){
            s.generated = dbg_.DIB->createLexicalBlock(effectiveScope(parent), state_.file, sp->line, sp->column);
        }
    }
    state_.scopes.push_back(s);
    return state_.scopes.size() - 1;
}

void ScopeTracker::enterScope(size_t index){
    const Scope s = state_.scopes.at(index);
    if(!s.source) return;
    std::lock_guard<std::recursive_mutex> lock(dbg_.mutex());
    const SequencePoint* sp = startPoint(*s.source);
    llvm::DIScope* scope = effectiveScope(index);
    state_.location.set(sp, scope);
    if(!dbg_.enabled()) return;
    for(const auto& local : s.source->variables){
        const StackSlot& slot = state_.input.locals.at(local.index);
        std::string name = local.name.empty() ? "var" + std::to_string(local.index) : local.name;
        di::emit_variable(dbg_, state_, sp, scope, slot, di::VariableKind::Auto, name);
    }
}

void ScopeTracker::advance(size_t instructionIndex){
    const auto& instructions = state_.body().instructions;
    const Instruction& instruction = instructions.at(instructionIndex);
    auto& stack = state_.stack;
    // Lexical blocks and locations are uniqued in the shared context.
    std::lock_guard<std::recursive_mutex> lock(dbg_.mutex());

    // Exit finished scopes; the function root always stays.
    while(stack.size() > 1){
        const Scope& s = state_.scopes[stack.back()];
        if(s.source && instruction.offset > instructions.at(s.source->end).offset){
            if(dbg_.trace) llvm::errs() << "[di][scope] pop depth=" << stack.size() << " at IL_" << instruction.offset << "\n";
            stack.pop_back();
        } else {
            break;
        }
    }

    // Enter child scopes starting here; zero-width nesting can open several.
    bool foundNewScope = true;
    while(foundNewScope){
        foundNewScope = false;
        const ScopeNode* source = state_.scopes[stack.back()].source;
        if(!source) break;
        for(const auto& child : source->scopes){
            if(child.start == instructionIndex){
                size_t s = createScope(stack.back(), child);
                stack.push_back(s);
                if(dbg_.trace) llvm::errs() << "[di][scope] push depth=" << stack.size() << " at IL_" << instruction.offset << "\n";
                enterScope(s);
                foundNewScope = true;
                break;
            }
        }
    }

    if(instruction.sequence_point)
        state_.location.set(&*instruction.sequence_point, effectiveScope(stack.back()));
}

} // namespace clrdi::ir::scopes
