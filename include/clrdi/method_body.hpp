// Method body as seen by debug-info synthesis: instructions with sequence
// points, the lexical scope tree, and the native storage of locals/params.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "clrdi/types.hpp"

namespace llvm {
class Function;
class Value;
}

namespace clrdi {

struct SequencePoint {
    std::string url; // full path of the source document
    unsigned line = 0;
    unsigned column = 0;
};

struct Instruction {
    uint32_t offset = 0;
    std::optional<SequencePoint> sequence_point;
};

struct LocalDecl {
    unsigned index = 0; // into FunctionInput::locals
    std::string name;
};

// Lexical scope covering instructions [start, end] (indices into
// MethodBody::instructions, both inclusive). Children are strictly nested and
// do not overlap each other.
struct ScopeNode {
    size_t start = 0;
    size_t end = 0;
    std::vector<LocalDecl> variables;
    std::vector<ScopeNode> scopes;
};

struct MethodBody {
    std::vector<Instruction> instructions;
    std::optional<ScopeNode> scope;          // absent when no scope info was recorded
    std::vector<std::string> variable_names; // by local index; entries may be empty
};

// Native storage of a local or argument: an alloca (addressable) or an SSA value.
struct StackSlot {
    llvm::Value* value = nullptr;
    TypeId type = 0;
};

struct FunctionInput {
    TypeId declaring_type = 0;
    std::string name;
    llvm::Function* function = nullptr;
    const MethodBody* body = nullptr;
    std::vector<StackSlot> locals;
    std::vector<StackSlot> arguments;
};

} // namespace clrdi
