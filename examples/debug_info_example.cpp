// Example: synthesize debug info for a tiny compiled method and print the module.
//
//   namespace App.Collections { class Node { Node next; int value; } }
//   namespace App { class Program { static int Count(Node head) { ... } } }
//
// Environment (see clrdi::detectEnv): CLRDI_DI_TRACE=1 shows cache and scope
// activity, CLRDI_DWARF_VERSION / CLRDI_CODEVIEW pick the debug format.
#include <iostream>

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include "clrdi/method_body.hpp"
#include "clrdi/types.hpp"
#include "clrdi/ir/context.hpp"
#include "clrdi/ir/debug.hpp"
#include "clrdi/ir/di.hpp"
#include "clrdi/ir/scopes.hpp"
#include "clrdi/ir/types.hpp"

using namespace clrdi;

static SequencePoint at(unsigned line, unsigned col){ return SequencePoint{"/src/App/Program.cs", line, col}; }

int main(){
    Context ctx;
    ctx.setEnv(detectEnv());
    ctx.newModule("/build/bin/App.dll");
    llvm::Module& M = ctx.module();

    TypeTable types;
    auto i32 = types.get_primitive(MetadataKind::Int32);
    AggregateDecl nodeDecl; nodeDecl.ns = "App.Collections"; nodeDecl.name = "Node";
    auto node = types.add_aggregate(nodeDecl);
    types.set_fields(node, {{"next", node}, {"value", i32}});
    AggregateDecl progDecl; progDecl.ns = "App"; progDecl.name = "Program";
    auto prog = types.add_aggregate(progDecl);
    types.set_fields(prog, {});

    ir::debug::DebugManager dbg(ctx, types);
    dbg.initialize();

    // IL_0000 count = 0
    // IL_0002 while (head != null) {      scope [1,3]: Node cur
    // IL_0006   cur = head; count++;
    // IL_000c   head = cur.next; }
    // IL_0010 return count
    MethodBody body;
    auto ins = [](uint32_t offset, SequencePoint sp){ Instruction i; i.offset = offset; i.sequence_point = sp; return i; };
    body.instructions = {ins(0x00, at(12, 9)), ins(0x02, at(13, 9)), ins(0x06, at(15, 13)),
                         ins(0x0c, at(17, 13)), ins(0x10, at(19, 9))};
    ScopeNode loop; loop.start = 1; loop.end = 3;
    loop.variables = {{1, "cur"}};
    ScopeNode root; root.start = 0; root.end = 4;
    root.variables = {{0, "count"}};
    root.scopes.push_back(loop);
    body.scope = root;

    auto* nodePtr = ir::map_type(types, M, node);
    auto* fty = llvm::FunctionType::get(llvm::Type::getInt32Ty(M.getContext()), {nodePtr}, false);
    auto* F = llvm::Function::Create(fty, llvm::Function::ExternalLinkage, "App_Program_Count", &M);
    F->getArg(0)->setName("head");
    llvm::IRBuilder<> B(llvm::BasicBlock::Create(M.getContext(), "entry", F));

    FunctionInput input;
    input.declaring_type = prog;
    input.name = "Count";
    input.function = F;
    input.body = &body;
    input.locals = {{B.CreateAlloca(B.getInt32Ty(), nullptr, "count"), i32}, {B.CreateAlloca(nodePtr, nullptr, "cur"), node}};
    input.arguments = {{F->getArg(0), node}};

    ir::scopes::FunctionDebugState state(input, B);
    ir::scopes::ScopeTracker tracker(dbg, state);
    ir::di::prepare_function(dbg, tracker);

    auto* count = input.locals[0].value;
    auto* cur = input.locals[1].value;
    for(size_t i = 0; i < body.instructions.size(); ++i){
        tracker.advance(i);
        switch(i){
        case 0: B.CreateStore(B.getInt32(0), count); break;
        case 2: B.CreateStore(F->getArg(0), cur);
                B.CreateStore(B.CreateAdd(B.CreateLoad(B.getInt32Ty(), count), B.getInt32(1)), count); break;
        case 4: B.CreateRet(B.CreateLoad(B.getInt32Ty(), count)); break;
        default: break;
        }
    }

    ir::di::finalize_module_debug(dbg);
    if(llvm::verifyModule(M, &llvm::errs())){
        std::cerr << "module verification failed\n";
        return 1;
    }
    M.print(llvm::outs(), nullptr);
    return 0;
}
