#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/IR/DebugInfoMetadata.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include "clrdi/ir/di.hpp"
#include "clrdi/ir/scopes.hpp"
#include "test_unit.hpp"

using namespace clrdi;
using namespace clrdi::ir;

namespace {

class DebugInfoTest : public ::testing::Test {
protected:
    test::TestUnit unit;
    debug::DebugManager& dbg = *unit.dbg;

    llvm::DICompositeType* cls(TypeId id){
        return llvm::dyn_cast_or_null<llvm::DICompositeType>(dbg.diClassOf(id));
    }
};

TEST_F(DebugInfoTest, NamespacePrefixesAreShared){
    auto* abc = dbg.diNamespaceOf("A.B.C");
    EXPECT_EQ(dbg.namespaces.size(), 3u);
    auto* ab = dbg.diNamespaceOf("A.B");
    EXPECT_EQ(dbg.namespaces.size(), 3u);
    ASSERT_NE(abc, nullptr);
    EXPECT_EQ(abc->getScope(), ab);
}

TEST_F(DebugInfoTest, NonLocalAggregateIsForwardDeclaredOnce){
    auto ext = unit.addClass("System", "Console", StackKind::Object, /*local*/ false);
    auto* first = dbg.diClassOf(ext);
    auto* second = dbg.diClassOf(ext);
    EXPECT_EQ(first, second);
    EXPECT_FALSE(dbg.isQueued(ext));
    EXPECT_EQ(dbg.pendingCount(), 0u);
    ASSERT_NE(cls(ext), nullptr);
    EXPECT_TRUE(cls(ext)->isForwardDecl());
}

TEST_F(DebugInfoTest, SelfReferentialClassCompletes){
    auto node = unit.addClass("App", "Node", StackKind::Object);
    unit.types.set_fields(node, {{"next", node}, {"prev", node}, {"value", unit.i32()}});
    (void)dbg.diTypeOf(node);
    dbg.drain();
    ASSERT_NE(cls(node), nullptr);
    EXPECT_EQ(cls(node)->getElements().size(), 3u);
    EXPECT_EQ(dbg.classEntry(node)->state, debug::ClassState::Complete);
    EXPECT_EQ(dbg.pendingCount(), 0u);
}

TEST_F(DebugInfoTest, ScopeStackFollowsInstructionOffsets){
    auto prog = unit.addClass("App", "Program", StackKind::Object);
    unit.types.set_fields(prog, {});
    MethodBody body;
    const uint32_t offsets[] = {0, 1, 2, 3, 5, 7, 9};
    for(unsigned i = 0; i < 7; ++i) body.instructions.push_back(test::ins(offsets[i], 10 + i));
    // Root spans offsets [0,10), Child spans [2,6).
    ScopeNode child; child.start = 2; child.end = 4;
    ScopeNode root; root.start = 0; root.end = 6;
    root.scopes.push_back(child);
    body.scope = root;

    test::TestFunction tf(unit, body, prog, "Run", {});
    scopes::FunctionDebugState state(tf.input, *tf.builder);
    scopes::ScopeTracker tracker(dbg, state);
    ASSERT_NE(di::prepare_function(dbg, tracker), nullptr);

    std::vector<size_t> depths;
    for(size_t i = 0; i < body.instructions.size(); ++i){
        tracker.advance(i);
        depths.push_back(tracker.depth());
    }
    EXPECT_EQ(depths, (std::vector<size_t>{1, 1, 2, 2, 2, 1, 1}));
    // Child was created exactly once.
    EXPECT_EQ(state.scopes.size(), 2u);
    EXPECT_EQ(tracker.top(), 0u);
}

TEST_F(DebugInfoTest, Int32IsStableSignedBasicType){
    auto* ty = llvm::dyn_cast_or_null<llvm::DIBasicType>(dbg.diTypeOf(unit.i32()));
    ASSERT_NE(ty, nullptr);
    EXPECT_EQ(ty->getEncoding(), llvm::dwarf::DW_ATE_signed);
    EXPECT_EQ(ty->getSizeInBits(), 32u);
    EXPECT_EQ(ty->getName().str(), "int");
    EXPECT_EQ(dbg.diTypeOf(unit.i32()), ty);
}

TEST_F(DebugInfoTest, ReferenceTypeMembersFollowObjectHeader){
    auto val = unit.addClass("App", "PairValue", StackKind::Value);
    unit.types.set_fields(val, {{"a", unit.i32()}, {"b", unit.i32()}});
    auto ref = unit.addClass("App", "PairRef", StackKind::Object);
    unit.types.set_fields(ref, {{"a", unit.i32()}, {"b", unit.i32()}});
    (void)dbg.diTypeOf(val);
    (void)dbg.diTypeOf(ref);
    dbg.drain();

    auto offsets = [&](TypeId id){
        std::vector<uint64_t> out;
        for(auto* md : cls(id)->getElements())
            out.push_back(llvm::cast<llvm::DIDerivedType>(md)->getOffsetInBits());
        return out;
    };
    EXPECT_EQ(offsets(val), (std::vector<uint64_t>{0, 32}));
    // One pointer-sized header precedes the data of a reference type.
    EXPECT_EQ(offsets(ref), (std::vector<uint64_t>{64, 96}));
}

TEST_F(DebugInfoTest, EnumUsesUnderlyingDescriptor){
    auto u16 = unit.types.get_primitive(MetadataKind::UInt16);
    auto flags = unit.types.add_enum("App", "Flags", u16);
    EXPECT_EQ(dbg.diTypeOf(flags), dbg.diTypeOf(u16));
}

TEST_F(DebugInfoTest, UnsupportedKindFallsBackToIntPtr){
    auto mvar = unit.types.add_opaque(MetadataKind::MVar, "!!0");
    auto* ty = llvm::dyn_cast_or_null<llvm::DIBasicType>(dbg.diTypeOf(mvar));
    ASSERT_NE(ty, nullptr);
    EXPECT_EQ(ty, dbg.diTypeOf(unit.types.native_int()));
    EXPECT_EQ(ty->getName().str(), "IntPtr");
}

TEST_F(DebugInfoTest, LateFieldsCompleteAtFinalization){
    auto late = unit.addClass("App", "Late", StackKind::Object);
    (void)dbg.diTypeOf(late);
    dbg.drain();
    EXPECT_EQ(dbg.incompleteClasses(), (std::vector<TypeId>{late}));
    unit.types.set_fields(late, {{"x", unit.i32()}});
    di::finalize_module_debug(dbg);
    EXPECT_TRUE(dbg.incompleteClasses().empty());
    EXPECT_EQ(cls(late)->getElements().size(), 1u);
    // Header pointer plus the int, padded to pointer alignment.
    EXPECT_EQ(cls(late)->getSizeInBits(), 128u);
    EXPECT_FALSE(cls(late)->isTemporary());
}

TEST_F(DebugInfoTest, ConcurrentResolutionSharesDescriptors){
    auto shape = unit.addClass("App.Geometry", "Shape", StackKind::Object);
    unit.types.set_fields(shape, {{"id", unit.i32()}, {"next", shape}});
    std::vector<llvm::DIType*> seen(4, nullptr);
    std::vector<std::thread> workers;
    for(size_t i = 0; i < seen.size(); ++i){
        workers.emplace_back([&, i]{
            seen[i] = dbg.diTypeOf(shape);
            dbg.drain();
        });
    }
    for(auto& t : workers) t.join();
    for(auto* ty : seen) EXPECT_EQ(ty, seen[0]);
    EXPECT_EQ(cls(shape)->getElements().size(), 2u);
    EXPECT_EQ(dbg.namespaces.size(), 2u);
}

TEST_F(DebugInfoTest, ConcurrentProloguesShareOneBuilder){
    auto prog = unit.addClass("App", "Program", StackKind::Object);
    auto node = unit.addClass("App", "Node", StackKind::Object);
    unit.types.set_fields(prog, {});
    unit.types.set_fields(node, {{"next", node}, {"value", unit.i32()}});

    MethodBody body;
    body.instructions = {test::ins(0, 10), test::ins(2, 11), test::ins(4, 12), test::ins(6, 13)};
    ScopeNode inner; inner.start = 1; inner.end = 2;
    inner.variables = {{1, "cur"}};
    ScopeNode root; root.start = 0; root.end = 3;
    root.variables = {{0, "count"}};
    root.scopes.push_back(inner);
    body.scope = root;

    // Functions and their allocas are created up front; only debug info is built concurrently.
    std::vector<std::unique_ptr<test::TestFunction>> functions;
    std::vector<std::unique_ptr<scopes::FunctionDebugState>> states;
    for(int i = 0; i < 4; ++i){
        functions.push_back(std::make_unique<test::TestFunction>(unit, body, prog, "Walk" + std::to_string(i),
                                                                 std::vector<TypeId>{unit.i32(), node}));
        states.push_back(std::make_unique<scopes::FunctionDebugState>(functions.back()->input, *functions.back()->builder));
    }
    std::vector<llvm::DISubprogram*> subprograms(functions.size(), nullptr);
    std::vector<std::thread> workers;
    for(size_t i = 0; i < functions.size(); ++i){
        workers.emplace_back([&, i]{
            scopes::ScopeTracker tracker(dbg, *states[i]);
            subprograms[i] = di::prepare_function(dbg, tracker);
            for(size_t k = 0; k < body.instructions.size(); ++k) tracker.advance(k);
        });
    }
    for(auto& t : workers) t.join();

    for(auto& f : functions) f->builder->CreateRetVoid();
    di::finalize_module_debug(dbg);
    for(size_t i = 0; i < functions.size(); ++i){
        ASSERT_NE(subprograms[i], nullptr);
        EXPECT_EQ(functions[i]->function->getSubprogram(), subprograms[i]);
        EXPECT_EQ(subprograms[i]->getScope(), cls(prog));
    }
    EXPECT_EQ(cls(node)->getElements().size(), 2u);
    EXPECT_TRUE(dbg.incompleteClasses().empty());
    EXPECT_FALSE(llvm::verifyModule(unit.module(), &llvm::errs()));
}

TEST(QualifiedDebugName, UsesScopeSeparators){
    EXPECT_EQ(di::qualified_debug_name("App.Model.Program", "Main"), "App::Model::Program::Main");
    EXPECT_EQ(di::qualified_debug_name("Program", ".ctor"), "Program::.ctor");
}

} // namespace
