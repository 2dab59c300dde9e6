#include <cassert>
#include <iostream>

#include <llvm/IR/DebugInfoMetadata.h>

#include "test_unit.hpp"

using namespace clrdi;

void run_namespace_registry_tests(){
    std::cout << "[di] namespace registry test...\n";
    test::TestUnit unit;
    auto& dbg = *unit.dbg;

    // Empty path: declared at compile-unit level, nothing created.
    assert(dbg.diNamespaceOf("") == nullptr);
    assert(dbg.namespaces.size() == 0);

    auto* abc = dbg.diNamespaceOf("A.B.C");
    assert(abc && abc->getName() == "C");
    assert(dbg.namespaces.size() == 3);

    // Parent entries were created on the way down and are reused.
    auto* ab = dbg.diNamespaceOf("A.B");
    assert(dbg.namespaces.size() == 3);
    assert(ab && ab->getName() == "B");
    assert(abc->getScope() == ab);
    auto* a = llvm::dyn_cast_or_null<llvm::DINamespace>(ab->getScope());
    assert(a && a->getName() == "A" && a->getScope() == nullptr);

    // Siblings share the parent.
    auto* abd = dbg.diNamespaceOf("A.B.D");
    assert(dbg.namespaces.size() == 4);
    assert(abd != abc && abd->getScope() == ab);

    assert(dbg.diNamespaceOf("A.B.C") == abc);
    assert(dbg.namespaces.lookup("A.B.C") == abc);
    assert(dbg.namespaces.lookup("X.Y") == nullptr);
    assert(dbg.namespaces.size() == 4);

    auto* sys = dbg.diNamespaceOf("System");
    assert(sys && sys->getScope() == nullptr);
    assert(dbg.namespaces.size() == 5);

    (void)abc; (void)ab; (void)a; (void)abd; (void)sys;
    std::cout << "[di] namespace registry test passed\n";
}
