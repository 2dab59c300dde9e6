#pragma once

#include <llvm/IR/DIBuilder.h>
#include <llvm/IR/DebugInfoMetadata.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/TrackingMDRef.h>

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "clrdi/types.hpp"
#include "clrdi/ir/context.hpp"
#include "clrdi/ir/namespaces.hpp"

namespace clrdi::ir::debug
{

    // Single home for type descriptors. Caches hold slot handles, so completing
    // a class rewrites one slot and every referrer sees the final node. Slots
    // track their node, so a uniqued node re-keyed by a replaced operand stays
    // reachable.
    class DescriptorArena
    {
    public:
        using Handle = size_t;

        Handle add(llvm::DIType *d)
        {
            slots_.emplace_back(d);
            return slots_.size() - 1;
        }
        llvm::DIType *get(Handle h) const { return slots_.at(h).get(); }
        void replace(Handle h, llvm::DIType *d) { slots_.at(h).reset(d); }
        size_t size() const { return slots_.size(); }

    private:
        std::vector<llvm::TypedTrackingMDRef<llvm::DIType>> slots_;
    };

    enum class ClassState
    {
        ForwardDeclared, // non-local aggregate, opaque forever
        Pending,         // local aggregate, replaceable placeholder until its members are known
        Complete         // member list finalized (happens once)
    };

    struct ClassEntry
    {
        ClassState state;
        DescriptorArena::Handle slot;
    };

    // Unit-wide debug-info state: DIBuilder, compile unit, namespace/type/class
    // caches and the class completion worklist. Every DIBuilder call of the unit
    // (here, in the scope tracker and in the function prologue) runs under
    // mutex(), a recursive lock, so functions may be compiled from several
    // threads. IR built outside these calls shares the LLVMContext and stays
    // the caller's to serialize.
    class DebugManager
    {
    private:
        Context &ctx_;
        const TypeTable &types_;
        DescriptorArena arena_;
        std::unordered_map<TypeId, ClassEntry> classEntries_;
        std::deque<TypeId> worklist_;
        std::vector<TypeId> deferred_; // drained while field layout was unavailable
        mutable std::recursive_mutex mutex_;

    public:
        bool enableDebugInfo = true;
        bool trace = false;
        std::unique_ptr<llvm::DIBuilder> DIB;
        llvm::DIFile *DI_File = nullptr; // unit-level file (module identifier)
        llvm::DICompileUnit *DI_CU = nullptr;
        NamespaceRegistry namespaces;

        std::unordered_map<TypeId, DescriptorArena::Handle> DITypeCache;

    public:
        DebugManager(Context &ctx, const TypeTable &types);
        // Placeholders still pending are sealed so no temporary node outlives the unit.
        ~DebugManager();

        // Reads ctx.env(), adds module flags, creates the DIBuilder and compile unit.
        void initialize();
        bool enabled() const { return enableDebugInfo && DIB != nullptr; }

        llvm::Module &module() { return ctx_.module(); }
        const TypeTable &types() const { return types_; }
        // Unit lock; hold it around any sequence of DIB calls.
        std::recursive_mutex &mutex() const { return mutex_; }

        llvm::DINamespace *diNamespaceOf(const std::string &path);

        // Debug type of a semantic type; reference types resolve to a pointer to
        // their class. Unsupported kinds degrade to the native int type.
        llvm::DIType *diTypeOf(TypeId id);

        // Class descriptor of an aggregate: a replaceable placeholder (queued for
        // completion) for local types, a forward declaration otherwise.
        llvm::DIType *diClassOf(TypeId id);

        // Finalize member lists of queued classes until the queue is empty.
        // Classes whose fields are not yet available are parked and retried by
        // the next drain.
        void drain();

        // Give classes that never got a field layout a permanent, member-less
        // descriptor. Called once, right before the DIBuilder is finalized.
        void sealIncomplete();

        std::optional<ClassEntry> classEntry(TypeId id) const;
        bool isQueued(TypeId id) const;
        size_t pendingCount() const;
        size_t deferredCount() const;
        std::vector<TypeId> incompleteClasses() const;

    private:
        llvm::DIType *cacheType(TypeId id, llvm::DIType *ty);
        llvm::DIType *createBasicType(TypeId id);
        void completeClass(TypeId id, ClassEntry &entry);
        llvm::DICompositeType *createFinalClass(TypeId id, llvm::DINodeArray members);
    };

}
