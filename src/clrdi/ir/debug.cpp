#include <algorithm>
#include <string>

#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include "clrdi/ir/debug.hpp"
#include "clrdi/ir/types.hpp"

namespace clrdi::ir::debug {

DebugManager::DebugManager(Context& ctx, const TypeTable& types)
    : ctx_(ctx), types_(types)
{
}

DebugManager::~DebugManager()
{
    sealIncomplete();
}

void DebugManager::initialize()
{
    const DebugEnv& env = ctx_.env();
    enableDebugInfo = env.enableDebugInfo;
    trace = env.trace;
    namespaces.trace = env.trace;
    // Reset members first (in case of re-init)
    DIB.reset();
    DI_File = nullptr;
    DI_CU = nullptr;
    if (!enableDebugInfo)
        return;
    llvm::Module& M = ctx_.module();
    M.addModuleFlag(llvm::Module::Warning, "Debug Info Version", llvm::DEBUG_METADATA_VERSION);
    if (env.codeView)
        M.addModuleFlag(llvm::Module::Warning, "CodeView", 1u);
    else
        M.addModuleFlag(llvm::Module::Warning, "Dwarf Version", env.dwarfVersion);
    DIB = std::make_unique<llvm::DIBuilder>(M);
    std::string id = M.getModuleIdentifier();
    DI_File = DIB->createFile(llvm::sys::path::filename(id), llvm::sys::path::parent_path(id));
    // C++ so debuggers understand '::' qualified names and class scopes.
    DI_CU = DIB->createCompileUnit(llvm::dwarf::DW_LANG_C_plus_plus, DI_File, env.producer, /*isOptimized*/ false, "", 0);
    if (trace)
        llvm::errs() << "[di][init] compile unit for '" << id << "' producer=" << env.producer << "\n";
}

llvm::DINamespace* DebugManager::diNamespaceOf(const std::string& path)
{
    if (!enabled())
        return nullptr;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return namespaces.resolve(*DIB, path);
}

llvm::DIType* DebugManager::cacheType(TypeId id, llvm::DIType* ty)
{
    DITypeCache[id] = arena_.add(ty);
    return ty;
}

llvm::DIType* DebugManager::createBasicType(TypeId id)
{
    const TypeInfo& T = types_.at(id);
    uint64_t bits = size_in_bits(module(), map_type(types_, module(), id));
    const char* name = "?";
    unsigned enc = llvm::dwarf::DW_ATE_signed;
    switch (T.kind)
    {
    case MetadataKind::Boolean: name = "bool"; enc = llvm::dwarf::DW_ATE_boolean; break;
    case MetadataKind::SByte: name = "sbyte"; enc = llvm::dwarf::DW_ATE_signed; break;
    case MetadataKind::Byte: name = "byte"; enc = llvm::dwarf::DW_ATE_unsigned; break;
    case MetadataKind::Int16: name = "short"; enc = llvm::dwarf::DW_ATE_signed; break;
    case MetadataKind::UInt16: name = "ushort"; enc = llvm::dwarf::DW_ATE_unsigned; break;
    case MetadataKind::Int32: name = "int"; enc = llvm::dwarf::DW_ATE_signed; break;
    case MetadataKind::UInt32: name = "uint"; enc = llvm::dwarf::DW_ATE_unsigned; break;
    case MetadataKind::Int64: name = "long"; enc = llvm::dwarf::DW_ATE_signed; break;
    case MetadataKind::UInt64: name = "ulong"; enc = llvm::dwarf::DW_ATE_unsigned; break;
    case MetadataKind::Single: name = "float"; enc = llvm::dwarf::DW_ATE_float; break;
    case MetadataKind::Double: name = "double"; enc = llvm::dwarf::DW_ATE_float; break;
    case MetadataKind::Char: name = "char"; enc = llvm::dwarf::DW_ATE_unsigned; break;
    case MetadataKind::IntPtr: name = "IntPtr"; enc = llvm::dwarf::DW_ATE_signed; break;
    case MetadataKind::UIntPtr: name = "UIntPtr"; enc = llvm::dwarf::DW_ATE_unsigned; break;
    default: break;
    }
    return DIB->createBasicType(name, bits, enc);
}

llvm::DIType* DebugManager::diTypeOf(TypeId id)
{
    if (!enabled())
        return nullptr;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (auto it = DITypeCache.find(id); it != DITypeCache.end())
        return arena_.get(it->second);

    const TypeInfo& T = types_.at(id);
    if (is_primitive_kind(T.kind))
        return cacheType(id, createBasicType(id));

    switch (T.kind)
    {
    case MetadataKind::Pointer:
    case MetadataKind::ByReference:
    {
        // Element first: a pointer to a class still under construction is fine,
        // the class is cached before its members are resolved.
        auto* pointee = diTypeOf(T.element);
        if (auto it = DITypeCache.find(id); it != DITypeCache.end())
            return arena_.get(it->second);
        uint64_t psz = pointer_size_in_bits(module());
        uint32_t palign = pointer_align_in_bits(module());
        return cacheType(id, DIB->createPointerType(pointee, psz, palign, {}, T.name));
    }
    case MetadataKind::Array:
    case MetadataKind::String:
    case MetadataKind::TypedByReference:
    case MetadataKind::GenericInstance:
    case MetadataKind::ValueType:
    case MetadataKind::Class:
    case MetadataKind::Object:
    {
        if (T.is_enum)
        {
            // Enums are described by their underlying integer type.
            auto* underlying = diTypeOf(T.underlying);
            DITypeCache[id] = DITypeCache.at(T.underlying);
            return underlying;
        }

        auto* debugClass = diClassOf(id);

        // Try again from cache, it might have been done through recursion already
        if (auto it = DITypeCache.find(id); it != DITypeCache.end())
            return arena_.get(it->second);

        if (T.stack == StackKind::Value)
        {
            DITypeCache[id] = classEntries_.at(id).slot;
            return debugClass;
        }
        // Reference types are pointers at the native level.
        uint64_t psz = pointer_size_in_bits(module());
        uint32_t palign = pointer_align_in_bits(module());
        return cacheType(id, DIB->createPointerType(debugClass, psz, palign, {}, ""));
    }
    default:
    {
        // Not every metadata kind has a debug shape yet; never fail compilation over it.
        if (trace)
            llvm::errs() << "[di][type] no debug shape for '" << types_.full_name(id) << "' (kind="
                         << static_cast<int>(T.kind) << "), using IntPtr\n";
        auto* fallback = diTypeOf(types_.native_int());
        DITypeCache[id] = DITypeCache.at(types_.native_int());
        return fallback;
    }
    }
}

llvm::DIType* DebugManager::diClassOf(TypeId id)
{
    if (!enabled())
        return nullptr;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (auto it = classEntries_.find(id); it != classEntries_.end())
        return arena_.get(it->second.slot);

    const TypeInfo& T = types_.at(id);
    auto* debugNamespace = namespaces.resolve(*DIB, T.ns);

    llvm::Type* structType = class_layout_type(types_, module(), id);
    uint64_t size = size_in_bits(module(), structType);
    uint32_t align = align_in_bits(module(), structType);
    std::string fullName = types_.full_name(id);

    if (T.is_local)
    {
        // Base first so it is completed before the derived class.
        if (T.base)
            (void)diClassOf(*T.base);
        // Placeholder until the members are known; size and alignment are
        // recomputed when it is replaced.
        auto* debugClass = DIB->createReplaceableCompositeType(llvm::dwarf::DW_TAG_class_type, T.name, debugNamespace,
                                                               nullptr, 0, 0, size, align, llvm::DINode::FlagZero,
                                                               fullName);
        // Registered before any member is resolved so recursive references terminate.
        classEntries_.emplace(id, ClassEntry{ClassState::Pending, arena_.add(debugClass)});
        worklist_.push_back(id);
        if (trace)
            llvm::errs() << "[di][class] '" << fullName << "' created, members pending\n";
        return debugClass;
    }

    auto* debugClass = DIB->createForwardDecl(llvm::dwarf::DW_TAG_class_type, T.name, debugNamespace, nullptr, 0,
                                              0, size, align, fullName);
    classEntries_.emplace(id, ClassEntry{ClassState::ForwardDeclared, arena_.add(debugClass)});
    if (trace)
        llvm::errs() << "[di][class] '" << fullName << "' forward declared\n";
    return debugClass;
}

void DebugManager::drain()
{
    if (!enabled())
        return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // Retry classes parked by an earlier drain; their layout may be known now.
    for (TypeId id : deferred_)
        worklist_.push_back(id);
    deferred_.clear();

    while (!worklist_.empty())
    {
        TypeId id = worklist_.front();
        worklist_.pop_front();
        // unordered_map references survive rehashing caused by nested inserts.
        ClassEntry& entry = classEntries_.at(id);
        if (entry.state != ClassState::Pending)
            continue;
        if (!types_.at(id).fields)
        {
            deferred_.push_back(id);
            continue;
        }
        completeClass(id, entry);
    }
}

void DebugManager::completeClass(TypeId id, ClassEntry& entry)
{
    const TypeInfo& T = types_.at(id);
    auto* placeholder = llvm::cast<llvm::DICompositeType>(arena_.get(entry.slot));
    llvm::Module& M = module();
    auto* valueType = value_struct(types_, M, id);
    uint64_t headerBits = T.stack == StackKind::Object ? object_header_bits(types_, M, id) : 0;

    std::vector<llvm::Metadata*> memberTypes;
    memberTypes.reserve(T.fields->size());
    for (const auto& field : *T.fields)
    {
        // May queue more classes; the drain loop picks them up.
        auto* fieldType = diTypeOf(field.type);
        llvm::Type* fieldLL = map_type(types_, M, field.type);
        uint64_t fieldSize = size_in_bits(M, fieldLL);
        uint32_t fieldAlign = align_in_bits(M, fieldLL);
        uint64_t fieldOffset = T.explicit_layout ? field.explicit_offset * 8
                                                 : field_offset_in_bits(M, valueType, field.struct_index);
        // Object header (vtable ptr) precedes field data.
        fieldOffset += headerBits;
        memberTypes.push_back(DIB->createMemberType(placeholder, field.name, nullptr, 0, fieldSize, fieldAlign,
                                                    fieldOffset, llvm::DINode::FlagZero, fieldType));
    }

    auto* debugClass = createFinalClass(id, DIB->getOrCreateArray(memberTypes));
    // Members, pointers and subprograms naming the placeholder now name the final node.
    debugClass = DIB->replaceTemporary(llvm::TempMDNode(placeholder), debugClass);
    arena_.replace(entry.slot, debugClass);
    entry.state = ClassState::Complete;
    if (trace)
        llvm::errs() << "[di][class] '" << types_.full_name(id) << "' completed with " << memberTypes.size()
                     << " members, " << debugClass->getSizeInBits() << " bits\n";
}

llvm::DICompositeType* DebugManager::createFinalClass(TypeId id, llvm::DINodeArray members)
{
    const TypeInfo& T = types_.at(id);
    llvm::Module& M = module();
    // The layout may have been unknown when the placeholder was created.
    llvm::Type* structType = class_layout_type(types_, M, id);
    llvm::DIType* parentDebugClass = T.base ? diClassOf(*T.base) : nullptr;
    return DIB->createClassType(namespaces.resolve(*DIB, T.ns), T.name, nullptr, 0, size_in_bits(M, structType),
                                align_in_bits(M, structType), 0, llvm::DINode::FlagZero, parentDebugClass, members,
                                nullptr, nullptr, types_.full_name(id));
}

void DebugManager::sealIncomplete()
{
    if (!enabled())
        return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (TypeId id : incompleteClasses())
    {
        ClassEntry& entry = classEntries_.at(id);
        auto* placeholder = llvm::cast<llvm::DICompositeType>(arena_.get(entry.slot));
        auto* debugClass = createFinalClass(id, DIB->getOrCreateArray({}));
        arena_.replace(entry.slot, DIB->replaceTemporary(llvm::TempMDNode(placeholder), debugClass));
        entry.state = ClassState::Complete;
    }
    worklist_.clear();
    deferred_.clear();
}

std::optional<ClassEntry> DebugManager::classEntry(TypeId id) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = classEntries_.find(id);
    if (it == classEntries_.end())
        return std::nullopt;
    return it->second;
}

size_t DebugManager::pendingCount() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return worklist_.size();
}

size_t DebugManager::deferredCount() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return deferred_.size();
}

bool DebugManager::isQueued(TypeId id) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return std::find(worklist_.begin(), worklist_.end(), id) != worklist_.end() ||
           std::find(deferred_.begin(), deferred_.end(), id) != deferred_.end();
}

std::vector<TypeId> DebugManager::incompleteClasses() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<TypeId> out;
    for (const auto& [id, entry] : classEntries_)
        if (entry.state == ClassState::Pending)
            out.push_back(id);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace clrdi::ir::debug
