#include "clrdi/ir/types.hpp"

#include <vector>

#include <llvm/IR/DataLayout.h>

namespace clrdi::ir {

static llvm::StructType* named_struct(llvm::LLVMContext& llctx, const std::string& name){
    auto* ST = llvm::StructType::getTypeByName(llctx, name);
    if(!ST) ST = llvm::StructType::create(llctx, name);
    return ST;
}

// Behind a pointer the aggregate body is not needed; referencing the named
// struct keeps self-referential layouts from recursing.
static llvm::Type* pointee_of(const TypeTable& types, llvm::Module& M, TypeId id){
    const TypeInfo& info = types.at(id);
    if(is_aggregate_kind(info.kind) && !info.is_enum && info.stack == StackKind::Value)
        return named_struct(M.getContext(), "struct." + types.full_name(id));
    llvm::Type* T = map_type(types, M, id);
    // No pointers to void under typed pointers.
    if(T->isVoidTy()) return llvm::Type::getInt8Ty(M.getContext());
    return T;
}

llvm::Type* map_type(const TypeTable& types, llvm::Module& M, TypeId id){
    auto& llctx = M.getContext();
    const TypeInfo& T = types.at(id);
    switch(T.kind){
        case MetadataKind::Void: return llvm::Type::getVoidTy(llctx);
        case MetadataKind::Boolean:
        case MetadataKind::SByte:
        case MetadataKind::Byte: return llvm::Type::getInt8Ty(llctx);
        case MetadataKind::Char:
        case MetadataKind::Int16:
        case MetadataKind::UInt16: return llvm::Type::getInt16Ty(llctx);
        case MetadataKind::Int32:
        case MetadataKind::UInt32: return llvm::Type::getInt32Ty(llctx);
        case MetadataKind::Int64:
        case MetadataKind::UInt64: return llvm::Type::getInt64Ty(llctx);
        case MetadataKind::Single: return llvm::Type::getFloatTy(llctx);
        case MetadataKind::Double: return llvm::Type::getDoubleTy(llctx);
        case MetadataKind::IntPtr:
        case MetadataKind::UIntPtr:
            return llvm::Type::getIntNTy(llctx, static_cast<unsigned>(pointer_size_in_bits(M)));
        case MetadataKind::Pointer:
        case MetadataKind::ByReference:
            return llvm::PointerType::getUnqual(pointee_of(types, M, T.element));
        default:
            break;
    }
    if(is_aggregate_kind(T.kind)){
        if(T.is_enum) return map_type(types, M, T.underlying);
        if(T.stack == StackKind::Object)
            return llvm::PointerType::getUnqual(named_struct(llctx, "class." + types.full_name(id)));
        return value_struct(types, M, id);
    }
    // Generic parameters, function pointers: pointer-sized opaque values.
    return llvm::Type::getInt8PtrTy(llctx);
}

llvm::StructType* value_struct(const TypeTable& types, llvm::Module& M, TypeId id){
    const TypeInfo& T = types.at(id);
    auto* ST = named_struct(M.getContext(), "struct." + types.full_name(id));
    if(ST->isOpaque() && T.fields){
        std::vector<llvm::Type*> elems; elems.reserve(T.fields->size());
        for(auto& f : *T.fields) elems.push_back(map_type(types, M, f.type));
        ST->setBody(elems, /*isPacked*/ false);
    }
    return ST;
}

llvm::StructType* object_struct(const TypeTable& types, llvm::Module& M, TypeId id){
    auto* ST = named_struct(M.getContext(), "class." + types.full_name(id));
    if(ST->isOpaque()){
        auto* data = value_struct(types, M, id);
        if(!data->isOpaque()){
            llvm::Type* header = llvm::Type::getInt8PtrTy(M.getContext());
            ST->setBody({header, data}, /*isPacked*/ false);
        }
    }
    return ST;
}

llvm::Type* class_layout_type(const TypeTable& types, llvm::Module& M, TypeId id){
    const TypeInfo& T = types.at(id);
    if(!is_aggregate_kind(T.kind) || T.is_enum) return map_type(types, M, id);
    if(T.stack == StackKind::Object) return object_struct(types, M, id);
    return value_struct(types, M, id);
}

uint64_t object_header_bits(const TypeTable& types, llvm::Module& M, TypeId id){
    auto* ST = object_struct(types, M, id);
    if(ST->isSized()) return field_offset_in_bits(M, ST, kObjectDataIndex);
    // Layout not known yet: header is a single vtable pointer.
    return pointer_size_in_bits(M);
}

uint64_t size_in_bits(const llvm::Module& M, llvm::Type* T){
    if(!T || !T->isSized()) return 0;
    return M.getDataLayout().getTypeAllocSizeInBits(T).getFixedSize();
}

uint32_t align_in_bits(const llvm::Module& M, llvm::Type* T){
    if(!T || !T->isSized()) return 0;
    return static_cast<uint32_t>(M.getDataLayout().getABITypeAlign(T).value() * 8);
}

uint64_t field_offset_in_bits(const llvm::Module& M, llvm::StructType* ST, unsigned index){
    if(!ST || !ST->isSized() || index >= ST->getNumElements()) return 0;
    return M.getDataLayout().getStructLayout(ST)->getElementOffsetInBits(index);
}

uint64_t pointer_size_in_bits(const llvm::Module& M){
    unsigned bits = M.getDataLayout().getPointerSizeInBits();
    return bits ? bits : 64;
}

uint32_t pointer_align_in_bits(const llvm::Module& M){
    return static_cast<uint32_t>(M.getDataLayout().getPointerABIAlignment(0).value() * 8);
}

} // namespace clrdi::ir
