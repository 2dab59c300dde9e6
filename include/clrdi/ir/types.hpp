#pragma once
#include "clrdi/types.hpp"

#include <cstdint>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Type.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Module.h>

namespace clrdi::ir {

// Object layout: { header (vtable pointer), data }; data is element 1.
inline constexpr unsigned kObjectDataIndex = 1;

// Map a TypeId to the LLVM type a local or field of that type occupies
// (reference types map to a pointer to their object struct).
llvm::Type* map_type(const TypeTable& types, llvm::Module& M, TypeId id);

// Field struct of an aggregate ("struct.<FullName>"). Stays opaque until the
// aggregate's fields are known.
llvm::StructType* value_struct(const TypeTable& types, llvm::Module& M, TypeId id);

// Heap object struct of a reference aggregate ("class.<FullName>").
llvm::StructType* object_struct(const TypeTable& types, llvm::Module& M, TypeId id);

// Representation whose ABI size describes the aggregate itself: the object
// struct for reference types, the value struct for value types, the mapped
// type otherwise.
llvm::Type* class_layout_type(const TypeTable& types, llvm::Module& M, TypeId id);

// Bit offset of object data past the runtime header.
uint64_t object_header_bits(const TypeTable& types, llvm::Module& M, TypeId id);

// ABI queries against the module's DataLayout, in bits. A type whose layout is
// not known yet (opaque struct, or one containing one) reports 0.
uint64_t size_in_bits(const llvm::Module& M, llvm::Type* T);
uint32_t align_in_bits(const llvm::Module& M, llvm::Type* T);
uint64_t field_offset_in_bits(const llvm::Module& M, llvm::StructType* ST, unsigned index);
uint64_t pointer_size_in_bits(const llvm::Module& M);
uint32_t pointer_align_in_bits(const llvm::Module& M);

} // namespace clrdi::ir
