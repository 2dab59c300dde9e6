// Semantic type table for managed metadata types (the type-system side of debug info).
#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace clrdi
{

    using TypeId = uint32_t;

    // Element type tags as they appear in managed metadata signatures.
    enum class MetadataKind
    {
        Void,
        Boolean,
        Char,
        SByte,
        Byte,
        Int16,
        UInt16,
        Int32,
        UInt32,
        Int64,
        UInt64,
        Single,
        Double,
        String,
        Pointer,
        ByReference,
        ValueType,
        Class,
        Var,
        Array,
        GenericInstance,
        TypedByReference,
        IntPtr,
        UIntPtr,
        FunctionPointer,
        Object,
        MVar
    };

    // How values of a type live on the evaluation stack: inline, or as a
    // reference to a heap object preceded by a runtime header.
    enum class StackKind
    {
        Value,
        Object
    };

    struct FieldInfo
    {
        std::string name;
        TypeId type{0};
        unsigned struct_index{0};    // position in the lowered value struct
        uint64_t explicit_offset{0}; // byte offset, explicit-layout aggregates only
    };

    struct TypeInfo
    {
        MetadataKind kind{MetadataKind::Void};
        std::string ns;   // dotted namespace path, may be empty
        std::string name; // short name
        StackKind stack{StackKind::Value};
        bool is_local{false}; // defined in the unit being compiled
        bool is_enum{false};
        bool explicit_layout{false};
        TypeId element{0};          // Pointer / ByReference
        TypeId underlying{0};       // enums
        std::optional<TypeId> base; // aggregates
        // Absent until layout has been computed for the aggregate.
        std::optional<std::vector<FieldInfo>> fields;
    };

    struct AggregateDecl
    {
        MetadataKind kind{MetadataKind::Class};
        std::string ns;
        std::string name;
        StackKind stack{StackKind::Object};
        bool is_local{true};
        std::optional<TypeId> base;
        bool explicit_layout{false};
    };

    inline bool is_primitive_kind(MetadataKind k)
    {
        switch (k)
        {
        case MetadataKind::Boolean:
        case MetadataKind::Char:
        case MetadataKind::SByte:
        case MetadataKind::Byte:
        case MetadataKind::Int16:
        case MetadataKind::UInt16:
        case MetadataKind::Int32:
        case MetadataKind::UInt32:
        case MetadataKind::Int64:
        case MetadataKind::UInt64:
        case MetadataKind::Single:
        case MetadataKind::Double:
        case MetadataKind::IntPtr:
        case MetadataKind::UIntPtr:
            return true;
        default:
            return false;
        }
    }

    inline bool is_aggregate_kind(MetadataKind k)
    {
        switch (k)
        {
        case MetadataKind::Array:
        case MetadataKind::String:
        case MetadataKind::TypedByReference:
        case MetadataKind::GenericInstance:
        case MetadataKind::ValueType:
        case MetadataKind::Class:
        case MetadataKind::Object:
            return true;
        default:
            return false;
        }
    }

    class TypeTable
    {
    public:
        TypeTable()
        { // seed primitives so ids stay stable across runs
            get_primitive(MetadataKind::Void);
            get_primitive(MetadataKind::Boolean);
            get_primitive(MetadataKind::Char);
            get_primitive(MetadataKind::SByte);
            get_primitive(MetadataKind::Byte);
            get_primitive(MetadataKind::Int16);
            get_primitive(MetadataKind::UInt16);
            get_primitive(MetadataKind::Int32);
            get_primitive(MetadataKind::UInt32);
            get_primitive(MetadataKind::Int64);
            get_primitive(MetadataKind::UInt64);
            get_primitive(MetadataKind::Single);
            get_primitive(MetadataKind::Double);
            get_primitive(MetadataKind::IntPtr);
            get_primitive(MetadataKind::UIntPtr);
        }

        TypeId get_primitive(MetadataKind k)
        {
            if (!is_primitive_kind(k) && k != MetadataKind::Void)
                throw std::invalid_argument("not a primitive metadata kind");
            auto key = static_cast<int>(k);
            auto it = primitive_index_.find(key);
            if (it != primitive_index_.end())
                return it->second;
            TypeInfo t{};
            t.kind = k;
            t.ns = "System";
            t.name = primitive_name(k);
            TypeId id = add_type(std::move(t));
            primitive_index_[key] = id;
            return id;
        }
        TypeId get_pointer(TypeId to) { return get_indirection(MetadataKind::Pointer, to, pointer_cache_); }
        TypeId get_by_reference(TypeId to) { return get_indirection(MetadataKind::ByReference, to, byref_cache_); }

        TypeId add_enum(const std::string &ns, const std::string &name, TypeId underlying, bool is_local = true)
        {
            if (!is_primitive_kind(at(underlying).kind))
                throw std::invalid_argument("enum underlying type must be primitive: " + name);
            TypeInfo t{};
            t.kind = MetadataKind::ValueType;
            t.ns = ns;
            t.name = name;
            t.is_local = is_local;
            t.is_enum = true;
            t.underlying = underlying;
            return add_type(std::move(t));
        }

        TypeId add_aggregate(const AggregateDecl &d)
        {
            if (!is_aggregate_kind(d.kind))
                throw std::invalid_argument("not an aggregate metadata kind: " + d.name);
            if (d.base)
                (void)at(*d.base);
            TypeInfo t{};
            t.kind = d.kind;
            t.ns = d.ns;
            t.name = d.name;
            t.stack = d.stack;
            t.is_local = d.is_local;
            t.base = d.base;
            t.explicit_layout = d.explicit_layout;
            return add_type(std::move(t));
        }

        // Kinds the debug-type catalog has no dedicated shape for (generic
        // parameters, function pointers ...).
        TypeId add_opaque(MetadataKind k, const std::string &name)
        {
            TypeInfo t{};
            t.kind = k;
            t.name = name;
            return add_type(std::move(t));
        }

        // Publishes the field layout of an aggregate. Struct indices follow
        // declaration order.
        void set_fields(TypeId id, std::vector<FieldInfo> fields)
        {
            TypeInfo &t = types_.at(id);
            if (!is_aggregate_kind(t.kind))
                throw std::invalid_argument("fields on non-aggregate type: " + t.name);
            for (size_t i = 0; i < fields.size(); ++i)
            {
                (void)at(fields[i].type);
                fields[i].struct_index = static_cast<unsigned>(i);
            }
            t.fields = std::move(fields);
        }

        const TypeInfo &at(TypeId id) const { return types_.at(id); }
        size_t size() const { return types_.size(); }
        TypeId native_int() const { return primitive_index_.at(static_cast<int>(MetadataKind::IntPtr)); }

        std::string full_name(TypeId id) const
        {
            const TypeInfo &t = at(id);
            return t.ns.empty() ? t.name : t.ns + "." + t.name;
        }

    private:
        TypeId add_type(TypeInfo t)
        {
            TypeId id = static_cast<TypeId>(types_.size());
            types_.push_back(std::move(t));
            return id;
        }
        TypeId get_indirection(MetadataKind k, TypeId to, std::unordered_map<TypeId, TypeId> &cache)
        {
            auto it = cache.find(to);
            if (it != cache.end())
                return it->second;
            const TypeInfo &target = at(to);
            TypeInfo t{};
            t.kind = k;
            t.ns = target.ns;
            t.name = target.name + (k == MetadataKind::Pointer ? "*" : "&");
            t.element = to;
            TypeId id = add_type(std::move(t));
            cache[to] = id;
            return id;
        }
        static std::string primitive_name(MetadataKind k)
        {
            switch (k)
            {
            case MetadataKind::Void:
                return "Void";
            case MetadataKind::Boolean:
                return "Boolean";
            case MetadataKind::Char:
                return "Char";
            case MetadataKind::SByte:
                return "SByte";
            case MetadataKind::Byte:
                return "Byte";
            case MetadataKind::Int16:
                return "Int16";
            case MetadataKind::UInt16:
                return "UInt16";
            case MetadataKind::Int32:
                return "Int32";
            case MetadataKind::UInt32:
                return "UInt32";
            case MetadataKind::Int64:
                return "Int64";
            case MetadataKind::UInt64:
                return "UInt64";
            case MetadataKind::Single:
                return "Single";
            case MetadataKind::Double:
                return "Double";
            case MetadataKind::IntPtr:
                return "IntPtr";
            case MetadataKind::UIntPtr:
                return "UIntPtr";
            default:
                return "?";
            }
        }

        std::vector<TypeInfo> types_;
        std::unordered_map<int, TypeId> primitive_index_;
        std::unordered_map<TypeId, TypeId> pointer_cache_;
        std::unordered_map<TypeId, TypeId> byref_cache_;
    };

} // namespace clrdi
