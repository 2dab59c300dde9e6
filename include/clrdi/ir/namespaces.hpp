#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <llvm/IR/DIBuilder.h>
#include <llvm/IR/DebugInfoMetadata.h>

namespace clrdi::ir::debug {

// Dotted namespace path -> DINamespace, kept as a trie keyed by path segment.
// A parent node always exists before its child is created; entries are never removed.
class NamespaceRegistry {
public:
    // Empty path resolves to nullptr (declared at compile-unit level).
    llvm::DINamespace* resolve(llvm::DIBuilder& DIB, std::string_view path);

    // Number of namespace descriptors created so far.
    size_t size() const { return count_; }
    // Cached descriptor for path without creating anything; nullptr if absent.
    llvm::DINamespace* lookup(std::string_view path) const;

    bool trace = false;

private:
    struct Node {
        llvm::DINamespace* descriptor = nullptr;
        std::map<std::string, std::unique_ptr<Node>, std::less<>> children;
    };
    Node root_;
    size_t count_ = 0;
};

} // namespace clrdi::ir::debug
