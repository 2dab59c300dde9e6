#include "clrdi/ir/namespaces.hpp"

#include <llvm/Support/raw_ostream.h>

namespace clrdi::ir::debug {

llvm::DINamespace* NamespaceRegistry::resolve(llvm::DIBuilder& DIB, std::string_view path){
    Node* node = &root_;
    size_t pos = 0;
    while(pos <= path.size() && !path.empty()){
        size_t dot = path.find('.', pos);
        if(dot == std::string_view::npos) dot = path.size();
        std::string_view segment = path.substr(pos, dot - pos);
        auto it = node->children.find(segment);
        if(it == node->children.end()){
            auto child = std::make_unique<Node>();
            child->descriptor = DIB.createNameSpace(node->descriptor, segment, /*ExportSymbols*/ false);
            ++count_;
            if(trace) llvm::errs() << "[di][ns] created '" << path.substr(0, dot) << "'\n";
            it = node->children.emplace(std::string(segment), std::move(child)).first;
        }
        node = it->second.get();
        pos = dot + 1;
    }
    return node->descriptor;
}

llvm::DINamespace* NamespaceRegistry::lookup(std::string_view path) const {
    const Node* node = &root_;
    size_t pos = 0;
    while(pos <= path.size() && !path.empty()){
        size_t dot = path.find('.', pos);
        if(dot == std::string_view::npos) dot = path.size();
        auto it = node->children.find(path.substr(pos, dot - pos));
        if(it == node->children.end()) return nullptr;
        node = it->second.get();
        pos = dot + 1;
    }
    return node->descriptor;
}

} // namespace clrdi::ir::debug
