#include <codectx/ast/symbol.h>

namespace codectx::ast {

std::optional<Visibility> parseVisibility(std::string_view label) {
    while (!label.empty() && (label.back() == ':' || label.back() == ' ' || label.back() == '\t' ||
                              label.back() == '\n' || label.back() == '\r')) {
        label.remove_suffix(1);
    }
    while (!label.empty() && (label.front() == ' ' || label.front() == '\t' ||
                              label.front() == '\n' || label.front() == '\r')) {
        label.remove_prefix(1);
    }
    if (label == "public") {
        return Visibility::Public;
    }
    if (label == "private") {
        return Visibility::Private;
    }
    if (label == "protected") {
        return Visibility::Protected;
    }
    return std::nullopt;
}

bool sameSymbol(const Symbol& a, const Symbol& b) {
    return a.id == b.id && a.name == b.name && a.kind == b.kind && a.location == b.location &&
           a.language == b.language && a.signature == b.signature &&
           a.visibility == b.visibility && a.hash == b.hash && a.metadata == b.metadata;
}

} // namespace codectx::ast
