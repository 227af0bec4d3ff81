#pragma once

#include <string_view>

#include <boost/regex.hpp>

namespace codectx::parser::swift {

/**
 * @brief Regular expressions recognising Swift declarations and idioms.
 *
 * Patterns run over source whose comments and string contents are blanked, so
 * offsets match the original text. Declarations start a line or follow '{' or ';'
 * on the same line.
 */
struct SwiftPatterns {
    // Declarations
    boost::regex typeDecl;        // 1 modifiers, 2 keyword, 3 name, 4 generics, 5 inheritance
    boost::regex function;        // 1 modifiers, 2 name, 3 parameters, 4 effects, 5 return type
    boost::regex initializer;     // 1 modifiers, 2 failable marker, 3 parameters, 4 effects
    boost::regex deinitializer;
    boost::regex property;        // 1 modifiers, 2 let/var, 3 name, 4 type, 5 terminator
    boost::regex typeAlias;       // 1 modifiers, 2 name, 3 generics, 4 target
    boost::regex associatedType;  // 1 name, 2 constraint, 3 default
    boost::regex subscript;       // 1 modifiers, 2 parameters, 3 return type
    boost::regex operatorDecl;    // 1 fixity, 2 operator, 3 precedence group
    boost::regex importDecl;      // 1 import kind, 2 module path
    boost::regex attribute;       // 1 name, 2 arguments

    // Closures
    boost::regex closure;
    boost::regex escapingClosure;
    boost::regex trailingClosure; // 1 member call name, 2 call name

    // Concurrency
    boost::regex asyncProperty;
    boost::regex awaitCall;
    boost::regex asyncSequence;
    boost::regex asyncIterator;

    // Optionals
    boost::regex optionalChaining;
    boost::regex optionalBinding;
    boost::regex nilCoalescing;
    boost::regex forceUnwrap;

    // Control flow
    boost::regex guardStatement;
    boost::regex deferStatement;

    // Result builders and macros
    boost::regex resultBuilder;
    boost::regex viewBuilder;
    boost::regex functionBuilder;
    boost::regex macroDecl;
    boost::regex macroUsage;

    SwiftPatterns();
};

const SwiftPatterns& swiftPatterns();

// Attributes that never wrap a property (@MainActor, @objc, ...)
bool isPlainAttribute(std::string_view name);

// '#name(' forms that are compiler directives rather than macro expansions
bool isDirectiveKeyword(std::string_view name);

} // namespace codectx::parser::swift
