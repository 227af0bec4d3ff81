#pragma once

#include <string_view>

#include <boost/regex.hpp>

namespace codectx::parser::dart {

/**
 * @brief Regular expressions recognising Dart declarations.
 *
 * Compiled once on first use. Declaration patterns capture the declared name in
 * group 1; the extractor derives node lines from that group.
 */
struct DartPatterns {
    // Declarations
    boost::regex classDecl;
    boost::regex mixin;
    boost::regex extension;
    boost::regex enumDecl;
    boost::regex typedefDecl;
    boost::regex functionTypedef;
    boost::regex function;
    boost::regex method;
    boost::regex variable;
    boost::regex importDirective;
    boost::regex partDirective;
    boost::regex partOfDirective;

    // Class declaration details
    boost::regex classModifier;
    boost::regex abstractClass;
    boost::regex extendsClause;
    boost::regex withClause;
    boost::regex stateClass;
    boost::regex mixinConstraint;

    // Flutter members
    boost::regex buildMethod;
    boost::regex lifecycleMethod;

    // Async
    boost::regex asyncGenerator;
    boost::regex asyncMethod;
    boost::regex asyncFunction;
    boost::regex awaitKeyword;
    boost::regex stream;

    // Functional
    boost::regex higherOrderFunction;
    boost::regex closureFactory;

    // Error handling
    boost::regex tryBlock;
    boost::regex catchBlock;
    boost::regex finallyBlock;
    boost::regex throwStatement;
    boost::regex rethrowStatement;

    // Pattern matching and records
    boost::regex switchBlock;
    boost::regex casePattern;
    boost::regex recordType;
    boost::regex namedRecord;

    DartPatterns();
};

const DartPatterns& dartPatterns();

// Pattern used by the limited and streaming strategies; nullptr for unknown names
const boost::regex* patternByName(std::string_view name);

// AST node type produced by a named pattern
std::string_view nodeTypeForPattern(std::string_view name);

// Names that a method or function pattern may capture from control-flow statements
bool isControlFlowKeyword(std::string_view name);

} // namespace codectx::parser::dart
