#include <codectx/parser/dart/dart_patterns.h>
#include <codectx/parser/regex_util.h>

#include <array>

namespace codectx::parser::dart {

namespace {

constexpr std::array<std::string_view, 14> kControlFlowKeywords = {
    "if",    "else",     "for",    "while", "do",  "switch", "case",
    "break", "continue", "return", "throw", "try", "catch",  "finally"};

} // namespace

DartPatterns::DartPatterns()
    : classDecl(compilePattern(
          R"re(^(?:(?:sealed|final|base|interface|mixin)\s+)?(?:abstract\s+)?class\s+(\w+)(?:<[\w\s,<>]+>)?(?:\s+extends\s+[\w<>]+)?(?:\s+with\s+[\w\s,<>]+)?(?:\s+implements\s+[\w\s,<>]+)?\s*\{)re")),
      mixin(compilePattern(R"re(^mixin\s+(\w+(?:<[\w\s,<>]+>)?)(?:\s+on\s+[\w\s,<>]+)?\s*\{)re")),
      extension(compilePattern(
          R"re(^extension\s+(\w*(?:<[\w,\s]+>)?)\s*on\s+([\w<>\[\],\s]+?)\s*\{)re")),
      enumDecl(compilePattern(
          R"re(^enum\s+(\w+)(?:<[\w\s,<>]+>)?(?:\s+implements\s+[\w\s,<>]+)?(?:\s+with\s+[\w\s,<>]+)?\s*\{)re")),
      typedefDecl(compilePattern(
          R"re(^typedef\s+(\w+)(?:<[\w\s,<>]+>)?\s*=\s*([\w<>\[\],\s\(\)\{\}?]+);)re")),
      functionTypedef(compilePattern(
          R"re(^typedef\s+(\w+)\s*=\s*[\w\s<>\[\],\(\)\{\}?]+Function\s*\([^)]*\))re")),
      function(compilePattern(
          R"re(^[\w<>\[\],\t \(\)\{\}?]*?\b(\w+)(?:<[\w\t ,<>?]*>)?[\t ]*\([^)]*\)\s*(?:async\s*\*?\s*)?(?:\{|=>))re")),
      method(compilePattern(
          R"re(^[ \t]+(?:@override\s+)?(?:static\s+)?[\w<>\[\],\t \(\)\{\}?]*?\b(\w+)(?:<[\w\t ,<>?]*>)?[\t ]*\([^)]*\)\s*(?:async\s*\*?\s*)?(?:\{|=>))re")),
      variable(compilePattern(
          R"re(^[ \t]*(?:late\s+)?(?:final\s+|const\s+|var\s+|static\s+)?(?:[\w<>\[\],\t ?\(\)\{\}]+[\t ]+)?(\w+)[\t ]*=(?!=|>))re")),
      importDirective(compilePattern(
          R"re(^[ \t]*import\s+['"]([^'"]+)['"](?:\s+as\s+(\w+))?[^;\n]*;)re")),
      partDirective(compilePattern(R"re(^part\s+['"]([^'"]+)['"];)re")),
      partOfDirective(
          compilePattern(R"re(^part\s+of\s+(?:['"]([^'"]*)['"]|(\w+(?:\.\w+)*));)re")),
      classModifier(compilePattern(R"re(^(sealed|final|base|interface|mixin)\s+)re")),
      abstractClass(compilePattern(R"re(\babstract\s+class\b)re")),
      extendsClause(compilePattern(R"re(\bextends\s+([\w<>]+))re")),
      withClause(compilePattern(R"re(\bwith\s+([\w\s,<>]+?)\s*(?:\bimplements\b|\{))re")),
      stateClass(compilePattern(R"re(\bextends\s+State<)re")),
      mixinConstraint(compilePattern(R"re(\son\s+([\w<>,\s]+?)\s*\{)re")),
      buildMethod(compilePattern(R"re(Widget\s+build\s*\(\s*BuildContext\s+\w+\s*\))re")),
      lifecycleMethod(compilePattern(
          R"re(^[ \t]+@override\s+void\s+(initState|dispose|didUpdateWidget|didChangeDependencies)\s*\()re")),
      asyncGenerator(compilePattern(
          R"re(^[ \t]*Stream<[\w\s<>,]+>\s+(\w+)\s*\([^)]*\)\s*async\s*\*\s*\{)re")),
      asyncMethod(compilePattern(
          R"re(^[ \t]+(?:Future<[\w\s<>,]+>\s+)?(\w+)\s*\([^)]*\)\s+async\s*\{)re")),
      asyncFunction(compilePattern(
          R"re(^(?:Future<[\w\s<>,]+>\s+)?(\w+)\s*\([^)]*\)\s+async\s*\{)re")),
      awaitKeyword(compilePattern(R"re(\bawait\s+)re")),
      stream(compilePattern(R"re(\bStream(?:Controller|Subscription|Builder)?<)re")),
      higherOrderFunction(compilePattern(
          R"re(^[ \t]*(?:static\s+)?[\w<>\[\],\t \(\)\{\}]*?\b(map|filter|reduce|compose|curry|memoize|pipe|asyncMap|asyncFilter)\s*(?:<[^>\n]*>)?\s*\()re")),
      closureFactory(compilePattern(
          R"re(^[ \t]*(?:static\s+)?(?:[\w\t <>\(\)]*)?Function(?:\(\))?\s+(create\w+)\s*\()re")),
      tryBlock(compilePattern(R"re(\btry\s*\{)re")),
      catchBlock(compilePattern(R"re(\bcatch\s*\([^)]+\)\s*\{)re")),
      finallyBlock(compilePattern(R"re(\bfinally\s*\{)re")),
      throwStatement(compilePattern(R"re(\bthrow\s+)re")),
      rethrowStatement(compilePattern(R"re(\brethrow\s*;)re")),
      switchBlock(compilePattern(R"re(\bswitch\s*\([^)]+\)\s*\{)re")),
      casePattern(compilePattern(R"re(\bcase\s+[^:\n]+:)re")),
      recordType(compilePattern(R"re(^[ \t]*\([\w\t ,<>?]+,[\w\t ,<>?]+\)\s+\w+)re")),
      namedRecord(compilePattern(R"re(\(\{[\w\s,<>?:]+\}\))re")) {}

const DartPatterns& dartPatterns() {
    static const DartPatterns patterns;
    return patterns;
}

const boost::regex* patternByName(std::string_view name) {
    const auto& p = dartPatterns();
    if (name == "import") {
        return &p.importDirective;
    }
    if (name == "class") {
        return &p.classDecl;
    }
    if (name == "function") {
        return &p.function;
    }
    if (name == "mixin") {
        return &p.mixin;
    }
    if (name == "extension") {
        return &p.extension;
    }
    if (name == "enum") {
        return &p.enumDecl;
    }
    if (name == "typedef") {
        return &p.typedefDecl;
    }
    if (name == "asyncGenerator") {
        return &p.asyncGenerator;
    }
    if (name == "asyncFunction") {
        return &p.asyncFunction;
    }
    return nullptr;
}

std::string_view nodeTypeForPattern(std::string_view name) {
    if (name == "class") {
        return "class_declaration";
    }
    if (name == "mixin") {
        return "mixin_declaration";
    }
    if (name == "extension") {
        return "extension_declaration";
    }
    if (name == "enum") {
        return "enum_declaration";
    }
    if (name == "typedef") {
        return "typedef_declaration";
    }
    if (name == "function") {
        return "function_declaration";
    }
    if (name == "import") {
        return "import_statement";
    }
    if (name == "asyncGenerator") {
        return "async_generator";
    }
    if (name == "asyncFunction") {
        return "async_function";
    }
    return "unknown_declaration";
}

bool isControlFlowKeyword(std::string_view name) {
    for (auto keyword : kControlFlowKeywords) {
        if (name == keyword) {
            return true;
        }
    }
    return false;
}

} // namespace codectx::parser::dart
