#include <codectx/parser/regex_util.h>
#include <codectx/parser/swift/swift_patterns.h>

#include <array>
#include <string>

namespace codectx::parser::swift {

namespace {

// Start of a line, or right after '{' or ';'
const std::string kLead = R"re((?:^|(?<=[{;]))[ \t]*)re";

const std::string kAttribute = R"re(@\w+(?:\([^()\n]*\))?)re";
const std::string kAccess = R"re((?:public|private|internal|fileprivate|package|open)(?:\(set\))?)re";

const std::string kTypeModifiers =
    "((?:(?:" + kAttribute + "|" + kAccess + R"re(|final|indirect)[ \t]+)*))re";

const std::string kMemberModifiers =
    "((?:(?:" + kAttribute + "|" + kAccess +
    R"re(|final|static|class|override|convenience|required|mutating|nonmutating|nonisolated|lazy|weak|unowned|dynamic|optional|distributed)[ \t]+)*))re";

const std::string kGenerics = R"re((<(?:[^<>\n{]|<[^<>\n{]*>)*>)?)re";
const std::string kGenericsSkip = R"re((?:<(?:[^<>\n{]|<[^<>\n{]*>)*>)?)re";

// Two levels of nested parentheses, so closure parameter types fit
const std::string kParameters = R"re(\(((?:[^()]|\((?:[^()]|\([^()]*\))*\))*)\))re";

const std::string kEffects =
    R"re(((?:(?:async|throws|rethrows|reasync)(?:\([^()\n]*\))?[ \t]*)*))re";

const std::string kWhere = R"re((?:[ \t]*\bwhere\b[^{\n;]*?)?)re";
const std::string kDeclEnd = R"re([ \t]*(?=\{|;|//|$))re";

const std::string kOperatorChars = R"re([-+*/%=!<>&|^~?.]+)re";

constexpr std::array<std::string_view, 14> kPlainAttributes = {
    "MainActor", "objc", "nonobjc", "available", "discardableResult", "inlinable",
    "usableFromInline", "ViewBuilder", "escaping", "frozen", "preconcurrency", "Sendable",
    "globalActor", "resultBuilder"};

constexpr std::array<std::string_view, 9> kDirectiveKeywords = {
    "if", "elseif", "else", "endif", "available", "unavailable", "selector", "keyPath",
    "sourceLocation"};

} // namespace

SwiftPatterns::SwiftPatterns()
    : typeDecl(compilePattern(
          kLead + kTypeModifiers +
          R"re((class|struct|protocol|enum|actor|extension)[ \t]+(?!(?:func|var|let|override|subscript|init|deinit|static|final)\b)(\w+(?:\.\w+)*))re" +
          kGenerics + R"re(([^{\n;]*?)\s*\{)re")),
      function(compilePattern(kLead + kMemberModifiers + R"re(func[ \t]+(\w+|)re" +
                              kOperatorChars + R"re()[ \t]*)re" + kGenericsSkip + R"re([ \t]*)re" +
                              kParameters + R"re([ \t]*)re" + kEffects +
                              R"re((?:->[ \t]*([^{\n;]+?))?)re" + kWhere + kDeclEnd)),
      initializer(compilePattern(kLead + kMemberModifiers + R"re(init([?!])?[ \t]*)re" +
                                 kGenericsSkip + R"re([ \t]*)re" + kParameters + R"re([ \t]*)re" +
                                 kEffects + kWhere + kDeclEnd)),
      deinitializer(compilePattern(kLead + R"re(deinit\s*(?=\{))re")),
      property(compilePattern(
          kLead + kMemberModifiers +
          R"re((let|var)[ \t]+(\w+)[ \t]*(?::[ \t]*([^=\n{};/]+?))?[ \t]*(=(?!=)|\{|;|\}|//|$))re")),
      typeAlias(compilePattern(kLead + kTypeModifiers + R"re(typealias[ \t]+(\w+)[ \t]*)re" +
                               kGenerics + R"re([ \t]*=[ \t]*([^\n;]+?)[ \t]*(?=;|//|\}|$))re")),
      associatedType(compilePattern(
          kLead +
          R"re(associatedtype[ \t]+(\w+)(?:[ \t]*:[ \t]*([^\n=;{}/]+?))?(?:[ \t]*=[ \t]*([^\n;{}/]+?))?(?:[ \t]+where[^\n;{}]*)?[ \t]*(?=;|//|\}|$))re")),
      subscript(compilePattern(kLead + kMemberModifiers + R"re(subscript[ \t]*)re" +
                               kGenericsSkip + R"re([ \t]*)re" + kParameters +
                               R"re([ \t]*(?:(?:async|throws)[ \t]*)*->[ \t]*([^{\n;]+?))re" +
                               kWhere + kDeclEnd)),
      operatorDecl(compilePattern(R"re(^[ \t]*(prefix|postfix|infix)[ \t]+operator[ \t]+()re" +
                                  kOperatorChars + R"re()(?:[ \t]*:[ \t]*(\w+))?)re")),
      importDecl(compilePattern(
          R"re(^[ \t]*(?:@\w+(?:\([^()\n]*\))?[ \t]+)*(?:(?:public|internal|private|fileprivate|package)[ \t]+)?import[ \t]+(?:(typealias|struct|class|enum|protocol|let|var|func)[ \t]+)?([\w.]+))re")),
      attribute(compilePattern(R"re(@(\w+)(\([^()\n]*\))?)re")),
      closure(compilePattern(
          R"re(\{[ \t]*(?:\[[^\]\n]*\][ \t]*)?(?!for\b|case\b|if\b|while\b)(?:\([^()\n]*\)|[\w, \t]+?)[ \t]*(?:(?:async|throws)[ \t]*)*(?:->[ \t]*[^{}\n]+?[ \t]*)?\bin\b)re")),
      escapingClosure(compilePattern(R"re(@escaping\b)re")),
      trailingClosure(compilePattern(
          R"re((?:\.(\w+)|\b([A-Za-z_]\w*))[ \t]*(?:\([^()\n]*\))?[ \t]*\{)re")),
      asyncProperty(
          compilePattern(R"re(\bvar[ \t]+\w+[ \t]*:[^{\n]*\{\s*get[ \t]+async\b)re")),
      awaitCall(compilePattern(R"re(\bawait[ \t]+\w)re")),
      asyncSequence(compilePattern(R"re(\bfor[ \t]+(?:try[ \t]+)?await\b)re")),
      asyncIterator(compilePattern(R"re([:,][ \t]*Async(?:Sequence|IteratorProtocol)\b)re")),
      optionalChaining(compilePattern(R"re([\w)\]]\?\.\w)re")),
      optionalBinding(compilePattern(R"re(\b(?:if|guard|while)[ \t]+(?:let|var)[ \t]+\w+)re")),
      nilCoalescing(compilePattern(R"re(\?\?)re")),
      forceUnwrap(compilePattern(R"re((?:\b(?!try!|as!)\w+|[)\]])!(?!=))re")),
      guardStatement(compilePattern(R"re(^[ \t]*guard\b[^{]*?\belse[ \t]*\{)re")),
      deferStatement(compilePattern(R"re(^[ \t]*defer[ \t]*\{)re")),
      resultBuilder(compilePattern(
          R"re(@resultBuilder\s+(?:(?:public|internal|private|fileprivate|package)\s+)?(?:struct|class|enum)\s+(\w+))re")),
      viewBuilder(compilePattern(
          R"re(@ViewBuilder\s+(?:(?:public|internal|private|fileprivate|package|static|override)\s+)*(?:var|func)\s+(\w+))re")),
      functionBuilder(compilePattern(
          R"re(@_functionBuilder\s+(?:(?:public|internal)\s+)?(?:struct|class|enum)\s+(\w+))re")),
      macroDecl(compilePattern(
          R"re(@(?:freestanding|attached)[ \t]*\((?:[^()]|\([^()]*\))*\)\s*(?:@(?:freestanding|attached)[ \t]*\((?:[^()]|\([^()]*\))*\)\s*)*(?:(?:public|internal|package)\s+)?macro\s+(\w+))re")),
      macroUsage(compilePattern(R"re(#(\w+)[ \t]*[({])re")) {}

const SwiftPatterns& swiftPatterns() {
    static const SwiftPatterns patterns;
    return patterns;
}

bool isPlainAttribute(std::string_view name) {
    for (auto attr : kPlainAttributes) {
        if (name == attr) {
            return true;
        }
    }
    return false;
}

bool isDirectiveKeyword(std::string_view name) {
    for (auto keyword : kDirectiveKeywords) {
        if (name == keyword) {
            return true;
        }
    }
    return false;
}

} // namespace codectx::parser::swift
