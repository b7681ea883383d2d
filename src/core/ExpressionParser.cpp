#include "core/ExpressionParser.hpp"

#include "common/Errors.hpp"

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace tpl::core {

namespace {

enum class TokenKind { LParen, RParen, LBracket, RBracket, Comma, Dot, String, Integer,
                       Identifier, End };

struct Token {
  TokenKind kind;
  std::string sText;
  size_t nPos;
};

/// Recursive-descent parser over a pre-tokenized expression.
class Parser {
 public:
  Parser(const std::string& sText, const std::string& sLocation, int iMaxDepth)
      : _sText(sText), _sLocation(sLocation), _iMaxDepth(iMaxDepth) {
    tokenize();
  }

  ExprPtr parseAll() {
    auto upExpr = parseExpr(0);
    if (peek().kind != TokenKind::End) {
      fail("unexpected '" + peek().sText + "'", peek().nPos);
    }
    return upExpr;
  }

 private:
  [[noreturn]] void fail(const std::string& sReason, size_t nPos) const {
    const std::string sName = _sLocation.empty() ? _sText : _sLocation;
    throw common::MalformedDocumentError(
        sName, "Invalid expression '" + _sText + "': " + sReason + " at position " +
                   std::to_string(nPos));
  }

  void tokenize() {
    size_t i = 0;
    const size_t n = _sText.size();
    while (i < n) {
      const char c = _sText[i];
      if (std::isspace(static_cast<unsigned char>(c))) {
        ++i;
        continue;
      }
      switch (c) {
        case '(': _vTokens.push_back({TokenKind::LParen, "(", i++}); continue;
        case ')': _vTokens.push_back({TokenKind::RParen, ")", i++}); continue;
        case '[': _vTokens.push_back({TokenKind::LBracket, "[", i++}); continue;
        case ']': _vTokens.push_back({TokenKind::RBracket, "]", i++}); continue;
        case ',': _vTokens.push_back({TokenKind::Comma, ",", i++}); continue;
        case '.': _vTokens.push_back({TokenKind::Dot, ".", i++}); continue;
        default: break;
      }

      if (c == '\'') {
        const size_t nStart = i++;
        std::string sValue;
        bool bClosed = false;
        while (i < n) {
          if (_sText[i] == '\'') {
            if (i + 1 < n && _sText[i + 1] == '\'') {
              sValue += '\'';
              i += 2;
              continue;
            }
            ++i;
            bClosed = true;
            break;
          }
          sValue += _sText[i++];
        }
        if (!bClosed) {
          fail("unterminated string literal", nStart);
        }
        _vTokens.push_back({TokenKind::String, sValue, nStart});
        continue;
      }

      if (std::isdigit(static_cast<unsigned char>(c)) ||
          (c == '-' && i + 1 < n && std::isdigit(static_cast<unsigned char>(_sText[i + 1])))) {
        const size_t nStart = i++;
        while (i < n && std::isdigit(static_cast<unsigned char>(_sText[i]))) ++i;
        _vTokens.push_back({TokenKind::Integer, _sText.substr(nStart, i - nStart), nStart});
        continue;
      }

      if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        const size_t nStart = i;
        while (i < n && (std::isalnum(static_cast<unsigned char>(_sText[i])) || _sText[i] == '_')) {
          ++i;
        }
        _vTokens.push_back({TokenKind::Identifier, _sText.substr(nStart, i - nStart), nStart});
        continue;
      }

      fail(std::string("unexpected character '") + c + "'", i);
    }
    _vTokens.push_back({TokenKind::End, "<end>", n});
  }

  const Token& peek() const { return _vTokens[_nPos]; }
  const Token& next() { return _vTokens[_nPos++]; }

  void expect(TokenKind kind, const char* pWhat) {
    if (peek().kind != kind) {
      fail(std::string("expected ") + pWhat + " but found '" + peek().sText + "'", peek().nPos);
    }
    ++_nPos;
  }

  ExprPtr parseExpr(int iDepth) {
    if (iDepth >= _iMaxDepth) {
      fail("nesting deeper than " + std::to_string(_iMaxDepth), peek().nPos);
    }

    auto upExpr = parsePrimary(iDepth);
    for (;;) {
      if (peek().kind == TokenKind::Dot) {
        next();
        if (peek().kind != TokenKind::Identifier) {
          fail("expected property name after '.'", peek().nPos);
        }
        upExpr = makeMember(std::move(upExpr), next().sText);
      } else if (peek().kind == TokenKind::LBracket) {
        next();
        auto upIndex = parseExpr(iDepth + 1);
        expect(TokenKind::RBracket, "']'");
        upExpr = makeIndex(std::move(upExpr), std::move(upIndex));
      } else {
        return upExpr;
      }
    }
  }

  ExprPtr parsePrimary(int iDepth) {
    const Token& tok = next();
    switch (tok.kind) {
      case TokenKind::String:
        return makeLiteral(tok.sText);
      case TokenKind::Integer: {
        int64_t iValue = 0;
        try {
          iValue = std::stoll(tok.sText);
        } catch (const std::out_of_range&) {
          fail("integer literal out of range", tok.nPos);
        }
        return makeLiteral(iValue);
      }
      case TokenKind::Identifier: {
        std::string sName = tok.sText;
        expect(TokenKind::LParen, "'(' after function name");
        std::vector<ExprPtr> vArgs;
        if (peek().kind != TokenKind::RParen) {
          vArgs.push_back(parseExpr(iDepth + 1));
          while (peek().kind == TokenKind::Comma) {
            next();
            vArgs.push_back(parseExpr(iDepth + 1));
          }
        }
        expect(TokenKind::RParen, "')'");
        return makeCall(std::move(sName), std::move(vArgs));
      }
      default:
        fail("unexpected '" + tok.sText + "'", tok.nPos);
    }
  }

  const std::string& _sText;
  const std::string& _sLocation;
  int _iMaxDepth;
  std::vector<Token> _vTokens;
  size_t _nPos = 0;
};

}  // namespace

ExpressionParser::ExpressionParser(int iMaxDepth) : _iMaxDepth(iMaxDepth) {}
ExpressionParser::~ExpressionParser() = default;

bool ExpressionParser::isExpression(const std::string& sValue) {
  return sValue.size() >= 2 && sValue.front() == '[' && sValue.back() == ']' &&
         sValue.compare(0, 2, "[[") != 0;
}

std::string ExpressionParser::unescapeLiteral(const std::string& sValue) {
  if (sValue.compare(0, 2, "[[") == 0 && sValue.back() == ']') {
    return sValue.substr(1);
  }
  return sValue;
}

std::string ExpressionParser::escapeLiteral(const std::string& sValue) {
  if (sValue.size() >= 2 && sValue.front() == '[' && sValue.back() == ']') {
    return "[" + sValue;
  }
  return sValue;
}

ExprPtr ExpressionParser::parse(const std::string& sExpression,
                                const std::string& sLocation) const {
  std::string sInner = sExpression;
  if (isExpression(sInner)) {
    sInner = sInner.substr(1, sInner.size() - 2);
  }
  Parser parser(sInner, sLocation, _iMaxDepth);
  return parser.parseAll();
}

}  // namespace tpl::core
