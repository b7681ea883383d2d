#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace tpl::core {

/// Converts template and parameter documents into the typed model.
/// Schema violations throw common::MalformedDocumentError naming the offending
/// location ("parameters/vmName/type", "resources/0/name", ...).
/// Class abbreviation: tp
class TemplateParser {
 public:
  /// nMaxBytes of 0 disables the document size check.
  explicit TemplateParser(size_t nMaxBytes = 0);
  ~TemplateParser();

  /// Parse template JSON text.
  common::Template parseDocument(const std::string& sDocument) const;
  common::Template parse(const nlohmann::json& jDocument) const;
  common::Template parseFile(const std::string& sPath) const;

  /// Normalize parameter values to {name: value}. Accepts a plain object or a
  /// deployment parameters file ({"parameters": {name: {"value": v}}}).
  static nlohmann::json parseParameterValues(const nlohmann::json& jDocument);
  nlohmann::json parseParameterValuesFile(const std::string& sPath) const;

 private:
  nlohmann::json parseJson(const std::string& sDocument, const std::string& sName) const;
  std::string readFile(const std::string& sPath) const;

  size_t _nMaxBytes;
};

}  // namespace tpl::core
