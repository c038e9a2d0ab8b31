#pragma once

#include <map>
#include <string>
#include <string_view>

namespace diststage::staging {

// Pages published next to the staged artifacts.
enum class DocumentId {
  kHeader, // HEADER.html, shown above the directory listing
  kReadme, // README.html, shown below the directory listing
};

using TemplateVariables = std::map<std::string, std::string>;

// File name of the rendered page ("HEADER.html" / "README.html").
std::string_view DocumentFileName(DocumentId id);

// Renders one built-in page. Placeholders are written `${name}`; every value
// is HTML-escaped. Returns false and sets `error` when the template
// references a variable that `variables` does not provide.
//
// kReadme expects: artifactId, version, siteUrl.
bool RenderDocument(DocumentId id, const TemplateVariables& variables, std::string& text,
                    std::string& error);

} // namespace diststage::staging
