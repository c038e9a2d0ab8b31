#include "staging/doc_templates.hpp"

#include <sstream>

namespace diststage::staging {

namespace {

constexpr std::string_view kHeaderTemplate =
    R"(<h2>Distribution artifacts</h2>
<p>
  This directory holds release candidate distributions staged for review.
  Artifacts under <code>source/</code> are source bundles, artifacts under
  <code>binaries/</code> are binary bundles.
</p>
<p>
  Always verify downloads against the published signatures and checksums
  before use.
</p>
)";

constexpr std::string_view kReadmeTemplate =
    R"(<h2>${artifactId} ${version}</h2>
<p>
  The files in this directory are the staged distributions of
  <strong>${artifactId}</strong> version <strong>${version}</strong>.
</p>
<ul>
  <li><code>source/</code>: source distributions (<code>${artifactId}-${version}-src.*</code>)</li>
  <li><code>binaries/</code>: binary distributions (<code>${artifactId}-${version}-bin.*</code>)</li>
  <li><code>RELEASE-NOTES.txt</code>: changes in this release</li>
</ul>
<p>
  Project documentation: <a href="${siteUrl}">${siteUrl}</a>
</p>
)";

std::string EscapeHtml(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '&':
      out << "&amp;";
      break;
    case '<':
      out << "&lt;";
      break;
    case '>':
      out << "&gt;";
      break;
    case '"':
      out << "&quot;";
      break;
    case '\'':
      out << "&#39;";
      break;
    default:
      out << ch;
      break;
    }
  }
  return out.str();
}

std::string_view TemplateFor(DocumentId id) {
  switch (id) {
  case DocumentId::kHeader:
    return kHeaderTemplate;
  case DocumentId::kReadme:
    return kReadmeTemplate;
  }
  return {};
}

} // namespace

std::string_view DocumentFileName(DocumentId id) {
  switch (id) {
  case DocumentId::kHeader:
    return "HEADER.html";
  case DocumentId::kReadme:
    return "README.html";
  }
  return "";
}

bool RenderDocument(DocumentId id, const TemplateVariables& variables, std::string& text,
                    std::string& error) {
  const std::string_view source = TemplateFor(id);
  text.clear();
  text.reserve(source.size());

  std::size_t pos = 0;
  while (pos < source.size()) {
    const std::size_t open = source.find("${", pos);
    if (open == std::string_view::npos) {
      text.append(source.substr(pos));
      break;
    }
    const std::size_t close = source.find('}', open + 2);
    if (close == std::string_view::npos) {
      error = "unterminated placeholder in " + std::string(DocumentFileName(id));
      return false;
    }

    text.append(source.substr(pos, open - pos));
    const std::string name(source.substr(open + 2, close - open - 2));
    const auto it = variables.find(name);
    if (it == variables.end()) {
      error = "missing template variable '" + name + "' for " + std::string(DocumentFileName(id));
      return false;
    }
    text += EscapeHtml(it->second);
    pos = close + 1;
  }

  return true;
}

} // namespace diststage::staging
