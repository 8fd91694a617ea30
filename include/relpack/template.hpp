#pragma once

#include <relpack/result.hpp>
#include <map>
#include <string>

namespace relpack {

using TemplateVars = std::map<std::string, std::string>;

// Substitute {{ name }} placeholders. \{{ produces a literal {{.
// Unknown names and unclosed braces are errors.
Result<std::string> render_template(const std::string& text, const TemplateVars& vars);

// Same substitution, leaving unknown or malformed placeholders untouched
std::string render_template_lenient(const std::string& text, const TemplateVars& vars);

// version / tag ("v1.2.3"), version_num ("1.2.3"), product, date (UTC,
// YYYY-MM-DD). `tag` must already be a validated version.
TemplateVars release_vars(const std::string& tag, const std::string& product);

// Current UTC date as YYYY-MM-DD
std::string utc_date();

// Current UTC time as "YYYY-MM-DD HH:MM:SS UTC"
std::string utc_timestamp();

} // namespace relpack
