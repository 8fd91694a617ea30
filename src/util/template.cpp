#include <relpack/template.hpp>
#include <relpack/version.hpp>

#include <ctime>

namespace relpack {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string known_vars_hint(const TemplateVars& vars) {
    if (vars.empty()) return "no variables defined";
    std::string hint = "available variables: ";
    bool first = true;
    for (const auto& kv : vars) {
        if (!first) hint += ", ";
        hint += kv.first;
        first = false;
    }
    return hint;
}

// Shared scanner. With `strict` unset every problem is copied through
// verbatim and the result is always ok.
static Result<std::string> substitute(const std::string& text, const TemplateVars& vars,
                                      bool strict) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;

    while (i < text.size()) {
        if (text.compare(i, 3, "\\{{") == 0) {
            out += "{{";
            i += 3;
            continue;
        }
        if (text.compare(i, 2, "{{") != 0) {
            out.push_back(text[i++]);
            continue;
        }

        size_t close = text.find("}}", i + 2);
        if (close == std::string::npos) {
            if (strict) {
                return RelpackError{RelpackError::Parse,
                    "unclosed '{{' in template at position " + std::to_string(i)};
            }
            out += "{{";
            i += 2;
            continue;
        }

        std::string name = trim(text.substr(i + 2, close - i - 2));
        auto it = name.empty() ? vars.end() : vars.find(name);
        if (it == vars.end()) {
            if (strict && name.empty()) {
                return RelpackError{RelpackError::Parse,
                    "empty variable name in template at position " + std::to_string(i)};
            }
            if (strict) {
                return RelpackError{RelpackError::NotFound,
                    "undefined variable '" + name + "' in template",
                    known_vars_hint(vars)};
            }
            out.append(text, i, close + 2 - i);
        } else {
            out += it->second;
        }
        i = close + 2;
    }

    return Result<std::string>::ok(std::move(out));
}

Result<std::string> render_template(const std::string& text, const TemplateVars& vars) {
    return substitute(text, vars, true);
}

std::string render_template_lenient(const std::string& text, const TemplateVars& vars) {
    return std::move(substitute(text, vars, false)).value();
}

static std::string format_utc(const char* fmt) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string utc_date() {
    return format_utc("%Y-%m-%d");
}

std::string utc_timestamp() {
    return format_utc("%Y-%m-%d %H:%M:%S UTC");
}

TemplateVars release_vars(const std::string& tag, const std::string& product) {
    TemplateVars vars;
    vars["version"] = tag;
    vars["tag"] = tag;
    vars["version_num"] = to_numeric(tag).value_or(tag);
    vars["product"] = product;
    vars["date"] = utc_date();
    return vars;
}

} // namespace relpack
