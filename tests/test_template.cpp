#include <catch2/catch.hpp>
#include <relpack/template.hpp>
#include <string>

using namespace relpack;

TEST_CASE("placeholders are substituted", "[template]") {
    TemplateVars vars{{"version", "v1.2.3"}, {"product", "app"}};
    auto r = render_template("{{product}}_{{ version }}.txt", vars);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "app_v1.2.3.txt");
}

TEST_CASE("text without placeholders is unchanged", "[template]") {
    REQUIRE(render_template("checksums.txt", {}).value() == "checksums.txt");
    REQUIRE(render_template("a } b { c", {}).value() == "a } b { c");
}

TEST_CASE("escaped braces are literal", "[template]") {
    TemplateVars vars{{"v", "1"}};
    REQUIRE(render_template("\\{{v}} {{v}}", vars).value() == "{{v}} 1");
}

TEST_CASE("unknown variable is an error with a hint", "[template]") {
    TemplateVars vars{{"version", "v1"}, {"tag", "v1"}};
    auto r = render_template("{{ verison }}", vars);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::NotFound);
    REQUIRE(r.error().message.find("verison") != std::string::npos);
    REQUIRE(r.error().hint == "available variables: tag, version");
}

TEST_CASE("malformed placeholders are parse errors", "[template]") {
    auto unclosed = render_template("name_{{version", {{"version", "v1"}});
    REQUIRE(unclosed.is_err());
    REQUIRE(unclosed.error().code == RelpackError::Parse);

    auto empty = render_template("x{{  }}y", {});
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == RelpackError::Parse);
}

TEST_CASE("lenient rendering keeps problems verbatim", "[template]") {
    TemplateVars vars{{"version", "v2.0.0"}};
    REQUIRE(render_template_lenient("{{version}} {{missing}} {{", vars) ==
            "v2.0.0 {{missing}} {{");
}

TEST_CASE("release_vars", "[template]") {
    auto vars = release_vars("v1.4.0", "relpack");
    REQUIRE(vars.at("version") == "v1.4.0");
    REQUIRE(vars.at("tag") == "v1.4.0");
    REQUIRE(vars.at("version_num") == "1.4.0");
    REQUIRE(vars.at("product") == "relpack");
    REQUIRE(vars.at("date").size() == 10);
    REQUIRE(render_template("checksums_{{ version_num }}.txt", vars).value() ==
            "checksums_1.4.0.txt");
}

TEST_CASE("UTC timestamps", "[template]") {
    auto date = utc_date();
    REQUIRE(date.size() == 10);
    REQUIRE(date[4] == '-');
    REQUIRE(date[7] == '-');
    auto ts = utc_timestamp();
    REQUIRE(ts.size() == 23);
    REQUIRE(ts.substr(ts.size() - 4) == " UTC");
}
