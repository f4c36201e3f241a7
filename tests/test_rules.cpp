// Copyright (c) Created by MWAC-dev on 2026.
// tests/test_rules.cpp
#include "test_context.hpp"

#include "nls/errors.hpp"
#include "nls/rule_adapters.hpp"
#include "nls/rules.hpp"
#include "nls/templates.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;
using nls::test::TempDir;
using nls::test::TestContext;
using nls::test::write_file;

namespace {

const char* kScales = R"({
  "config_version": "1.0.0",
  "kind": "scales",
  "scales": [
    { "tag": "x1", "factor": 1 },
    { "tag": "x2", "factor": 2 },
    { "tag": "x1.5", "factor": "3/2", "file_suffix": "_{tag}" }
  ],
  "default_scales": ["x1", "x2"]
})";

const char* kMaterial = R"({
  "config_version": "1.0.0",
  "kind": "document",
  "document": "material",
  "extension": ".NL2MAT",
  "root": "root",
  "rules": [
    { "path": "material/*/tilingwidth", "kind": "scale-inverse" },
    { "path": "material/texcoordgen/tilingwidth", "kind": "scale-linear", "decimals": 3 },
    { "path": "material/*/tilingwidth", "kind": "identity" },
    { "path": "material/shape@length", "kind": "scale-linear" }
  ]
})";

void test_field_paths(TestContext& ctx) {
    nls::FieldPath p;
    std::string err;
    ctx.expect_true(nls::FieldPath::Parse("a/b/c", p, err) && p.segments.size() == 3 && p.attribute.empty(), "a/b/c");
    ctx.expect_true(nls::FieldPath::Parse("a/*@len", p, err) && p.attribute == "len" && p.has_wildcard(), "a/*@len");
    ctx.expect_eq(p.str(), std::string("a/*@len"), "str() gives the path back");
    ctx.expect_true(p.matches({"a", "anything"}, "len"), "wildcard matches any element name");
    ctx.expect_false(p.matches({"a", "b", "c"}, "len"), "wildcard matches exactly one segment");
    ctx.expect_false(p.matches({"a", "b"}, ""), "attribute path does not match text");

    for (const char* bad : {"", "a//b", "a/b@", "a/b@*", "a b", "/a"}) {
        ctx.expect_false(nls::FieldPath::Parse(bad, p, err), std::string("rejects path '") + bad + "'");
    }
}

void test_ratios(TestContext& ctx) {
    std::int64_t n = 0, d = 0;
    ctx.expect_true(nls::ParseRatio("2", n, d) && n == 2 && d == 1, "integer ratio");
    ctx.expect_true(nls::ParseRatio("6/4", n, d) && n == 3 && d == 2, "fractions are reduced");
    ctx.expect_true(nls::ParseRatio("1.5", n, d) && n == 3 && d == 2, "decimal ratio");
    ctx.expect_true(nls::ParseRatio("0.25", n, d) && n == 1 && d == 4, "quarter");
    ctx.expect_false(nls::ParseRatio("0", n, d), "zero is not a scale");
    ctx.expect_false(nls::ParseRatio("-2", n, d), "negative is not a scale");
    ctx.expect_false(nls::ParseRatio("1/0", n, d), "zero denominator");
    ctx.expect_false(nls::ParseRatio("x2", n, d), "tag is not a ratio");
    ctx.expect_false(nls::ParseRatio("0.1234567891", n, d), "too many decimal places for a ratio");
}

void test_rule_precedence(TestContext& ctx) {
    TempDir dir("nls_rules");
    write_file(dir.path() / "scales.json", kScales);
    write_file(dir.path() / "nl2mat.json", kMaterial);

    const nls::RuleTable table = nls::LoadRuleTable(dir.path());
    const nls::DocumentRules* mat = table.find_document("some/Rail.Nl2Mat");
    ctx.expect_true(mat != nullptr, "extension lookup ignores case");
    if (!mat) return;
    ctx.expect_true(mat->role == nls::DocumentRole::Material, "role defaults to the document name");

    const nls::TransformRule* exact = mat->find({"material", "texcoordgen", "tilingwidth"}, "");
    ctx.expect_true(exact && exact->kind == nls::TransformKind::ScaleLinear && exact->decimals == 3,
                    "exact path beats an earlier wildcard");
    const nls::TransformRule* wild = mat->find({"material", "other", "tilingwidth"}, "");
    ctx.expect_true(wild && wild->kind == nls::TransformKind::ScaleInverse, "first wildcard in file order wins");
    const nls::TransformRule* attr = mat->find({"material", "shape"}, "length");
    ctx.expect_true(attr && attr->kind == nls::TransformKind::ScaleLinear, "attribute rule");
    ctx.expect_true(mat->find({"material", "shape"}, "") == nullptr, "no rule means identity");

    ctx.expect_eq(table.default_set().size(), std::size_t(2), "default set");
    const nls::ScaleFactor* half = table.find_scale("1.5");
    ctx.expect_true(half && half->tag == "x1.5", "scale lookup by value");
    ctx.expect_true(table.find_scale("3/2") == half, "scale lookup by ratio");
    ctx.expect_true(table.find_scale("x2") && table.find_scale("x2")->numerator == 2, "scale lookup by tag");
    ctx.expect_true(table.find_scale("5") == nullptr, "unknown scale");

    nls::ScaleFactor forged{"x2", 5, 1, ""};
    ctx.expect_false(table.supports(forged), "a tag with another ratio is not supported");
    ctx.expect_true(table.supports(*table.find_scale("x2")), "a table scale is supported");

    const nls::ScaleFactor wide{"w", 4000000000, 3, ""};
    const nls::ScaleFactor wider{"w", 4000000001, 3000000001, ""};
    ctx.expect_true(wide == wide, "equal ratios compare equal");
    ctx.expect_false(wide == wider, "large ratios compare without overflow");

    json j = table;
    ctx.expect_eq(j["scales"][2]["factor"].get<std::string>(), std::string("3/2"), "rule table serializes");
    ctx.expect_eq(j["documents"][0]["extension"].get<std::string>(), std::string(".nl2mat"), "extension is lowercased");
}

void expect_template_error(TestContext& ctx, const std::string& material, const std::string& message,
                           const std::string& scales = kScales) {
    TempDir dir("nls_rules");
    write_file(dir.path() / "scales.json", scales);
    if (!material.empty()) write_file(dir.path() / "nl2mat.json", material);
    ctx.expect_throws<nls::TemplateLoadError>([&] { nls::LoadRuleTable(dir.path()); }, message);
}

void test_malformed_templates(TestContext& ctx) {
    ctx.expect_throws<nls::TemplateLoadError>([] { nls::LoadRuleTable("/nonexistent/templates"); },
                                              "missing directory");

    expect_template_error(ctx, "{ not json", "malformed JSON");
    expect_template_error(ctx, "", "no document template");
    expect_template_error(ctx, R"({"kind":"document","document":"material","extension":".nl2mat",
        "rules":[{"path":"a/b","kind":"scale-cubic"}]})", "unknown transform kind");
    expect_template_error(ctx, R"({"kind":"document","document":"material","extension":".nl2mat",
        "rules":[{"path":"a//b","kind":"identity"}]})", "invalid field path");
    expect_template_error(ctx, R"({"kind":"document","document":"prop","extension":".nl2mat"})", "unknown role");
    expect_template_error(ctx, R"({"kind":"document","document":"material","extension":"nl2mat"})",
                          "extension without a dot");
    expect_template_error(ctx, R"({"kind":"mystery"})", "unknown template kind");
    expect_template_error(ctx, R"({"config_version":"2.0.0","kind":"document","document":"material","extension":".nl2mat"})",
                          "unsupported config version");
    expect_template_error(ctx, R"({"kind":"document","document":"material","extension":".nl2mat",
        "rules":[{"path":"a","kind":"scale-linear","decimals":40}]})", "decimals out of range");

    const std::string material = R"({"kind":"document","document":"material","extension":".nl2mat"})";
    expect_template_error(ctx, material, "duplicate scale tag",
                          R"({"kind":"scales","scales":[{"tag":"x2","factor":2},{"tag":"x2","factor":3}]})");
    expect_template_error(ctx, material, "duplicate factor",
                          R"({"kind":"scales","scales":[{"tag":"x2","factor":2},{"tag":"two","factor":"4/2"}]})");
    expect_template_error(ctx, material, "zero factor", R"({"kind":"scales","scales":[{"tag":"x0","factor":0}]})");
    expect_template_error(ctx, material, "integer factor out of range",
                          R"({"kind":"scales","scales":[{"tag":"big","factor":9223372036854775807}]})");
    expect_template_error(ctx, material, "tag with a separator",
                          R"({"kind":"scales","scales":[{"tag":"a/b","factor":2}]})");
    expect_template_error(ctx, material, "empty scale list", R"({"kind":"scales","scales":[]})");

    {
        TempDir dir("nls_rules");
        write_file(dir.path() / "a.json", kScales);
        write_file(dir.path() / "b.json", material);
        write_file(dir.path() / "c.json", material);
        ctx.expect_throws<nls::TemplateLoadError>([&] { nls::LoadRuleTable(dir.path()); },
                                                  "two templates for one extension");
    }
    {
        TempDir dir("nls_rules");
        write_file(dir.path() / "scales.json",
                   R"({"kind":"scales","scales":[{"tag":"x1","factor":1}],"default_scales":["x9"]})");
        write_file(dir.path() / "nl2mat.json", material);
        ctx.expect_throws<nls::UnsupportedScaleFactorError>([&] { nls::LoadRuleTable(dir.path()); },
                                                            "unknown default scale");
    }
    {
        TempDir dir("nls_rules");
        write_file(dir.path() / "scales.json", kScales);
        write_file(dir.path() / "nl2mat.json", material);
        write_file(dir.path() / "notes.txt", "not a template");
        bool loaded = false;
        try {
            loaded = nls::LoadRuleTable(dir.path()).documents.size() == 1;
        } catch (const std::exception& e) {
            std::cout << "  " << e.what() << '\n';
        }
        ctx.expect_true(loaded, "files other than *.json are ignored");
    }
}

void test_shipped_templates(TestContext& ctx) {
    nls::RuleTable table;
    try {
        table = nls::LoadRuleTable(NLS_TEMPLATES_DIR);
    } catch (const std::exception& e) {
        ctx.expect_true(false, std::string("shipped templates load: ") + e.what());
        return;
    }
    ctx.expect_eq(table.scales.size(), std::size_t(4), "four shipped scales");
    ctx.expect_eq(table.default_set().size(), std::size_t(4), "all of them by default");
    ctx.expect_true(table.scales.front().is_identity(), "x1 is the identity");

    const nls::DocumentRules* mat = table.find_document("rail.nl2mat");
    const nls::DocumentRules* sco = table.find_document("track.nl2sco");
    ctx.expect_true(mat && mat->role == nls::DocumentRole::Material, "material template");
    ctx.expect_true(sco && sco->role == nls::DocumentRole::Object, "object template");
    if (!mat || !sco) return;

    const auto* tiling = mat->find({"material", "renderpass", "texunit", "texcoordgen", "tilingwidth"}, "");
    ctx.expect_true(tiling && tiling->kind == nls::TransformKind::ScaleLinear, "tiling width scales");
    const auto* color = mat->find({"material", "renderpass", "texunit", "color"}, "");
    ctx.expect_true(color && color->kind == nls::TransformKind::Identity, "colors are identity");
    const auto* reference = sco->find({"sceneobject", "shape", "material"}, "");
    ctx.expect_true(reference && reference->kind == nls::TransformKind::FilenameSuffix, "material references");
    ctx.expect_eq(sco->companions.size(), std::size_t(1), "preview is a companion");
    ctx.expect_true(table.find_document("readme.txt") == nullptr, "other files have no template");
}

} // namespace

int main() {
    TestContext ctx;
    test_field_paths(ctx);
    test_ratios(ctx);
    test_rule_precedence(ctx);
    test_malformed_templates(ctx);
    test_shipped_templates(ctx);
    ctx.summary();
    return ctx.exit_code();
}
