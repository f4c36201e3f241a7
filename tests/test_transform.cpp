// Copyright (c) Created by MWAC-dev on 2026.
// tests/test_transform.cpp
#include "test_context.hpp"

#include "nls/errors.hpp"
#include "nls/markup.hpp"
#include "nls/naming.hpp"
#include "nls/rule_adapters.hpp"
#include "nls/templates.hpp"
#include "nls/transform.hpp"

#include <nlohmann/json.hpp>

#include <string>

using nls::test::TestContext;

namespace {

const char* kRail =
    "<?xml version=\"1.0\"?>\n"
    "<root>\n"
    "  <material>\n"
    "    <renderpass>\n"
    "      <color r=\"0.8\" g=\"0.8\" b=\"0.8\"/>\n"
    "      <texunit>\n"
    "        <map>rail.png</map>\n"
    "        <texcoordgen>\n"
    "          <tilingwidth>10.0</tilingwidth>\n"
    "          <tilingheight> 4.00 </tilingheight>\n"
    "          <density>4.0</density>\n"
    "        </texcoordgen>\n"
    "        <uvscale>0.5</uvscale>\n"
    "        <future level=\"2.5\">3.0</future>\n"
    "      </texunit>\n"
    "    </renderpass>\n"
    "  </material>\n"
    "</root>\n";

const char* kTrack =
    "<?xml version=\"1.0\"?>\n"
    "<root>\n"
    "  <sceneobject>\n"
    "    <name>Track</name>\n"
    "    <preview>preview.png</preview>\n"
    "    <usercolor r=\"1\" g=\"0\" b=\"0\"/>\n"
    "    <shape length=\"2.5\" id=\"7\">\n"
    "      <material>rail.nl2mat</material>\n"
    "      <dimensions>1.0 0.5 2.0</dimensions>\n"
    "    </shape>\n"
    "    <shape length=\"1\">\n"
    "      <material> R&amp;D.nl2mat </material>\n"
    "    </shape>\n"
    "  </sceneobject>\n"
    "</root>\n";

struct Fixture {
    nls::RuleTable table;
    const nls::DocumentRules* material{nullptr};
    const nls::DocumentRules* object{nullptr};

    const nls::ScaleFactor& scale(const std::string& tag) const { return *table.find_scale(tag); }
};

bool load_fixture(TestContext& ctx, Fixture& fx) {
    try {
        fx.table = nls::LoadRuleTable(NLS_TEMPLATES_DIR);
    } catch (const std::exception& e) {
        ctx.expect_true(false, std::string("shipped templates load: ") + e.what());
        return false;
    }
    fx.material = fx.table.find_document("rail.nl2mat");
    fx.object = fx.table.find_document("track.nl2sco");
    return fx.material && fx.object;
}

std::string field(const nls::Document& doc, const std::string& path) {
    const nls::Node* n = doc.find(path);
    return n ? n->raw_text() : "<missing>";
}

void test_identity(TestContext& ctx, const Fixture& fx) {
    const nls::Document rail = nls::ParseDocument(kRail, "rail.nl2mat");
    const nls::Document same = nls::Transform(rail, fx.scale("x1"), fx.table, *fx.material, "rail.nl2mat");
    ctx.expect_true(same == rail, "x1 gives a structurally equal material");
    ctx.expect_eq(nls::SerializeDocument(same), std::string(kRail), "x1 material is byte identical");

    const nls::Document track = nls::ParseDocument(kTrack, "track.nl2sco");
    const nls::Document track1 = nls::Transform(track, fx.scale("x1"), fx.table, *fx.object, "track.nl2sco");
    ctx.expect_eq(nls::SerializeDocument(track1), std::string(kTrack), "x1 object is byte identical");
}

void test_linear_and_inverse(TestContext& ctx, const Fixture& fx) {
    const nls::Document rail = nls::ParseDocument(kRail, "rail.nl2mat");
    const nls::Document x2 = nls::Transform(rail, fx.scale("x2"), fx.table, *fx.material, "rail.nl2mat");
    const std::string tc = "material/renderpass/texunit/texcoordgen/";
    ctx.expect_eq(field(x2, tc + "tilingwidth"), std::string("20.0"), "tiling width doubles");
    ctx.expect_eq(field(x2, tc + "tilingheight"), std::string(" 8.00 "), "padding and precision are kept");
    ctx.expect_eq(field(x2, tc + "density"), std::string("2.0"), "density is divided");
    ctx.expect_eq(field(x2, "material/renderpass/texunit/uvscale"), std::string("0.3"), "0.25 rounds half away");
    ctx.expect_eq(field(x2, "material/renderpass/texunit/map"), std::string("rail.png"), "texture name untouched");

    const nls::Document x3 = nls::Transform(rail, fx.scale("x3"), fx.table, *fx.material, "rail.nl2mat");
    ctx.expect_eq(field(x3, tc + "tilingwidth"), std::string("30.0"), "tiling width triples");
    ctx.expect_eq(field(x3, tc + "density"), std::string("1.3"), "4.0 / 3");

    ctx.expect_eq(field(rail, tc + "tilingwidth"), std::string("10.0"), "source document is not modified");
}

void test_unknown_fields(TestContext& ctx, const Fixture& fx) {
    const nls::Document rail = nls::ParseDocument(kRail, "rail.nl2mat");
    const nls::Document x4 = nls::Transform(rail, fx.scale("x4"), fx.table, *fx.material, "rail.nl2mat");
    const nls::Node* future = x4.find("material/renderpass/texunit/future");
    ctx.expect_true(future && future->raw_text() == "3.0", "unknown element text passes through");
    ctx.expect_true(future && future->attribute("level") && future->attribute("level")->value == "2.5",
                    "unknown attribute passes through");
    const nls::Node* color = x4.find("material/renderpass/color");
    ctx.expect_true(color && color->attribute("r")->value == "0.8", "colors are untouched");

    const std::string out = nls::SerializeDocument(x4);
    ctx.expect_true(out.find("<future level=\"2.5\">3.0</future>") != std::string::npos, "serialized verbatim");
    ctx.expect_true(out.find("<?xml version=\"1.0\"?>\n<root>\n  <material>") == 0, "prolog is kept");
}

void test_object(TestContext& ctx, const Fixture& fx) {
    const nls::Document track = nls::ParseDocument(kTrack, "track.nl2sco");
    const nls::Document x2 = nls::Transform(track, fx.scale("x2"), fx.table, *fx.object, "track.nl2sco");
    const nls::Node* shape = x2.find("sceneobject/shape");
    ctx.expect_true(shape && shape->attribute("length")->value == "5.0", "length attribute scales");
    ctx.expect_true(shape && shape->attribute("id")->value == "7", "other attributes stay");
    ctx.expect_eq(field(x2, "sceneobject/shape/dimensions"), std::string("2.0 1.0 4.0"), "every token scales");
    ctx.expect_eq(field(x2, "sceneobject/shape/material"), std::string("rail.nl2mat"),
                  "empty suffix keeps the reference, the scale directory separates variants");
}

void test_references(TestContext& ctx, const Fixture& fx) {
    nls::RuleTable table = fx.table;
    for (auto& s : table.scales) s.file_suffix = "_{tag}";
    const nls::DocumentRules* object = table.find_document("track.nl2sco");
    const nls::ScaleFactor& x2 = *table.find_scale("x2");

    const nls::Document track = nls::ParseDocument(kTrack, "track.nl2sco");
    const nls::Document out = nls::Transform(track, x2, table, *object, "track.nl2sco");
    ctx.expect_eq(field(out, "sceneobject/shape/material"), std::string("rail_x2.nl2mat"), "reference gets the suffix");
    ctx.expect_true(nls::SerializeDocument(out).find("<material> R&amp;D_x2.nl2mat </material>") != std::string::npos,
                    "escaped reference is rewritten and re-escaped");

    const auto written = nls::ScaledOutputPath("/out", x2, "shapes/rail.nl2mat");
    ctx.expect_eq(written.generic_string(), std::string("/out/x2/shapes/rail_x2.nl2mat"), "output path");
    ctx.expect_eq(written.filename().string(), field(out, "sceneobject/shape/material"),
                  "reference and written file share one naming function");

    const auto refs = nls::CollectReferences(track, *object);
    ctx.expect_eq(refs.size(), std::size_t(2), "two references");
    if (refs.size() == 2) {
        ctx.expect_eq(refs[0].value, std::string("rail.nl2mat"), "first reference");
        ctx.expect_eq(refs[1].value, std::string("R&D.nl2mat"), "references are unescaped and trimmed");
        ctx.expect_eq(refs[0].line, std::size_t(8), "reference line");
        ctx.expect_eq(refs[0].path, std::string("sceneobject/shape/material"), "reference field");
    }

    const auto previews = nls::CollectCompanions(track, *object);
    ctx.expect_true(previews.size() == 1 && previews[0].value == "preview.png", "preview companion");
    const nls::Document rail = nls::ParseDocument(kRail, "rail.nl2mat");
    const auto maps = nls::CollectCompanions(rail, *fx.material);
    ctx.expect_true(maps.size() == 1 && maps[0].value == "rail.png", "texture companion");
}

void test_naming(TestContext& ctx) {
    const nls::ScaleFactor x2{"x2", 2, 1, "_{tag}"};
    const nls::ScaleFactor plain{"x2", 2, 1, ""};
    ctx.expect_eq(nls::ScaledFileName("rail.nl2mat", x2), std::string("rail_x2.nl2mat"), "suffix before extension");
    ctx.expect_eq(nls::ScaledFileName("mats\\rail.nl2mat", x2), std::string("mats\\rail_x2.nl2mat"), "backslash dirs");
    ctx.expect_eq(nls::ScaledFileName("v1.2/rail", x2), std::string("v1.2/rail_x2"), "dot in directory only");
    ctx.expect_eq(nls::ScaledFileName(".hidden", x2), std::string(".hidden_x2"), "leading dot is not an extension");
    ctx.expect_eq(nls::ScaledFileName("rail.nl2mat", plain), std::string("rail.nl2mat"), "empty suffix");
}

void test_errors(TestContext& ctx, const Fixture& fx) {
    const nls::Document rail = nls::ParseDocument(kRail, "rail.nl2mat");
    const nls::ScaleFactor x5{"x5", 5, 1, ""};
    ctx.expect_throws<nls::UnsupportedScaleFactorError>(
        [&] { nls::Transform(rail, x5, fx.table, *fx.material); }, "factor outside the table");

    const nls::Document bad = nls::ParseDocument(
        "<root>\n<material><renderpass><texunit><uvscale>wide</uvscale></texunit></renderpass></material>\n</root>");
    ctx.total_checks += 1;
    try {
        nls::Transform(bad, fx.scale("x2"), fx.table, *fx.material, "bad.nl2mat");
        ctx.failed_checks += 1;
        std::cout << "FAILED: non-numeric scaled field is rejected\n";
    } catch (const nls::MalformedInputError& e) {
        const std::string what = e.what();
        if (e.line() != 2 || what.find("material/renderpass/texunit/uvscale") == std::string::npos) {
            ctx.failed_checks += 1;
            std::cout << "FAILED: error names field and line: " << what << '\n';
        }
    }

    const nls::Document wrongRoot = nls::ParseDocument("<scene><material/></scene>");
    ctx.expect_throws<nls::MalformedInputError>([&] { nls::CheckRoot(wrongRoot, *fx.material, "x.nl2mat"); },
                                                "root element must match the template");
}

void test_text_rule_on_parent(TestContext& ctx, const Fixture& fx) {
    const auto rules = nlohmann::json::parse(R"({
        "document": "material", "extension": ".nl2mat",
        "rules": [ { "path": "a", "kind": "scale-linear" }, { "path": "a/b", "kind": "scale-linear" } ]
    })").get<nls::DocumentRules>();
    const nls::Document doc = nls::ParseDocument("<r><a>1.0<b>2.0</b></a></r>");
    const nls::Document out = nls::Transform(doc, fx.scale("x2"), fx.table, rules);
    ctx.expect_eq(nls::SerializeDocument(out), std::string("<r><a>1.0<b>4.0</b></a></r>"),
                  "text rules only apply to leaf elements");
}

} // namespace

int main() {
    TestContext ctx;
    Fixture fx;
    if (load_fixture(ctx, fx)) {
        test_identity(ctx, fx);
        test_linear_and_inverse(ctx, fx);
        test_unknown_fields(ctx, fx);
        test_object(ctx, fx);
        test_references(ctx, fx);
        test_errors(ctx, fx);
        test_text_rule_on_parent(ctx, fx);
    } else {
        ctx.expect_true(false, "material and object templates are shipped");
    }
    test_naming(ctx);
    ctx.summary();
    return ctx.exit_code();
}
