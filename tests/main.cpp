#include <planwise/ast/Nodes.hpp>
#include <planwise/catalog/Catalog.hpp>
#include <planwise/config/Config.hpp>
#include <planwise/config/TomlLite.hpp>
#include <planwise/diag/DiagCode.hpp>
#include <planwise/eval/Evaluator.hpp>
#include <planwise/grid/Grid.hpp>
#include <planwise/json/Json.hpp>
#include <planwise/parse/Resolver.hpp>
#include <planwise/render/Render.hpp>
#include <planwise/validate/Validator.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace planwise;

namespace {

const std::filesystem::path kCases = PLANWISE_TEST_CASE_DIR;

bool fail(const std::string& what) {
    std::cerr << what << "\n";
    return false;
}

bool load_fixture(catalog::CatalogStore& store, diag::Bag& bag) {
    if (!catalog::load_json_file(kCases / "course_db.json", store, bag) || bag.has_error()) {
        std::cerr << "fixture catalog failed to load:\n" << bag.render_text();
        return false;
    }
    return true;
}

const eval::MissingAnyOf* as_any(const eval::MissingInfo& m) {
    return std::get_if<eval::MissingAnyOf>(&m);
}

const eval::MissingCourse* as_course(const eval::MissingInfo& m) {
    return std::get_if<eval::MissingCourse>(&m);
}

size_t count_kind(const std::vector<validate::PlacementError>& errors, validate::RuleKind k) {
    size_t n = 0;
    for (const auto& e : errors) {
        if (e.kind == k) ++n;
    }
    return n;
}

/// Fixture plan: a catalog, a resolver, a grid and a validator bound together.
struct Fixture {
    diag::Bag bag{};
    catalog::CatalogStore store{};
    grid::SemesterOrder order = grid::default_semester_order(4);
    grid::PlanGrid plan{};
    std::unique_ptr<parse::Resolver> resolver{};
    std::unique_ptr<validate::Validator> validator{};

    bool init() {
        if (!load_fixture(store, bag)) return false;
        plan.init_semesters(order);
        resolver = std::make_unique<parse::Resolver>(store, bag);
        validator = std::make_unique<validate::Validator>(store, *resolver, plan);
        return true;
    }

    std::vector<validate::PlacementError> check(const std::string& code, const std::string& semester) {
        const catalog::Course* c = store.course(code);
        if (c == nullptr) return {};
        return validator->validate_placement(*c, semester, order, bag);
    }
};

bool run_courseset_id_case() {
    const char* good[] = {"ECE435H1_p6", "MAT186H1_e1", "CS101Y1_c2", "ABCD999H9_p10"};
    const char* bad[] = {"ECE435H1", "X_p1", "E435H1_p1", "ABCDE100H1_p1", "ECE43H1_p1",
                         "ECE435Z1_p1", "ECE435H1_q1", "ECE435H1_p", "ECE435H1_p1x", "ece435H1_p1"};
    for (const char* id : good) {
        if (!parse::is_courseset_id(id)) return fail(std::string("expected courseset id: ") + id);
    }
    for (const char* id : bad) {
        if (parse::is_courseset_id(id)) return fail(std::string("not a courseset id: ") + id);
    }
    return true;
}

bool run_catalog_load_case() {
    diag::Bag bag;
    catalog::CatalogStore store;
    if (!load_fixture(store, bag)) return false;

    if (store.courses().size() != 27) return fail("fixture should hold 27 courses");
    if (store.courseset_count() != 13) return fail("fixture should hold 13 coursesets");

    const auto* ece435 = store.course("ECE435H1");
    if (ece435 == nullptr || ece435->session != catalog::Session::kFall ||
        ece435->prerequisites.value_or("") != "ECE435H1_p6" || ece435->corequisites.has_value()) {
        return fail("ECE435H1 loaded incorrectly");
    }
    if (store.course("ECE159H1")->session != catalog::Session::kWinter) return fail("S should mean Winter");
    if (store.course("ECE302H1")->session != catalog::Session::kBoth) return fail("B should mean Both");

    const auto groups = store.groups();
    const std::vector<std::string> want_groups{"Communications", "Core", "Photonics", "Software"};
    if (groups != want_groups) return fail("groups should be sorted and unique");

    if (store.courseset_expression("ECE464H1_p3").value_or("") != "ECE464H1_p1 / ECE464H1_p2") {
        return fail("courseset expression lookup failed");
    }
    if (store.courseset_expression("ECE999H1_p1").has_value()) return fail("unknown courseset should be absent");
    return true;
}

bool run_catalog_anomaly_case() {
    const std::string text = R"({
      "courses": [
        { "code": "AAA100H1", "title": "First", "session": "F" },
        { "code": "AAA100H1", "title": "Second", "session": "S" },
        { "title": "No code" },
        42,
        { "code": "BBB100H1", "session": "summer" }
      ],
      "coursesets": {
        "AAA100H1_p1": "BBB100H1",
        "AAA100H1_p2": { "note": "no expression" }
      }
    })";

    diag::Bag bag;
    catalog::CatalogStore store;
    if (!catalog::load_json(text, "inline.json", store, bag)) return fail("anomalies must not fail the load");
    if (bag.has_error()) return fail("anomalies must be warnings");

    if (store.courses().size() != 2) return fail("expected 2 usable courses");
    if (store.course("AAA100H1")->title != "First") return fail("first duplicate entry should win");
    if (!bag.has_code(diag::Code::C_DUPLICATE_COURSE)) return fail("missing C_DUPLICATE_COURSE");
    if (bag.count_code(diag::Code::C_CATALOG_SHAPE) != 4) {
        std::cerr << bag.render_text();
        return fail("expected 4 C_CATALOG_SHAPE warnings");
    }
    if (store.course("BBB100H1")->session != catalog::Session::kBoth) return fail("bad session should default to Both");
    if (store.courseset_expression("AAA100H1_p1").value_or("") != "BBB100H1") return fail("plain string courseset");
    if (store.courseset_expression("AAA100H1_p2").has_value()) return fail("courseset without expression kept");

    diag::Bag bad;
    catalog::CatalogStore empty;
    if (catalog::load_json("{ \"courses\": [ ", "broken.json", empty, bad)) return fail("broken JSON accepted");
    if (!bad.has_code(diag::Code::C_JSON_INVALID)) return fail("missing C_JSON_INVALID");

    bad.clear();
    if (catalog::load_json("{ \"coursesets\": {} }", "nocourses.json", empty, bad)) return fail("missing courses accepted");
    if (!bad.has_code(diag::Code::C_CATALOG_SHAPE)) return fail("missing C_CATALOG_SHAPE for absent courses");

    bad.clear();
    if (catalog::load_json_file(kCases / "does_not_exist.json", empty, bad)) return fail("missing file accepted");
    if (!bad.has_code(diag::Code::C_FILE_READ_FAILED)) return fail("missing C_FILE_READ_FAILED");
    return true;
}

bool run_json_case() {
    const auto r = json::parse(R"({"a": [1, true, null, "x\u00e9\n"], "b": {"c": "\ud83d\ude00"}})");
    if (!r.ok) return fail("json parse failed");
    const json::Value* a = json::get(r.value, "a");
    if (a == nullptr || !a->is_array() || a->array_v.size() != 4) return fail("json array shape");
    if (a->array_v[3].string_v != "x\xc3\xa9\n") return fail("json escape decoding");
    const json::Value* b = json::get(r.value, "b");
    if (b == nullptr || json::get_string(*b, "c").value_or("") != "\xf0\x9f\x98\x80") return fail("surrogate pair");
    if (json::get_string(r.value, "a").has_value()) return fail("non-string member read as string");

    if (json::parse("{\"a\": 1,}").ok) return fail("trailing comma accepted");
    if (json::parse("[1] 2").ok) return fail("trailing content accepted");

    // Surrogates must come as a high/low pair.
    if (json::parse(R"("\ud83d\u0041")").ok) return fail("high surrogate followed by a non-surrogate accepted");
    if (json::parse(R"("\ud83d")").ok) return fail("lone high surrogate accepted");
    if (json::parse(R"("\ude00x")").ok) return fail("lone low surrogate accepted");
    if (json::parse(R"(["\ud83d", "a"])").ok) return fail("unpaired surrogate inside an array accepted");
    if (json::escape("a\"b\\c\n") != "a\\\"b\\\\c\\n") return fail("json escape");
    return true;
}

bool run_resolve_cache_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto first = f.resolver->resolve("ECE435H1_p6");
    const auto second = f.resolver->resolve("ECE435H1_p6");
    if (!first || first != second) return fail("repeated resolve should return the cached tree");

    // p6 and its five operands are cached.
    if (f.resolver->cache_size() != 6) return fail("expected 6 cached coursesets");
    if (f.resolver->resolve("ECE435H1_p1") != first->as_all_of()->children.front()) {
        return fail("operand subtree should be shared with the cache");
    }

    if (f.resolver->resolve("") != nullptr) return fail("empty id should be no requirement");

    const size_t primed = f.resolver->prime(f.store.courseset_ids());
    if (primed != 13) return fail("every fixture courseset should produce a tree");
    return true;
}

bool run_resolve_concurrent_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto expected = f.resolver->resolve("ECE464H1_p3");
    std::vector<ast::NodePtr> seen(8);
    std::vector<std::thread> workers{};
    for (size_t i = 0; i < seen.size(); ++i) {
        workers.emplace_back([&, i] {
            seen[i] = f.resolver->resolve(i % 2 == 0 ? "ECE464H1_p3" : "ECE435H1_p6");
        });
    }
    for (auto& w : workers) w.join();

    const auto other = f.resolver->resolve("ECE435H1_p6");
    for (size_t i = 0; i < seen.size(); ++i) {
        const auto& want = (i % 2 == 0) ? expected : other;
        if (seen[i] != want) return fail("concurrent resolve returned a different tree");
    }
    return true;
}

// ECE435H1_p6 is an AND of five two-way ORs.
bool run_and_of_ors_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto tree = f.resolver->resolve("ECE435H1_p6");
    const auto r = eval::evaluate(tree, {});
    if (r.satisfied || r.missing.size() != 5) return fail("expected 5 missing OR groups");

    const std::vector<std::vector<std::string>> want{
        {"ECE216H1", "ECE221H1"},
        {"ECE231H1", "ECE295H1"},
        {"MAT290H1", "MAT291H1"},
        {"ECE302H1", "STA286H1"},
        {"ECE320H1", "ECE357H1"},
    };
    for (size_t i = 0; i < want.size(); ++i) {
        const auto* any = as_any(r.missing[i]);
        if (any == nullptr || any->options != want[i]) return fail("OR group " + std::to_string(i) + " wrong");
    }

    const auto partial = eval::evaluate(tree, {"ECE221H1", "ECE295H1", "MAT290H1", "STA286H1"});
    if (partial.satisfied || partial.missing.size() != 1) return fail("expected one remaining OR group");

    const auto full = eval::evaluate(tree, {"ECE221H1", "ECE295H1", "MAT290H1", "STA286H1", "ECE357H1"});
    if (!full.satisfied || !full.missing.empty()) return fail("all groups covered should satisfy");
    return true;
}

// ECE464H1_p3 is an OR of two ANDs.
bool run_or_of_ands_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto tree = f.resolver->resolve("ECE464H1_p3");
    if (!tree || !tree->is_any_of() || tree->as_any_of()->children.size() != 2) return fail("expected OR of two");

    if (!eval::evaluate(tree, {"ECE417H1", "MIE286H1"}).satisfied) return fail("second branch should satisfy");
    if (!eval::evaluate(tree, {"ECE302H1", "ECE316H1", "ECE417H1"}).satisfied) return fail("first branch should satisfy");

    const auto r = eval::evaluate(tree, {"ECE417H1"});
    if (r.satisfied || r.missing.size() != 1) return fail("expected one missing OR");
    const auto* any = as_any(r.missing.front());
    const std::vector<std::string> leaves{"ECE302H1", "ECE316H1", "ECE417H1", "ECE417H1", "MIE286H1"};
    if (any == nullptr || any->options != leaves) return fail("OR options should be every leaf in tree order");

    const std::vector<std::string> shown{"ECE302H1", "ECE316H1", "ECE417H1", "MIE286H1"};
    if (render::unique_options(*any) != shown) return fail("display options should be de-duplicated");

    if (render::to_readable(tree) != "((ECE302H1 and ECE316H1 and ECE417H1) or (ECE417H1 and MIE286H1))") {
        return fail("AND alternatives should keep their parentheses, got: " + render::to_readable(tree));
    }
    return true;
}

bool run_evaluate_shape_case() {
    if (!eval::evaluate(ast::NodePtr{}, {}).satisfied) return fail("null tree should be satisfied");

    const auto tree = ast::make_all_of({
        ast::make_course("A"),
        ast::make_any_of({ast::make_course("B"), ast::make_course("C")}),
        ast::make_all_of({ast::make_course("D"), ast::make_course("E")}),
    });

    const auto r = eval::evaluate(tree, {});
    if (r.satisfied || r.missing.size() != 4) return fail("AND misses should be flattened");
    if (as_course(r.missing[0]) == nullptr || as_course(r.missing[0])->code != "A") return fail("first miss A");
    if (as_any(r.missing[1]) == nullptr) return fail("second miss should be the OR");
    if (as_course(r.missing[3]) == nullptr || as_course(r.missing[3])->code != "E") return fail("last miss E");

    const auto some = eval::evaluate(tree, {"A", "C", "D"});
    if (some.satisfied || some.missing.size() != 1 || as_course(some.missing[0])->code != "E") {
        return fail("only E should remain");
    }
    return true;
}

bool run_unresolved_courseset_case() {
    Fixture f;
    if (!f.init()) return false;

    if (f.resolver->resolve("ECE496Y1_p1") != nullptr) return fail("unknown courseset should be no requirement");
    if (f.resolver->resolve("ECE496Y1_p1") != nullptr) return fail("unknown courseset should stay absent");
    if (f.bag.count_code(diag::Code::P_UNRESOLVED_COURSESET) != 1) return fail("unknown courseset warned once");

    if (!f.plan.place("fall-1", "ECE496Y1", f.bag)) return fail("place ECE496Y1");
    if (count_kind(f.check("ECE496Y1", "fall-1"), validate::RuleKind::kPrerequisite) != 0) {
        return fail("unresolved prerequisite should be vacuously satisfied");
    }

    // An OR with a vacuous operand is itself vacuous; an AND just drops it.
    if (f.resolver->resolve_field("ECE417H1 / ECE999H1_p1") != nullptr) return fail("vacuous OR operand");
    const auto and_tree = f.resolver->resolve_field("ECE417H1 & ECE998H1_p1");
    if (!and_tree || render::to_readable(and_tree) != "ECE417H1") return fail("vacuous AND operand should drop");
    return true;
}

bool run_cycle_case() {
    const std::string text = R"({
      "courses": [ { "code": "AAA100H1", "session": "B", "prerequisites": "AAA100H1_p1" } ],
      "coursesets": {
        "AAA100H1_p1": { "courses": "AAA100H1_p2" },
        "AAA100H1_p2": { "courses": "AAA100H1_p1" }
      }
    })";

    diag::Bag bag;
    catalog::CatalogStore store;
    if (!catalog::load_json(text, "cycle.json", store, bag)) return fail("cycle catalog load");

    parse::Resolver resolver(store, bag);
    const auto tree = resolver.resolve("AAA100H1_p1");
    if (tree != nullptr) return fail("a pure cycle should resolve to no requirement");
    if (!bag.has_code(diag::Code::P_CYCLIC_COURSESET)) return fail("missing P_CYCLIC_COURSESET");
    if (bag.has_error()) return fail("cycle should be a warning");

    bag.clear();
    if (resolver.resolve("AAA100H1_p2") != nullptr) return fail("the other cycle member is absent too");
    if (bag.count_code(diag::Code::P_CYCLIC_COURSESET) != 1) return fail("cycle seen from AAA100H1_p2 should warn");

    bag.clear();
    if (resolver.resolve("AAA100H1_p1") != nullptr || resolver.resolve("AAA100H1_p2") != nullptr) {
        return fail("cycle members should stay absent");
    }
    if (!bag.empty()) return fail("cached cycle members should not warn again");
    return true;
}

// Each cycle member resolves as if expansion started from it, whatever was
// resolved first.
bool run_cycle_order_case() {
    const std::string text = R"({
      "courses": [
        { "code": "CCC100H1", "session": "B" },
        { "code": "DDD100H1", "session": "B" }
      ],
      "coursesets": {
        "AAA100H1_p1": { "courses": "AAA100H1_p2 & CCC100H1" },
        "AAA100H1_p2": { "courses": "AAA100H1_p1 / DDD100H1" }
      }
    })";

    diag::Bag bag;
    catalog::CatalogStore store;
    if (!catalog::load_json(text, "cycle.json", store, bag)) return fail("cycle catalog load");

    parse::Resolver p2_first(store, bag);
    const auto p2_alone = p2_first.resolve("AAA100H1_p2");
    if (render::to_readable(p2_alone) != "(CCC100H1 or DDD100H1)") {
        return fail("AAA100H1_p2 from scratch: " + render::to_readable(p2_alone));
    }
    if (p2_first.resolve("AAA100H1_p2") != p2_alone) return fail("cycle member should be cached once resolved");
    const auto p1_late = p2_first.resolve("AAA100H1_p1");

    parse::Resolver p1_first(store, bag);
    const auto p1_alone = p1_first.resolve("AAA100H1_p1");
    if (render::to_readable(p1_alone) != "CCC100H1") return fail("AAA100H1_p1 from scratch: " + render::to_readable(p1_alone));
    const auto p2_late = p1_first.resolve("AAA100H1_p2");

    if (render::to_readable(p2_late) != render::to_readable(p2_alone)) {
        return fail("AAA100H1_p2 after AAA100H1_p1: " + render::to_readable(p2_late));
    }
    if (render::to_readable(p1_late) != render::to_readable(p1_alone)) {
        return fail("AAA100H1_p1 after AAA100H1_p2: " + render::to_readable(p1_late));
    }

    // Reached from outside the cycle, the members expand the same way.
    const auto outside = p2_first.resolve_field("AAA100H1_p1 & DDD100H1");
    if (render::to_readable(outside) != "CCC100H1 and DDD100H1") return fail("cycle used from an inline field");
    if (bag.has_error()) return fail("cycles should only warn");
    return true;
}

bool run_malformed_expression_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto tree = f.resolver->resolve("ECE470H1_p1");
    if (!f.bag.has_code(diag::Code::P_MALFORMED_EXPRESSION)) return fail("mixed delimiters should warn");
    if (render::to_readable(tree) != "ECE417H1 and (ECE302H1 or ECE316H1)") {
        return fail("mixed delimiters should read as AND of OR groups, got: " + render::to_readable(tree));
    }

    f.bag.clear();
    const auto gap = f.resolver->resolve_field("ECE417H1 &  & ECE302H1");
    if (!f.bag.has_code(diag::Code::P_MALFORMED_EXPRESSION)) return fail("empty operand should warn");
    if (render::to_readable(gap) != "ECE417H1 and ECE302H1") return fail("empty operand should be dropped");
    return true;
}

bool run_unknown_course_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto tree = f.resolver->resolve("ECE472H1_p1");
    if (f.bag.count_code(diag::Code::P_UNKNOWN_COURSE) != 1) return fail("unknown code should warn once");
    if (render::to_readable(tree) != "(ECE417H1 or XYZ999H1)") return fail("unknown code should stay a leaf");
    if (!eval::evaluate(tree, {"XYZ999H1"}).satisfied) return fail("unknown leaf still matches by code");
    return true;
}

bool run_inline_field_case() {
    Fixture f;
    if (!f.init()) return false;

    const auto leaf = f.resolver->resolve_field("APS105H1");
    if (!leaf || !leaf->is_course() || leaf->as_course()->code != "APS105H1") return fail("plain code field");
    if (f.resolver->resolve_field("APS105H1") != leaf) return fail("inline field should be cached");

    const auto mixed = f.resolver->resolve_field("ECE435H1_p1 & MIE286H1");
    if (render::to_readable(mixed) != "(ECE216H1 or ECE221H1) and MIE286H1") return fail("inline id expansion");

    if (f.resolver->resolve_field("   ") != nullptr) return fail("blank field should be no requirement");
    return true;
}

bool run_render_case() {
    if (!render::to_readable(ast::NodePtr{}).empty()) return fail("null renders empty");
    if (render::to_readable(ast::make_any_of({ast::make_course("A")})) != "A") return fail("single-child OR");

    const auto tree = ast::make_all_of({
        ast::make_course("A"),
        ast::make_any_of({ast::make_course("B"), ast::make_course("C")}),
    });
    if (render::to_readable(tree) != "A and (B or C)") return fail("AND with nested OR");

    const auto alternatives = ast::make_any_of({
        ast::make_all_of({ast::make_course("A"), ast::make_course("B")}),
        ast::make_course("C"),
        ast::make_all_of({ast::make_course("D")}),
    });
    if (render::to_readable(alternatives) != "((A and B) or C or D)") return fail("OR of ANDs");

    validate::PlacementError pre{};
    pre.kind = validate::RuleKind::kPrerequisite;
    pre.missing.push_back(eval::MissingCourse{"A"});
    pre.missing.push_back(eval::MissingAnyOf{{"B", "C", "B"}});
    if (render::describe(pre) != "missing prerequisite: A; one of B, C") return fail("prerequisite message");

    validate::PlacementError excl{};
    excl.kind = validate::RuleKind::kExclusion;
    excl.conflicts = {"X", "Y"};
    if (render::describe(excl) != "cannot be taken together with X, Y") return fail("exclusion message");

    validate::PlanReport report{};
    report["AAA100H1"].push_back(pre);
    report["BBB100H1"];
    const std::string js = render::report_json(report);
    const std::string want =
        R"({"AAA100H1":[{"kind":"prerequisite","missing":[{"course":"A"},{"any_of":["B","C"]}],)"
        R"("message":"missing prerequisite: A; one of B, C"}],"BBB100H1":[]})";
    if (js != want) return fail("report json mismatch: " + js);
    if (!json::parse(js).ok) return fail("report json should parse");

    if (render::report_text(report) != "AAA100H1: missing prerequisite: A; one of B, C\n") return fail("report text");

    diag::Bag bag;
    bag.warn(diag::Code::P_UNKNOWN_COURSE, "X_p1", "say \"hi\"");
    if (render::diagnostics_json(bag) !=
        R"([{"code":"P_UNKNOWN_COURSE","severity":"warning","subject":"X_p1","message":"say \"hi\""}])") {
        return fail("diagnostics json");
    }
    return true;
}

bool run_grid_case() {
    diag::Bag bag;
    const auto order = grid::default_semester_order(2);
    const grid::SemesterOrder want{"fall-1", "winter-1", "fall-2", "winter-2"};
    if (order != want) return fail("default semester order");
    if (grid::term_of("Winter-3") != grid::Term::kWinter || grid::term_of("fall-1") != grid::Term::kFall) {
        return fail("term from semester prefix");
    }
    if (grid::term_of("summer-1").has_value()) return fail("summer has no term");

    grid::PlanGrid plan(2);
    plan.init_semesters(order);

    if (!plan.add_course("fall-1", 0, "AAA100H1", bag)) return fail("add course");
    if (plan.add_course("winter-1", 0, "AAA100H1", bag) || !bag.has_code(diag::Code::G_DUPLICATE_PLACEMENT)) {
        return fail("a course may occupy only one slot");
    }
    if (plan.add_course("fall-1", 0, "BBB100H1", bag) || !bag.has_code(diag::Code::G_SLOT_OCCUPIED)) {
        return fail("occupied slot");
    }
    if (plan.add_course("fall-1", 2, "BBB100H1", bag) || !bag.has_code(diag::Code::G_SLOT_OUT_OF_RANGE)) {
        return fail("slot range");
    }
    if (plan.add_course("spring-9", 0, "BBB100H1", bag) || !bag.has_code(diag::Code::G_UNKNOWN_SEMESTER)) {
        return fail("unknown semester");
    }

    bag.clear();
    if (!plan.place("fall-1", "BBB100H1", bag) || plan.find_course("BBB100H1")->slot != 1) return fail("place");
    if (plan.place("fall-1", "CCC100H1", bag)) return fail("full semester should reject");
    if (!plan.place("winter-1", "CCC100H1", bag)) return fail("place winter");

    bag.clear();
    if (plan.placed_before(order, "winter-1") != eval::CodeSet{"AAA100H1", "BBB100H1"}) return fail("placed_before");
    if (plan.placed_up_to(order, "winter-1").size() != 3) return fail("placed_up_to");
    if (!plan.placed_before(order, "fall-1").empty()) return fail("nothing precedes the first semester");

    if (!plan.move_course("winter-1", 0, "fall-2", 1, bag)) return fail("move");
    const auto moved = plan.find_course("CCC100H1");
    if (!moved || moved->semester_id != "fall-2" || moved->slot != 1) return fail("moved placement");
    if (plan.move_course("fall-1", 0, "fall-1", 1, bag)) return fail("move onto occupied slot");

    if (!plan.remove_course("fall-1", 0, bag) || plan.find_course("AAA100H1").has_value()) return fail("remove");

    const auto all = plan.placements(order);
    if (all.size() != 2 || all[0].code != "BBB100H1" || all[1].code != "CCC100H1") return fail("placements order");
    return true;
}

bool run_no_requirement_case() {
    Fixture f;
    if (!f.init()) return false;

    for (const auto& sem : f.order) {
        if (!f.check("ECE302H1", sem).empty()) return fail("Both-session course without rules fails in " + sem);
    }
    return true;
}

bool run_session_case() {
    Fixture f;
    if (!f.init()) return false;

    if (!f.check("ECE110H1", "fall-1").empty()) return fail("fall course in fall");
    const auto errors = f.check("ECE110H1", "winter-1");
    if (errors.size() != 1 || errors.front().kind != validate::RuleKind::kSession) return fail("expected one session error");
    if (render::describe(errors.front()) != "ECE110H1 is offered in Fall only, but winter-1 is a Winter term") {
        return fail("session message: " + render::describe(errors.front()));
    }

    if (count_kind(f.check("ECE159H1", "fall-2"), validate::RuleKind::kSession) != 1) return fail("winter course in fall");

    f.plan.init_semesters({"summer-1"});
    if (!f.check("ECE110H1", "summer-1").empty()) return fail("unknown term should skip the session rule");
    if (!f.bag.has_code(diag::Code::V_UNKNOWN_TERM)) return fail("missing V_UNKNOWN_TERM");
    if (!f.bag.has_code(diag::Code::V_UNKNOWN_SEMESTER)) return fail("missing V_UNKNOWN_SEMESTER");
    return true;
}

bool run_temporal_case() {
    Fixture f;
    if (!f.init()) return false;

    // Prerequisites need strictly earlier semesters.
    if (!f.plan.place("fall-1", "APS105H1", f.bag) || !f.plan.place("fall-1", "ECE244H1", f.bag)) return fail("place");
    auto errors = f.check("ECE244H1", "fall-1");
    if (count_kind(errors, validate::RuleKind::kPrerequisite) != 1) return fail("same-semester prerequisite should fail");
    if (as_course(errors.front().missing.front())->code != "APS105H1") return fail("missing APS105H1");

    if (!f.plan.move_course("fall-1", 1, "winter-1", 0, f.bag)) return fail("move");
    if (!f.check("ECE244H1", "winter-1").empty()) return fail("earlier prerequisite should pass");

    // Corequisites also accept the same semester.
    if (!f.plan.place("winter-1", "ECE297H1", f.bag)) return fail("place ECE297H1");
    if (!f.check("ECE297H1", "winter-1").empty()) return fail("same-semester corequisite should pass");

    if (!f.plan.move_course("winter-1", 0, "fall-2", 0, f.bag)) return fail("move ECE244H1 later");
    errors = f.check("ECE297H1", "winter-1");
    if (count_kind(errors, validate::RuleKind::kCorequisite) != 1) return fail("later corequisite should fail");
    return true;
}

bool run_exclusion_case() {
    Fixture f;
    if (!f.init()) return false;

    if (!f.plan.place("winter-1", "APS106H1", f.bag)) return fail("place APS106H1");
    if (!f.check("APS106H1", "winter-1").empty()) return fail("no conflict yet");

    // Placement order does not matter; a later conflicting course still counts.
    if (!f.plan.place("fall-2", "APS105H1", f.bag)) return fail("place APS105H1");
    auto errors = f.check("APS106H1", "winter-1");
    if (errors.size() != 1 || errors.front().kind != validate::RuleKind::kExclusion) return fail("expected exclusion");
    if (errors.front().conflicts != std::vector<std::string>{"APS105H1"}) return fail("conflict list");

    if (!f.plan.remove_course("fall-2", 0, f.bag)) return fail("remove");
    if (!f.check("APS106H1", "winter-1").empty()) return fail("conflict should clear after removal");

    // A course listed in its own exclusions does not conflict with itself.
    if (!f.plan.place("fall-1", "MAT186H1", f.bag)) return fail("place MAT186H1");
    if (!f.check("MAT186H1", "fall-1").empty()) return fail("self exclusion");
    if (!f.plan.place("fall-2", "MAT196H1", f.bag)) return fail("place MAT196H1");
    if (count_kind(f.check("MAT186H1", "fall-1"), validate::RuleKind::kExclusion) != 1) return fail("MAT196H1 conflict");
    return true;
}

bool run_validate_all_case() {
    Fixture f;
    if (!f.init()) return false;

    f.plan.place("fall-1", "APS105H1", f.bag);
    f.plan.place("winter-1", "ECE244H1", f.bag);
    f.plan.place("winter-1", "ECE110H1", f.bag);
    f.plan.place("fall-2", "ECE435H1", f.bag);
    f.plan.place("fall-2", "NOPE100H1", f.bag);
    if (f.bag.has_error()) return fail("fixture placements failed:\n" + f.bag.render_text());

    diag::Bag pass;
    const auto report = f.validator->validate_all(f.order, pass);
    if (report.size() != 4) return fail("every placed catalog course gets an entry");
    if (report.contains("NOPE100H1")) return fail("unknown course should not be validated");
    if (pass.count_code(diag::Code::V_UNKNOWN_COURSE) != 1) return fail("missing V_UNKNOWN_COURSE");
    if (f.bag.has_code(diag::Code::V_UNKNOWN_COURSE)) return fail("validation anomalies belong to the call's bag");

    if (!report.at("APS105H1").empty() || !report.at("ECE244H1").empty()) return fail("valid placements");
    if (count_kind(report.at("ECE110H1"), validate::RuleKind::kSession) != 1) return fail("ECE110H1 session");

    const auto& ece435 = report.at("ECE435H1");
    if (ece435.size() != 1 || ece435.front().missing.size() != 5) return fail("ECE435H1 should miss 5 groups");

    const std::string text = render::report_text(report);
    if (text.find("ECE435H1: missing prerequisite: one of ECE216H1, ECE221H1; one of ECE231H1, ECE295H1") ==
        std::string::npos) {
        return fail("report text for ECE435H1:\n" + text);
    }
    return true;
}

// Revalidation passes share nothing but the resolver cache.
bool run_validate_concurrent_case() {
    Fixture f;
    if (!f.init()) return false;

    f.plan.init_semesters({"fall-1", "winter-1", "summer-1"});
    f.plan.place("fall-1", "APS105H1", f.bag);
    f.plan.place("winter-1", "ECE244H1", f.bag);
    f.plan.place("winter-1", "ECE110H1", f.bag);
    f.plan.place("summer-1", "ECE302H1", f.bag);
    f.plan.place("summer-1", "NOPE100H1", f.bag);
    if (f.bag.has_error()) return fail("fixture placements failed:\n" + f.bag.render_text());

    const grid::SemesterOrder order{"fall-1", "winter-1"};
    diag::Bag first;
    const std::string expected = render::report_text(f.validator->validate_all(order, first));
    // summer-1 is outside the order and has no term; NOPE100H1 is not in the catalog.
    if (first.count_code(diag::Code::V_UNKNOWN_SEMESTER) != 1 || first.count_code(diag::Code::V_UNKNOWN_TERM) != 1 ||
        first.count_code(diag::Code::V_UNKNOWN_COURSE) != 1 || first.all().size() != 3) {
        return fail("one pass should report each anomaly once:\n" + first.render_text());
    }

    for (int i = 0; i < 3; ++i) {
        diag::Bag again;
        if (render::report_text(f.validator->validate_all(order, again)) != expected) return fail("revalidation differs");
        if (again.all().size() != first.all().size()) return fail("revalidation should not grow the diagnostics");
    }

    std::vector<size_t> sizes(4);
    std::vector<int> same(4, 1);
    std::vector<std::thread> workers{};
    for (size_t t = 0; t < sizes.size(); ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i) {
                diag::Bag own;
                if (render::report_text(f.validator->validate_all(order, own)) != expected) same[t] = 0;
                sizes[t] = own.all().size();
            }
        });
    }
    for (auto& w : workers) w.join();

    for (size_t t = 0; t < sizes.size(); ++t) {
        if (!same[t]) return fail("concurrent validate_all returned a different report");
        if (sizes[t] != 3) return fail("concurrent validate_all diagnostics");
    }
    return true;
}

bool run_toml_case() {
    config::FlatMap values;
    std::vector<std::string> warnings;
    std::string err;

    const std::string text =
        "top = 1\n"
        "[plan]\n"
        "years = 3 # inline comment\n"
        "years = 6\n"
        "[diag]\n"
        "format = \"json # not a comment\"\n"
        "extra = [\"a\", \"b\"]\n"
        "warnings = false\n";
    if (!config::toml_lite::parse_text(text, "inline.toml", values, warnings, err)) return fail("toml parse: " + err);
    if (std::get<int64_t>(values.at("top")) != 1) return fail("top-level key");
    if (std::get<int64_t>(values.at("plan.years")) != 6) return fail("later duplicate should win");
    if (warnings.size() != 1) return fail("duplicate key should warn");
    if (std::get<std::string>(values.at("diag.format")) != "json # not a comment") return fail("string with '#'");
    if (std::get<std::vector<std::string>>(values.at("diag.extra")).size() != 2) return fail("string array");
    if (std::get<bool>(values.at("diag.warnings"))) return fail("bool value");

    if (config::toml_lite::parse_text("[plan\n", "bad.toml", values, warnings, err)) return fail("bad section accepted");
    if (err.find("bad.toml:1") == std::string::npos) return fail("error should name the line");
    if (config::toml_lite::parse_text("years 4\n", "bad.toml", values, warnings, err)) return fail("missing '='");
    return true;
}

bool run_config_case() {
    config::Paths paths{};
    paths.global_config = kCases / "no_such_global.toml";
    paths.project_root = kCases;
    paths.project_config = kCases / config::kProjectFileName;

    const auto loaded = config::load_files(paths);
    bool unknown_warned = false;
    for (const auto& w : loaded.warnings) {
        if (w.find("diag.legacy_mode") != std::string::npos) unknown_warned = true;
    }
    if (!unknown_warned) return fail("unknown config key should warn");
    if (loaded.effective_values.contains("diag.legacy_mode")) return fail("unknown key should be dropped");

    std::vector<std::string> warnings;
    const auto s = config::materialize(loaded, &warnings);
    if (s.plan_years != 5) return fail("plan.years from project config");
    if (s.plan_slots_per_semester != 5 || warnings.empty()) return fail("wrong-typed key should warn and keep default");
    if (s.diag_warnings) return fail("diag.warnings from project config");

    if (std::getenv("PLANWISE_CATALOG") == nullptr &&
        std::filesystem::path(s.catalog_path) != kCases / "data/course_db.json") {
        return fail("relative catalog path should be taken from the project root: " + s.catalog_path);
    }
    if (std::getenv("PLANWISE_DIAG_FORMAT") == nullptr && s.diag_format != "json") return fail("format normalized");

    config::LoadedConfig huge{};
    huge.effective_values["plan.years"] = int64_t{3000000000};
    huge.effective_values["plan.slots_per_semester"] = int64_t{-7};
    std::vector<std::string> huge_warnings;
    const auto capped = config::materialize(huge, &huge_warnings);
    if (capped.plan_years != config::kMaxPlanYears) return fail("plan.years should be capped");
    if (capped.plan_slots_per_semester != 5) return fail("non-positive slots should fall back to the default");
    if (huge_warnings.size() != 1 || huge_warnings.front().find("plan.years") == std::string::npos) {
        return fail("capping plan.years should warn");
    }

    const auto defaults = config::materialize(config::LoadedConfig{});
    if (defaults.plan_years != 4 || defaults.plan_slots_per_semester != 5 || defaults.diag_color != "auto") {
        return fail("defaults");
    }

    if (config::find_project_root(kCases) != kCases) return fail("project root should be found by planwise.toml");
    return true;
}

std::pair<int, std::string> run_cli_capture(const std::string& command) {
    const std::string tmp_path = "/tmp/planwise_cli_capture.txt";
    const std::string full = command + " > " + tmp_path + " 2>&1";
    const int rc = std::system(full.c_str());

    std::ifstream ifs(tmp_path, std::ios::binary);
    std::string out((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    std::remove(tmp_path.c_str());
    return {rc, out};
}

bool run_cli_cases() {
    const std::string bin = "XDG_CONFIG_HOME=/tmp/planwise_no_config NO_COLOR=1 \"" + std::string(PLANWISE_BUILD_BIN) + "\"";
    const std::string catalog = " --catalog \"" + (kCases / "course_db.json").string() + "\"";

    auto [rc_bad, out_bad] = run_cli_capture(bin + " check" + catalog +
                                             " --place fall-1:ECE244H1 --place winter-1:ECE110H1");
    if (rc_bad == 0 || out_bad.find("ECE244H1: missing prerequisite: APS105H1") == std::string::npos ||
        out_bad.find("ECE110H1 is offered in Fall only, but winter-1 is a Winter term") == std::string::npos) {
        std::cerr << "cli check with errors\n" << out_bad;
        return false;
    }

    auto [rc_ok, out_ok] = run_cli_capture(bin + " check" + catalog +
                                           " --place fall-1:APS105H1 --place winter-1:ECE244H1");
    if (rc_ok != 0 || out_ok.find("2 placement(s) checked, 0 error(s)") == std::string::npos) {
        std::cerr << "cli check clean plan\n" << out_ok;
        return false;
    }

    auto [rc_json, out_json] = run_cli_capture(bin + " check" + catalog + " --format json --place winter-1:ECE110H1");
    if (rc_json == 0 || out_json.find("\"kind\":\"session\"") == std::string::npos) {
        std::cerr << "cli check json\n" << out_json;
        return false;
    }

    auto [rc_show, out_show] = run_cli_capture(bin + " show" + catalog + " ECE435H1");
    if (rc_show != 0 || out_show.find("Session: Fall") == std::string::npos ||
        out_show.find("Prerequisites: (ECE216H1 or ECE221H1) and (ECE231H1 or ECE295H1)") == std::string::npos) {
        std::cerr << "cli show\n" << out_show;
        return false;
    }

    auto [rc_res, out_res] = run_cli_capture(bin + " resolve" + catalog + " ECE496Y1_p1");
    if (rc_res != 0 || out_res.find("(no requirement)") == std::string::npos ||
        out_res.find("P_UNRESOLVED_COURSESET") == std::string::npos) {
        std::cerr << "cli resolve unknown id\n" << out_res;
        return false;
    }

    auto [rc_quiet, out_quiet] = run_cli_capture(bin + " resolve" + catalog + " --no-warnings ECE496Y1_p1");
    if (rc_quiet != 0 || out_quiet.find("P_UNRESOLVED_COURSESET") != std::string::npos) {
        std::cerr << "cli --no-warnings\n" << out_quiet;
        return false;
    }

    auto [rc_cmd, out_cmd] = run_cli_capture(bin + " frobnicate");
    if (rc_cmd == 0 || out_cmd.find("unknown command") == std::string::npos) {
        std::cerr << "cli unknown command should fail\n" << out_cmd;
        return false;
    }

    auto [rc_place, out_place] = run_cli_capture(bin + " show" + catalog + " --place fall-1:APS105H1 APS105H1");
    if (rc_place == 0 || out_place.find("--place is only valid for check") == std::string::npos) {
        std::cerr << "cli --place outside check should fail\n" << out_place;
        return false;
    }
    return true;
}

} // namespace

int main() {
    const bool ok_ids = run_courseset_id_case();
    const bool ok_catalog = run_catalog_load_case();
    const bool ok_catalog_anomaly = run_catalog_anomaly_case();
    const bool ok_json = run_json_case();

    const bool ok_cache = run_resolve_cache_case();
    const bool ok_concurrent = run_resolve_concurrent_case();
    const bool ok_and_of_ors = run_and_of_ors_case();
    const bool ok_or_of_ands = run_or_of_ands_case();
    const bool ok_shape = run_evaluate_shape_case();
    const bool ok_unresolved = run_unresolved_courseset_case();
    const bool ok_cycle = run_cycle_case();
    const bool ok_cycle_order = run_cycle_order_case();
    const bool ok_malformed = run_malformed_expression_case();
    const bool ok_unknown = run_unknown_course_case();
    const bool ok_inline = run_inline_field_case();
    const bool ok_render = run_render_case();

    const bool ok_grid = run_grid_case();
    const bool ok_none = run_no_requirement_case();
    const bool ok_session = run_session_case();
    const bool ok_temporal = run_temporal_case();
    const bool ok_exclusion = run_exclusion_case();
    const bool ok_all = run_validate_all_case();
    const bool ok_all_concurrent = run_validate_concurrent_case();

    const bool ok_toml = run_toml_case();
    const bool ok_config = run_config_case();
    const bool ok_cli = run_cli_cases();

    if (!ok_ids || !ok_catalog || !ok_catalog_anomaly || !ok_json ||
        !ok_cache || !ok_concurrent || !ok_and_of_ors || !ok_or_of_ands || !ok_shape || !ok_unresolved ||
        !ok_cycle || !ok_cycle_order || !ok_malformed || !ok_unknown || !ok_inline || !ok_render ||
        !ok_grid || !ok_none || !ok_session || !ok_temporal || !ok_exclusion || !ok_all || !ok_all_concurrent ||
        !ok_toml || !ok_config || !ok_cli) {
        return 1;
    }

    std::cout << "planwise tests passed\n";
    return 0;
}
