#include <gtest/gtest.h>
#include "fieldmeta/registry.hpp"

using namespace fieldmeta;

namespace {
node_ptr E(const char* s){ return parse_one(s); }

TypeInfo model_type(){
    TypeInfo t;
    t.name = "Model";
    t.fields.push_back(FieldInfo{ "a", n_sym("Int"), n_i64(1) });
    t.fields.push_back(FieldInfo{ "b", n_sym("Int"), nullptr });
    t.fields.push_back(FieldInfo{ "c", nullptr, n_str("c0") });
    return t;
}

DefaultFn constant(node_ptr v){ return [v](const std::string&, const std::string&){ return clone(v); }; }
}

TEST(Registry, DefaultWhenNotOverridden){
    Registry reg;
    reg.add_kind("bounds", constant(E("[1e-7 1.0]")));
    reg.declare_type(model_type());
    EXPECT_TRUE(equal(reg.get("bounds", "Model", "a"), E("[1e-7 1.0]")));
    // undeclared types fall through to the default as well
    EXPECT_TRUE(equal(reg.get("bounds", "Other", "z"), E("[1e-7 1.0]")));
}

TEST(Registry, ExactOverrideWins){
    Registry reg;
    reg.add_kind("units", constant(n_i64(1)));
    reg.declare_type(model_type());
    reg.bind("units", "Model", "a", n_sym("kg"));
    EXPECT_TRUE(equal(reg.get("units", "Model", "a"), E("kg")));
    EXPECT_TRUE(equal(reg.get("units", "Model", "b"), E("1")));
    EXPECT_EQ(reg.find_binding("units", "Model", "b"), nullptr);
}

TEST(Registry, RebindingReplaces){
    Registry reg;
    reg.add_kind("units", constant(n_i64(1)));
    reg.bind("units", "Model", "a", n_sym("kg"));
    reg.bind("units", "Model", "a", n_sym("g"));
    auto bs = reg.bindings("units");
    ASSERT_EQ(bs.size(), 1u);
    EXPECT_TRUE(equal(bs[0].value, E("g")));
}

TEST(Registry, DefaultsAreProducedFreshOnEveryLookup){
    Registry reg;
    int calls = 0;
    reg.add_kind("counter", [&](const std::string&, const std::string& field){ ++calls; return n_str(field); });
    reg.add_kind("bounds", constant(E("[0 1]")));
    auto first = reg.get("counter", "Model", "a");
    auto second = reg.get("counter", "Model", "a");
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(equal(first, E("\"a\"")));
    auto b1 = reg.get("bounds", "Model", "a");
    auto b2 = reg.get("bounds", "Model", "a");
    EXPECT_NE(b1.get(), b2.get());
    std::get<vector_t>(b1->data).elems.clear();
    EXPECT_TRUE(equal(reg.get("bounds", "Model", "a"), E("[0 1]")));
}

TEST(Registry, AggregateFollowsDeclaredOrder){
    Registry reg;
    reg.add_kind("label", constant(n_str("")));
    reg.declare_type(model_type());
    reg.bind("label", "Model", "c", n_str("C"));
    reg.bind("label", "Model", "a", n_str("A"));
    auto all = reg.all("label", "Model");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(equal(all[0], E("\"A\"")));
    EXPECT_TRUE(equal(all[1], E("\"\"")));
    EXPECT_TRUE(equal(all[2], E("\"C\"")));

    TypeInfo empty; empty.name = "Empty";
    reg.declare_type(empty);
    EXPECT_TRUE(reg.all("label", "Empty").empty());
    EXPECT_THROW(reg.all("label", "Nope"), std::out_of_range);
}

TEST(Registry, BindingsAreOrderedByTypeThenField){
    Registry reg;
    reg.add_kind("units", constant(n_i64(1)));
    reg.bind("units", "Zeta", "a", n_i64(1));
    reg.bind("units", "Alpha", "b", n_i64(2));
    reg.bind("units", "Alpha", "a", n_i64(3));
    auto bs = reg.bindings("units");
    ASSERT_EQ(bs.size(), 3u);
    EXPECT_EQ(bs[0].type + "." + bs[0].field, "Alpha.a");
    EXPECT_EQ(bs[1].type + "." + bs[1].field, "Alpha.b");
    EXPECT_EQ(bs[2].type + "." + bs[2].field, "Zeta.a");
    EXPECT_TRUE(reg.bindings("nope").empty());
}

TEST(Registry, UnknownNames){
    Registry reg;
    reg.add_kind("units", constant(n_i64(1)));
    reg.declare_type(model_type());
    EXPECT_THROW(reg.get("units", "Model", "missing"), std::out_of_range);
    EXPECT_THROW(reg.get("nope", "Model", "a"), std::out_of_range);
    EXPECT_THROW(reg.bind("nope", "Model", "a", n_i64(1)), std::out_of_range);
    EXPECT_THROW(reg.add_kind("bad", DefaultFn{}), std::invalid_argument);
}

TEST(Registry, FrozenRejectsMutation){
    Registry reg;
    reg.add_kind("units", constant(n_i64(1)));
    reg.declare_type(model_type());
    reg.bind("units", "Model", "a", n_sym("kg"));
    reg.freeze();
    EXPECT_EQ(reg.phase(), Registry::Phase::frozen);
    EXPECT_THROW(reg.add_kind("label", constant(n_str(""))), registry_error);
    EXPECT_THROW(reg.declare_type(model_type()), registry_error);
    try {
        reg.bind("units", "Model", "b", n_sym("g"));
        FAIL() << "expected registry_error";
    } catch(const registry_error& e){
        EXPECT_EQ(e.code, "E0300");
    }
    EXPECT_TRUE(equal(reg.get("units", "Model", "a"), E("kg")));
    EXPECT_TRUE(equal(reg.get("units", "Model", "b"), E("1")));
}

TEST(Registry, Records){
    Registry reg;
    reg.declare_type(model_type());
    auto r = reg.make_record("Model", { n_i64(5), n_i64(6) });
    EXPECT_EQ(r.type_name(), "Model");
    EXPECT_EQ(r.size(), 3u);
    EXPECT_TRUE(equal(r.get("a"), E("5")));
    EXPECT_TRUE(equal(r.get("c"), E("\"c0\"")));
    r.set("a", n_i64(7));
    EXPECT_TRUE(equal(r.get("a"), E("7")));
    EXPECT_THROW(r.get("missing"), std::out_of_range);
    EXPECT_THROW(reg.make_record("Model", {}), std::invalid_argument); // b has no default
    EXPECT_THROW(reg.make_record("Model", { n_i64(1), n_i64(2), n_i64(3), n_i64(4) }), std::invalid_argument);
    EXPECT_THROW(reg.make_record("Nope"), std::out_of_range);
}

TEST(Registry, AccessorReadsByTypeAndInstance){
    Registry reg;
    reg.add_kind("units", constant(n_i64(1)));
    reg.declare_type(model_type());
    reg.bind("units", "Model", "b", n_sym("m"));
    Accessor units(reg, "units");
    auto r = reg.make_record("Model", { n_i64(1), n_i64(2) });
    EXPECT_TRUE(equal(units("Model", "b"), E("m")));
    EXPECT_TRUE(equal(units.of(r, "b"), E("m")));
    EXPECT_TRUE(equal(units.of(r, "a"), units("Model", "a")));
    auto all = units.of(r);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(equal(all[1], E("m")));
    EXPECT_THROW(units.of(r, "zzz"), std::out_of_range);
}
