#include <gtest/gtest.h>
#include "../languages/surface/parser/parser.hpp"
#include "fieldmeta/loader.hpp"

using namespace fieldmeta;

namespace {
std::vector<std::string> lower(const char* src){
    surface::Parser p;
    auto r = p.parse_string(src);
    EXPECT_TRUE(r.success) << r.error_message << " at " << r.line << ":" << r.column;
    std::vector<std::string> out;
    for(auto& f : r.forms) out.push_back(to_string(f));
    return out;
}
}

TEST(SurfaceParser, KindAndChainDefinitions){
    auto forms = lower("@metadata bounds (1e-7, 1.0)\n@metadata label \"\"\n@chain columns @label @units\n");
    ASSERT_EQ(forms.size(), 3u);
    EXPECT_EQ(forms[0], "(defkind bounds [1e-07 1.0])");
    EXPECT_EQ(forms[1], "(defkind label \"\")");
    EXPECT_EQ(forms[2], "(defchain columns [label units])");
}

TEST(SurfaceParser, ChainStopsAtTheEndOfItsLine){
    auto forms = lower("@chain lu @label @units\n@lu struct M { a | \"A\" | m }");
    ASSERT_EQ(forms.size(), 2u);
    EXPECT_EQ(forms[0], "(defchain lu [label units])");
    EXPECT_EQ(forms[1], "(lu (struct M (| (| a \"A\") m)))");
}

TEST(SurfaceParser, BareDeclarationWithDefaults){
    auto forms = lower("@default struct Model { a: Int = 1 | 4, b: Int = 4 | 9 }");
    ASSERT_EQ(forms.size(), 1u);
    EXPECT_EQ(forms[0], "(default (struct Model (= (: a Int) (| 1 4)) (= (: b Int) (| 4 9))))");
}

TEST(SurfaceParser, FieldsOnTheirOwnLines){
    auto forms = lower(R"(
        # model parameters
        @bounds struct Model {
            a: Int | (1, 4)   # tight
            b: Float64
        }
    )");
    ASSERT_EQ(forms.size(), 1u);
    EXPECT_EQ(forms[0], "(bounds (struct Model (| (: a Int) [1 4]) (: b Float64)))");
}

TEST(SurfaceParser, TypedBlock){
    auto forms = lower("@bounds Model { a | (0, 10), b | _ }");
    ASSERT_EQ(forms.size(), 1u);
    EXPECT_EQ(forms[0], "(bounds Model (| a [0 10]) (| b _))");
}

TEST(SurfaceParser, NestedApplications){
    auto forms = lower("@label @units struct M { a: Int | \"A\" | m }");
    ASSERT_EQ(forms.size(), 1u);
    EXPECT_EQ(forms[0], "(label (units (struct M (| (| (: a Int) \"A\") m))))");
}

TEST(SurfaceParser, ValuesAndTypes){
    auto forms = lower("struct Model{T} { a: Vector{T} = nothing, b = -2.5, c = true, d = (), e = (x,), f = \"q\\\"\" }");
    ASSERT_EQ(forms.size(), 1u);
    EXPECT_EQ(forms[0], "(struct (Model T) (= (: a (Vector T)) nil) (= b -2.5) (= c true) (= d []) (= e [x]) (= f \"q\\\"\"))");
}

TEST(SurfaceParser, PositionsPointAtTheSource){
    surface::Parser p;
    auto r = p.parse_string("\n@units struct M {\n  a | kg\n}");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.forms.size(), 1u);
    EXPECT_EQ(line(*r.forms[0]), 2);
    auto decl = as_list(*r.forms[0])->elems[1];
    auto field = as_list(*decl)->elems[2];
    EXPECT_EQ(line(*field), 3);
    EXPECT_EQ(col(*field), 3);
}

TEST(SurfaceParser, Errors){
    surface::Parser p;
    auto r = p.parse_string("@metadata units 1\n@units struct { a }");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.line, 2);
    EXPECT_FALSE(r.error_message.empty());

    EXPECT_FALSE(p.parse_string("@a @b Model { x | 1 }").success);
    EXPECT_FALSE(p.parse_string("struct M { a | }").success);
    EXPECT_FALSE(p.parse_string("@metadata units").success);
    EXPECT_FALSE(p.parse_string("fields a b").success);
    EXPECT_TRUE(p.parse_string("  # only a comment\n").success);
}

TEST(SurfaceParser, LoadsEndToEnd){
    surface::Parser p;
    auto r = p.parse_string(R"(
        @metadata default nothing
        @metadata bounds (1e-7, 1.0)
        @metadata label ""
        @chain param @default @bounds
        @param struct Model { a: Int = 1 | 4 | (0, 10), b: Int = 4 | 9 | _ }
        @label Model { a | "Alpha" }
    )");
    ASSERT_TRUE(r.success) << r.error_message;
    Loader loader{ LoaderEnv{} };
    auto res = loader.load_forms(r.forms);
    ASSERT_TRUE(res.success) << (res.diagnostics.empty() ? "" : res.diagnostics[0].message);
    loader.freeze();
    auto defaults = loader.accessor("default")("Model");
    ASSERT_EQ(defaults.size(), 2u);
    EXPECT_EQ(to_string(defaults[0]), "4");
    EXPECT_EQ(to_string(defaults[1]), "9");
    EXPECT_EQ(to_string(loader.accessor("bounds")("Model", "a")), "[0 10]");
    EXPECT_EQ(to_string(loader.accessor("bounds")("Model", "b")), "[1e-07 1.0]");
    EXPECT_EQ(to_string(loader.accessor("label")("Model", "a")), "\"Alpha\"");
}
