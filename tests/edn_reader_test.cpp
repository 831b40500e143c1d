#include <gtest/gtest.h>
#include "fieldmeta/edn.hpp"

using namespace fieldmeta;

TEST(EdnReader, AnnotationSymbolsReadAsOrdinaryForms){
    auto f = parse_one("(| (: a Int) [1 4])");
    ASSERT_TRUE(is_form(f, "|"));
    auto& el = as_list(*f)->elems;
    ASSERT_EQ(el.size(), 3u);
    EXPECT_TRUE(is_form(el[1], ":"));
    EXPECT_TRUE(is_vector(*el[2]));
    EXPECT_TRUE(is_symbol_named(as_list(*el[1])->elems[1], "a"));
}

TEST(EdnReader, KeywordsAndLoneColonAreDistinct){
    auto f = parse_one("(:kw : x)");
    auto& el = as_list(*f)->elems;
    EXPECT_TRUE(is_keyword(*el[0]));
    EXPECT_TRUE(is_symbol_named(el[1], ":"));
}

TEST(EdnReader, Numbers){
    auto v = parse_one("[1e-7 1.0 -3 +4 - _]");
    auto& el = std::get<vector_t>(v->data).elems;
    ASSERT_EQ(el.size(), 6u);
    EXPECT_DOUBLE_EQ(std::get<double>(el[0]->data), 1e-7);
    EXPECT_DOUBLE_EQ(std::get<double>(el[1]->data), 1.0);
    EXPECT_EQ(std::get<int64_t>(el[2]->data), -3);
    EXPECT_EQ(std::get<int64_t>(el[3]->data), 4);
    EXPECT_TRUE(is_symbol_named(el[4], "-"));
    EXPECT_TRUE(is_symbol_named(el[5], "_"));
}

TEST(EdnReader, CommentsAndCommasAreWhitespace){
    auto forms = parse_all("; header\n(defkind units 1) ; trailing\n[1, 2,3]");
    ASSERT_EQ(forms.size(), 2u);
    EXPECT_EQ(std::get<vector_t>(forms[1]->data).elems.size(), 3u);
}

TEST(EdnReader, PositionsAreRecorded){
    auto forms = parse_all("(defkind a 1)\n  (struct M x)");
    ASSERT_EQ(forms.size(), 2u);
    EXPECT_EQ(line(*forms[1]), 2);
    EXPECT_EQ(col(*forms[1]), 3);
    auto x = as_list(*forms[1])->elems[2];
    EXPECT_EQ(line(*x), 2);
    EXPECT_EQ(col(*x), 13);
}

TEST(EdnReader, Errors){
    try {
        parse_one("(a b");
        FAIL() << "expected parse_error";
    } catch(const parse_error& e){
        EXPECT_EQ(e.code, "E0001");
        EXPECT_EQ(e.line, 1);
    }
    EXPECT_THROW(parse_one("1 2"), parse_error);
    EXPECT_THROW(parse_one("\"open"), parse_error);
    EXPECT_THROW(parse_one("{:a}"), parse_error);
    EXPECT_THROW(parse_all(")"), parse_error);
}

TEST(EdnReader, PrintsBackTheSameText){
    const char* src = "(do (struct Model (= (: a Int) 1)) (override bounds Model a [0.5 \"x\" nil true]))";
    EXPECT_EQ(to_string(parse_one(src)), src);
    EXPECT_EQ(to_string(n_f64(2.0)), "2.0");
}

TEST(EdnReader, EqualityIgnoresPositionsByDefault){
    auto a = parse_one("(struct M (: a Int))");
    auto b = parse_one("  (struct   M\n (: a Int))");
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, b, false));
    EXPECT_FALSE(equal(a, parse_one("(struct M (: a Float64))")));
    EXPECT_TRUE(equal(parse_one("{:a 1 :b 2}"), parse_one("{:b 2 :a 1}")));
}

TEST(EdnReader, CloneIsDeep){
    auto a = parse_one("[1 [2 3]]");
    auto c = clone(a);
    EXPECT_TRUE(equal(a, c));
    std::get<vector_t>(std::get<vector_t>(c->data).elems[1]->data).elems.push_back(n_i64(4));
    EXPECT_FALSE(equal(a, c));
    EXPECT_EQ(to_string(a), "[1 [2 3]]");
}

TEST(EdnReader, PrettyPrintBreaksDeclarations){
    auto s = to_pretty_string(parse_one("(do (struct M a b) (override units M a kg))"));
    EXPECT_EQ(s, "(do\n  (struct M\n    a\n    b)\n  (override units M a kg))");
}
