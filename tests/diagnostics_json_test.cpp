#include <gtest/gtest.h>
#include "fieldmeta/loader.hpp"
#include "fieldmeta/diagnostics_json.hpp"

using namespace fieldmeta;

TEST(DiagnosticsJson, Success){
    Loader loader{ LoaderEnv{} };
    auto r = loader.load_source("(defkind units 1) (units (struct M (| a kg)))");
    auto js = diagnostics_to_json(r);
    EXPECT_EQ(js, "{\"success\":true,\"forms\":2,\"errors\":[]}");
}

TEST(DiagnosticsJson, ErrorsCarryCodeAndPosition){
    Loader loader{ LoaderEnv{} };
    auto r = loader.load_source("(defkind units 1)\n(defchain c [units nope])");
    auto js = diagnostics_to_json(r);
    EXPECT_NE(js.find("\"success\":false"), std::string::npos);
    EXPECT_NE(js.find("\"code\":\"E0200\""), std::string::npos);
    EXPECT_NE(js.find("\"line\":2"), std::string::npos);
    EXPECT_NE(js.find("\"hint\":\"define the extension"), std::string::npos);
}

TEST(DiagnosticsJson, Escaping){
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), "\"a\\\"b\\\\c\\n\\t\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, PrintedOnlyWhenEnabled){
    LoadResult r;
    r.success = false;
    r.diagnostics.push_back(Diagnostic{ "E0001", "bad", "", 1, 2 });
    LoaderEnv off{};
    ::testing::internal::CaptureStderr();
    maybe_print_json(r, off);
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");

    LoaderEnv on{};
    on.diagJson = true;
    ::testing::internal::CaptureStderr();
    maybe_print_json(r, on);
    auto err = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(err, diagnostics_to_json(r) + "\n");
}
