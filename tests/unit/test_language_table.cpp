/**
 * @file test_language_table.cpp
 * @brief Unit tests for the language template table and placeholder expansion.
 */

#include "sandbox/language_table.hpp"

#include <gtest/gtest.h>

using namespace sandbox_runner;

TEST(LanguageTableTest, DefaultsCoverEveryLanguage) {
    auto table = LanguageTable::defaults();
    for (auto language : kAllLanguages) {
        const auto* tmpl = table.find(language);
        ASSERT_NE(tmpl, nullptr) << to_string(language);
        EXPECT_EQ(tmpl->language, language);
        EXPECT_FALSE(tmpl->source_file.empty());
        EXPECT_FALSE(tmpl->run_argv.empty());
    }
}

TEST(LanguageTableTest, PackageSupport) {
    auto table = LanguageTable::defaults();
    EXPECT_TRUE(table.supports_packages(Language::Python));
    EXPECT_TRUE(table.supports_packages(Language::JavaScript));
    EXPECT_FALSE(table.supports_packages(Language::Cpp));
    EXPECT_FALSE(table.supports_packages(Language::Java));
}

TEST(LanguageTableTest, CompiledLanguages) {
    auto table = LanguageTable::defaults();
    EXPECT_TRUE(table.find(Language::Cpp)->is_compiled());
    EXPECT_TRUE(table.find(Language::Go)->is_compiled());
    EXPECT_FALSE(table.find(Language::Python)->is_compiled());
}

TEST(LanguageTableTest, ExpandSubstitutesPlaceholders) {
    TemplateContext ctx{
        .workdir = "/w",
        .source = "/w/main.cpp",
        .binary = "/w/main",
        .dataset = "/w/data",
        .packages = {},
    };
    auto argv = LanguageTable::expand({"g++", "-o", "{binary}", "{source}", "-I{workdir}/inc"}, ctx);
    EXPECT_EQ(argv, (std::vector<std::string>{"g++", "-o", "/w/main", "/w/main.cpp", "-I/w/inc"}));
    EXPECT_EQ(LanguageTable::expand_value("{dataset}/x", ctx), "/w/data/x");
}

TEST(LanguageTableTest, PackagesExpandToSeparateArguments) {
    TemplateContext ctx;
    ctx.workdir = "/w";
    ctx.packages = {"numpy", "pandas==2.2"};
    auto argv = LanguageTable::expand({"pip", "install", "{packages}", "--target", "{workdir}"}, ctx);
    EXPECT_EQ(argv, (std::vector<std::string>{"pip", "install", "numpy", "pandas==2.2",
                                              "--target", "/w"}));

    ctx.packages.clear();
    EXPECT_EQ(LanguageTable::expand({"pip", "{packages}"}, ctx).size(), 1u);
}

TEST(LanguageTableTest, ConfigOverridesApply) {
    Config config = default_config();
    LanguageOverride python;
    python.run = std::vector<std::string>{"python3.12", "{source}"};
    python.env["EXTRA"] = "1";
    config.languages[Language::Python] = python;

    auto table = LanguageTable::from_config(config);
    const auto* tmpl = table.find(Language::Python);
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->run_argv.front(), "python3.12");
    EXPECT_EQ(tmpl->env.at("EXTRA"), "1");
    // Untouched fields keep their defaults
    EXPECT_EQ(tmpl->source_file, "main.py");
    EXPECT_TRUE(tmpl->supports_packages());
}
