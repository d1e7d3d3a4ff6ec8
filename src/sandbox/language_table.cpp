/**
 * @file language_table.cpp
 * @brief Built-in language templates and placeholder expansion.
 * @author Dimitris Kafetzis
 */

#include "sandbox/language_table.hpp"

namespace sandbox_runner {

namespace {

void replace_all(std::string& text, std::string_view from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

}  // anonymous namespace

LanguageTable LanguageTable::defaults() {
    LanguageTable table;

    table.set(LanguageTemplate{
        .language = Language::Python,
        .source_file = "main.py",
        .compile_argv = {},
        .run_argv = {"python3", "-u", "{source}"},
        .install_argv = {"python3", "-m", "pip", "install", "--quiet", "--no-input",
                         "--disable-pip-version-check", "--target",
                         "{workdir}/.packages", "{packages}"},
        .env = {{"PYTHONPATH", "{workdir}/.packages"},
                {"PYTHONDONTWRITEBYTECODE", "1"}},
    });

    table.set(LanguageTemplate{
        .language = Language::JavaScript,
        .source_file = "main.js",
        .compile_argv = {},
        .run_argv = {"node", "{source}"},
        .install_argv = {"npm", "install", "--silent", "--no-audit", "--no-fund",
                         "--prefix", "{workdir}", "{packages}"},
        .env = {{"NODE_PATH", "{workdir}/node_modules"}},
    });

    // Single-file source launcher (JDK 11+); class name is free.
    table.set(LanguageTemplate{
        .language = Language::Java,
        .source_file = "Main.java",
        .compile_argv = {},
        .run_argv = {"java", "-Xss16m", "{source}"},
        .install_argv = {},
        .env = {},
    });

    table.set(LanguageTemplate{
        .language = Language::Cpp,
        .source_file = "main.cpp",
        .compile_argv = {"g++", "-std=c++17", "-O2", "-pipe", "-o", "{binary}", "{source}"},
        .run_argv = {"{binary}"},
        .install_argv = {},
        .env = {},
    });

    table.set(LanguageTemplate{
        .language = Language::Go,
        .source_file = "main.go",
        .compile_argv = {"go", "build", "-o", "{binary}", "{source}"},
        .run_argv = {"{binary}"},
        .install_argv = {},
        .env = {{"GOCACHE", "{workdir}/.gocache"},
                {"GOPATH", "{workdir}/.gopath"},
                {"GO111MODULE", "off"}},
    });

    table.set(LanguageTemplate{
        .language = Language::R,
        .source_file = "main.R",
        .compile_argv = {},
        .run_argv = {"Rscript", "{source}"},
        .install_argv = {},
        .env = {{"R_LIBS_USER", "{workdir}/.rlibs"}},
    });

    return table;
}

LanguageTable LanguageTable::from_config(const Config& config) {
    auto table = defaults();
    for (const auto& [language, entry] : config.languages) {
        LanguageTemplate tmpl = *table.find(language);
        if (entry.source_file) tmpl.source_file = *entry.source_file;
        if (entry.compile) tmpl.compile_argv = *entry.compile;
        if (entry.run) tmpl.run_argv = *entry.run;
        if (entry.install) tmpl.install_argv = *entry.install;
        for (const auto& [key, value] : entry.env) {
            tmpl.env[key] = value;
        }
        table.set(std::move(tmpl));
    }
    return table;
}

void LanguageTable::set(LanguageTemplate tmpl) {
    auto language = tmpl.language;
    templates_[language] = std::move(tmpl);
}

const LanguageTemplate* LanguageTable::find(Language language) const {
    auto it = templates_.find(language);
    return it == templates_.end() ? nullptr : &it->second;
}

bool LanguageTable::supports_packages(Language language) const {
    const auto* tmpl = find(language);
    return tmpl && tmpl->supports_packages();
}

std::vector<std::string> LanguageTable::expand(const std::vector<std::string>& argv,
                                               const TemplateContext& ctx) {
    std::vector<std::string> out;
    out.reserve(argv.size() + ctx.packages.size());
    for (const auto& arg : argv) {
        if (arg == "{packages}") {
            out.insert(out.end(), ctx.packages.begin(), ctx.packages.end());
            continue;
        }
        out.push_back(expand_value(arg, ctx));
    }
    return out;
}

std::string LanguageTable::expand_value(const std::string& value, const TemplateContext& ctx) {
    std::string out = value;
    replace_all(out, "{workdir}", ctx.workdir);
    replace_all(out, "{source}", ctx.source);
    replace_all(out, "{binary}", ctx.binary);
    replace_all(out, "{dataset}", ctx.dataset);
    return out;
}

}  // namespace sandbox_runner
