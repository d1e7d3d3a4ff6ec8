/**
 * @file language_table.hpp
 * @brief Language → isolation template table.
 * @author Dimitris Kafetzis
 *
 * Every supported Language maps to one LanguageTemplate describing how to
 * materialize and run source inside an environment directory. Command
 * templates use placeholders expanded per environment:
 *
 *   {workdir}   environment root directory
 *   {source}    path of the written source file
 *   {binary}    path of the compiled artifact (compiled languages)
 *   {packages}  expands to one argument per requested package
 *   {dataset}   path of the shared dataset inside the environment
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace sandbox_runner {

struct LanguageTemplate {
    Language language{Language::Python};
    std::string source_file;                 ///< File name inside {workdir}
    std::vector<std::string> compile_argv;   ///< Empty = interpreted
    std::vector<std::string> run_argv;
    std::vector<std::string> install_argv;   ///< Empty = packages unsupported
    std::map<std::string, std::string> env;

    [[nodiscard]] bool supports_packages() const noexcept { return !install_argv.empty(); }
    [[nodiscard]] bool is_compiled() const noexcept { return !compile_argv.empty(); }
};

/**
 * @brief Values substituted into template placeholders.
 */
struct TemplateContext {
    std::string workdir;
    std::string source;
    std::string binary;
    std::string dataset;
    std::vector<std::string> packages;
};

class LanguageTable {
public:
    /// Built-in templates for all languages in kAllLanguages.
    static LanguageTable defaults();

    /// Built-in templates with [languages.*] overrides applied.
    static LanguageTable from_config(const Config& config);

    void set(LanguageTemplate tmpl);
    [[nodiscard]] const LanguageTemplate* find(Language language) const;
    [[nodiscard]] bool supports_packages(Language language) const;

    /**
     * @brief Expand placeholders in an argument or environment template.
     *
     * "{packages}" as a whole argument expands to zero or more arguments;
     * all other placeholders are substituted in place.
     */
    static std::vector<std::string> expand(const std::vector<std::string>& argv,
                                           const TemplateContext& ctx);
    static std::string expand_value(const std::string& value, const TemplateContext& ctx);

private:
    std::map<Language, LanguageTemplate> templates_;
};

}  // namespace sandbox_runner
