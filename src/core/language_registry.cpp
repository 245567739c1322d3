/**
 * @file language_registry.cpp
 * @brief Built-in language table and lookup
 * 
 * **Built-in runtimes**:
 * | ids                    | image              | argv               |
 * |------------------------|--------------------|--------------------|
 * | python, python3, py    | python:3.11-slim   | python FILE        |
 * | javascript, js, node   | node:18-alpine     | node FILE          |
 * | bash, sh               | ubuntu:22.04       | bash FILE          |
 * | ruby, rb               | ruby:3.2-alpine    | ruby FILE          |
 * | go, golang             | golang:1.21-alpine | sh -c "go run FILE"|
 * 
 * @date 2025
 */

#include "runcage/core/language_registry.hpp"
#include "runcage/core/errors.hpp"
#include "runcage/utils/string_utils.hpp"

#include <stdexcept>

namespace runcage {
namespace core {

namespace {

LaunchCommand Interpreter(const std::string& program) {
    return [program](const std::string& filename) {
        return std::vector<std::string>{program, filename};
    };
}

} // anonymous namespace

LanguageRegistry LanguageRegistry::Default() {
    LanguageRegistry registry;

    registry.Register({"python", "python:3.11-slim", ".py", Interpreter("python"),
                       "Python 3.11", "Python 3.11 with pip"},
                      {"python3", "py"});

    registry.Register({"javascript", "node:18-alpine", ".js", Interpreter("node"),
                       "Node.js 18", "Node.js 18 with npm"},
                      {"js", "node"});

    registry.Register({"bash", "ubuntu:22.04", ".sh", Interpreter("bash"),
                       "Bash 5", "Ubuntu 22.04 with bash"},
                      {"sh"});

    registry.Register({"ruby", "ruby:3.2-alpine", ".rb", Interpreter("ruby"),
                       "Ruby 3.2", "Ruby 3.2 with gems"},
                      {"rb"});

    registry.Register({"go", "golang:1.21-alpine", ".go",
                       [](const std::string& filename) {
                           return std::vector<std::string>{"sh", "-c", "go run " + filename};
                       },
                       "Go 1.21", "Go 1.21 compiler"},
                      {"golang"});

    return registry;
}

void LanguageRegistry::Register(LanguageSpec spec, const std::vector<std::string>& aliases) {
    if (!spec.launch_command) {
        throw std::invalid_argument("Language '" + spec.id + "' has no launch command");
    }

    spec.id = NormalizeId(spec.id);
    auto shared = std::make_shared<const LanguageSpec>(std::move(spec));

    std::vector<std::string> ids{shared->id};
    for (const auto& alias : aliases) {
        ids.push_back(NormalizeId(alias));
    }

    for (const auto& id : ids) {
        if (id.empty() || entries_.count(id)) {
            throw std::invalid_argument("Language id already registered or empty: '" + id + "'");
        }
    }
    for (const auto& id : ids) {
        entries_[id] = shared;
    }
}

std::optional<LanguageSpec> LanguageRegistry::Resolve(const std::string& language_id) const {
    auto it = entries_.find(NormalizeId(language_id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

const LanguageSpec& LanguageRegistry::Require(const std::string& language_id) const {
    auto it = entries_.find(NormalizeId(language_id));
    if (it == entries_.end()) {
        throw UnsupportedLanguageError(
            "Unsupported language: " + language_id +
            ". Supported: " + utils::StringUtils::Join(KnownIds(), ", "));
    }
    return *it->second;
}

std::vector<std::string> LanguageRegistry::KnownIds() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, spec] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<LanguageInfo> LanguageRegistry::ListLanguages() const {
    std::vector<LanguageInfo> languages;
    languages.reserve(entries_.size());

    for (const auto& [id, spec] : entries_) {
        languages.push_back(LanguageInfo{
            id, spec->display_name, spec->file_extension, spec->image, spec->description});
    }

    return languages;
}

std::string LanguageRegistry::NormalizeId(const std::string& language_id) {
    return utils::StringUtils::ToLower(utils::StringUtils::Trim(language_id));
}

} // namespace core
} // namespace runcage
