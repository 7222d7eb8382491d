#include "sandbox/language_registry.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace coderun::sandbox {

LanguageRegistry::LanguageRegistry(const config::Config& config) {
    languages_.reserve(config.languages.size());
    for (const auto& [id, language] : config.languages) {
        LanguageSpec spec{};
        spec.id = utils::ToLower(id);
        spec.image = language.image;
        spec.command = language.command;
        spec.extension = language.extension;
        spec.timeout = std::chrono::seconds(language.timeout_s);
        spec.memory_limit_bytes = static_cast<std::uint64_t>(language.memory_limit_mb) * 1024 * 1024;
        spec.network_disabled = language.network_disabled;
        languages_.push_back(std::move(spec));
    }
    std::sort(languages_.begin(), languages_.end(), [](const LanguageSpec& lhs, const LanguageSpec& rhs) {
        return lhs.id < rhs.id;
    });
}

const LanguageSpec* LanguageRegistry::Find(const std::string& language) const {
    const auto id = utils::ToLower(utils::Trim(language));
    auto it = std::lower_bound(languages_.begin(), languages_.end(), id, [](const LanguageSpec& spec, const std::string& key) {
        return spec.id < key;
    });
    if (it == languages_.end() || it->id != id) {
        return nullptr;
    }
    return &*it;
}

bool LanguageRegistry::Has(const std::string& language) const {
    return Find(language) != nullptr;
}

std::vector<std::string> LanguageRegistry::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(languages_.size());
    for (const auto& spec : languages_) {
        ids.push_back(spec.id);
    }
    return ids;
}

}  // namespace coderun::sandbox
