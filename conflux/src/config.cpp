#include <conflux/config.hpp>
#include <algorithm>
#include <stdexcept>

namespace conflux {

bool AgentProfile::has_capability(const std::string& tag) const {
    return std::find(capabilities.begin(), capabilities.end(), tag) != capabilities.end();
}

AgentCatalog::AgentCatalog(std::vector<AgentProfile> profiles) {
    for (auto& profile : profiles) {
        add(std::move(profile));
    }
}

AgentCatalog AgentCatalog::default_catalog() {
    return AgentCatalog({
        {"product-manager", {"requirements", "analysis"}, 6, 5},
        {"project-manager", {"planning", "coordination"}, 3, 5},
        {"tech-lead", {"architecture", "design", "complex-features"}, 5, 10},
        {"senior-developer", {"complex-features", "review", "integration"}, 4, 30},
        {"junior-developer", {"simple-features", "ui", "testing"}, 1, 15},
        {"qa-engineer", {"testing", "validation", "quality-assurance"}, 2, 20},
    });
}

void AgentCatalog::add(AgentProfile profile) {
    if (profile.name.empty()) {
        throw std::invalid_argument("Agent profile must have a name");
    }
    if (find(profile.name)) {
        throw std::invalid_argument("Duplicate agent profile: " + profile.name);
    }
    profiles_.push_back(std::move(profile));
}

const AgentProfile* AgentCatalog::find(const AgentType& name) const {
    for (const auto& profile : profiles_) {
        if (profile.name == name) return &profile;
    }
    return nullptr;
}

int AgentCatalog::rank_of(const AgentType& name) const {
    const AgentProfile* profile = find(name);
    return profile ? profile->rank : 1;
}

std::uint32_t AgentCatalog::base_minutes_of(const AgentType& name) const {
    const AgentProfile* profile = find(name);
    return profile ? profile->base_minutes : 20;
}

} // namespace conflux
