#include "bonk/physics/CollisionLayers.hpp"

#include "bonk/core/Logger.hpp"

namespace bonk::physics {

CollisionLayerRegistry::CollisionLayerRegistry() {
    Register(kDefaultLayer);
}

std::uint32_t CollisionLayerRegistry::Register(const std::string& name) {
    auto it = m_nameToIndex.find(name);
    if (it != m_nameToIndex.end()) {
        return it->second;
    }

    if (m_names.size() >= kMaxLayers) {
        core::Logger::Warning("[CollisionLayers] Maximum {} layers reached. Cannot register '{}'",
                              kMaxLayers, name);
        return 0;
    }

    const auto index = static_cast<std::uint32_t>(m_names.size());
    m_nameToIndex.emplace(name, index);
    m_names.push_back(name);
    return index;
}

std::uint32_t CollisionLayerRegistry::Category(const std::string& name) {
    return 1u << Register(name);
}

std::uint32_t CollisionLayerRegistry::Mask(const std::vector<std::string>& names) {
    if (names.empty()) {
        return kAllLayers;
    }
    std::uint32_t result = 0;
    for (const auto& name : names) {
        result |= Category(name);
    }
    return result;
}

std::optional<std::uint32_t> CollisionLayerRegistry::IndexOf(const std::string& name) const {
    auto it = m_nameToIndex.find(name);
    if (it == m_nameToIndex.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> CollisionLayerRegistry::NameOf(std::uint32_t index) const {
    if (index >= m_names.size()) {
        return std::nullopt;
    }
    return m_names[index];
}

std::vector<std::string> CollisionLayerRegistry::GetLayerNames() const {
    return m_names;
}

void CollisionLayerRegistry::Reset() {
    m_nameToIndex.clear();
    m_names.clear();
    Register(kDefaultLayer);
}

} // namespace bonk::physics
