#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bonk::physics {

/**
 * @brief Maps layer names to collision category bits.
 *
 * "default" is always bit 0. Unknown names register on first use. Once all
 * 32 bits are taken further names fall back to the default category.
 */
class CollisionLayerRegistry {
public:
    static constexpr std::size_t kMaxLayers = 32;
    static constexpr const char* kDefaultLayer = "default";
    static constexpr std::uint32_t kAllLayers = 0xFFFFFFFFu;

    CollisionLayerRegistry();

    // Returns the bit index; no-op for known names.
    std::uint32_t Register(const std::string& name);
    std::uint32_t Category(const std::string& name);
    // OR of the named categories. An empty list collides with everything.
    std::uint32_t Mask(const std::vector<std::string>& names);

    std::optional<std::uint32_t> IndexOf(const std::string& name) const;
    std::optional<std::string> NameOf(std::uint32_t index) const;
    std::vector<std::string> GetLayerNames() const;
    std::size_t Size() const { return m_names.size(); }

    void Reset();

private:
    std::unordered_map<std::string, std::uint32_t> m_nameToIndex;
    std::vector<std::string> m_names;
};

} // namespace bonk::physics
