#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace haq {

/// @brief Maps region names and adjectives to the known member countries.
///
/// The static table covers 13 regions. Region names resolve against the
/// available country vocabulary, `Global` (or no region) resolves to all known
/// countries.
class RegionResolver {
  public:
    /// @brief The name of the all-countries scope
    static constexpr const char *GlobalRegion = "Global";

    /// @brief Initialises a new instance of the RegionResolver class
    /// @param available The country vocabulary with data
    explicit RegionResolver(std::vector<std::string> available);

    /// @brief Finds the canonical region named in a free text
    ///
    /// Patterns are tested in order, more specific first, e.g. `South Asian`
    /// resolves to South Asia, `EU` to Europe, `worldwide` to Global.
    /// @param text The free text
    /// @return The canonical region name, or std::nullopt
    static std::optional<std::string> normalize(std::string_view text);

    /// @brief Resolves a region name or adjective to the member countries with data
    /// @param name_or_adjective The region, e.g. Europe or European
    /// @return The member countries, ordered by name
    /// @throws UnknownRegionError for unknown regions, or regions without data.
    std::vector<std::string> resolve(std::string_view name_or_adjective) const;

    /// @brief Disambiguates string arguments, same as the std::string_view overload
    std::vector<std::string> resolve(const char *name_or_adjective) const {
        return resolve(std::string_view{name_or_adjective});
    }

    /// @brief Disambiguates string arguments, same as the std::string_view overload
    std::vector<std::string> resolve(const std::string &name_or_adjective) const {
        return resolve(std::string_view{name_or_adjective});
    }

    /// @brief Resolves an optional region, no region is the global scope
    std::vector<std::string> resolve(const std::optional<std::string> &region) const;

    /// @brief Gets the static member table of a canonical region
    /// @throws UnknownRegionError for unknown regions.
    static const std::vector<std::string> &members(std::string_view region);

    /// @brief Gets the region used for the monthly seasonal pattern of a country
    /// @param country The canonical country name
    /// @return Southeast Asia, South Asia or East Asia, else std::nullopt
    static std::optional<std::string> seasonal_region(std::string_view country);

    /// @brief Gets the supported region names, ordered
    static std::vector<std::string> supported_regions();

    const std::vector<std::string> &available() const noexcept { return available_; }

  private:
    std::vector<std::string> available_;
};

} // namespace haq
