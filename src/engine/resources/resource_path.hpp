#pragma once

#include <filesystem>
#include <string_view>

#include <EASTL/string.h>
#include <EASTL/string_view.h>
#include <spdlog/fmt/fmt.h>

/**
 * Names an asset that an FX config refers to: an effect prefab, or a sound clip
 *
 * Written as a URI. The scheme says which folder the path is relative to:
 *  - res://  the data/ folder next to the executable
 *  - game:// the data/game/ folder
 *  - file:// the working directory, or an absolute path. Paths without a scheme are file paths
 */
class ResourcePath {
public:
    enum class Scope {
        File,
        Resource,
        Game,
    };

    ResourcePath() = default;

    explicit ResourcePath(eastl::string_view uri);

    explicit ResourcePath(std::string_view uri);

    ResourcePath(Scope scope_in, std::filesystem::path path_in);

    bool operator==(const ResourcePath& other) const = default;

    /**
     * True if this path doesn't name anything
     */
    bool empty() const;

    /**
     * Checks the file extension, including the dot
     */
    bool has_extension(eastl::string_view extension) const;

    /**
     * Resolves the path against the folder its scope names
     */
    std::filesystem::path to_filepath() const;

    eastl::string to_string() const;

    Scope get_scope() const;

    const std::filesystem::path& get_path() const;

private:
    Scope scope = Scope::File;

    std::filesystem::path path;
};

ResourcePath operator""_res(const char* uri, size_t size);

template<>
struct fmt::formatter<ResourcePath> : formatter<std::string_view> {
    auto format(const ResourcePath& resource, format_context& ctx) const {
        const auto uri = resource.to_string();
        return formatter<std::string_view>::format(std::string_view{uri.data(), uri.size()}, ctx);
    }
};
