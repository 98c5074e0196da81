#include "resource_path.hpp"

#include <EASTL/algorithm.h>
#include <EASTL/array.h>

#include "core/system_interface.hpp"

struct SchemePrefix {
    ResourcePath::Scope scope;

    eastl::string_view prefix;
};

static constexpr eastl::array<SchemePrefix, 3> SCHEMES = {{
    {ResourcePath::Scope::Resource, "res://"},
    {ResourcePath::Scope::Game, "game://"},
    {ResourcePath::Scope::File, "file://"},
}};

ResourcePath::ResourcePath(const eastl::string_view uri) {
    auto normalized = eastl::string{uri.data(), uri.size()};
    eastl::replace(normalized.begin(), normalized.end(), '\\', '/');

    auto remainder = eastl::string_view{normalized.data(), normalized.size()};
    for(const auto& scheme : SCHEMES) {
        if(remainder.starts_with(scheme.prefix)) {
            scope = scheme.scope;
            remainder.remove_prefix(scheme.prefix.size());
            break;
        }
    }

    path = std::string{remainder.data(), remainder.size()};
}

ResourcePath::ResourcePath(const std::string_view uri) :
    ResourcePath{eastl::string_view{uri.data(), uri.size()}} {
}

ResourcePath::ResourcePath(const Scope scope_in, std::filesystem::path path_in) :
    scope{scope_in}, path{std::move(path_in)} {
}

bool ResourcePath::empty() const {
    return path.empty();
}

bool ResourcePath::has_extension(const eastl::string_view extension) const {
    return path.extension() == std::string_view{extension.data(), extension.size()};
}

std::filesystem::path ResourcePath::to_filepath() const {
    switch(scope) {
    case Scope::Resource:
        return SystemInterface::get().get_data_folder() / path;

    case Scope::Game:
        return SystemInterface::get().get_data_folder() / "game" / path;

    case Scope::File:
        [[fallthrough]];
    default:
        return path;
    }
}

eastl::string ResourcePath::to_string() const {
    const auto itr = eastl::find_if(
        SCHEMES.begin(),
        SCHEMES.end(),
        [&](const SchemePrefix& scheme) { return scheme.scope == scope; });

    auto uri = eastl::string{itr->prefix.data(), itr->prefix.size()};
    uri += path.generic_string().c_str();
    return uri;
}

ResourcePath::Scope ResourcePath::get_scope() const {
    return scope;
}

const std::filesystem::path& ResourcePath::get_path() const {
    return path;
}

ResourcePath operator""_res(const char* uri, const size_t size) {
    return ResourcePath{eastl::string_view{uri, size}};
}
